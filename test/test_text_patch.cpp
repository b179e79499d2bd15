// test_text_patch.cpp - Tests for text patches
// Scalar-sequence diff, apply and UTF-8 conversion

#include <catch2/catch_all.hpp>
#include <post_body/text_patch.h>

#include <string>

using namespace post_body;

// ============================================================
// Helper Functions
// ============================================================

namespace {

TextPatch make_patch(uint16_t position, uint16_t remove, std::u32string insert) {
    TextPatch patch;
    patch.position = position;
    patch.remove = remove;
    patch.insert = std::move(insert);
    return patch;
}

struct TextDiffCase {
    const char* name;
    std::u32string in;
    uint16_t position;
    uint16_t remove;
    std::u32string insert;
    std::u32string out;
};

} // namespace

// ============================================================
// compute / apply
// ============================================================

TEST_CASE("TextPatch compute and apply", "[text_patch]") {
    const TextDiffCase cases[] = {
        {"append",                           U"a",    1, 0, U"a",   U"aa"},
        {"prepend",                          U"bc",   0, 0, U"a",   U"abc"},
        {"append to empty body",             U"",     0, 0, U"abc", U"abc"},
        {"backspace",                        U"abc",  2, 1, U"",    U"ab"},
        {"remove one from front",            U"abc",  0, 1, U"",    U"bc"},
        {"remove one multibyte char",        U"αΒΓΔ", 2, 1, U"",    U"αΒΔ"},
        {"inject into the middle",           U"abc",  2, 0, U"abc", U"ababcc"},
        {"inject multibyte into the middle", U"αΒΓ",  2, 0, U"Δ",   U"αΒΔΓ"},
        {"replace in the middle",            U"abc",  1, 1, U"d",   U"adc"},
        {"replace multibyte in the middle",  U"αΒΓ",  1, 1, U"Δ",   U"αΔΓ"},
        {"replace suffix",                   U"abc",  1, 2, U"de",  U"ade"},
        {"replace prefix",                   U"abc",  0, 2, U"de",  U"dec"},
    };

    for (const auto& c : cases) {
        DYNAMIC_SECTION(c.name) {
            auto expected = make_patch(c.position, c.remove, c.insert);

            auto patch = TextPatch::compute(c.in, c.out);
            REQUIRE(patch.has_value());
            REQUIRE(*patch == expected);

            REQUIRE(expected.apply(c.in) == c.out);
        }
    }
}

TEST_CASE("TextPatch apply appends to destination", "[text_patch][apply]") {
    auto patch = make_patch(1, 1, U"X");

    std::u32string dst = U">";
    patch.apply(dst, U"abc");
    REQUIRE(dst == U">aXc");
}

TEST_CASE("TextPatch apply tolerates short source", "[text_patch][apply]") {
    SECTION("position past the end") {
        auto patch = make_patch(5, 2, U"x");
        REQUIRE(patch.apply(U"abc") == U"abcx");
    }

    SECTION("removal past the end") {
        auto patch = make_patch(1, 10, U"x");
        REQUIRE(patch.apply(U"abc") == U"ax");
    }
}

TEST_CASE("TextPatch apply_utf8 counts scalars", "[text_patch][utf8]") {
    auto patch = TextPatch::compute(to_scalars("héllo wörld"), to_scalars("héllo wörld!"));
    REQUIRE(patch.has_value());
    REQUIRE(patch->position == 11);
    REQUIRE(patch->remove == 0);

    REQUIRE(patch->apply_utf8("héllo wörld") == "héllo wörld!");
}

TEST_CASE("TextPatch identical input", "[text_patch]") {
    auto patch = TextPatch::compute(U"same", U"same");
    REQUIRE(patch.has_value());
    REQUIRE(patch->remove == 0);
    REQUIRE(patch->insert.empty());
    REQUIRE(patch->apply(U"same") == U"same");
}

TEST_CASE("TextPatch offsets beyond 16 bits", "[text_patch][limits]") {
    const std::u32string long_text(TextPatch::max_offset + 10, U'a');

    SECTION("edit position too far") {
        REQUIRE_FALSE(TextPatch::compute(long_text, long_text + U"b").has_value());
    }

    SECTION("removal too long") {
        REQUIRE_FALSE(TextPatch::compute(U"x" + long_text, U"y").has_value());
    }

    SECTION("edit at the front of a long text") {
        auto patch = TextPatch::compute(long_text, U"b" + long_text);
        REQUIRE(patch.has_value());
        REQUIRE(patch->position == 0);
        REQUIRE(patch->insert == U"b");
    }
}

TEST_CASE("TextPatch estimate_new_size", "[text_patch][estimate]") {
    SECTION("plain estimate") {
        REQUIRE(make_patch(1, 0, U"a").estimate_new_size(1) == 2);
        REQUIRE(make_patch(0, 2, U"").estimate_new_size(3) == 1);
    }

    SECTION("negative estimate falls back") {
        REQUIRE(make_patch(0, 5, U"").estimate_new_size(2) == 2);
    }

    SECTION("oversized estimate falls back") {
        auto patch = make_patch(0, 0, std::u32string(3000, U'x'));
        REQUIRE(patch.estimate_new_size(10) == 10);
        REQUIRE(patch.apply(U"0123456789").size() == 3010);
    }
}

// ============================================================
// UTF-8 conversion
// ============================================================

TEST_CASE("to_scalars and from_scalars", "[text_patch][utf8]") {
    SECTION("multibyte") {
        REQUIRE(to_scalars("αΒΓ") == U"αΒΓ");
        REQUIRE(to_scalars("日本") == U"日本");
        REQUIRE(from_scalars(U"αΒΓ") == "αΒΓ");
        REQUIRE(from_scalars(U"\U0001F600") == "\xF0\x9F\x98\x80");
    }

    SECTION("empty") {
        REQUIRE(to_scalars("").empty());
        REQUIRE(from_scalars(U"").empty());
    }

    SECTION("invalid byte decodes to replacement character") {
        REQUIRE(to_scalars("a\xFF" "b") == U"a\uFFFDb");
    }

    SECTION("truncated sequence") {
        REQUIRE(to_scalars("\xE2\x82") == U"\uFFFD\uFFFD");
    }

    SECTION("surrogate encodes to replacement character") {
        std::u32string bad;
        bad.push_back(static_cast<char32_t>(0xD800));
        REQUIRE(from_scalars(bad) == "\xEF\xBF\xBD");
    }
}

TEST_CASE("TextPatch to_string", "[text_patch]") {
    auto patch = make_patch(1, 2, U"de");
    REQUIRE(patch.to_string() == "TextPatch{position: 1, remove: 2, insert: \"de\"}");
}
