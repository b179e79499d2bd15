// test_diff.cpp - Tests for the body diff
// Positional tree diff and round-trip through apply_patch

#include <catch2/catch_all.hpp>
#include <post_body/body_diff.h>
#include <post_body/builders.h>

#include <string>
#include <utility>
#include <vector>

using namespace post_body;

// ============================================================
// Helper Functions
// ============================================================

namespace {

TextPatch make_text_patch(uint16_t position, uint16_t remove, std::u32string insert) {
    TextPatch patch;
    patch.position = position;
    patch.remove = remove;
    patch.insert = std::move(insert);
    return patch;
}

/// Apply diff(from, to) to a copy of from and check it reproduces to
void require_round_trip(const Node& from, const Node& to) {
    INFO("from: " << from << " to: " << to);

    auto patch = diff(from, to);
    if (!patch) {
        REQUIRE(detail::collapse(from) == detail::collapse(to));
        return;
    }

    INFO("patch: " << *patch);
    Node target = from;
    auto result = apply_patch(target, std::move(*patch));
    REQUIRE(result);
    REQUIRE(detail::collapse(target) == detail::collapse(to));
}

Node sample_body() {
    return BodyBuilder()
        .text("hello ")
        .bold(Node::italic(Node::text("world")))
        .newline()
        .node(Node{PostLink{17, 2, 0}})
        .url("https://example.com")
        .quote(Node::children({Node::text("quoted"), Node::newline()}))
        .finish();
}

} // namespace

// ============================================================
// No-op diffs
// ============================================================

TEST_CASE("Diff of equal trees", "[diff][noop]") {
    SECTION("markers") {
        REQUIRE_FALSE(diff(Node{}, Node{}).has_value());
        REQUIRE_FALSE(diff(Node::newline(), Node::newline()).has_value());
    }

    SECTION("every leaf kind") {
        const Node leaves[] = {
            Node::text("a"),
            Node::url("https://x"),
            Node::code("int x;"),
            Node{PostLink{1, 2, 3}},
            Node{Command{command::Dice{-1, 20, {4, 17}}}},
            Node{Command{command::EightBall{"yes"}}},
            Node{Reference{"label", "https://ref"}},
            Node{Embed{EmbedProvider::YouTube, "dQw4w9WgXcQ"}},
            Node{PendingNode{pending::Countdown{10}}},
        };
        for (const auto& leaf : leaves) {
            INFO(leaf);
            REQUIRE_FALSE(diff(leaf, leaf).has_value());
        }
    }

    SECTION("nested wrappers") {
        Node n = Node::spoiler(Node::bold(Node::italic(Node::quote(Node::text("deep")))));
        REQUIRE_FALSE(diff(n, n).has_value());
    }

    SECTION("multi-element children") {
        Node body = sample_body();
        REQUIRE_FALSE(diff(body, body).has_value());
    }
}

TEST_CASE("Diff singleton collapse", "[diff][collapse]") {
    const Node leaves[] = {
        Node::text("a"),
        Node::newline(),
        Node::bold(Node::text("b")),
        Node{PostLink{1, 1, 0}},
    };

    for (const auto& x : leaves) {
        INFO(x);
        Node wrapped = Node::children({x});
        REQUIRE_FALSE(diff(wrapped, x).has_value());
        REQUIRE_FALSE(diff(x, wrapped).has_value());
    }

    SECTION("collapse helper") {
        Node single = Node::children({Node::text("a")});
        REQUIRE(detail::collapse(single) == Node::text("a"));

        Node pair = Node::children({Node::text("a"), Node::newline()});
        REQUIRE(&detail::collapse(pair) == &pair);
    }

    SECTION("changes are diffed against the sole element") {
        auto patch = diff(Node::children({Node::text("ab")}), Node::text("abc"));
        REQUIRE(patch.has_value());
        REQUIRE(*patch == Patch::text(make_text_patch(2, 0, U"c")));

        patch = diff(Node::bold(Node::text("x")), Node::children({Node::children({Node::bold(Node::text("y"))})}));
        REQUIRE(patch.has_value());
        REQUIRE(*patch == Patch::wrapped(Patch::text(make_text_patch(0, 1, U"y"))));
    }
}

// ============================================================
// Patch shapes
// ============================================================

TEST_CASE("Diff of textual leaves", "[diff][text]") {
    SECTION("same kind yields a text patch") {
        auto patch = diff(Node::text("abc"), Node::text("ade"));
        REQUIRE(patch.has_value());
        REQUIRE(*patch == Patch::text(make_text_patch(1, 2, U"de")));
    }

    SECTION("counts scalars") {
        auto patch = diff(Node::code("αΒΓΔ"), Node::code("αΒΔ"));
        REQUIRE(patch.has_value());
        REQUIRE(*patch == Patch::text(make_text_patch(2, 1, U"")));
    }

    SECTION("different textual kinds are replaced") {
        auto patch = diff(Node::text("abc"), Node::url("abc"));
        REQUIRE(patch.has_value());
        REQUIRE(*patch == Patch::replace(Node::url("abc")));
    }

    SECTION("edit beyond 16-bit offsets falls back to replace") {
        std::string long_text(70000, 'a');
        Node changed = Node::text(long_text + "b");

        auto patch = diff(Node::text(long_text), changed);
        REQUIRE(patch.has_value());
        REQUIRE(patch->kind() == PatchKind::Replace);
        REQUIRE(*patch == Patch::replace(changed));
    }
}

TEST_CASE("Diff of textual leaves holding invalid UTF-8", "[diff][utf8]") {
    SECTION("payloads that decode to the same scalars") {
        Node from = Node::text("\xfe");
        Node to = Node::text("\xff");

        auto patch = diff(from, to);
        REQUIRE(patch.has_value());
        REQUIRE(*patch == Patch::replace(to));

        REQUIRE(apply_patch(from, std::move(*patch)));
        REQUIRE(from == to);
    }

    SECTION("append after an invalid byte keeps the raw bytes") {
        Node from = Node::text("a\xff");
        Node to = Node::text("a\xff" "b");

        auto patch = diff(from, to);
        REQUIRE(patch.has_value());
        REQUIRE(patch->kind() == PatchKind::Replace);

        REQUIRE(apply_patch(from, std::move(*patch)));
        REQUIRE(*from.text_payload() == "a\xff" "b");
    }

    SECTION("valid payloads still get a text patch") {
        auto patch = diff(Node::url("h\xc3\xa9"), Node::url("h\xc3\xa9!"));
        REQUIRE(patch.has_value());
        REQUIRE(*patch == Patch::text(make_text_patch(2, 0, U"!")));
    }

    SECTION("round trip") {
        require_round_trip(Node::children({Node::text("x\xc0"), Node::newline()}),
                           Node::children({Node::text("x\xc1"), Node::newline()}));
        require_round_trip(Node::code("\xe2\x82"), Node::code("\xe2\x82\xac"));
    }
}

TEST_CASE("Diff of wrappers", "[diff][wrapped]") {
    SECTION("same wrapper descends") {
        auto patch = diff(Node::bold(Node::text("a")), Node::bold(Node::text("ab")));
        REQUIRE(patch.has_value());
        REQUIRE(*patch == Patch::wrapped(Patch::text(make_text_patch(1, 0, U"b"))));
    }

    SECTION("nested wrappers nest patches") {
        auto patch = diff(Node::quote(Node::spoiler(Node::text("x"))),
                          Node::quote(Node::spoiler(Node::text("y"))));
        REQUIRE(patch.has_value());
        REQUIRE(*patch == Patch::wrapped(Patch::wrapped(Patch::text(make_text_patch(0, 1, U"y")))));
    }

    SECTION("different wrappers are replaced") {
        auto patch = diff(Node::bold(Node::text("a")), Node::italic(Node::text("a")));
        REQUIRE(patch.has_value());
        REQUIRE(patch->kind() == PatchKind::Replace);
    }
}

TEST_CASE("Diff of children", "[diff][children]") {
    Node old_list = Node::children({Node::text("a"), Node::newline(), Node::text("b")});

    SECTION("appended elements") {
        Node new_list = Node::children({Node::text("a"), Node::newline(), Node::text("b"),
                                        Node::newline(), Node::code("c")});
        auto patch = diff(old_list, new_list);
        REQUIRE(patch.has_value());

        const auto* children = patch->get_if<patches::Children>();
        REQUIRE(children != nullptr);
        REQUIRE(children->patch.empty());
        REQUIRE_FALSE(children->truncate.has_value());
        REQUIRE(children->append == NodeList{Node::newline(), Node::code("c")});
    }

    SECTION("removed elements") {
        Node new_list = Node::children({Node::text("a")});
        auto patch = diff(old_list, new_list);
        REQUIRE(patch.has_value());

        const auto* children = patch->get_if<patches::Children>();
        REQUIRE(children != nullptr);
        REQUIRE(children->patch.empty());
        REQUIRE(children->truncate == std::optional<std::size_t>{1});
        REQUIRE(children->append.empty());
    }

    SECTION("changed element") {
        Node new_list = Node::children({Node::text("a"), Node::newline(), Node::text("bc")});
        auto patch = diff(old_list, new_list);
        REQUIRE(patch.has_value());

        std::vector<std::pair<std::size_t, Patch>> expected;
        expected.emplace_back(2, Patch::text(make_text_patch(1, 0, U"c")));
        REQUIRE(*patch == Patch::children(std::move(expected)));
    }

    SECTION("leaf against a longer list is replaced") {
        auto patch = diff(Node::text("a"), old_list);
        REQUIRE(patch.has_value());
        REQUIRE(*patch == Patch::replace(old_list));
    }

    SECTION("no reorder detection") {
        Node swapped = Node::children({Node::text("b"), Node::newline(), Node::text("a")});
        auto patch = diff(old_list, swapped);
        REQUIRE(patch.has_value());

        const auto* children = patch->get_if<patches::Children>();
        REQUIRE(children != nullptr);
        REQUIRE(children->patch.size() == 2);
        REQUIRE(children->patch[0].first == 0);
        REQUIRE(children->patch[1].first == 2);
    }
}

// ============================================================
// Round trip
// ============================================================

TEST_CASE("Diff round trip", "[diff][roundtrip]") {
    const std::pair<Node, Node> pairs[] = {
        {Node{}, Node::text("hello")},
        {Node::text("hello"), Node{}},
        {Node::text("hello"), Node::text("help")},
        {Node::text("αΒΓ"), Node::text("αΔΓ")},
        {Node::children({Node::text("a"), Node::newline(), Node::bold(Node::text("b"))}),
         Node::children({Node::text("a"), Node::newline(), Node::bold(Node::text("bc")), Node::text("d")})},
        {Node::children({Node::text("a"), Node::newline(), Node::text("b")}),
         Node::children({Node::text("a")})},
        {Node::bold(Node::italic(Node::text("x"))), Node::bold(Node::italic(Node::text("xy")))},
        {Node::text("abc"), Node::code("abc")},
        {Node::children({Node{PostLink{1, 0, 0}}}), Node::children({Node{PostLink{1, 5, 2}}})},
        {Node::quote(Node::children({Node::text("q"), Node::newline()})),
         Node::quote(Node::children({Node::text("q"), Node::newline(), Node::text("r")}))},
        {Node::text("x"), Node::children({Node::text("x"), Node::newline()})},
        {Node::children({Node::text("a")}), Node::text("ab")},
        {Node::spoiler(Node::text("a")), Node::bold(Node::text("a"))},
        {sample_body(), Node{}},
        {Node{}, sample_body()},
    };

    for (const auto& [from, to] : pairs) {
        require_round_trip(from, to);
    }
}

TEST_CASE("Diff round trip while typing", "[diff][roundtrip]") {
    // Replays a typing session keystroke by keystroke
    const std::string typed = "héllo wörld, 日本語";
    Node previous;
    Node current;

    for (char32_t c : to_scalars(typed)) {
        current += c;
        require_round_trip(previous, current);
        previous = current;
    }

    current += Node::bold(Node::text("bold"));
    require_round_trip(previous, current);
    previous = current;

    while (current.remove_last()) {
        require_round_trip(previous, current);
        previous = current;
    }
    REQUIRE(current.is_empty());
}
