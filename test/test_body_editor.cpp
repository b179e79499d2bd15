// test_body_editor.cpp - Tests for the producer session
// Reducer, length limit, patch emission, close

#include <catch2/catch_all.hpp>
#include <post_body/body_diff.h>
#include <post_body/body_editor.h>

#include <string>
#include <utility>
#include <vector>

using namespace post_body;

// ============================================================
// Helper Functions
// ============================================================

namespace {

/// Editor wired to an in-memory observer that applies every patch
struct EditorFixture {
    BodyEditor editor;
    Node observed;
    std::vector<PatchKind> kinds;
    std::vector<uint64_t> closed;

    explicit EditorFixture(uint64_t id = 7, EditorOptions options = {})
        : editor(id, std::move(options)) {
        editor.set_effects({
            .on_patch = [this](BodyPatch patch) {
                REQUIRE(patch.id == editor.id());
                kinds.push_back(patch.patch.kind());
                REQUIRE(apply_patch(observed, std::move(patch.patch)));
            },
            .on_closed = [this](uint64_t id) { closed.push_back(id); },
        });
    }

    void require_in_sync() const {
        REQUIRE(detail::collapse(observed) == detail::collapse(editor.body()));
    }
};

} // namespace

// ============================================================
// Reducer
// ============================================================

TEST_CASE("body_update reducer", "[editor][reducer]") {
    BodyModel model;
    model.id = 3;

    SECTION("append text") {
        auto next = body_update(model, actions::AppendText{"héllo"});
        REQUIRE(next.body.get() == Node::text("héllo"));
        REQUIRE(next.length == 5);
        REQUIRE(model.body.get().is_empty());
    }

    SECTION("append char and backspace") {
        auto next = body_update(model, actions::AppendChar{U'Δ'});
        REQUIRE(next.body.get() == Node::text("Δ"));
        REQUIRE(next.length == 1);

        next = body_update(next, actions::Backspace{});
        REQUIRE(next.body.get().is_empty());
        REQUIRE(next.length == 0);
    }

    SECTION("backspace on empty body is a no-op") {
        auto next = body_update(model, actions::Backspace{});
        REQUIRE(next == model);
    }

    SECTION("close") {
        auto next = body_update(model, actions::Close{});
        REQUIRE_FALSE(next.open);

        auto after = body_update(next, actions::AppendText{"ignored"});
        REQUIRE(after == next);
    }
}

// ============================================================
// BodyEditor
// ============================================================

TEST_CASE("BodyEditor initial state", "[editor]") {
    SECTION("empty") {
        BodyEditor editor{1};
        REQUIRE(editor.id() == 1);
        REQUIRE(editor.is_open());
        REQUIRE(editor.length() == 0);
        REQUIRE(editor.body().is_empty());
        REQUIRE(editor.patch_count() == 0);
    }

    SECTION("with initial body") {
        EditorOptions options;
        options.initial = Node::children({Node::text("ab"), Node::newline()});
        BodyEditor editor{2, std::move(options)};
        REQUIRE(editor.length() == 3);
        REQUIRE(editor.get_model().max_length == POST_BODY_MAX_BODY_LENGTH);
    }
}

TEST_CASE("BodyEditor emits patches", "[editor][patch]") {
    EditorFixture f;

    f.editor.append_text("hel");
    f.editor.append_text("lo");
    f.editor.append_char(U'!');
    f.require_in_sync();

    REQUIRE(f.kinds == std::vector<PatchKind>{PatchKind::Replace, PatchKind::Text, PatchKind::Text});

    f.editor.append_node(Node::newline());
    f.editor.append_node(Node::bold(Node::text("b")));
    f.editor.append_text("tail");
    f.require_in_sync();
    REQUIRE(f.observed == Node::children({Node::text("hello!"), Node::newline(),
                                          Node::bold(Node::text("b")), Node::text("tail")}));

    for (int i = 0; i < 5; ++i) {
        f.editor.backspace();
        f.require_in_sync();
    }
    REQUIRE(f.editor.body() == Node::children({Node::text("hello!"), Node::newline()}));
    REQUIRE(f.editor.patch_count() == f.kinds.size());
}

TEST_CASE("BodyEditor skips no-op edits", "[editor][patch]") {
    EditorFixture f;

    f.editor.backspace();
    f.editor.append_text("");
    f.editor.append_node(Node{});
    REQUIRE(f.kinds.empty());

    f.editor.append_text("x");
    f.editor.replace_body(Node::text("x"));
    REQUIRE(f.kinds.size() == 1);
}

TEST_CASE("BodyEditor replace_body", "[editor][patch]") {
    EditorFixture f;
    f.editor.append_text("abc");

    f.editor.replace_body(Node::children({Node::text("abc"), Node::url("https://x")}));
    f.require_in_sync();
    REQUIRE(f.editor.length() == 12);
}

TEST_CASE("BodyEditor length limit", "[editor][limit]") {
    EditorOptions options;
    options.max_length = 5;
    EditorFixture f{9, std::move(options)};

    SECTION("text is clipped") {
        f.editor.append_text("héllo world");
        REQUIRE(f.editor.body() == Node::text("héllo"));
        REQUIRE(f.editor.length() == 5);

        f.editor.append_char(U'x');
        REQUIRE(f.editor.length() == 5);
        f.require_in_sync();
    }

    SECTION("nodes that do not fit are rejected") {
        f.editor.append_text("abcd");
        f.editor.append_node(Node::bold(Node::text("xy")));
        REQUIRE(f.editor.body() == Node::text("abcd"));

        f.editor.append_node(Node::bold(Node::text("x")));
        REQUIRE(f.editor.length() == 5);

        // Opaque leaves have no length
        f.editor.append_node(Node{PostLink{1, 1, 0}});
        REQUIRE(f.editor.body().child_list()->size() == 3);
        f.require_in_sync();
    }

    SECTION("oversized replacement is rejected") {
        f.editor.append_text("ab");
        f.editor.replace_body(Node::text("abcdef"));
        REQUIRE(f.editor.body() == Node::text("ab"));
    }
}

TEST_CASE("BodyEditor default length limit", "[editor][limit]") {
    BodyEditor editor{1};
    editor.append_text(std::string(POST_BODY_MAX_BODY_LENGTH + 500, 'a'));
    REQUIRE(editor.length() == POST_BODY_MAX_BODY_LENGTH);
}

TEST_CASE("BodyEditor close", "[editor][close]") {
    EditorFixture f;
    f.editor.append_text("final");
    f.editor.close();

    REQUIRE_FALSE(f.editor.is_open());
    REQUIRE(f.closed == std::vector<uint64_t>{7});

    const auto patches_before = f.kinds.size();
    f.editor.append_text(" more");
    f.editor.backspace();
    f.editor.close();

    REQUIRE(f.editor.body() == Node::text("final"));
    REQUIRE(f.kinds.size() == patches_before);
    REQUIRE(f.closed.size() == 1);
}

TEST_CASE("BodyEditor snapshot", "[editor][snapshot]") {
    BodyEditor editor{5};
    editor.append_text("abc");

    Node snapshot = editor.snapshot();
    REQUIRE(snapshot == editor.body());

    snapshot += "def";
    REQUIRE(editor.body() == Node::text("abc"));
}
