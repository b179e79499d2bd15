// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file body_editor.h
/// @brief Producer side of live post editing.
///
/// A BodyEditor owns the body of one open post. Edits are dispatched as
/// actions through a lager store; after every dispatch the editor diffs the
/// body it last published against the current one and hands the resulting
/// BodyPatch to its on_patch effect.
///
/// @code
///   BodyEditor editor{42};
///   editor.set_effects({
///       .on_patch = [&](BodyPatch patch) { transport.send(serialize(patch)); },
///   });
///   editor.append_text("hello");
///   editor.backspace();
/// @endcode

#pragma once

#include <post_body/post_body_config.h>
#include <post_body/api.h>
#include <post_body/node.h>
#include <post_body/patch.h>

#include <immer/box.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <variant>

namespace post_body {

// ============================================================
// Editor State Model (for lager store)
// ============================================================

struct BodyModel {
    uint64_t id = 0;
    immer::box<Node> body;

    /// Body length in Unicode scalars
    std::size_t length = 0;
    std::size_t max_length = POST_BODY_MAX_BODY_LENGTH;

    /// Cleared by Close. A closed body accepts no further edits.
    bool open = true;

    bool operator==(const BodyModel&) const = default;
};

// ============================================================
// Editor Actions
// ============================================================

namespace actions {

/// Append text, clipped to the remaining length budget
struct AppendText {
    std::string text;
};

/// Append a single typed character
struct AppendChar {
    char32_t value = 0;
};

/// Append a parsed node. Rejected whole if it does not fit.
struct AppendNode {
    Node node;
};

/// Remove the last character, or the trailing non-text node
struct Backspace {};

/// Substitute the whole body (full reparse of the input)
struct ReplaceBody {
    Node body;
};

/// Close the post
struct Close {};

} // namespace actions

using BodyAction = std::variant<actions::AppendText,
                                actions::AppendChar,
                                actions::AppendNode,
                                actions::Backspace,
                                actions::ReplaceBody,
                                actions::Close>;

/// Reducer
[[nodiscard]] POST_BODY_API BodyModel body_update(BodyModel model, BodyAction action);

// ============================================================
// BodyEditor
// ============================================================

struct EditorOptions {
    Node initial;
    std::size_t max_length = POST_BODY_MAX_BODY_LENGTH;
};

struct EditorEffects {
    /// Receives the patch of every dispatch that changed the body
    std::function<void(BodyPatch)> on_patch;

    /// Called once, when the post is closed
    std::function<void(uint64_t id)> on_closed;
};

class POST_BODY_API BodyEditor {
public:
    explicit BodyEditor(uint64_t id, EditorOptions options = {});
    ~BodyEditor();

    BodyEditor(BodyEditor&&) noexcept;
    BodyEditor& operator=(BodyEditor&&) noexcept;
    BodyEditor(const BodyEditor&) = delete;
    BodyEditor& operator=(const BodyEditor&) = delete;

    void dispatch(BodyAction action);

    void append_text(std::string text);
    void append_char(char32_t c);
    void append_node(Node node);
    void backspace();
    void replace_body(Node body);
    void close();

    [[nodiscard]] const BodyModel& get_model() const;
    [[nodiscard]] const Node& body() const;
    [[nodiscard]] uint64_t id() const;
    [[nodiscard]] std::size_t length() const;
    [[nodiscard]] bool is_open() const;

    /// Copy of the current body, for resynchronising an observer
    [[nodiscard]] Node snapshot() const;

    /// Number of patches handed to on_patch so far
    [[nodiscard]] std::size_t patch_count() const;

    void set_effects(EditorEffects effects);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace post_body
