// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Fluent builder for post body trees.
///
/// BodyBuilder accumulates nodes with the coalescing append of Node, so
/// adjacent text runs merge as they would while typing:
/// @code
///   #include <post_body/builders.h>
///
///   Node body = BodyBuilder()
///       .text("see ")
///       .url("https://example.com")
///       .newline()
///       .bold(Node::text("important"))
///       .finish();
/// @endcode
///
/// Note: This header must be included separately from node.h if you need Builder functionality.

#pragma once

#include <post_body/node.h>

#include <string>
#include <string_view>
#include <utility>

namespace post_body {

class BodyBuilder {
public:
    BodyBuilder() = default;
    explicit BodyBuilder(Node existing) : body_(std::move(existing)) {}

    // Move operations (allowed)
    BodyBuilder(BodyBuilder&&) noexcept = default;
    BodyBuilder& operator=(BodyBuilder&&) noexcept = default;

    // Copy operations (disabled - a builder has a single owner of its tree)
    BodyBuilder(const BodyBuilder&) = delete;
    BodyBuilder& operator=(const BodyBuilder&) = delete;

    BodyBuilder& text(std::string_view s) {
        body_ += s;
        return *this;
    }

    BodyBuilder& newline() {
        body_ += Node::newline();
        return *this;
    }

    /// Append any node, merging text runs
    BodyBuilder& node(Node n) {
        body_ += std::move(n);
        return *this;
    }

    BodyBuilder& url(std::string s) { return node(Node::url(std::move(s))); }
    BodyBuilder& code(std::string s) { return node(Node::code(std::move(s))); }
    BodyBuilder& bold(Node inner) { return node(Node::bold(std::move(inner))); }
    BodyBuilder& italic(Node inner) { return node(Node::italic(std::move(inner))); }
    BodyBuilder& spoiler(Node inner) { return node(Node::spoiler(std::move(inner))); }
    BodyBuilder& quote(Node inner) { return node(Node::quote(std::move(inner))); }

    /// Current body length in Unicode scalars
    [[nodiscard]] std::size_t length() const { return body_.scalar_length(); }

    /// Finish building and return the tree
    /// @note The builder is left holding Empty
    [[nodiscard]] Node finish() {
        return std::exchange(body_, Node{});
    }

private:
    Node body_;
};

} // namespace post_body
