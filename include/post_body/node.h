// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file node.h
/// @brief Node type of the post body tree.
///
/// A post body is a recursive tree of typed content nodes:
/// - Empty and NewLine markers
/// - Children: ordered list of sibling nodes
/// - Textual leaves: Text, URL, Code (the only leaves diffed partially)
/// - Opaque leaves: PostLink, Command, Reference, Embed, Pending
/// - Wrappers: Spoiler, Bold, Italic, Quoted, each owning exactly one child
///
/// A Children list holding a single node is interchangeable with that node
/// for diff and patch purposes.
///
/// ## Ownership
/// Wrappers own their child through std::unique_ptr, Children own their
/// elements directly. Subtrees are never shared, so copying a Node is a
/// deep copy and moving it transfers the whole tree.
///
/// ## Coalescing append
/// Trees are built with operator+=, which merges adjacent text runs and
/// absorbs Empty values:
/// @code
///   Node body;
///   body += "hello ";
///   body += Node::bold(Node::text("world"));
///   body += "!";      // Children([Text("hello "), Bold(Text("world")), Text("!")])
/// @endcode

#pragma once

#include <post_body/post_body_config.h>
#include <post_body/api.h>
#include <post_body/leaf_types.h>

#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace post_body {

namespace detail {

inline void log_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if POST_BODY_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_document_error(
    std::string_view func,
    uint64_t id,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if POST_BODY_VERBOSE_LOG
    std::cerr << "[" << func << "] document " << id << ": " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)id;
    (void)message;
    (void)loc;
#endif
}

} // namespace detail

struct Node;

using NodeList = std::vector<Node>;
using NodePtr  = std::unique_ptr<Node>;

namespace nodes {

/// No content
struct Empty {
    bool operator==(const Empty&) const = default;
};

/// Explicit line break
struct NewLine {
    bool operator==(const NewLine&) const = default;
};

/// Unformatted text. Can include newlines.
struct Text {
    std::string value;
    bool operator==(const Text&) const = default;
};

/// External URL
struct URL {
    std::string value;
    bool operator==(const URL&) const = default;
};

/// Programming code tags
struct Code {
    std::string value;
    bool operator==(const Code&) const = default;
};

/// Formatting wrapper owning exactly one child node.
/// Tag only distinguishes the wrapper kinds.
template <typename Tag>
struct Wrapper {
    NodePtr inner;
};

struct SpoilerTag {};
struct BoldTag {};
struct ItalicTag {};
struct QuotedTag {};

using Spoiler = Wrapper<SpoilerTag>;
using Bold    = Wrapper<BoldTag>;
using Italic  = Wrapper<ItalicTag>;
using Quoted  = Wrapper<QuotedTag>;

} // namespace nodes

/// Node discriminator. Values match the variant index of Node::data and the
/// wire tag of the binary codec.
enum class NodeKind : uint8_t {
    Empty = 0,
    NewLine,
    Children,
    Text,
    PostLink,
    Command,
    URL,
    Reference,
    Embed,
    Code,
    Spoiler,
    Bold,
    Italic,
    Quoted,
    Pending,
};

[[nodiscard]] POST_BODY_API std::string_view node_kind_name(NodeKind kind) noexcept;

template <typename T>
concept NodeAlternative =
    std::same_as<T, nodes::Empty> || std::same_as<T, nodes::NewLine> ||
    std::same_as<T, NodeList> || std::same_as<T, nodes::Text> ||
    std::same_as<T, PostLink> || std::same_as<T, Command> ||
    std::same_as<T, nodes::URL> || std::same_as<T, Reference> ||
    std::same_as<T, Embed> || std::same_as<T, nodes::Code> ||
    std::same_as<T, nodes::Spoiler> || std::same_as<T, nodes::Bold> ||
    std::same_as<T, nodes::Italic> || std::same_as<T, nodes::Quoted> ||
    std::same_as<T, PendingNode>;

struct POST_BODY_API Node {
    /// Order must match NodeKind.
    using DataVariant = std::variant<nodes::Empty,
                                     nodes::NewLine,
                                     NodeList,
                                     nodes::Text,
                                     PostLink,
                                     Command,
                                     nodes::URL,
                                     Reference,
                                     Embed,
                                     nodes::Code,
                                     nodes::Spoiler,
                                     nodes::Bold,
                                     nodes::Italic,
                                     nodes::Quoted,
                                     PendingNode>;

    DataVariant data;

    // ============================================================
    // Construction
    // ============================================================

    Node() noexcept : data(nodes::Empty{}) {}

    template <NodeAlternative T>
    Node(T v) : data(std::in_place_type<T>, std::move(v)) {}

    /// Deep copy
    Node(const Node& other);
    Node& operator=(const Node& other);

    Node(Node&&) noexcept = default;
    Node& operator=(Node&&) noexcept = default;
    ~Node() = default;

    [[nodiscard]] static Node empty() { return Node{}; }
    [[nodiscard]] static Node newline() { return Node{nodes::NewLine{}}; }
    [[nodiscard]] static Node text(std::string s) { return Node{nodes::Text{std::move(s)}}; }
    [[nodiscard]] static Node url(std::string s) { return Node{nodes::URL{std::move(s)}}; }
    [[nodiscard]] static Node code(std::string s) { return Node{nodes::Code{std::move(s)}}; }
    [[nodiscard]] static Node children(NodeList list) { return Node{std::move(list)}; }
    [[nodiscard]] static Node children(std::initializer_list<Node> init) { return Node{NodeList(init)}; }
    [[nodiscard]] static Node spoiler(Node inner);
    [[nodiscard]] static Node bold(Node inner);
    [[nodiscard]] static Node italic(Node inner);
    [[nodiscard]] static Node quote(Node inner);

    // ============================================================
    // Type Checking
    // ============================================================

    [[nodiscard]] NodeKind kind() const noexcept { return static_cast<NodeKind>(data.index()); }
    [[nodiscard]] std::string_view kind_name() const noexcept { return node_kind_name(kind()); }

    template <typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(data);
    }

    [[nodiscard]] bool is_empty() const { return is<nodes::Empty>(); }
    [[nodiscard]] bool is_children() const { return is<NodeList>(); }

    /// Text, URL or Code
    [[nodiscard]] bool is_textual() const noexcept;

    /// Spoiler, Bold, Italic or Quoted
    [[nodiscard]] bool is_wrapper() const noexcept;

    // ============================================================
    // Access
    // ============================================================

    template <typename T>
    [[nodiscard]] T* get_if() {
        return std::get_if<T>(&data);
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const {
        return std::get_if<T>(&data);
    }

    /// String payload of a textual leaf, nullptr for any other kind
    [[nodiscard]] std::string* text_payload();
    [[nodiscard]] const std::string* text_payload() const;

    /// Child of a wrapper node, nullptr for any other kind
    [[nodiscard]] Node* wrapped();
    [[nodiscard]] const Node* wrapped() const;

    /// Element list of a Children node, nullptr for any other kind
    [[nodiscard]] NodeList* child_list() { return get_if<NodeList>(); }
    [[nodiscard]] const NodeList* child_list() const { return get_if<NodeList>(); }

    /// Number of Unicode scalars of textual content, descending into lists and
    /// wrappers. A NewLine counts as one scalar, opaque leaves as none.
    [[nodiscard]] std::size_t scalar_length() const;

    // ============================================================
    // Coalescing append
    // ============================================================

    /// Append a node, merging adjacent text runs.
    /// - Appending Empty is a no-op
    /// - Appending to Empty replaces it
    /// - Text onto Text (or onto a list ending with Text) concatenates
    /// - Children onto Children extends the list
    /// - Anything else turns the destination into Children([old, new])
    Node& operator+=(Node rhs);

    /// Append text without building an intermediate node when possible
    Node& operator+=(std::string_view rhs);
    Node& operator+=(const char* rhs) { return *this += std::string_view{rhs}; }
    Node& operator+=(char32_t rhs);

    /// Remove the last scalar of the trailing text run, or the trailing
    /// non-textual leaf. Emptied leaves and lists collapse to Empty.
    /// @return false if there was nothing to remove
    bool remove_last();

    // ============================================================
    // Comparison and utility
    // ============================================================

    [[nodiscard]] bool operator==(const Node& other) const;

    [[nodiscard]] std::string to_string() const;
};

POST_BODY_API std::ostream& operator<<(std::ostream& os, const Node& node);

} // namespace post_body
