// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <post_body/node.h>
#include <post_body/text_patch.h>

#include <sstream>
#include <stdexcept>

namespace post_body {

namespace {

template <typename T>
struct is_wrapper_type : std::false_type {};

template <typename Tag>
struct is_wrapper_type<nodes::Wrapper<Tag>> : std::true_type {};

template <typename T>
inline constexpr bool is_wrapper_v = is_wrapper_type<T>::value;

template <typename T>
inline constexpr bool is_textual_v =
    std::is_same_v<T, nodes::Text> || std::is_same_v<T, nodes::URL> || std::is_same_v<T, nodes::Code>;

template <typename Tag>
Node wrap(Node inner)
{
    return Node{nodes::Wrapper<Tag>{std::make_unique<Node>(std::move(inner))}};
}

std::string quote_string(const std::string& s)
{
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            default:   out += c; break;
        }
    }
    out += "\"";
    return out;
}

} // namespace

std::string_view node_kind_name(NodeKind kind) noexcept
{
    switch (kind) {
        case NodeKind::Empty:     return "Empty";
        case NodeKind::NewLine:   return "NewLine";
        case NodeKind::Children:  return "Children";
        case NodeKind::Text:      return "Text";
        case NodeKind::PostLink:  return "PostLink";
        case NodeKind::Command:   return "Command";
        case NodeKind::URL:       return "URL";
        case NodeKind::Reference: return "Reference";
        case NodeKind::Embed:     return "Embed";
        case NodeKind::Code:      return "Code";
        case NodeKind::Spoiler:   return "Spoiler";
        case NodeKind::Bold:      return "Bold";
        case NodeKind::Italic:    return "Italic";
        case NodeKind::Quoted:    return "Quoted";
        case NodeKind::Pending:   return "Pending";
    }
    return "Unknown";
}

// ============================================================
// Construction
// ============================================================

Node::Node(const Node& other)
    : data(std::visit([](const auto& val) -> DataVariant {
          using T = std::decay_t<decltype(val)>;

          if constexpr (is_wrapper_v<T>) {
              // Wrappers always own a child; a moved-from wrapper is copied as Empty
              return DataVariant{std::in_place_type<T>, T{std::make_unique<Node>(val.inner ? *val.inner : Node{})}};
          } else {
              return DataVariant{std::in_place_type<T>, val};
          }
      }, other.data))
{
}

Node& Node::operator=(const Node& other)
{
    if (this != &other) {
        Node copy{other};
        data = std::move(copy.data);
    }
    return *this;
}

Node Node::spoiler(Node inner) { return wrap<nodes::SpoilerTag>(std::move(inner)); }
Node Node::bold(Node inner)    { return wrap<nodes::BoldTag>(std::move(inner)); }
Node Node::italic(Node inner)  { return wrap<nodes::ItalicTag>(std::move(inner)); }
Node Node::quote(Node inner)   { return wrap<nodes::QuotedTag>(std::move(inner)); }

// ============================================================
// Type Checking and Access
// ============================================================

bool Node::is_textual() const noexcept
{
    switch (kind()) {
        case NodeKind::Text:
        case NodeKind::URL:
        case NodeKind::Code:
            return true;
        default:
            return false;
    }
}

bool Node::is_wrapper() const noexcept
{
    switch (kind()) {
        case NodeKind::Spoiler:
        case NodeKind::Bold:
        case NodeKind::Italic:
        case NodeKind::Quoted:
            return true;
        default:
            return false;
    }
}

std::string* Node::text_payload()
{
    return std::visit([](auto& val) -> std::string* {
        using T = std::decay_t<decltype(val)>;
        if constexpr (is_textual_v<T>) {
            return &val.value;
        } else {
            return nullptr;
        }
    }, data);
}

const std::string* Node::text_payload() const
{
    return const_cast<Node*>(this)->text_payload();
}

Node* Node::wrapped()
{
    return std::visit([](auto& val) -> Node* {
        using T = std::decay_t<decltype(val)>;
        if constexpr (is_wrapper_v<T>) {
            return val.inner.get();
        } else {
            return nullptr;
        }
    }, data);
}

const Node* Node::wrapped() const
{
    return const_cast<Node*>(this)->wrapped();
}

std::size_t Node::scalar_length() const
{
    return std::visit([](const auto& val) -> std::size_t {
        using T = std::decay_t<decltype(val)>;

        if constexpr (is_textual_v<T>) {
            return to_scalars(val.value).size();
        } else if constexpr (std::is_same_v<T, nodes::NewLine>) {
            return 1;
        } else if constexpr (std::is_same_v<T, NodeList>) {
            std::size_t total = 0;
            for (const auto& child : val) {
                total += child.scalar_length();
            }
            return total;
        } else if constexpr (is_wrapper_v<T>) {
            return val.inner ? val.inner->scalar_length() : 0;
        } else {
            return 0;
        }
    }, data);
}

// ============================================================
// Coalescing append
// ============================================================

Node& Node::operator+=(Node rhs)
{
    if (rhs.is_empty()) {
        return *this;
    }
    if (is_empty()) {
        *this = std::move(rhs);
        return *this;
    }

    auto* dst_text = get_if<nodes::Text>();
    auto* rhs_text = rhs.get_if<nodes::Text>();
    if (dst_text && rhs_text) {
        dst_text->value += rhs_text->value;
        return *this;
    }

    if (auto* list = child_list()) {
        if (auto* rhs_list = rhs.child_list()) {
            auto it = rhs_list->begin();
            if (it != rhs_list->end()) {
                auto* last_text = list->empty() ? nullptr : list->back().get_if<nodes::Text>();
                auto* first_text = it->get_if<nodes::Text>();
                if (last_text && first_text) {
                    last_text->value += first_text->value;
                    ++it;
                }
            }
            for (; it != rhs_list->end(); ++it) {
                list->push_back(std::move(*it));
            }
            return *this;
        }

        if (rhs_text) {
            if (!list->empty()) {
                if (auto* last_text = list->back().get_if<nodes::Text>()) {
                    last_text->value += rhs_text->value;
                    return *this;
                }
            }
        }
        list->push_back(std::move(rhs));
        return *this;
    }

    NodeList pair;
    pair.reserve(2);
    pair.push_back(std::move(*this));
    pair.push_back(std::move(rhs));
    data = std::move(pair);
    return *this;
}

Node& Node::operator+=(std::string_view rhs)
{
    if (auto* text = get_if<nodes::Text>()) {
        text->value += rhs;
        return *this;
    }
    if (auto* list = child_list()) {
        if (!list->empty()) {
            if (auto* last_text = list->back().get_if<nodes::Text>()) {
                last_text->value += rhs;
                return *this;
            }
        }
        list->push_back(Node::text(std::string{rhs}));
        return *this;
    }
    return *this += Node::text(std::string{rhs});
}

Node& Node::operator+=(char32_t rhs)
{
    return *this += std::string_view{from_scalars(std::u32string_view{&rhs, 1})};
}

bool Node::remove_last()
{
    return std::visit([this](auto& val) -> bool {
        using T = std::decay_t<decltype(val)>;

        if constexpr (std::is_same_v<T, nodes::Empty>) {
            return false;
        } else if constexpr (is_textual_v<T>) {
            std::u32string scalars = to_scalars(val.value);
            if (scalars.empty()) {
                data = nodes::Empty{};
                return false;
            }
            scalars.pop_back();
            if (scalars.empty()) {
                data = nodes::Empty{};
            } else {
                val.value = from_scalars(scalars);
            }
            return true;
        } else if constexpr (std::is_same_v<T, NodeList>) {
            bool removed = false;
            while (!val.empty() && !removed) {
                Node& last = val.back();
                removed = last.remove_last();
                if (last.is_empty()) {
                    val.pop_back();
                }
            }
            if (val.empty()) {
                data = nodes::Empty{};
            }
            return removed;
        } else if constexpr (is_wrapper_v<T>) {
            bool removed = val.inner && val.inner->remove_last();
            if (!val.inner || val.inner->is_empty()) {
                data = nodes::Empty{};
            }
            return removed;
        } else {
            // Atomic leaves are removed whole
            data = nodes::Empty{};
            return true;
        }
    }, data);
}

// ============================================================
// Comparison
// ============================================================

bool Node::operator==(const Node& other) const
{
    if (data.index() != other.data.index()) return false;

    return std::visit([&other](const auto& val) -> bool {
        using T = std::decay_t<decltype(val)>;
        const auto& rhs = std::get<T>(other.data);

        if constexpr (is_wrapper_v<T>) {
            if (!val.inner && !rhs.inner) return true;
            if (!val.inner || !rhs.inner) return false;
            return *val.inner == *rhs.inner;
        } else {
            return val == rhs;
        }
    }, data);
}

// ============================================================
// Utility
// ============================================================

std::string Node::to_string() const
{
    return std::visit([this](const auto& val) -> std::string {
        using T = std::decay_t<decltype(val)>;

        if constexpr (std::is_same_v<T, nodes::Empty>) {
            return "Empty";
        } else if constexpr (std::is_same_v<T, nodes::NewLine>) {
            return "NewLine";
        } else if constexpr (is_textual_v<T>) {
            return std::string{kind_name()} + "(" + quote_string(val.value) + ")";
        } else if constexpr (std::is_same_v<T, NodeList>) {
            std::ostringstream oss;
            oss << "[";
            bool first = true;
            for (const auto& child : val) {
                if (!first) oss << ", ";
                first = false;
                oss << child.to_string();
            }
            oss << "]";
            return oss.str();
        } else if constexpr (is_wrapper_v<T>) {
            return std::string{kind_name()} + "(" + (val.inner ? val.inner->to_string() : "null") + ")";
        } else {
            return std::string{kind_name()} + "(" + post_body::to_string(val) + ")";
        }
    }, data);
}

std::ostream& operator<<(std::ostream& os, const Node& node)
{
    return os << node.to_string();
}

} // namespace post_body
