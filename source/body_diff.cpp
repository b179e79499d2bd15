// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <post_body/body_diff.h>

#include <iterator>

namespace post_body {

namespace {

/// Child of a wrapper. A moved-from wrapper reads as Empty.
const Node& inner_of(const Node& wrapper) noexcept
{
    static const Node empty_node;
    const Node* inner = wrapper.wrapped();
    return inner ? *inner : empty_node;
}

} // namespace

namespace detail {

const Node& collapse(const Node& node) noexcept
{
    if (const auto* list = node.child_list(); list && list->size() == 1) {
        return list->front();
    }
    return node;
}

std::optional<Patch> diff_children(const NodeList& old_list, const NodeList& new_list)
{
    patches::Children result;

    std::size_t i = 0;
    for (;; ++i) {
        const bool has_old = i < old_list.size();
        const bool has_new = i < new_list.size();

        if (has_old && has_new) {
            if (auto sub = diff(old_list[i], new_list[i])) {
                result.patch.emplace_back(i, std::move(*sub));
            }
        } else if (has_new) {
            // Old list exhausted: everything left in the new one is appended
            result.append.assign(new_list.begin() + static_cast<std::ptrdiff_t>(i), new_list.end());
            break;
        } else if (has_old) {
            result.truncate = i;
            break;
        } else {
            break;
        }
    }

    if (result.patch.empty() && !result.truncate && result.append.empty()) {
        return std::nullopt;
    }
    return Patch{std::move(result)};
}

std::optional<Patch> diff_text(const std::string& old_text, const std::string& new_text, const Node& new_node)
{
    // Most strings do not change between two revisions
    if (old_text == new_text) {
        return std::nullopt;
    }

    const std::u32string old_scalars = to_scalars(old_text);
    const std::u32string new_scalars = to_scalars(new_text);

    // Payloads that are not valid UTF-8 do not survive decoding: replace the whole leaf
    if (from_scalars(old_scalars) != old_text || from_scalars(new_scalars) != new_text) {
        return Patch::replace(new_node);
    }

    auto patch = TextPatch::compute(old_scalars, new_scalars);
    if (!patch) {
        // Edit not addressable with 16-bit offsets: ship the whole leaf
        return Patch::replace(new_node);
    }
    return Patch::text(std::move(*patch));
}

PatchResult apply_children(NodeList& list, patches::Children patch)
{
    for (auto& [index, sub] : patch.patch) {
        if (index >= list.size()) {
            auto result = PatchResult::out_of_bounds(index, list.size());
            log_error("apply_patch", result.error_message);
            return result;
        }
        auto result = apply_patch(list[index], std::move(sub));
        if (!result) {
            return result;
        }
    }

    if (patch.truncate && *patch.truncate < list.size()) {
        list.erase(list.begin() + static_cast<std::ptrdiff_t>(*patch.truncate), list.end());
    }

    list.reserve(list.size() + patch.append.size());
    for (auto& node : patch.append) {
        list.push_back(std::move(node));
    }
    return PatchResult::ok();
}

} // namespace detail

// ============================================================
// Diff
// ============================================================

std::optional<Patch> diff(const Node& old_node, const Node& new_node)
{
    const NodeKind old_kind = old_node.kind();
    const NodeKind new_kind = new_node.kind();

    if ((old_kind == NodeKind::Empty && new_kind == NodeKind::Empty) ||
        (old_kind == NodeKind::NewLine && new_kind == NodeKind::NewLine)) {
        return std::nullopt;
    }

    const auto* old_list = old_node.child_list();
    const auto* new_list = new_node.child_list();
    if (old_list && new_list) {
        return detail::diff_children(*old_list, *new_list);
    }

    // A single-element list is diffed as its element
    const Node& old_view = detail::collapse(old_node);
    const Node& new_view = detail::collapse(new_node);
    if (&old_view != &old_node || &new_view != &new_node) {
        return diff(old_view, new_view);
    }

    if (old_kind == new_kind) {
        if (old_node.is_textual()) {
            return detail::diff_text(*old_node.text_payload(), *new_node.text_payload(), new_node);
        }
        if (old_node.is_wrapper()) {
            auto inner = diff(inner_of(old_node), inner_of(new_node));
            if (!inner) {
                return std::nullopt;
            }
            return Patch::wrapped(std::move(*inner));
        }
    }

    if (old_node == new_node) {
        return std::nullopt;
    }
    return Patch::replace(new_node);
}

// ============================================================
// Apply
// ============================================================

PatchResult apply_patch(Node& node, Patch patch)
{
    if (auto* replace = patch.get_if<patches::Replace>()) {
        node = std::move(replace->node);
        return PatchResult::ok();
    }

    if (auto* children = patch.get_if<patches::Children>()) {
        if (auto* list = node.child_list()) {
            return detail::apply_children(*list, std::move(*children));
        }

        // Patch was computed against the collapsed view: wrap the node back
        NodeList wrapped;
        wrapped.push_back(std::move(node));
        node = Node{std::move(wrapped)};
        return detail::apply_children(*node.child_list(), std::move(*children));
    }

    if (auto* list = node.child_list(); list && list->size() == 1) {
        // Take the element out before the list holding it is destroyed
        Node sole = std::move(list->front());
        node = std::move(sole);
        return apply_patch(node, std::move(patch));
    }

    if (auto* text = patch.get_if<TextPatch>()) {
        if (auto* payload = node.text_payload()) {
            *payload = text->apply_utf8(*payload);
            return PatchResult::ok();
        }
    } else if (auto* wrapped = patch.get_if<patches::Wrapped>()) {
        Node* inner = node.wrapped();
        if (inner && wrapped->inner) {
            return apply_patch(*inner, std::move(*wrapped->inner));
        }
    }

    auto result = PatchResult::type_mismatch(node.kind(), patch.kind());
    detail::log_error("apply_patch", result.error_message);
    return result;
}

} // namespace post_body
