// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file body_diff.h
/// @brief Diff two post body trees and apply the resulting patch.
///
/// The diff is a fast positional single-pass comparison suited to
/// append-mostly live editing. It never matches moved or reordered nodes:
/// children are compared index by index, trailing additions become an
/// append and trailing removals a truncation.
///
/// Usage:
/// @code
///   if (auto patch = diff(old_body, new_body)) {
///       // transmit *patch to observers
///       auto result = apply_patch(observer_body, std::move(*patch));
///       if (!result) { /* resynchronise with a full snapshot */ }
///   }
/// @endcode

#pragma once

#include <post_body/api.h>
#include <post_body/node.h>
#include <post_body/patch.h>

#include <optional>

namespace post_body {

/// Compute the patch turning old_node into new_node.
/// @return std::nullopt when the trees are observably equal (no patch should
///         be transmitted). A single-element Children list and its element
///         count as equal.
[[nodiscard]] POST_BODY_API std::optional<Patch> diff(const Node& old_node, const Node& new_node);

/// Apply a patch to a tree in place.
///
/// Stops at the first error. Elements of a Children list patched before
/// the failing index stay mutated.
[[nodiscard]] POST_BODY_API PatchResult apply_patch(Node& node, Patch patch);

namespace detail {

/// Sole element of a single-element Children list, otherwise the node itself
[[nodiscard]] POST_BODY_API const Node& collapse(const Node& node) noexcept;

[[nodiscard]] std::optional<Patch> diff_children(const NodeList& old_list, const NodeList& new_list);
[[nodiscard]] std::optional<Patch> diff_text(const std::string& old_text, const std::string& new_text,
                                             const Node& new_node);
[[nodiscard]] PatchResult apply_children(NodeList& list, patches::Children patch);

} // namespace detail

} // namespace post_body
