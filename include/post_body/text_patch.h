// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file text_patch.h
/// @brief Scalar-sequence text patches for textual leaves.
///
/// Text, URL and Code payloads are UTF-8 strings, but every position and
/// length of a TextPatch counts Unicode scalar values, never bytes. This
/// keeps patches correct for multi-byte text.
///
/// A patch is a single contiguous edit found by trimming the common prefix
/// and the common suffix of the two versions:
/// @code
///   auto patch = TextPatch::compute(U"abc", U"ade");   // {1, 2, U"de"}
///   std::u32string out = patch->apply(U"abc");         // U"ade"
/// @endcode
/// This matches live single-cursor editing. Interleaved edits still produce
/// a correct, if larger, patch.

#pragma once

#include <post_body/post_body_config.h>
#include <post_body/api.h>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace post_body {

// ============================================================
// UTF-8 <-> Unicode scalar conversion
// ============================================================

/// Decode UTF-8 into Unicode scalars.
/// Each byte of an invalid or truncated sequence decodes to U+FFFD.
[[nodiscard]] POST_BODY_API std::u32string to_scalars(std::string_view utf8);

/// Encode Unicode scalars as UTF-8.
/// Surrogates and values above U+10FFFF are encoded as U+FFFD.
[[nodiscard]] POST_BODY_API std::string from_scalars(std::u32string_view scalars);

/// Partially modify an existing string
struct POST_BODY_API TextPatch {
    /// Largest position or removal count a patch can address
    static constexpr std::size_t max_offset = std::numeric_limits<uint16_t>::max();

    /// Position to start the mutation at
    uint16_t position = 0;

    /// Number of scalars to remove after position
    uint16_t remove = 0;

    /// Scalars to insert at position after removal
    std::u32string insert;

    bool operator==(const TextPatch&) const = default;

    /// Generate the patch turning old_text into new_text.
    /// @return std::nullopt if the edit starts or removes beyond max_offset
    [[nodiscard]] static std::optional<TextPatch> compute(std::u32string_view old_text,
                                                          std::u32string_view new_text);

    /// Apply to a scalar sequence, appending the result to dst.
    /// A source shorter than position + remove is copied as far as it goes.
    void apply(std::u32string& dst, std::u32string_view src) const;

    /// Apply to a scalar sequence, returning a new buffer
    [[nodiscard]] std::u32string apply(std::u32string_view src) const;

    /// Apply to the UTF-8 payload of a textual leaf
    [[nodiscard]] std::string apply_utf8(std::string_view src) const;

    /// Estimate the size of the destination after the patch, for buffer
    /// pre-allocation. Falls back to dst_size when the estimate is outside
    /// [0, POST_BODY_MAX_SIZE_HINT], so a bogus patch cannot inflate an
    /// allocation.
    [[nodiscard]] std::size_t estimate_new_size(std::size_t dst_size) const noexcept;

    [[nodiscard]] std::string to_string() const;
};

} // namespace post_body
