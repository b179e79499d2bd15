// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <post_body/text_patch.h>

#include <boost/locale/utf.hpp>

#include <algorithm>
#include <iterator>
#include <sstream>

namespace post_body {

namespace utf = boost::locale::utf;

namespace {

constexpr char32_t replacement_char = 0xFFFD;

/// Length of the common prefix of two scalar ranges
template <typename ItA, typename ItB>
std::size_t common_prefix(ItA a, ItA a_end, ItB b, ItB b_end)
{
    std::size_t n = 0;
    while (a != a_end && b != b_end && *a == *b) {
        ++a;
        ++b;
        ++n;
    }
    return n;
}

} // namespace

// ============================================================
// UTF-8 <-> Unicode scalar conversion
// ============================================================

std::u32string to_scalars(std::string_view utf8)
{
    std::u32string out;
    out.reserve(utf8.size());

    const char* p = utf8.data();
    const char* const end = p + utf8.size();
    while (p != end) {
        const char* start = p;
        utf::code_point c = utf::utf_traits<char>::decode(p, end);
        if (c == utf::illegal || c == utf::incomplete) {
            out.push_back(replacement_char);
            p = start + 1;
            continue;
        }
        out.push_back(static_cast<char32_t>(c));
    }
    return out;
}

std::string from_scalars(std::u32string_view scalars)
{
    std::string out;
    out.reserve(scalars.size());

    auto it = std::back_inserter(out);
    for (char32_t c : scalars) {
        utf::code_point cp = static_cast<utf::code_point>(c);
        if (!utf::is_valid_codepoint(cp)) {
            cp = replacement_char;
        }
        it = utf::utf_traits<char>::encode(cp, it);
    }
    return out;
}

// ============================================================
// TextPatch
// ============================================================

std::optional<TextPatch> TextPatch::compute(std::u32string_view old_text, std::u32string_view new_text)
{
    const std::size_t start = common_prefix(old_text.begin(), old_text.end(),
                                            new_text.begin(), new_text.end());
    const std::size_t end = common_prefix(old_text.rbegin(), old_text.rend() - start,
                                          new_text.rbegin(), new_text.rend() - start);
    const std::size_t remove = old_text.size() - end - start;

    if (start > max_offset || remove > max_offset) {
        return std::nullopt;
    }

    TextPatch patch;
    patch.position = static_cast<uint16_t>(start);
    patch.remove = static_cast<uint16_t>(remove);
    patch.insert = std::u32string{new_text.substr(start, new_text.size() - end - start)};
    return patch;
}

void TextPatch::apply(std::u32string& dst, std::u32string_view src) const
{
    const std::size_t head = std::min<std::size_t>(position, src.size());
    dst.append(src.substr(0, head));
    dst.append(insert);

    const std::size_t tail = std::min<std::size_t>(head + remove, src.size());
    dst.append(src.substr(tail));
}

std::u32string TextPatch::apply(std::u32string_view src) const
{
    std::u32string dst;
    dst.reserve(estimate_new_size(src.size()));
    apply(dst, src);
    return dst;
}

std::string TextPatch::apply_utf8(std::string_view src) const
{
    return from_scalars(apply(to_scalars(src)));
}

std::size_t TextPatch::estimate_new_size(std::size_t dst_size) const noexcept
{
    const auto estimate = static_cast<int64_t>(dst_size)
                        - static_cast<int64_t>(remove)
                        + static_cast<int64_t>(insert.size());
    if (estimate < 0 || estimate > POST_BODY_MAX_SIZE_HINT) {
        return dst_size;
    }
    return static_cast<std::size_t>(estimate);
}

std::string TextPatch::to_string() const
{
    std::ostringstream oss;
    oss << "TextPatch{position: " << position
        << ", remove: " << remove
        << ", insert: \"" << from_scalars(insert) << "\"}";
    return oss.str();
}

} // namespace post_body
