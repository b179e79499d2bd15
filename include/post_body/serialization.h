// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief Binary wire format for nodes, patches and routed body patches.
///
/// Usage:
/// @code
///   #include <post_body/serialization.h>
///
///   ByteBuffer wire = serialize(BodyPatch{42, std::move(*patch)});
///   BodyPatch received = deserialize_body_patch(wire);
/// @endcode
///
/// Layout (all integers little-endian):
///   Node:   1-byte NodeKind tag, then the payload
///           - Children: u32 count + nodes
///           - Text/URL/Code: u32 byte length + UTF-8 data
///           - PostLink: u64 id, u64 thread, u32 page
///           - Command/Pending: 1-byte variant tag + fields
///           - Reference: label string, url string
///           - Embed: u8 provider, data string
///           - Wrappers: one nested node
///   Patch:  1-byte PatchKind tag, then the payload
///           - Replace: node
///           - Text: u16 position, u16 remove, u32 count + u32 scalars
///           - Wrapped: nested patch
///           - Children: u32 count + (u64 index, patch) pairs,
///                       u8 truncate flag [+ u64 truncate],
///                       u32 count + appended nodes
///   BodyPatch: u64 id, patch
///
/// Fields carry no names and are read in the order above. Producers and
/// observers must agree on this exact layout.
///
/// Note: This header must be included separately from patch.h if you need serialization.

#pragma once

#include <post_body/api.h>
#include <post_body/node.h>
#include <post_body/patch.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace post_body {

using ByteBuffer = std::vector<uint8_t>;

/// Deepest nesting the decoder accepts before rejecting the buffer
inline constexpr std::size_t max_decode_depth = 256;

POST_BODY_API ByteBuffer serialize(const Node& node);
POST_BODY_API ByteBuffer serialize(const Patch& patch);
POST_BODY_API ByteBuffer serialize(const BodyPatch& patch);

/// @throws std::runtime_error on invalid data format or trailing bytes
POST_BODY_API Node deserialize_node(const ByteBuffer& buffer);
POST_BODY_API Node deserialize_node(const uint8_t* data, std::size_t size);

/// @throws std::runtime_error on invalid data format or trailing bytes
POST_BODY_API Patch deserialize_patch(const ByteBuffer& buffer);
POST_BODY_API Patch deserialize_patch(const uint8_t* data, std::size_t size);

/// @throws std::runtime_error on invalid data format or trailing bytes
POST_BODY_API BodyPatch deserialize_body_patch(const ByteBuffer& buffer);
POST_BODY_API BodyPatch deserialize_body_patch(const uint8_t* data, std::size_t size);

} // namespace post_body
