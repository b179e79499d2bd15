// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch.h
/// @brief Patch type describing the change between two post body trees.
///
/// A Patch mirrors the shape of the change, not of the node:
/// - Replace:  discard the destination subtree and substitute a new one
/// - Text:     apply a TextPatch to a Text, URL or Code leaf
/// - Wrapped:  descend into the child of Spoiler, Bold, Italic or Quoted
/// - Children: patch elements at indices, then truncate, then append
///
/// Patches are produced by diff(), consumed once by apply_patch() and then
/// discarded, so the type is move-only.

#pragma once

#include <post_body/post_body_config.h>
#include <post_body/api.h>
#include <post_body/node.h>
#include <post_body/text_patch.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace post_body {

struct Patch;

namespace patches {

/// Replace node with a new one
struct Replace {
    Node node;
};

/// Patch the contents of a wrapper node
struct Wrapped {
    std::unique_ptr<Patch> inner;
};

/// Descend into a Children list. Applied in this fixed order.
struct Children {
    /// First patch nodes at the specific indices
    std::vector<std::pair<std::size_t, Patch>> patch;

    /// Then truncate the list to this size
    std::optional<std::size_t> truncate;

    /// Then append these nodes
    NodeList append;
};

} // namespace patches

/// Patch discriminator. Values match the variant index and the wire tag.
enum class PatchKind : uint8_t {
    Replace = 0,
    Text,
    Wrapped,
    Children,
};

[[nodiscard]] POST_BODY_API std::string_view patch_kind_name(PatchKind kind) noexcept;

struct POST_BODY_API Patch {
    /// Order must match PatchKind.
    using DataVariant = std::variant<patches::Replace,
                                     TextPatch,
                                     patches::Wrapped,
                                     patches::Children>;

    DataVariant data;

    Patch(patches::Replace p) : data(std::in_place_type<patches::Replace>, std::move(p)) {}
    Patch(TextPatch p) : data(std::in_place_type<TextPatch>, std::move(p)) {}
    Patch(patches::Wrapped p) : data(std::in_place_type<patches::Wrapped>, std::move(p)) {}
    Patch(patches::Children p) : data(std::in_place_type<patches::Children>, std::move(p)) {}

    Patch(Patch&&) noexcept = default;
    Patch& operator=(Patch&&) noexcept = default;
    Patch(const Patch&) = delete;
    Patch& operator=(const Patch&) = delete;
    ~Patch() = default;

    [[nodiscard]] static Patch replace(Node node) { return Patch{patches::Replace{std::move(node)}}; }
    [[nodiscard]] static Patch text(TextPatch p) { return Patch{std::move(p)}; }
    [[nodiscard]] static Patch wrapped(Patch inner);
    [[nodiscard]] static Patch children(std::vector<std::pair<std::size_t, Patch>> patch,
                                        std::optional<std::size_t> truncate = std::nullopt,
                                        NodeList append = {});

    [[nodiscard]] PatchKind kind() const noexcept { return static_cast<PatchKind>(data.index()); }
    [[nodiscard]] std::string_view kind_name() const noexcept { return patch_kind_name(kind()); }

    template <typename T>
    [[nodiscard]] const T* get_if() const {
        return std::get_if<T>(&data);
    }

    template <typename T>
    [[nodiscard]] T* get_if() {
        return std::get_if<T>(&data);
    }

    [[nodiscard]] bool operator==(const Patch& other) const;

    [[nodiscard]] std::string to_string() const;
};

POST_BODY_API std::ostream& operator<<(std::ostream& os, const Patch& patch);

/// Patch addressed to one post body. The id lets a transport route the
/// patch to the matching observer-held tree.
struct BodyPatch {
    uint64_t id = 0;
    Patch patch;
};

// ============================================================
// Patch application result
// ============================================================

enum class PatchErrorCode {
    Success = 0,
    IndexOutOfBounds,   // Children patch index not present in the destination list
    TypeMismatch,       // Patch shape does not fit the destination node kind
    UnknownDocument,    // No replica holds the addressed body
    StaleDocument,      // Replica diverged earlier and awaits a snapshot
};

/// Outcome of applying a patch. A failure means the destination has already
/// diverged from the tree the patch was computed against: the caller must
/// resynchronise with a full snapshot rather than retry. Mutations made
/// before the failure are kept.
struct PatchResult {
    bool success = true;
    PatchErrorCode error_code = PatchErrorCode::Success;
    std::string error_message;

    /// Offending index and list length (IndexOutOfBounds)
    std::size_t index = 0;
    std::size_t length = 0;

    /// Destination and patch kinds (TypeMismatch)
    NodeKind node_kind = NodeKind::Empty;
    PatchKind patch_kind = PatchKind::Replace;

    explicit operator bool() const noexcept { return success; }

    [[nodiscard]] static PatchResult ok() { return PatchResult{}; }
    [[nodiscard]] POST_BODY_API static PatchResult out_of_bounds(std::size_t index, std::size_t length);
    [[nodiscard]] POST_BODY_API static PatchResult type_mismatch(NodeKind node, PatchKind patch);
    [[nodiscard]] POST_BODY_API static PatchResult unknown_document(uint64_t id);
    [[nodiscard]] POST_BODY_API static PatchResult stale_document(uint64_t id);

    /// Throws PatchError on failure
    POST_BODY_API void throw_if_failed() const;
};

class POST_BODY_API PatchError : public std::runtime_error {
public:
    explicit PatchError(const PatchResult& result)
        : std::runtime_error("Patch failed: " + result.error_message), code_(result.error_code) {}

    [[nodiscard]] PatchErrorCode code() const noexcept { return code_; }

private:
    PatchErrorCode code_;
};

} // namespace post_body
