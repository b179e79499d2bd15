// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <post_body/patch.h>

#include <sstream>
#include <type_traits>

namespace post_body {

std::string_view patch_kind_name(PatchKind kind) noexcept
{
    switch (kind) {
        case PatchKind::Replace:  return "Replace";
        case PatchKind::Text:     return "Text";
        case PatchKind::Wrapped:  return "Wrapped";
        case PatchKind::Children: return "Children";
    }
    return "Unknown";
}

Patch Patch::wrapped(Patch inner)
{
    return Patch{patches::Wrapped{std::make_unique<Patch>(std::move(inner))}};
}

Patch Patch::children(std::vector<std::pair<std::size_t, Patch>> patch,
                      std::optional<std::size_t> truncate,
                      NodeList append)
{
    return Patch{patches::Children{std::move(patch), truncate, std::move(append)}};
}

bool Patch::operator==(const Patch& other) const
{
    if (data.index() != other.data.index()) return false;

    return std::visit([&other](const auto& val) -> bool {
        using T = std::decay_t<decltype(val)>;
        const auto& rhs = std::get<T>(other.data);

        if constexpr (std::is_same_v<T, patches::Replace>) {
            return val.node == rhs.node;
        } else if constexpr (std::is_same_v<T, TextPatch>) {
            return val == rhs;
        } else if constexpr (std::is_same_v<T, patches::Wrapped>) {
            if (!val.inner || !rhs.inner) return !val.inner && !rhs.inner;
            return *val.inner == *rhs.inner;
        } else if constexpr (std::is_same_v<T, patches::Children>) {
            if (val.patch.size() != rhs.patch.size()) return false;
            for (std::size_t i = 0; i < val.patch.size(); ++i) {
                if (val.patch[i].first != rhs.patch[i].first) return false;
                if (!(val.patch[i].second == rhs.patch[i].second)) return false;
            }
            return val.truncate == rhs.truncate && val.append == rhs.append;
        }
    }, data);
}

std::string Patch::to_string() const
{
    return std::visit([](const auto& val) -> std::string {
        using T = std::decay_t<decltype(val)>;
        std::ostringstream oss;

        if constexpr (std::is_same_v<T, patches::Replace>) {
            oss << "Replace(" << val.node.to_string() << ")";
        } else if constexpr (std::is_same_v<T, TextPatch>) {
            oss << "Text(" << val.to_string() << ")";
        } else if constexpr (std::is_same_v<T, patches::Wrapped>) {
            oss << "Wrapped(" << (val.inner ? val.inner->to_string() : "null") << ")";
        } else if constexpr (std::is_same_v<T, patches::Children>) {
            oss << "Children{patch: [";
            bool first = true;
            for (const auto& [index, sub] : val.patch) {
                if (!first) oss << ", ";
                first = false;
                oss << index << ": " << sub.to_string();
            }
            oss << "], truncate: ";
            if (val.truncate) {
                oss << *val.truncate;
            } else {
                oss << "none";
            }
            oss << ", append: " << Node{val.append}.to_string() << "}";
        }
        return oss.str();
    }, data);
}

std::ostream& operator<<(std::ostream& os, const Patch& patch)
{
    return os << patch.to_string();
}

// ============================================================
// PatchResult
// ============================================================

PatchResult PatchResult::out_of_bounds(std::size_t index, std::size_t length)
{
    PatchResult result;
    result.success = false;
    result.error_code = PatchErrorCode::IndexOutOfBounds;
    result.index = index;
    result.length = length;
    result.error_message = "patch out of bounds: " + std::to_string(index) + " >= " + std::to_string(length);
    return result;
}

PatchResult PatchResult::type_mismatch(NodeKind node, PatchKind patch)
{
    PatchResult result;
    result.success = false;
    result.error_code = PatchErrorCode::TypeMismatch;
    result.node_kind = node;
    result.patch_kind = patch;
    result.error_message = "node type mismatch: attempting to patch " + std::string{node_kind_name(node)}
                         + " with " + std::string{patch_kind_name(patch)} + " patch";
    return result;
}

PatchResult PatchResult::unknown_document(uint64_t id)
{
    PatchResult result;
    result.success = false;
    result.error_code = PatchErrorCode::UnknownDocument;
    result.error_message = "no replica for document " + std::to_string(id);
    return result;
}

PatchResult PatchResult::stale_document(uint64_t id)
{
    PatchResult result;
    result.success = false;
    result.error_code = PatchErrorCode::StaleDocument;
    result.error_message = "document " + std::to_string(id) + " awaits resynchronisation";
    return result;
}

void PatchResult::throw_if_failed() const
{
    if (!success) {
        throw PatchError(*this);
    }
}

} // namespace post_body
