// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file body_replica.h
/// @brief Observer side of live post editing.
///
/// A BodyReplicaSet holds an independent copy of every open post body the
/// observer follows and keeps it in sync by applying received patches.
///
/// A failed patch leaves the replica diverged from its producer. The replica
/// is then marked stale, on_resync_needed fires, and further patches for it
/// are refused until a fresh snapshot is installed with insert().

#pragma once

#include <post_body/post_body_config.h>
#include <post_body/api.h>
#include <post_body/node.h>
#include <post_body/patch.h>
#include <post_body/serialization.h>

#include <tsl/robin_map.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>

namespace post_body {

struct ReplicaEffects {
    /// Called when a replica diverged and needs a full snapshot
    std::function<void(uint64_t id, const PatchResult& result)> on_resync_needed;
};

class POST_BODY_API BodyReplicaSet {
public:
    struct Replica {
        Node body;
        bool stale = false;
    };

    using ReplicaMap = tsl::robin_map<uint64_t, Replica>;

    BodyReplicaSet() = default;

    /// Install a snapshot, replacing any previous replica and clearing its stale flag
    void insert(uint64_t id, Node body);

    /// @return false if no replica had this id
    bool erase(uint64_t id);

    [[nodiscard]] const Node* find(uint64_t id) const;
    [[nodiscard]] bool contains(uint64_t id) const { return replicas_.count(id) > 0; }
    [[nodiscard]] bool is_stale(uint64_t id) const;
    [[nodiscard]] std::size_t size() const noexcept { return replicas_.size(); }
    [[nodiscard]] bool empty() const noexcept { return replicas_.empty(); }

    /// Apply a patch to the replica it is addressed to
    PatchResult apply(BodyPatch patch);

    /// Decode a serialized BodyPatch and apply it
    /// @throws std::runtime_error if the buffer is not a valid BodyPatch
    PatchResult apply_bytes(const ByteBuffer& buffer);

    void set_effects(ReplicaEffects effects) { effects_ = std::move(effects); }

private:
    ReplicaMap replicas_;
    ReplicaEffects effects_;
};

} // namespace post_body
