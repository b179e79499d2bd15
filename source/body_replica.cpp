// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <post_body/body_replica.h>
#include <post_body/body_diff.h>

#include <utility>

namespace post_body {

void BodyReplicaSet::insert(uint64_t id, Node body)
{
    auto it = replicas_.find(id);
    if (it != replicas_.end()) {
        it.value().body = std::move(body);
        it.value().stale = false;
    } else {
        replicas_.emplace(id, Replica{std::move(body), false});
    }
}

bool BodyReplicaSet::erase(uint64_t id)
{
    return replicas_.erase(id) > 0;
}

const Node* BodyReplicaSet::find(uint64_t id) const
{
    auto it = replicas_.find(id);
    if (it == replicas_.end()) {
        return nullptr;
    }
    return &it->second.body;
}

bool BodyReplicaSet::is_stale(uint64_t id) const
{
    auto it = replicas_.find(id);
    return it != replicas_.end() && it->second.stale;
}

PatchResult BodyReplicaSet::apply(BodyPatch patch)
{
    auto it = replicas_.find(patch.id);
    if (it == replicas_.end()) {
        auto result = PatchResult::unknown_document(patch.id);
        detail::log_document_error("BodyReplicaSet::apply", patch.id, result.error_message);
        return result;
    }

    Replica& replica = it.value();
    if (replica.stale) {
        return PatchResult::stale_document(patch.id);
    }

    auto result = apply_patch(replica.body, std::move(patch.patch));
    if (!result) {
        replica.stale = true;
        detail::log_document_error("BodyReplicaSet::apply", patch.id, result.error_message);
        if (effects_.on_resync_needed) {
            effects_.on_resync_needed(patch.id, result);
        }
    }
    return result;
}

PatchResult BodyReplicaSet::apply_bytes(const ByteBuffer& buffer)
{
    return apply(deserialize_body_patch(buffer));
}

} // namespace post_body
