#include "telemux/store/memory_chunk_store.hpp"

#include <algorithm>

namespace telemux::store {

MemoryChunkStore::Shard& MemoryChunkStore::shard_for(const chunk::GroupKey& key) {
    return shards_[chunk::GroupKeyHash{}(key) % SHARD_COUNT];
}

InsertResult MemoryChunkStore::insert(const chunk::ChunkRecord& record) {
    auto key = record.key();
    auto& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.groups.find(key);
    if (it == shard.groups.end()) {
        Group group;
        group.device_id = record.device_id;
        group.total_chunks = record.total_chunks;
        group.first_received_at_ms = record.received_at_ms;
        group.expires_at_ms = record.expires_at_ms;
        it = shard.groups.emplace(key, std::move(group)).first;
    }

    auto& group = it->second;

    // All chunks of a group must agree on total and device
    bool mismatch = group.total_chunks != record.total_chunks ||
                    group.device_id != record.device_id ||
                    record.sequence_number >= group.total_chunks;

    // A completed group keeps its identity so late chunks are still checked
    if (group.completed) {
        return {mismatch ? InsertStatus::CONFLICT : InsertStatus::COMPLETED,
                0, group.total_chunks};
    }

    if (group.conflicted || mismatch) {
        group.conflicted = true;
        return {InsertStatus::CONFLICT,
                static_cast<uint32_t>(group.chunks.size()),
                group.total_chunks};
    }

    if (group.chunks.count(record.sequence_number) > 0) {
        return {InsertStatus::DUPLICATE,
                static_cast<uint32_t>(group.chunks.size()),
                group.total_chunks};
    }

    group.chunks.emplace(record.sequence_number, record);
    group.first_received_at_ms = std::min(group.first_received_at_ms, record.received_at_ms);
    group.expires_at_ms = std::min(group.expires_at_ms, record.expires_at_ms);

    return {InsertStatus::INSERTED,
            static_cast<uint32_t>(group.chunks.size()),
            group.total_chunks};
}

uint32_t MemoryChunkStore::count_distinct(const chunk::GroupKey& key) {
    auto& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.groups.find(key);
    if (it == shard.groups.end()) {
        return 0;
    }
    return static_cast<uint32_t>(it->second.chunks.size());
}

std::vector<chunk::ChunkRecord> MemoryChunkStore::fetch_group(const chunk::GroupKey& key) {
    auto& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);

    std::vector<chunk::ChunkRecord> records;
    auto it = shard.groups.find(key);
    if (it == shard.groups.end()) {
        return records;
    }

    records.reserve(it->second.chunks.size());
    for (const auto& [seq, record] : it->second.chunks) {
        records.push_back(record);
    }
    return records;
}

std::optional<std::vector<chunk::ChunkRecord>> MemoryChunkStore::try_claim(
    const chunk::GroupKey& key,
    const std::string& owner,
    uint64_t now_ms,
    uint64_t lease_ms) {
    auto& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.groups.find(key);
    if (it == shard.groups.end()) {
        return std::nullopt;
    }

    auto& group = it->second;
    if (group.completed || group.conflicted || group.chunks.size() != group.total_chunks) {
        return std::nullopt;
    }

    // A live lease means another caller is reassembling
    if (!group.claim_owner.empty() && group.lease_until_ms > now_ms) {
        return std::nullopt;
    }

    group.claim_owner = owner;
    group.lease_until_ms = now_ms + lease_ms;

    std::vector<chunk::ChunkRecord> records;
    records.reserve(group.chunks.size());
    for (const auto& [seq, record] : group.chunks) {
        records.push_back(record);
    }
    return records;
}

bool MemoryChunkStore::release_claim(const chunk::GroupKey& key, const std::string& owner) {
    auto& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.groups.find(key);
    if (it == shard.groups.end() || it->second.claim_owner != owner) {
        return false;
    }

    it->second.claim_owner.clear();
    it->second.lease_until_ms = 0;
    return true;
}

size_t MemoryChunkStore::delete_group(const chunk::GroupKey& key) {
    auto& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.groups.find(key);
    if (it == shard.groups.end()) {
        return 0;
    }

    size_t deleted = it->second.chunks.size();
    shard.groups.erase(it);
    return deleted;
}

size_t MemoryChunkStore::complete_group(const chunk::GroupKey& key, uint64_t retain_until_ms) {
    auto& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.groups.find(key);
    if (it == shard.groups.end()) {
        return 0;
    }

    auto& group = it->second;
    size_t deleted = group.chunks.size();
    group.chunks.clear();
    group.completed = true;
    group.claim_owner.clear();
    group.lease_until_ms = 0;
    group.expires_at_ms = retain_until_ms;
    return deleted;
}

std::vector<ExpiredGroup> MemoryChunkStore::take_expired(uint64_t now_ms) {
    std::vector<ExpiredGroup> expired;

    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);

        for (auto it = shard.groups.begin(); it != shard.groups.end(); ) {
            const auto& group = it->second;
            bool lease_live = !group.claim_owner.empty() && group.lease_until_ms > now_ms;

            if (group.completed && group.expires_at_ms <= now_ms) {
                it = shard.groups.erase(it);
            } else if (group.expires_at_ms <= now_ms && !lease_live) {
                ExpiredGroup entry;
                entry.key = it->first;
                entry.device_id = group.device_id;
                entry.chunks_present = static_cast<uint32_t>(group.chunks.size());
                entry.total_chunks = group.total_chunks;
                entry.conflicted = group.conflicted;
                expired.push_back(std::move(entry));
                it = shard.groups.erase(it);
            } else {
                ++it;
            }
        }
    }

    return expired;
}

std::vector<PendingGroup> MemoryChunkStore::pending_groups(const std::string& tenant_id) {
    std::vector<PendingGroup> pending;

    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);

        for (const auto& [key, group] : shard.groups) {
            if (group.completed || (!tenant_id.empty() && key.tenant_id != tenant_id)) {
                continue;
            }

            PendingGroup entry;
            entry.key = key;
            entry.device_id = group.device_id;
            entry.chunks_present = static_cast<uint32_t>(group.chunks.size());
            entry.total_chunks = group.total_chunks;
            entry.first_received_at_ms = group.first_received_at_ms;
            entry.expires_at_ms = group.expires_at_ms;
            entry.conflicted = group.conflicted;
            entry.claimed = !group.claim_owner.empty();
            pending.push_back(std::move(entry));
        }
    }

    std::sort(pending.begin(), pending.end(),
              [](const PendingGroup& a, const PendingGroup& b) { return a.key < b.key; });
    return pending;
}

size_t MemoryChunkStore::record_count() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (const auto& [key, group] : shard.groups) {
            total += group.chunks.size();
        }
    }
    return total;
}

}  // namespace telemux::store
