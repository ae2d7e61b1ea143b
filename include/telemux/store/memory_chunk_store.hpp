#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

#include "telemux/store/chunk_store.hpp"

namespace telemux::store {

// In-process chunk store. State is split into shards keyed by a hash of the
// group key, so unrelated groups never share a lock.
class MemoryChunkStore : public ChunkStore {
public:
    static constexpr size_t SHARD_COUNT = 64;

    MemoryChunkStore() = default;

    MemoryChunkStore(const MemoryChunkStore&) = delete;
    MemoryChunkStore& operator=(const MemoryChunkStore&) = delete;

    InsertResult insert(const chunk::ChunkRecord& record) override;
    uint32_t count_distinct(const chunk::GroupKey& key) override;
    std::vector<chunk::ChunkRecord> fetch_group(const chunk::GroupKey& key) override;
    std::optional<std::vector<chunk::ChunkRecord>> try_claim(
        const chunk::GroupKey& key,
        const std::string& owner,
        uint64_t now_ms,
        uint64_t lease_ms) override;
    bool release_claim(const chunk::GroupKey& key, const std::string& owner) override;
    size_t delete_group(const chunk::GroupKey& key) override;
    size_t complete_group(const chunk::GroupKey& key, uint64_t retain_until_ms) override;
    std::vector<ExpiredGroup> take_expired(uint64_t now_ms) override;
    std::vector<PendingGroup> pending_groups(const std::string& tenant_id) override;

    // Total records across all groups
    [[nodiscard]] size_t record_count() const;

private:
    struct Group {
        std::string device_id;
        uint32_t total_chunks{0};
        std::map<uint32_t, chunk::ChunkRecord> chunks;
        uint64_t first_received_at_ms{0};
        uint64_t expires_at_ms{0};  // Earliest record expiry
        bool conflicted{false};
        bool completed{false};
        std::string claim_owner;
        uint64_t lease_until_ms{0};
    };

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<chunk::GroupKey, Group, chunk::GroupKeyHash> groups;
    };

    std::array<Shard, SHARD_COUNT> shards_;

    Shard& shard_for(const chunk::GroupKey& key);
};

}  // namespace telemux::store
