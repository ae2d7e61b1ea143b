#pragma once

#include <memory>
#include <string>

#include "telemux/store/chunk_store.hpp"

namespace telemux::store {

namespace detail {
class ConnectionPool;
}

struct SqliteStoreConfig {
    std::string path = "telemux.db";   // Database file shared by all engine instances
    int busy_timeout_ms = 5000;        // Wait for other writers before failing
    std::string journal_mode = "WAL";
    size_t pool_size = 4;              // Connections held by this process
};

// Durable chunk store on SQLite. Every operation runs in its own
// BEGIN IMMEDIATE transaction, so several processes can share one file.
class SqliteChunkStore : public ChunkStore {
public:
    explicit SqliteChunkStore(const SqliteStoreConfig& config);
    ~SqliteChunkStore() override;

    SqliteChunkStore(const SqliteChunkStore&) = delete;
    SqliteChunkStore& operator=(const SqliteChunkStore&) = delete;

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

private:
    SqliteStoreConfig config_;
    std::unique_ptr<detail::ConnectionPool> pool_;

    void ensure_schema();
};

}  // namespace telemux::store
