#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "telemux/chunk/chunk.hpp"
#include "telemux/store/sqlite_chunk_store.hpp"

namespace telemux::audit {

// Row of the raw audit log as read back for inspection
struct RawAuditEntry {
    int64_t id{0};
    chunk::ReassembledMessage message;
    size_t payload_size_bytes{0};
    std::string payload_digest;  // Hex BLAKE2b-256
    uint64_t created_at_ms{0};
};

// Append-only record of every accepted message. Implementations throw
// store::StoreError when the write cannot be made durable.
class RawAuditLog {
public:
    virtual ~RawAuditLog() = default;

    virtual void append(const chunk::ReassembledMessage& message, uint64_t created_at_ms) = 0;
};

// Raw audit log in the telemetry_raw table. Rows cannot be updated; deletion
// is left to an external retention job.
class SqliteRawAuditLog : public RawAuditLog {
public:
    explicit SqliteRawAuditLog(const store::SqliteStoreConfig& config);
    ~SqliteRawAuditLog() override;

    SqliteRawAuditLog(const SqliteRawAuditLog&) = delete;
    SqliteRawAuditLog& operator=(const SqliteRawAuditLog&) = delete;

    void append(const chunk::ReassembledMessage& message, uint64_t created_at_ms) override;

    // Entries for one correlation group, oldest first
    std::vector<RawAuditEntry> find_by_correlation(const chunk::GroupKey& key);

    // Most recent entries for a device, newest first
    std::vector<RawAuditEntry> recent_for_device(const std::string& device_id, size_t limit);

    // Number of entries for a tenant (all tenants when empty)
    size_t count(const std::string& tenant_id);

private:
    std::unique_ptr<store::detail::ConnectionPool> pool_;
};

}  // namespace telemux::audit
