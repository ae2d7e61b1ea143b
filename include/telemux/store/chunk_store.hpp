#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "telemux/chunk/chunk.hpp"

namespace telemux::store {

// Thrown by storage backends when the durable store cannot be reached or a
// statement fails. Ingestion is idempotent, so callers may retry.
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class InsertStatus {
    INSERTED,
    DUPLICATE,  // Same (group, sequence) already stored; nothing changed
    CONFLICT,   // Group declares a different total or device, or is poisoned
    COMPLETED   // Group was already reassembled; a matching late chunk is absorbed
};

struct InsertResult {
    InsertStatus status{InsertStatus::INSERTED};
    uint32_t distinct_chunks{0};  // Distinct sequence numbers stored after the insert
    uint32_t total_chunks{0};     // Total declared by the group
};

// Group removed by take_expired()
struct ExpiredGroup {
    chunk::GroupKey key;
    std::string device_id;
    uint32_t chunks_present{0};
    uint32_t total_chunks{0};
    bool conflicted{false};
};

// Snapshot of a group still waiting for chunks
struct PendingGroup {
    chunk::GroupKey key;
    std::string device_id;
    uint32_t chunks_present{0};
    uint32_t total_chunks{0};
    uint64_t first_received_at_ms{0};
    uint64_t expires_at_ms{0};
    bool conflicted{false};
    bool claimed{false};
};

// Shared storage for chunk records. All coordination between concurrent
// ingestions (and between engine instances sharing a backend) goes through
// this interface; every method is atomic with respect to one group.
class ChunkStore {
public:
    virtual ~ChunkStore() = default;

    // Insert with dedup on (tenant, correlation, sequence). The distinct count
    // is taken in the same atomic step as the insert.
    virtual InsertResult insert(const chunk::ChunkRecord& record) = 0;

    // Distinct sequence numbers currently stored for the group
    virtual uint32_t count_distinct(const chunk::GroupKey& key) = 0;

    // All records of the group, ordered by sequence number
    virtual std::vector<chunk::ChunkRecord> fetch_group(const chunk::GroupKey& key) = 0;

    // Claim a complete group for reassembly. Succeeds for exactly one caller
    // while the lease is live; returns the group's records on success.
    virtual std::optional<std::vector<chunk::ChunkRecord>> try_claim(
        const chunk::GroupKey& key,
        const std::string& owner,
        uint64_t now_ms,
        uint64_t lease_ms) = 0;

    // Drop a lease held by owner, keeping the records
    virtual bool release_claim(const chunk::GroupKey& key, const std::string& owner) = 0;

    // Delete all records and the lease of a group. Returns records deleted.
    virtual size_t delete_group(const chunk::GroupKey& key) = 0;

    // Delete the records of a reassembled group but remember it as completed
    // until retain_until_ms, so late duplicates are absorbed instead of
    // starting a new group. A late chunk that disagrees with the completed
    // group's total or device is still a CONFLICT. Returns records deleted.
    virtual size_t complete_group(const chunk::GroupKey& key, uint64_t retain_until_ms) = 0;

    // Atomically remove every group whose oldest record expired at or before
    // now_ms and which has no live lease. Completed markers past their
    // retention are dropped without being reported.
    virtual std::vector<ExpiredGroup> take_expired(uint64_t now_ms) = 0;

    // Incomplete groups for a tenant (all tenants when tenant_id is empty)
    virtual std::vector<PendingGroup> pending_groups(const std::string& tenant_id) = 0;
};

}  // namespace telemux::store
