#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "telemux/chunk/chunk.hpp"
#include "telemux/ingest/reassembly_merger.hpp"
#include "telemux/store/chunk_store.hpp"
#include "telemux/utils/time.hpp"

namespace telemux::ingest {

struct AccumulatorConfig {
    uint64_t ttl_ms = 60000;                  // Deadline for an incomplete group
    uint64_t claim_lease_ms = 30000;          // Lifetime of a reassembly claim
    size_t max_fragment_bytes = 256 * 1024;   // Per-chunk payload limit
    uint32_t max_chunks_per_message = 4096;
};

enum class IngestOutcome {
    INCOMPLETE,       // Stored, group still waiting for chunks
    REASSEMBLED,      // This call won the claim and produced the message
    ALREADY_HANDLED,  // Another caller holds the claim or already reassembled
    REJECTED          // Not stored
};

enum class IngestError {
    NONE,
    INVALID_CHUNK,         // Missing attribution or zero total
    OUT_OF_RANGE_SEQUENCE,
    PAYLOAD_TOO_LARGE,
    CORRELATION_CONFLICT,
    STORE_UNAVAILABLE,     // Retry: ingestion is idempotent
    SINK_UNAVAILABLE       // Retry: the claim was released
};

const char* ingest_error_to_string(IngestError error);
const char* ingest_outcome_to_string(IngestOutcome outcome);

struct IngestResult {
    IngestOutcome outcome{IngestOutcome::REJECTED};
    IngestError error{IngestError::NONE};
    bool duplicate{false};  // Same sequence number was already stored
    std::optional<chunk::ReassembledMessage> message;

    [[nodiscard]] bool ok() const { return error == IngestError::NONE; }
};

// Reassembly state machine for fragmented messages. Holds no group state of
// its own: completeness and claims are derived from the chunk store, so any
// number of accumulators (threads or processes) may share one store.
class ChunkAccumulator {
public:
    using ConflictCallback = std::function<void(const chunk::CorrelationConflictEvent& event)>;

    ChunkAccumulator(store::ChunkStore& store,
                     const ReassemblyMerger& merger,
                     const AccumulatorConfig& config,
                     std::string owner_token,
                     utils::Clock clock = utils::system_clock());

    void set_conflict_callback(ConflictCallback callback);

    // Store one chunk and, when it completes its group, claim and merge it.
    // Safe to call concurrently and to retry after any failure.
    IngestResult ingest(const chunk::ChunkSubmission& submission);

    // Called by the owner once the message was handed off: deletes the chunks
    // and keeps a completion marker for one TTL so late duplicates are
    // absorbed. A failure is logged; the rows are left for the sweeper.
    bool complete(const chunk::GroupKey& key);

    // Called when hand-off failed: releases the claim, keeping the rows so a
    // redelivered chunk can claim the group again.
    bool release(const chunk::GroupKey& key);

    // Checks that do not need the store
    [[nodiscard]] IngestError validate(const chunk::ChunkSubmission& submission) const;

    [[nodiscard]] const AccumulatorConfig& config() const { return config_; }
    [[nodiscard]] const std::string& owner_token() const { return owner_token_; }

private:
    store::ChunkStore& store_;
    const ReassemblyMerger& merger_;
    AccumulatorConfig config_;
    std::string owner_token_;
    utils::Clock clock_;
    ConflictCallback conflict_callback_;
};

}  // namespace telemux::ingest
