#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

#include "telemux/audit/raw_audit_log.hpp"
#include "telemux/chunk/chunk.hpp"
#include "telemux/ingest/chunk_accumulator.hpp"
#include "telemux/ingest/downstream_sink.hpp"
#include "telemux/ingest/expiry_sweeper.hpp"
#include "telemux/ingest/reassembly_merger.hpp"
#include "telemux/store/chunk_store.hpp"
#include "telemux/utils/time.hpp"

namespace telemux::ingest {

struct DemuxConfig {
    AccumulatorConfig accumulator;
    MergerConfig merger;
    SweeperConfig sweeper;
    uint32_t audit_retry_attempts = 3;
    uint64_t audit_retry_backoff_ms = 50;
};

struct DemuxStats {
    uint64_t chunks_received{0};
    uint64_t duplicates{0};
    uint64_t conflicts{0};
    uint64_t rejected{0};
    uint64_t reassembled{0};
    uint64_t claims_lost{0};
    uint64_t unfragmented_delivered{0};
    uint64_t store_errors{0};
    uint64_t sink_failures{0};
    uint64_t audit_failures{0};
    uint64_t groups_abandoned{0};
    uint64_t chunks_swept{0};
};

// Entry point of the ingestion pipeline. Unfragmented messages go straight to
// the audit log and the sink; fragments go through the accumulator, and the
// caller that completes a group delivers it. Thread-safe.
class TelemetryDemux {
public:
    using ConflictCallback = ChunkAccumulator::ConflictCallback;
    using AbandonCallback = ExpirySweeper::AbandonCallback;

    TelemetryDemux(store::ChunkStore& store,
                   audit::RawAuditLog& audit_log,
                   DownstreamSink& sink,
                   const DemuxConfig& config,
                   utils::Clock clock = utils::system_clock());
    ~TelemetryDemux();

    TelemetryDemux(const TelemetryDemux&) = delete;
    TelemetryDemux& operator=(const TelemetryDemux&) = delete;

    void set_conflict_callback(ConflictCallback callback);
    void set_abandon_callback(AbandonCallback callback);

    // Process one submission. On SINK_UNAVAILABLE or STORE_UNAVAILABLE the
    // caller should redeliver; every path is idempotent.
    IngestResult submit(const chunk::ChunkSubmission& submission);

    // Background expiry
    void start_sweeper();
    void stop_sweeper();
    size_t sweep_once();
    size_t sweep_once(uint64_t now_ms);

    [[nodiscard]] DemuxStats stats() const;
    [[nodiscard]] const DemuxConfig& config() const { return config_; }
    [[nodiscard]] const std::string& instance_id() const { return instance_id_; }

private:
    store::ChunkStore& store_;
    audit::RawAuditLog& audit_log_;
    DownstreamSink& sink_;
    DemuxConfig config_;
    utils::Clock clock_;
    std::string instance_id_;

    ReassemblyMerger merger_;
    ChunkAccumulator accumulator_;
    ExpirySweeper sweeper_;

    ConflictCallback conflict_callback_;
    AbandonCallback abandon_callback_;

    std::atomic<uint64_t> chunks_received_{0};
    std::atomic<uint64_t> duplicates_{0};
    std::atomic<uint64_t> conflicts_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> reassembled_{0};
    std::atomic<uint64_t> claims_lost_{0};
    std::atomic<uint64_t> unfragmented_delivered_{0};
    std::atomic<uint64_t> store_errors_{0};
    std::atomic<uint64_t> sink_failures_{0};
    std::atomic<uint64_t> audit_failures_{0};
    std::atomic<uint64_t> groups_abandoned_{0};
    std::atomic<uint64_t> chunks_swept_{0};

    IngestResult submit_unfragmented(const chunk::ChunkSubmission& submission);
    void write_audit(const chunk::ReassembledMessage& message);
    bool hand_off(const chunk::ReassembledMessage& message);
    void count_error(IngestError error);
};

}  // namespace telemux::ingest
