#include "telemux/ingest/telemetry_demux.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

#include <spdlog/spdlog.h>

#include "telemux/crypto/crypto.hpp"

namespace telemux::ingest {

TelemetryDemux::TelemetryDemux(store::ChunkStore& store,
                               audit::RawAuditLog& audit_log,
                               DownstreamSink& sink,
                               const DemuxConfig& config,
                               utils::Clock clock)
    : store_(store),
      audit_log_(audit_log),
      sink_(sink),
      config_(config),
      clock_(std::move(clock)),
      instance_id_(crypto::random_owner_token()),
      merger_(config.merger),
      accumulator_(store, merger_, config.accumulator, instance_id_, clock_),
      sweeper_(store, config.sweeper, clock_) {

    accumulator_.set_conflict_callback([this](const chunk::CorrelationConflictEvent& event) {
        if (conflict_callback_) {
            conflict_callback_(event);
        }
    });

    sweeper_.set_abandon_callback([this](const chunk::AbandonedGroupEvent& event) {
        ++groups_abandoned_;
        chunks_swept_ += event.chunks_present;
        if (abandon_callback_) {
            abandon_callback_(event);
        }
    });

    spdlog::info("Telemetry demux ready (instance: {}, ttl: {} ms, lease: {} ms)",
                 instance_id_, config_.accumulator.ttl_ms, config_.accumulator.claim_lease_ms);
}

TelemetryDemux::~TelemetryDemux() {
    sweeper_.stop();
}

void TelemetryDemux::set_conflict_callback(ConflictCallback callback) {
    conflict_callback_ = std::move(callback);
}

void TelemetryDemux::set_abandon_callback(AbandonCallback callback) {
    abandon_callback_ = std::move(callback);
}

IngestResult TelemetryDemux::submit(const chunk::ChunkSubmission& submission) {
    ++chunks_received_;

    if (submission.total_chunks == 1) {
        return submit_unfragmented(submission);
    }

    auto result = accumulator_.ingest(submission);
    if (result.duplicate) {
        ++duplicates_;
    }
    if (!result.ok()) {
        count_error(result.error);
        return result;
    }

    if (result.outcome == IngestOutcome::ALREADY_HANDLED && !result.duplicate) {
        ++claims_lost_;
    }
    if (result.outcome != IngestOutcome::REASSEMBLED) {
        return result;
    }

    const auto& message = *result.message;
    auto key = chunk::GroupKey{message.tenant_id, message.correlation_id};

    if (!hand_off(message)) {
        // Keep the chunks; a redelivered chunk claims the group again
        accumulator_.release(key);
        ++sink_failures_;
        result.outcome = IngestOutcome::REJECTED;
        result.error = IngestError::SINK_UNAVAILABLE;
        result.message.reset();
        return result;
    }

    accumulator_.complete(key);
    ++reassembled_;
    return result;
}

IngestResult TelemetryDemux::submit_unfragmented(const chunk::ChunkSubmission& submission) {
    IngestResult result;
    result.error = accumulator_.validate(submission);
    if (result.error != IngestError::NONE) {
        count_error(result.error);
        return result;
    }

    chunk::ReassembledMessage message;
    message.tenant_id = submission.tenant_id;
    message.device_id = submission.device_id;
    message.correlation_id = submission.correlation_id;
    message.payload = submission.payload;
    message.chunk_count = 1;
    message.completed_at_ms = clock_();
    message.first_received_at_ms =
        submission.received_at_ms != 0 ? submission.received_at_ms : message.completed_at_ms;
    message.source = submission.source;
    message.topic = submission.topic;
    message.client_id = submission.client_id;

    if (!hand_off(message)) {
        ++sink_failures_;
        result.error = IngestError::SINK_UNAVAILABLE;
        return result;
    }

    ++unfragmented_delivered_;
    result.outcome = IngestOutcome::REASSEMBLED;
    result.message = std::move(message);
    return result;
}

void TelemetryDemux::write_audit(const chunk::ReassembledMessage& message) {
    uint32_t attempts = std::max<uint32_t>(config_.audit_retry_attempts, 1);

    for (uint32_t attempt = 1; attempt <= attempts; ++attempt) {
        try {
            audit_log_.append(message, clock_());
            return;
        } catch (const store::StoreError& e) {
            spdlog::warn("Audit write for {}/{} failed (attempt {}/{}): {}",
                         message.tenant_id, message.correlation_id, attempt, attempts, e.what());
        }
        if (attempt < attempts && config_.audit_retry_backoff_ms > 0) {
            std::this_thread::sleep_for(
                std::chrono::milliseconds(config_.audit_retry_backoff_ms * attempt));
        }
    }

    // The audit trail is best effort: delivery continues without it
    ++audit_failures_;
    spdlog::error("Audit record lost for {}/{} from device {} ({} bytes)",
                  message.tenant_id, message.correlation_id, message.device_id,
                  message.payload.size());
}

// The audit row follows a successful delivery, so a refused message that is
// produced again on redelivery is recorded once
bool TelemetryDemux::hand_off(const chunk::ReassembledMessage& message) {
    bool delivered = false;
    try {
        delivered = sink_.deliver(message);
        if (!delivered) {
            spdlog::warn("Sink refused message {}/{} from device {}",
                         message.tenant_id, message.correlation_id, message.device_id);
        }
    } catch (const std::exception& e) {
        spdlog::error("Sink failed on message {}/{}: {}",
                      message.tenant_id, message.correlation_id, e.what());
    }

    if (delivered) {
        write_audit(message);
    }
    return delivered;
}

void TelemetryDemux::count_error(IngestError error) {
    switch (error) {
        case IngestError::CORRELATION_CONFLICT:
            ++conflicts_;
            break;
        case IngestError::STORE_UNAVAILABLE:
            ++store_errors_;
            break;
        case IngestError::SINK_UNAVAILABLE:
            ++sink_failures_;
            break;
        case IngestError::INVALID_CHUNK:
        case IngestError::OUT_OF_RANGE_SEQUENCE:
        case IngestError::PAYLOAD_TOO_LARGE:
            ++rejected_;
            break;
        case IngestError::NONE:
            break;
    }
}

void TelemetryDemux::start_sweeper() {
    sweeper_.start();
}

void TelemetryDemux::stop_sweeper() {
    sweeper_.stop();
}

size_t TelemetryDemux::sweep_once() {
    return sweeper_.sweep_once();
}

size_t TelemetryDemux::sweep_once(uint64_t now_ms) {
    return sweeper_.sweep_once(now_ms);
}

DemuxStats TelemetryDemux::stats() const {
    DemuxStats stats;
    stats.chunks_received = chunks_received_;
    stats.duplicates = duplicates_;
    stats.conflicts = conflicts_;
    stats.rejected = rejected_;
    stats.reassembled = reassembled_;
    stats.claims_lost = claims_lost_;
    stats.unfragmented_delivered = unfragmented_delivered_;
    stats.store_errors = store_errors_;
    stats.sink_failures = sink_failures_;
    stats.audit_failures = audit_failures_;
    stats.groups_abandoned = groups_abandoned_;
    stats.chunks_swept = chunks_swept_;
    return stats;
}

}  // namespace telemux::ingest
