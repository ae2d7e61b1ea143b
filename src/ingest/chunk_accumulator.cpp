#include "telemux/ingest/chunk_accumulator.hpp"

#include <spdlog/spdlog.h>

namespace telemux::ingest {

const char* ingest_error_to_string(IngestError error) {
    switch (error) {
        case IngestError::NONE: return "none";
        case IngestError::INVALID_CHUNK: return "invalid_chunk";
        case IngestError::OUT_OF_RANGE_SEQUENCE: return "out_of_range_sequence";
        case IngestError::PAYLOAD_TOO_LARGE: return "payload_too_large";
        case IngestError::CORRELATION_CONFLICT: return "correlation_conflict";
        case IngestError::STORE_UNAVAILABLE: return "store_unavailable";
        case IngestError::SINK_UNAVAILABLE: return "sink_unavailable";
    }
    return "unknown";
}

const char* ingest_outcome_to_string(IngestOutcome outcome) {
    switch (outcome) {
        case IngestOutcome::INCOMPLETE: return "incomplete";
        case IngestOutcome::REASSEMBLED: return "reassembled";
        case IngestOutcome::ALREADY_HANDLED: return "already_handled";
        case IngestOutcome::REJECTED: return "rejected";
    }
    return "unknown";
}

ChunkAccumulator::ChunkAccumulator(store::ChunkStore& store,
                                   const ReassemblyMerger& merger,
                                   const AccumulatorConfig& config,
                                   std::string owner_token,
                                   utils::Clock clock)
    : store_(store),
      merger_(merger),
      config_(config),
      owner_token_(std::move(owner_token)),
      clock_(std::move(clock)) {
}

void ChunkAccumulator::set_conflict_callback(ConflictCallback callback) {
    conflict_callback_ = std::move(callback);
}

IngestError ChunkAccumulator::validate(const chunk::ChunkSubmission& submission) const {
    if (submission.tenant_id.empty() || submission.device_id.empty()) {
        return IngestError::INVALID_CHUNK;
    }
    if (submission.total_chunks == 0 ||
        submission.total_chunks > config_.max_chunks_per_message) {
        return IngestError::INVALID_CHUNK;
    }
    // A fragmented message must name its group
    if (submission.total_chunks > 1 && submission.correlation_id.empty()) {
        return IngestError::INVALID_CHUNK;
    }
    // Zero-based: [0, total_chunks)
    if (submission.sequence_number >= submission.total_chunks) {
        return IngestError::OUT_OF_RANGE_SEQUENCE;
    }
    if (submission.payload.size() > config_.max_fragment_bytes) {
        return IngestError::PAYLOAD_TOO_LARGE;
    }
    return IngestError::NONE;
}

IngestResult ChunkAccumulator::ingest(const chunk::ChunkSubmission& submission) {
    IngestResult result;

    result.error = validate(submission);
    if (result.error != IngestError::NONE) {
        spdlog::debug("Rejected chunk {}/{} seq {} of {}: {}",
                      submission.tenant_id, submission.correlation_id,
                      submission.sequence_number, submission.total_chunks,
                      ingest_error_to_string(result.error));
        return result;
    }

    auto key = submission.key();
    auto record = chunk::make_record(submission, config_.ttl_ms);
    // Submissions without a receive time are stamped on entry
    if (record.received_at_ms == 0) {
        record.received_at_ms = clock_();
        record.expires_at_ms = record.received_at_ms + config_.ttl_ms;
    }

    store::InsertResult inserted;
    try {
        inserted = store_.insert(record);
    } catch (const store::StoreError& e) {
        spdlog::error("Chunk store insert failed for {}/{}: {}",
                      key.tenant_id, key.correlation_id, e.what());
        result.error = IngestError::STORE_UNAVAILABLE;
        return result;
    }

    if (inserted.status == store::InsertStatus::CONFLICT) {
        spdlog::warn("Correlation conflict on {}/{} from device {}: chunk declares {} chunks, "
                     "group declares {}",
                     key.tenant_id, key.correlation_id, submission.device_id,
                     submission.total_chunks, inserted.total_chunks);
        if (conflict_callback_) {
            chunk::CorrelationConflictEvent event;
            event.tenant_id = key.tenant_id;
            event.device_id = submission.device_id;
            event.correlation_id = key.correlation_id;
            event.declared_total = submission.total_chunks;
            event.existing_total = inserted.total_chunks;
            event.detected_at_ms = clock_();
            conflict_callback_(event);
        }
        result.error = IngestError::CORRELATION_CONFLICT;
        return result;
    }

    // Late chunk for a group that was already reassembled
    if (inserted.status == store::InsertStatus::COMPLETED) {
        spdlog::debug("Absorbed late chunk {}/{} seq {}",
                      key.tenant_id, key.correlation_id, submission.sequence_number);
        result.outcome = IngestOutcome::ALREADY_HANDLED;
        result.duplicate = true;
        return result;
    }

    result.duplicate = inserted.status == store::InsertStatus::DUPLICATE;

    if (inserted.distinct_chunks < inserted.total_chunks) {
        result.outcome = IngestOutcome::INCOMPLETE;
        return result;
    }

    // Every caller that sees a complete group races for the claim; the store
    // lets exactly one through while the lease is live.
    std::optional<std::vector<chunk::ChunkRecord>> claimed;
    uint64_t now_ms = clock_();
    try {
        claimed = store_.try_claim(key, owner_token_, now_ms, config_.claim_lease_ms);
    } catch (const store::StoreError& e) {
        spdlog::error("Claim failed for {}/{}: {}", key.tenant_id, key.correlation_id, e.what());
        result.error = IngestError::STORE_UNAVAILABLE;
        return result;
    }

    if (!claimed) {
        spdlog::debug("Claim lost for {}/{}", key.tenant_id, key.correlation_id);
        result.outcome = IngestOutcome::ALREADY_HANDLED;
        return result;
    }

    auto merged = merger_.merge(std::move(*claimed), inserted.total_chunks);

    chunk::ReassembledMessage message;
    message.tenant_id = key.tenant_id;
    message.device_id = submission.device_id;
    message.correlation_id = key.correlation_id;
    message.payload = std::move(merged.payload);
    message.chunk_count = merged.chunk_count;
    message.first_received_at_ms = merged.first_received_at_ms;
    message.completed_at_ms = now_ms;
    message.partial = merged.partial;
    message.source = submission.source;
    message.topic = submission.topic;
    message.client_id = submission.client_id;

    spdlog::debug("Reassembled {}/{}: {} chunks, {} bytes",
                  key.tenant_id, key.correlation_id, message.chunk_count, message.payload.size());

    result.outcome = IngestOutcome::REASSEMBLED;
    result.message = std::move(message);
    return result;
}

bool ChunkAccumulator::complete(const chunk::GroupKey& key) {
    try {
        store_.complete_group(key, clock_() + config_.ttl_ms);
        return true;
    } catch (const store::StoreError& e) {
        spdlog::error("Failed to mark reassembled group {}/{}, leaving it to expire: {}",
                      key.tenant_id, key.correlation_id, e.what());
        return false;
    }
}

bool ChunkAccumulator::release(const chunk::GroupKey& key) {
    try {
        return store_.release_claim(key, owner_token_);
    } catch (const store::StoreError& e) {
        spdlog::error("Failed to release claim on {}/{}, lease will lapse: {}",
                      key.tenant_id, key.correlation_id, e.what());
        return false;
    }
}

}  // namespace telemux::ingest
