#include "telemux/ingest/reassembly_merger.hpp"

#include <algorithm>
#include <limits>

#include <spdlog/spdlog.h>

namespace telemux::ingest {

ReassemblyMerger::ReassemblyMerger(const MergerConfig& config)
    : config_(config) {
}

MergeResult ReassemblyMerger::merge(std::vector<chunk::ChunkRecord> records,
                                    uint32_t total_chunks) const {
    MergeResult result;
    if (records.empty()) {
        result.partial = true;
        result.anomalies.push_back("no chunks to merge");
        return result;
    }

    // Stable so that repeated sequence numbers keep their store order
    std::stable_sort(records.begin(), records.end(),
                     [](const chunk::ChunkRecord& a, const chunk::ChunkRecord& b) {
                         return a.sequence_number < b.sequence_number;
                     });

    size_t total_bytes = 0;
    for (const auto& record : records) {
        total_bytes += record.payload.size();
    }
    result.payload.reserve(total_bytes);
    result.first_received_at_ms = std::numeric_limits<uint64_t>::max();

    uint32_t expected = 0;
    bool have_previous = false;
    uint32_t previous = 0;

    for (const auto& record : records) {
        if (have_previous && record.sequence_number == previous) {
            result.partial = true;
            result.anomalies.push_back(
                "repeated sequence number " + std::to_string(record.sequence_number));
            continue;
        }

        if (record.sequence_number != expected) {
            result.partial = true;
            result.anomalies.push_back(
                "missing sequence numbers " + std::to_string(expected) + ".." +
                std::to_string(record.sequence_number - 1));
        }

        result.payload.insert(result.payload.end(), record.payload.begin(), record.payload.end());
        result.first_received_at_ms = std::min(result.first_received_at_ms, record.received_at_ms);
        ++result.chunk_count;

        previous = record.sequence_number;
        have_previous = true;
        expected = record.sequence_number + 1;
    }

    if (result.chunk_count != total_chunks) {
        result.partial = true;
        result.anomalies.push_back(
            "merged " + std::to_string(result.chunk_count) + " of " +
            std::to_string(total_chunks) + " declared chunks");
    }

    if (result.payload.size() > config_.max_message_bytes) {
        result.partial = true;
        result.anomalies.push_back(
            "merged payload of " + std::to_string(result.payload.size()) +
            " bytes exceeds limit of " + std::to_string(config_.max_message_bytes));
    }

    for (const auto& anomaly : result.anomalies) {
        spdlog::warn("Reassembly anomaly for {}/{}: {}",
                     records.front().tenant_id, records.front().correlation_id, anomaly);
    }

    return result;
}

}  // namespace telemux::ingest
