#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "telemux/chunk/chunk.hpp"

namespace telemux::ingest {

struct MergerConfig {
    size_t max_message_bytes = 8 * 1024 * 1024;  // Anomaly threshold for merged payloads
};

struct MergeResult {
    chunk::Payload payload;
    uint32_t chunk_count{0};
    uint64_t first_received_at_ms{0};
    bool partial{false};                 // Any anomaly was found
    std::vector<std::string> anomalies;
};

// Orders a claimed chunk set by sequence number and concatenates the
// fragments. Never fails: anomalies are reported next to a best-effort payload.
class ReassemblyMerger {
public:
    explicit ReassemblyMerger(const MergerConfig& config = {});

    [[nodiscard]] MergeResult merge(std::vector<chunk::ChunkRecord> records,
                                    uint32_t total_chunks) const;

    [[nodiscard]] const MergerConfig& config() const { return config_; }

private:
    MergerConfig config_;
};

}  // namespace telemux::ingest
