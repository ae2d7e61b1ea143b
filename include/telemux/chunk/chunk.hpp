#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace telemux::chunk {

using Payload = std::vector<uint8_t>;

// How a message reached the transport layer
enum class IngestionSource : uint8_t {
    MQTT,
    HTTP,
    BRIDGE
};

const char* ingestion_source_to_string(IngestionSource source);
IngestionSource string_to_ingestion_source(const std::string& str);

// A correlation group is identified by tenant + correlation id.
// Chunks from different tenants never share a group.
struct GroupKey {
    std::string tenant_id;
    std::string correlation_id;

    bool operator==(const GroupKey& other) const {
        return tenant_id == other.tenant_id && correlation_id == other.correlation_id;
    }

    bool operator<(const GroupKey& other) const {
        if (tenant_id != other.tenant_id) {
            return tenant_id < other.tenant_id;
        }
        return correlation_id < other.correlation_id;
    }
};

struct GroupKeyHash {
    size_t operator()(const GroupKey& key) const {
        size_t h = std::hash<std::string>{}(key.tenant_id);
        h ^= std::hash<std::string>{}(key.correlation_id) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};

// Normalized chunk as handed over by the transport
struct ChunkSubmission {
    std::string tenant_id;
    std::string device_id;
    std::string correlation_id;
    uint32_t sequence_number{0};   // Zero-based
    uint32_t total_chunks{1};
    Payload payload;
    uint64_t received_at_ms{0};    // Unix epoch

    IngestionSource source{IngestionSource::MQTT};
    std::string topic;
    std::string client_id;

    [[nodiscard]] GroupKey key() const { return {tenant_id, correlation_id}; }
};

// One stored fragment
struct ChunkRecord {
    std::string tenant_id;
    std::string device_id;
    std::string correlation_id;
    uint32_t sequence_number{0};
    uint32_t total_chunks{0};
    Payload payload;
    uint64_t received_at_ms{0};
    uint64_t expires_at_ms{0};

    [[nodiscard]] GroupKey key() const { return {tenant_id, correlation_id}; }
};

// Fully reconstructed (or originally unfragmented) logical message
struct ReassembledMessage {
    std::string tenant_id;
    std::string device_id;
    std::string correlation_id;
    Payload payload;
    uint32_t chunk_count{0};
    uint64_t first_received_at_ms{0};
    uint64_t completed_at_ms{0};
    bool partial{false};  // Merged despite gaps or size anomalies

    IngestionSource source{IngestionSource::MQTT};
    std::string topic;
    std::string client_id;
};

// Emitted once per incomplete group removed by the sweeper
struct AbandonedGroupEvent {
    std::string tenant_id;
    std::string device_id;
    std::string correlation_id;
    uint32_t chunks_present{0};
    uint32_t total_chunks_declared{0};
    uint64_t abandoned_at_ms{0};
    bool conflicted{false};
};

// Raised when a chunk disagrees with the group it claims to belong to
struct CorrelationConflictEvent {
    std::string tenant_id;
    std::string device_id;
    std::string correlation_id;
    uint32_t declared_total{0};   // Total carried by the rejected chunk
    uint32_t existing_total{0};   // Total recorded for the group
    uint64_t detected_at_ms{0};
};

// Builds a record from a submission, stamping the expiry deadline
ChunkRecord make_record(const ChunkSubmission& submission, uint64_t ttl_ms);

}  // namespace telemux::chunk
