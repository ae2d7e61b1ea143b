#include "telemux/chunk/chunk.hpp"

#include <algorithm>
#include <cctype>

namespace telemux::chunk {

const char* ingestion_source_to_string(IngestionSource source) {
    switch (source) {
        case IngestionSource::MQTT: return "mqtt";
        case IngestionSource::HTTP: return "http";
        case IngestionSource::BRIDGE: return "bridge";
    }
    return "mqtt";
}

IngestionSource string_to_ingestion_source(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "http") return IngestionSource::HTTP;
    if (lower == "bridge") return IngestionSource::BRIDGE;
    return IngestionSource::MQTT;
}

ChunkRecord make_record(const ChunkSubmission& submission, uint64_t ttl_ms) {
    ChunkRecord record;
    record.tenant_id = submission.tenant_id;
    record.device_id = submission.device_id;
    record.correlation_id = submission.correlation_id;
    record.sequence_number = submission.sequence_number;
    record.total_chunks = submission.total_chunks;
    record.payload = submission.payload;
    record.received_at_ms = submission.received_at_ms;
    record.expires_at_ms = submission.received_at_ms + ttl_ms;
    return record;
}

}  // namespace telemux::chunk
