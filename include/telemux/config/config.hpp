#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "telemux/ingest/telemetry_demux.hpp"
#include "telemux/store/sqlite_chunk_store.hpp"
#include "telemux/utils/logging.hpp"

namespace telemux::config {

// Everything needed to run one engine instance
struct EngineConfig {
    ingest::DemuxConfig demux;
    store::SqliteStoreConfig store;
    utils::LoggingConfig logging;
    size_t worker_threads = 4;
};

// Parse configuration from an INI file. Missing keys keep their defaults.
std::optional<EngineConfig> load_config(const std::string& path);

// Parse configuration from CLI arguments. A --config file is loaded first and
// every option given on the command line overrides it.
std::optional<EngineConfig> parse_cli(int argc, char* argv[]);

// Save configuration to file
bool save_config(const EngineConfig& config, const std::string& path);

// Merge overlay values that differ from the defaults over base. Used for
// layering config files; a value equal to its default counts as unset.
EngineConfig merge_config(const EngineConfig& base, const EngineConfig& overlay);

// Validate configuration
struct ValidationResult {
    bool valid{true};
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

ValidationResult validate_config(const EngineConfig& config);

}  // namespace telemux::config
