#include "telemux/config/config.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace telemux::config {

namespace {

// Simple INI parser
class IniParser {
public:
    struct Entry {
        std::string section;
        std::string key;
        std::string value;
        size_t line{0};
    };

    static std::vector<Entry> parse(std::istream& input) {
        std::vector<Entry> entries;
        std::string current_section;
        std::string line;
        size_t line_number = 0;

        while (std::getline(input, line)) {
            ++line_number;
            line.erase(0, line.find_first_not_of(" \t\r\n"));
            line.erase(line.find_last_not_of(" \t\r\n") + 1);

            // Skip empty lines and comments
            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            if (line[0] == '[' && line.back() == ']') {
                current_section = line.substr(1, line.size() - 2);
                continue;
            }

            auto eq_pos = line.find('=');
            if (eq_pos != std::string::npos) {
                std::string key = line.substr(0, eq_pos);
                std::string value = line.substr(eq_pos + 1);

                key.erase(key.find_last_not_of(" \t") + 1);
                value.erase(0, value.find_first_not_of(" \t"));

                // Remove quotes
                if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                    value = value.substr(1, value.size() - 2);
                }

                entries.push_back({current_section, key, value, line_number});
            }
        }

        return entries;
    }
};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

uint64_t seconds_to_ms(const std::string& value) {
    return std::stoull(value) * 1000;
}

// Returns false for keys this version does not know
bool apply_entry(EngineConfig& config, const std::string& section,
                 const std::string& key, const std::string& value) {
    auto& accumulator = config.demux.accumulator;

    if (section == "engine" || section.empty()) {
        if (key == "ttl_seconds") {
            accumulator.ttl_ms = seconds_to_ms(value);
        } else if (key == "sweep_interval_seconds") {
            config.demux.sweeper.sweep_interval_ms = seconds_to_ms(value);
        } else if (key == "claim_lease_seconds") {
            accumulator.claim_lease_ms = seconds_to_ms(value);
        } else if (key == "max_fragment_bytes") {
            accumulator.max_fragment_bytes = std::stoull(value);
        } else if (key == "max_message_bytes") {
            config.demux.merger.max_message_bytes = std::stoull(value);
        } else if (key == "max_chunks_per_message") {
            accumulator.max_chunks_per_message = static_cast<uint32_t>(std::stoul(value));
        } else if (key == "audit_retry_attempts") {
            config.demux.audit_retry_attempts = static_cast<uint32_t>(std::stoul(value));
        } else if (key == "audit_retry_backoff_ms") {
            config.demux.audit_retry_backoff_ms = std::stoull(value);
        } else if (key == "worker_threads") {
            config.worker_threads = std::stoull(value);
        } else {
            return false;
        }
    } else if (section == "store") {
        if (key == "path") {
            config.store.path = value;
        } else if (key == "busy_timeout_ms") {
            config.store.busy_timeout_ms = std::stoi(value);
        } else if (key == "journal_mode") {
            config.store.journal_mode = value;
        } else if (key == "pool_size") {
            config.store.pool_size = std::stoull(value);
        } else {
            return false;
        }
    } else if (section == "logging") {
        if (key == "level") {
            auto level = utils::parse_log_level(value);
            if (!level) {
                throw std::invalid_argument("unknown log level");
            }
            config.logging.level = *level;
        } else if (key == "file") {
            config.logging.file_path = value;
        } else if (key == "max_file_bytes") {
            config.logging.max_file_bytes = std::stoull(value);
        } else if (key == "max_files") {
            config.logging.max_files = std::stoull(value);
        } else {
            return false;
        }
    } else {
        return false;
    }
    return true;
}

}  // namespace

std::optional<EngineConfig> load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        spdlog::error("Cannot open config file {}", path);
        return std::nullopt;
    }

    auto entries = IniParser::parse(file);
    EngineConfig config;

    for (const auto& entry : entries) {
        std::string section = to_lower(entry.section);
        std::string key = to_lower(entry.key);

        try {
            if (!apply_entry(config, section, key, entry.value)) {
                spdlog::warn("{}:{}: unknown key [{}] {}", path, entry.line, section, key);
            }
        } catch (const std::exception& e) {
            // std::stoull and friends throw on malformed numbers
            spdlog::error("{}:{}: invalid value '{}' for [{}] {}: {}",
                          path, entry.line, entry.value, section, key, e.what());
            return std::nullopt;
        }
    }

    return config;
}

std::optional<EngineConfig> parse_cli(int argc, char* argv[]) {
    CLI::App app{"telemux - telemetry ingestion demultiplexer"};

    const EngineConfig defaults;
    std::string config_path;
    std::string db_path;
    std::string log_level;
    std::string log_file;
    uint64_t ttl_seconds = defaults.demux.accumulator.ttl_ms / 1000;
    uint64_t sweep_seconds = defaults.demux.sweeper.sweep_interval_ms / 1000;
    uint64_t lease_seconds = defaults.demux.accumulator.claim_lease_ms / 1000;
    size_t max_fragment_bytes = defaults.demux.accumulator.max_fragment_bytes;
    size_t max_message_bytes = defaults.demux.merger.max_message_bytes;
    size_t workers = defaults.worker_threads;

    app.add_option("-c,--config", config_path, "INI configuration file");
    auto* db_opt = app.add_option("--db", db_path, "SQLite database shared by all instances");
    auto* ttl_opt = app.add_option("--ttl", ttl_seconds, "Seconds an incomplete group is kept");
    auto* sweep_opt = app.add_option("--sweep-interval", sweep_seconds,
                                     "Seconds between expiry sweeps");
    auto* lease_opt = app.add_option("--claim-lease", lease_seconds,
                                     "Seconds a reassembly claim stays live");
    auto* fragment_opt = app.add_option("--max-fragment-bytes", max_fragment_bytes,
                                        "Largest accepted chunk payload");
    auto* message_opt = app.add_option("--max-message-bytes", max_message_bytes,
                                       "Largest merged payload before it is flagged");
    auto* workers_opt = app.add_option("-w,--workers", workers, "Ingestion worker threads");
    auto* level_opt = app.add_option("-l,--log-level", log_level,
                                     "trace, debug, info, warn, error");
    auto* log_file_opt = app.add_option("--log-file", log_file,
                                        "Also write logs to a rotating file");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        app.exit(e);
        return std::nullopt;
    }

    EngineConfig config;
    if (!config_path.empty()) {
        auto loaded = load_config(config_path);
        if (!loaded) {
            return std::nullopt;
        }
        config = *loaded;
    }

    // Options given on the command line win over the file, even when they
    // repeat a default value
    if (db_opt->count() > 0) {
        config.store.path = db_path;
    }
    if (ttl_opt->count() > 0) {
        config.demux.accumulator.ttl_ms = ttl_seconds * 1000;
    }
    if (sweep_opt->count() > 0) {
        config.demux.sweeper.sweep_interval_ms = sweep_seconds * 1000;
    }
    if (lease_opt->count() > 0) {
        config.demux.accumulator.claim_lease_ms = lease_seconds * 1000;
    }
    if (fragment_opt->count() > 0) {
        config.demux.accumulator.max_fragment_bytes = max_fragment_bytes;
    }
    if (message_opt->count() > 0) {
        config.demux.merger.max_message_bytes = max_message_bytes;
    }
    if (workers_opt->count() > 0) {
        config.worker_threads = workers;
    }
    if (log_file_opt->count() > 0) {
        config.logging.file_path = log_file;
    }
    if (level_opt->count() > 0) {
        auto level = utils::parse_log_level(log_level);
        if (!level) {
            spdlog::error("Unknown log level '{}'", log_level);
            return std::nullopt;
        }
        config.logging.level = *level;
    }

    return config;
}

bool save_config(const EngineConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file) {
        return false;
    }

    const auto& accumulator = config.demux.accumulator;

    file << "[engine]\n";
    file << "ttl_seconds = " << accumulator.ttl_ms / 1000 << "\n";
    file << "sweep_interval_seconds = " << config.demux.sweeper.sweep_interval_ms / 1000 << "\n";
    file << "claim_lease_seconds = " << accumulator.claim_lease_ms / 1000 << "\n";
    file << "max_fragment_bytes = " << accumulator.max_fragment_bytes << "\n";
    file << "max_message_bytes = " << config.demux.merger.max_message_bytes << "\n";
    file << "max_chunks_per_message = " << accumulator.max_chunks_per_message << "\n";
    file << "audit_retry_attempts = " << config.demux.audit_retry_attempts << "\n";
    file << "audit_retry_backoff_ms = " << config.demux.audit_retry_backoff_ms << "\n";
    file << "worker_threads = " << config.worker_threads << "\n";
    file << "\n";

    file << "[store]\n";
    file << "path = " << config.store.path << "\n";
    file << "busy_timeout_ms = " << config.store.busy_timeout_ms << "\n";
    file << "journal_mode = " << config.store.journal_mode << "\n";
    file << "pool_size = " << config.store.pool_size << "\n";
    file << "\n";

    file << "[logging]\n";
    file << "level = " << utils::log_level_to_string(config.logging.level) << "\n";
    if (!config.logging.file_path.empty()) {
        file << "file = " << config.logging.file_path << "\n";
    }
    file << "max_file_bytes = " << config.logging.max_file_bytes << "\n";
    file << "max_files = " << config.logging.max_files << "\n";

    return static_cast<bool>(file);
}

EngineConfig merge_config(const EngineConfig& base, const EngineConfig& overlay) {
    const EngineConfig defaults;
    EngineConfig result = base;

    // Override with values from overlay that differ from the defaults
    const auto& acc = overlay.demux.accumulator;
    const auto& def = defaults.demux.accumulator;
    if (acc.ttl_ms != def.ttl_ms) {
        result.demux.accumulator.ttl_ms = acc.ttl_ms;
    }
    if (acc.claim_lease_ms != def.claim_lease_ms) {
        result.demux.accumulator.claim_lease_ms = acc.claim_lease_ms;
    }
    if (acc.max_fragment_bytes != def.max_fragment_bytes) {
        result.demux.accumulator.max_fragment_bytes = acc.max_fragment_bytes;
    }
    if (acc.max_chunks_per_message != def.max_chunks_per_message) {
        result.demux.accumulator.max_chunks_per_message = acc.max_chunks_per_message;
    }
    if (overlay.demux.merger.max_message_bytes != defaults.demux.merger.max_message_bytes) {
        result.demux.merger.max_message_bytes = overlay.demux.merger.max_message_bytes;
    }
    if (overlay.demux.sweeper.sweep_interval_ms != defaults.demux.sweeper.sweep_interval_ms) {
        result.demux.sweeper.sweep_interval_ms = overlay.demux.sweeper.sweep_interval_ms;
    }
    if (overlay.demux.audit_retry_attempts != defaults.demux.audit_retry_attempts) {
        result.demux.audit_retry_attempts = overlay.demux.audit_retry_attempts;
    }
    if (overlay.demux.audit_retry_backoff_ms != defaults.demux.audit_retry_backoff_ms) {
        result.demux.audit_retry_backoff_ms = overlay.demux.audit_retry_backoff_ms;
    }
    if (overlay.store.path != defaults.store.path) {
        result.store.path = overlay.store.path;
    }
    if (overlay.store.busy_timeout_ms != defaults.store.busy_timeout_ms) {
        result.store.busy_timeout_ms = overlay.store.busy_timeout_ms;
    }
    if (overlay.store.journal_mode != defaults.store.journal_mode) {
        result.store.journal_mode = overlay.store.journal_mode;
    }
    if (overlay.store.pool_size != defaults.store.pool_size) {
        result.store.pool_size = overlay.store.pool_size;
    }
    if (overlay.logging.level != defaults.logging.level) {
        result.logging.level = overlay.logging.level;
    }
    if (overlay.logging.file_path != defaults.logging.file_path) {
        result.logging.file_path = overlay.logging.file_path;
    }
    if (overlay.logging.max_file_bytes != defaults.logging.max_file_bytes) {
        result.logging.max_file_bytes = overlay.logging.max_file_bytes;
    }
    if (overlay.logging.max_files != defaults.logging.max_files) {
        result.logging.max_files = overlay.logging.max_files;
    }
    if (overlay.worker_threads != defaults.worker_threads) {
        result.worker_threads = overlay.worker_threads;
    }

    return result;
}

ValidationResult validate_config(const EngineConfig& config) {
    ValidationResult result;
    const auto& accumulator = config.demux.accumulator;

    auto error = [&result](std::string message) {
        result.errors.push_back(std::move(message));
        result.valid = false;
    };

    if (accumulator.ttl_ms == 0) {
        error("ttl_seconds must be positive");
    }
    if (config.demux.sweeper.sweep_interval_ms == 0) {
        error("sweep_interval_seconds must be positive");
    } else if (config.demux.sweeper.sweep_interval_ms >= accumulator.ttl_ms) {
        error("sweep_interval_seconds must be shorter than ttl_seconds");
    }
    if (accumulator.claim_lease_ms == 0) {
        error("claim_lease_seconds must be positive");
    } else if (accumulator.claim_lease_ms >= accumulator.ttl_ms) {
        error("claim_lease_seconds must be shorter than ttl_seconds");
    }
    if (accumulator.max_fragment_bytes == 0) {
        error("max_fragment_bytes must be positive");
    }
    if (config.demux.merger.max_message_bytes == 0) {
        error("max_message_bytes must be positive");
    }
    if (accumulator.max_chunks_per_message == 0) {
        error("max_chunks_per_message must be positive");
    }
    if (config.store.path.empty()) {
        error("store path is empty");
    }
    if (config.store.pool_size == 0) {
        error("store pool_size must be positive");
    }
    if (config.worker_threads == 0) {
        error("worker_threads must be positive");
    }
    if (!config.logging.file_path.empty() &&
        (config.logging.max_file_bytes == 0 || config.logging.max_files == 0)) {
        error("log rotation needs positive max_file_bytes and max_files");
    }

    if (accumulator.max_fragment_bytes > config.demux.merger.max_message_bytes) {
        result.warnings.push_back("max_fragment_bytes exceeds max_message_bytes");
    }
    if (config.demux.audit_retry_attempts == 0) {
        result.warnings.push_back("audit_retry_attempts is 0 - each write is tried once");
    }
    if (to_lower(config.store.journal_mode) != "wal") {
        result.warnings.push_back("journal_mode is not WAL - concurrent instances will block each other");
    }

    return result;
}

}  // namespace telemux::config
