#pragma once

#include <spdlog/spdlog.h>

#include <cstddef>
#include <optional>
#include <string>

namespace telemux::utils {

// Log levels
enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL,
    OFF
};

struct LoggingConfig {
    LogLevel level{LogLevel::INFO};
    std::string pattern;                       // Empty selects the default pattern
    std::string file_path;                     // Rotating file next to the console when set
    size_t max_file_bytes = 10 * 1024 * 1024;
    size_t max_files = 5;
};

// Install the "telemux" logger as spdlog's default. Safe to call more than
// once; the last call wins. Throws spdlog::spdlog_ex if the file cannot be
// opened.
void init_logging(const LoggingConfig& config = {});

// Set log level
void set_log_level(LogLevel level);

// Current level of the default logger
LogLevel get_log_level();

const char* log_level_to_string(LogLevel level);

// Case-insensitive; accepts the spdlog short names too. nullopt when unknown.
std::optional<LogLevel> parse_log_level(const std::string& str);

}  // namespace telemux::utils
