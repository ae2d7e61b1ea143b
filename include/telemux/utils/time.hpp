#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace telemux::utils {

// Wall-clock source in Unix epoch milliseconds. Injectable so tests can
// drive expiry deterministically.
using Clock = std::function<uint64_t()>;

// Shared stores compare these across processes, so this is wall-clock time
inline uint64_t unix_time_ms() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
}

inline Clock system_clock() {
    return [] { return unix_time_ms(); };
}

// Monotonic stopwatch for timing sweeps and store calls
class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    [[nodiscard]] uint64_t elapsed_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

}  // namespace telemux::utils
