#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

#include "telemux/chunk/chunk.hpp"
#include "telemux/store/chunk_store.hpp"
#include "telemux/utils/time.hpp"

namespace telemux::ingest {

struct SweeperConfig {
    uint64_t sweep_interval_ms = 15000;  // Must be shorter than the chunk TTL
};

struct SweeperStats {
    uint64_t sweeps_run{0};
    uint64_t groups_abandoned{0};
    uint64_t chunks_swept{0};
    uint64_t sweep_failures{0};
};

// Removes groups that never completed within their TTL and reports each one
// once. Runs on its own thread after start(), or on demand via sweep_once().
class ExpirySweeper {
public:
    using AbandonCallback = std::function<void(const chunk::AbandonedGroupEvent& event)>;

    ExpirySweeper(store::ChunkStore& store,
                  const SweeperConfig& config,
                  utils::Clock clock = utils::system_clock());
    ~ExpirySweeper();

    ExpirySweeper(const ExpirySweeper&) = delete;
    ExpirySweeper& operator=(const ExpirySweeper&) = delete;

    void set_abandon_callback(AbandonCallback callback);

    // One pass at the clock's current time. Returns groups removed.
    size_t sweep_once();
    size_t sweep_once(uint64_t now_ms);

    void start();
    void stop();

    [[nodiscard]] bool running() const { return running_; }
    [[nodiscard]] SweeperStats stats() const;
    [[nodiscard]] const SweeperConfig& config() const { return config_; }

private:
    store::ChunkStore& store_;
    SweeperConfig config_;
    utils::Clock clock_;
    AbandonCallback abandon_callback_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable wake_;
    bool stop_requested_{false};
    std::atomic<bool> running_{false};

    std::atomic<uint64_t> sweeps_run_{0};
    std::atomic<uint64_t> groups_abandoned_{0};
    std::atomic<uint64_t> chunks_swept_{0};
    std::atomic<uint64_t> sweep_failures_{0};

    void run();
};

}  // namespace telemux::ingest
