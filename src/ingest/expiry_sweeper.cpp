#include "telemux/ingest/expiry_sweeper.hpp"

#include <chrono>

#include <spdlog/spdlog.h>

namespace telemux::ingest {

ExpirySweeper::ExpirySweeper(store::ChunkStore& store,
                             const SweeperConfig& config,
                             utils::Clock clock)
    : store_(store), config_(config), clock_(std::move(clock)) {
}

ExpirySweeper::~ExpirySweeper() {
    stop();
}

void ExpirySweeper::set_abandon_callback(AbandonCallback callback) {
    abandon_callback_ = std::move(callback);
}

size_t ExpirySweeper::sweep_once() {
    return sweep_once(clock_());
}

size_t ExpirySweeper::sweep_once(uint64_t now_ms) {
    utils::Timer timer;
    ++sweeps_run_;

    std::vector<store::ExpiredGroup> expired;
    try {
        expired = store_.take_expired(now_ms);
    } catch (const store::StoreError& e) {
        // Nothing was removed; the next tick retries
        ++sweep_failures_;
        spdlog::error("Expiry sweep failed: {}", e.what());
        return 0;
    }

    for (const auto& group : expired) {
        ++groups_abandoned_;
        chunks_swept_ += group.chunks_present;

        spdlog::warn("Abandoned group {}/{} from device {}: {} of {} chunks{}",
                     group.key.tenant_id, group.key.correlation_id, group.device_id,
                     group.chunks_present, group.total_chunks,
                     group.conflicted ? " (conflicted)" : "");

        if (abandon_callback_) {
            chunk::AbandonedGroupEvent event;
            event.tenant_id = group.key.tenant_id;
            event.device_id = group.device_id;
            event.correlation_id = group.key.correlation_id;
            event.chunks_present = group.chunks_present;
            event.total_chunks_declared = group.total_chunks;
            event.abandoned_at_ms = now_ms;
            event.conflicted = group.conflicted;
            abandon_callback_(event);
        }
    }

    if (!expired.empty()) {
        spdlog::debug("Sweep removed {} groups in {} ms", expired.size(), timer.elapsed_ms());
    }
    return expired.size();
}

void ExpirySweeper::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    stop_requested_ = false;
    running_ = true;
    thread_ = std::thread([this] { run(); });
    spdlog::info("Expiry sweeper started (interval: {} ms)", config_.sweep_interval_ms);
}

void ExpirySweeper::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        stop_requested_ = true;
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    running_ = false;
    spdlog::info("Expiry sweeper stopped");
}

void ExpirySweeper::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        if (wake_.wait_for(lock, std::chrono::milliseconds(config_.sweep_interval_ms),
                           [this] { return stop_requested_; })) {
            break;
        }
        lock.unlock();
        sweep_once();
        lock.lock();
    }
}

SweeperStats ExpirySweeper::stats() const {
    SweeperStats stats;
    stats.sweeps_run = sweeps_run_;
    stats.groups_abandoned = groups_abandoned_;
    stats.chunks_swept = chunks_swept_;
    stats.sweep_failures = sweep_failures_;
    return stats;
}

}  // namespace telemux::ingest
