#include <atomic>
#include <condition_variable>
#include <csignal>
#include <deque>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "telemux/audit/raw_audit_log.hpp"
#include "telemux/config/config.hpp"
#include "telemux/crypto/crypto.hpp"
#include "telemux/ingest/telemetry_demux.hpp"
#include "telemux/store/sqlite_chunk_store.hpp"
#include "telemux/utils/logging.hpp"
#include "telemux/utils/time.hpp"

using namespace telemux;

std::atomic<bool> g_running{true};

void signal_handler(int sig) {
    spdlog::info("Received signal {}, shutting down...", sig);
    g_running = false;
}

namespace {

// Prints every delivered message
class LoggingSink : public ingest::DownstreamSink {
public:
    bool deliver(const chunk::ReassembledMessage& message) override {
        std::string text(message.payload.begin(), message.payload.end());
        spdlog::info("Delivered {}/{} from {}: {} chunks, {} bytes{}: {}",
                     message.tenant_id,
                     message.correlation_id.empty() ? "-" : message.correlation_id,
                     message.device_id, message.chunk_count, message.payload.size(),
                     message.partial ? " (partial)" : "", text);
        return true;
    }
};

// Fixed pool of ingestion workers fed from one queue
class WorkerPool {
public:
    WorkerPool(ingest::TelemetryDemux& demux, size_t workers) : demux_(demux) {
        for (size_t i = 0; i < workers; ++i) {
            threads_.emplace_back([this] { run(); });
        }
    }

    ~WorkerPool() {
        shutdown();
    }

    void submit(chunk::ChunkSubmission submission) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back(std::move(submission));
        }
        ready_.notify_one();
    }

    // Drains the queue, then joins the workers
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        threads_.clear();
    }

private:
    ingest::TelemetryDemux& demux_;
    std::vector<std::thread> threads_;
    std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<chunk::ChunkSubmission> queue_;
    bool closed_{false};

    void run() {
        while (true) {
            chunk::ChunkSubmission submission;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                ready_.wait(lock, [this] { return closed_ || !queue_.empty(); });
                if (queue_.empty()) {
                    return;
                }
                submission = std::move(queue_.front());
                queue_.pop_front();
            }

            auto result = demux_.submit(submission);
            if (!result.ok()) {
                spdlog::warn("Chunk {}/{} seq {} not accepted: {}",
                             submission.tenant_id, submission.correlation_id,
                             submission.sequence_number,
                             ingest::ingest_error_to_string(result.error));
            }
        }
    }
};

// Line format: tenant device correlation seq total payload
// A correlation of "-" marks an unfragmented message.
bool parse_line(const std::string& line, chunk::ChunkSubmission& submission) {
    std::istringstream input(line);
    std::string correlation;
    if (!(input >> submission.tenant_id >> submission.device_id >> correlation >>
          submission.sequence_number >> submission.total_chunks)) {
        return false;
    }
    submission.correlation_id = correlation == "-" ? std::string() : correlation;

    std::string payload;
    std::getline(input >> std::ws, payload);
    submission.payload.assign(payload.begin(), payload.end());
    submission.received_at_ms = utils::unix_time_ms();
    submission.source = chunk::IngestionSource::BRIDGE;
    submission.client_id = "telemux-demo";
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = config::parse_cli(argc, argv);
    if (!parsed) {
        return 1;
    }
    const auto& config = *parsed;

    // Initialize logging
    try {
        utils::init_logging(config.logging);
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::error("Cannot open log file {}: {}", config.logging.file_path, e.what());
        return 1;
    }

    auto validation = config::validate_config(config);
    for (const auto& warning : validation.warnings) {
        spdlog::warn("Config: {}", warning);
    }
    if (!validation.valid) {
        for (const auto& error : validation.errors) {
            spdlog::error("Config: {}", error);
        }
        return 1;
    }

    // Initialize crypto
    if (!crypto::init()) {
        spdlog::error("Failed to initialize crypto subsystem");
        return 1;
    }

    // Setup signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        store::SqliteChunkStore chunk_store(config.store);
        audit::SqliteRawAuditLog audit_log(config.store);
        LoggingSink sink;

        ingest::TelemetryDemux demux(chunk_store, audit_log, sink, config.demux);
        demux.set_abandon_callback([](const chunk::AbandonedGroupEvent& event) {
            spdlog::warn("Group {}/{} abandoned with {} of {} chunks",
                         event.tenant_id, event.correlation_id,
                         event.chunks_present, event.total_chunks_declared);
        });
        demux.start_sweeper();

        WorkerPool pool(demux, config.worker_threads);
        spdlog::info("Reading chunks from stdin ({} workers)", config.worker_threads);

        std::string line;
        size_t line_number = 0;
        while (g_running && std::getline(std::cin, line)) {
            ++line_number;
            if (line.empty() || line[0] == '#') {
                continue;
            }
            chunk::ChunkSubmission submission;
            if (!parse_line(line, submission)) {
                spdlog::warn("Line {}: expected 'tenant device correlation seq total payload'",
                             line_number);
                continue;
            }
            pool.submit(std::move(submission));
        }

        pool.shutdown();
        demux.stop_sweeper();

        // Print statistics
        auto stats = demux.stats();
        spdlog::info("Final statistics:");
        spdlog::info("  Chunks received: {}", stats.chunks_received);
        spdlog::info("  Duplicates: {}", stats.duplicates);
        spdlog::info("  Reassembled: {}", stats.reassembled);
        spdlog::info("  Unfragmented delivered: {}", stats.unfragmented_delivered);
        spdlog::info("  Conflicts: {}", stats.conflicts);
        spdlog::info("  Rejected: {}", stats.rejected);
        spdlog::info("  Groups abandoned: {}", stats.groups_abandoned);
        spdlog::info("  Store errors: {}", stats.store_errors);
        spdlog::info("  Audit failures: {}", stats.audit_failures);
    } catch (const store::StoreError& e) {
        spdlog::error("Store unavailable: {}", e.what());
        return 1;
    }

    return 0;
}
