/**
 * @file components.hpp
 * @brief Event subscribers that log and measure uploads
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * coordinator.upload(files);   // emits events
 * metrics.print_stats();
 */

#pragma once

#include "pbu/events/event_bus.hpp"
#include "pbu/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <cstdint>

namespace pbu::events {

/**
 * @brief Logs every upload event with spdlog
 *
 * Chunk-level events go to debug, batch and entry events to info/error.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<BatchStartedEvent>([this](const BatchStartedEvent& e) {
            on_batch_started(e);
        });

        bus_.subscribe<ChunkAppendedEvent>([this](const ChunkAppendedEvent& e) {
            on_chunk_appended(e);
        });

        bus_.subscribe<FileAppendsCompletedEvent>([this](const FileAppendsCompletedEvent& e) {
            on_file_appends_completed(e);
        });

        bus_.subscribe<FileUploadFailedEvent>([this](const FileUploadFailedEvent& e) {
            on_file_upload_failed(e);
        });

        bus_.subscribe<BatchFinishRequestedEvent>([this](const BatchFinishRequestedEvent& e) {
            on_finish_requested(e);
        });

        bus_.subscribe<BatchPollEvent>([this](const BatchPollEvent& e) {
            on_poll(e);
        });

        bus_.subscribe<EntryCommittedEvent>([this](const EntryCommittedEvent& e) {
            on_entry_committed(e);
        });

        bus_.subscribe<EntryFailedEvent>([this](const EntryFailedEvent& e) {
            on_entry_failed(e);
        });

        bus_.subscribe<BatchCompletedEvent>([this](const BatchCompletedEvent& e) {
            on_batch_completed(e);
        });

        bus_.subscribe<BatchFailedEvent>([this](const BatchFailedEvent& e) {
            on_batch_failed(e);
        });
    }

private:
    void on_batch_started(const BatchStartedEvent& e) {
        spdlog::info("[BatchStarted] batch={} files={} bytes={}", e.batch_id, e.file_count, e.total_bytes);
    }

    void on_chunk_appended(const ChunkAppendedEvent& e) {
        spdlog::debug("[ChunkAppended] session={} path={} offset={} bytes={} final={}",
                      e.session_id, e.commit_path, e.offset, e.bytes, e.is_final);
    }

    void on_file_appends_completed(const FileAppendsCompletedEvent& e) {
        spdlog::info("[FileAppended] session={} path={} bytes={} chunks={} duration={}ms",
                     e.session_id, e.commit_path, e.total_bytes, e.chunk_count, e.duration.count());
    }

    void on_file_upload_failed(const FileUploadFailedEvent& e) {
        spdlog::error("[FileFailed] session={} path={} error={}", e.session_id, e.commit_path, e.error_message);
    }

    void on_finish_requested(const BatchFinishRequestedEvent& e) {
        spdlog::info("[FinishRequested] batch={} entries={}", e.batch_id, e.entry_count);
    }

    void on_poll(const BatchPollEvent& e) {
        spdlog::debug("[FinishPoll] batch={} job={} attempt={} in_progress={}",
                      e.batch_id, e.async_job_id, e.attempt, e.in_progress);
    }

    void on_entry_committed(const EntryCommittedEvent& e) {
        spdlog::info("[EntryCommitted] #{} path={} bytes={}", e.index, e.remote_path, e.bytes);
    }

    void on_entry_failed(const EntryFailedEvent& e) {
        spdlog::error("[EntryFailed] #{} path={} reason={}", e.index, e.commit_path, e.reason);
    }

    void on_batch_completed(const BatchCompletedEvent& e) {
        spdlog::info("[BatchCompleted] batch={} files={} succeeded={} failed={} bytes={} duration={}ms",
                     e.batch_id, e.file_count, e.succeeded, e.failed, e.bytes_uploaded, e.duration.count());
    }

    void on_batch_failed(const BatchFailedEvent& e) {
        spdlog::error("[BatchFailed] batch={} files={} error={}", e.batch_id, e.file_count, e.error_message);
    }

    EventBus& bus_;
};

/**
 * @brief Aggregates transfer counters and timing across batches
 *
 * Counters are atomics: chunk events arrive from pool workers concurrently.
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> batches_started{0};
        std::atomic<uint64_t> batches_completed{0};
        std::atomic<uint64_t> batches_failed{0};
        std::atomic<uint64_t> chunks_appended{0};
        std::atomic<uint64_t> bytes_appended{0};
        std::atomic<uint64_t> files_appended{0};
        std::atomic<uint64_t> files_failed{0};
        std::atomic<uint64_t> entries_committed{0};
        std::atomic<uint64_t> entries_failed{0};
        std::atomic<uint64_t> bytes_uploaded{0};
        std::atomic<uint64_t> elapsed_ms{0};
        std::atomic<uint64_t> finish_polls{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<BatchStartedEvent>([this](const BatchStartedEvent&) {
            stats_.batches_started++;
        });

        bus_.subscribe<ChunkAppendedEvent>([this](const ChunkAppendedEvent& e) {
            stats_.chunks_appended++;
            stats_.bytes_appended += e.bytes;
        });

        bus_.subscribe<FileAppendsCompletedEvent>([this](const FileAppendsCompletedEvent&) {
            stats_.files_appended++;
        });

        bus_.subscribe<FileUploadFailedEvent>([this](const FileUploadFailedEvent&) {
            stats_.files_failed++;
        });

        bus_.subscribe<BatchPollEvent>([this](const BatchPollEvent&) {
            stats_.finish_polls++;
        });

        bus_.subscribe<EntryCommittedEvent>([this](const EntryCommittedEvent&) {
            stats_.entries_committed++;
        });

        bus_.subscribe<EntryFailedEvent>([this](const EntryFailedEvent&) {
            stats_.entries_failed++;
        });

        bus_.subscribe<BatchCompletedEvent>([this](const BatchCompletedEvent& e) {
            on_batch_completed(e);
        });

        bus_.subscribe<BatchFailedEvent>([this](const BatchFailedEvent&) {
            stats_.batches_failed++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    /// Megabytes (MiB) committed per second of batch time; 0 before any batch completes.
    double throughput_mb_per_s() const {
        const auto elapsed = stats_.elapsed_ms.load();
        if (elapsed == 0) {
            return 0.0;
        }
        const double megabytes = static_cast<double>(stats_.bytes_uploaded.load()) / (1024.0 * 1024.0);
        return megabytes / (static_cast<double>(elapsed) / 1000.0);
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Statistics:");
        spdlog::info("  Batches:         {} started, {} completed, {} failed",
                     stats_.batches_started.load(), stats_.batches_completed.load(), stats_.batches_failed.load());
        spdlog::info("  Chunks appended: {}", stats_.chunks_appended.load());
        spdlog::info("  Files appended:  {}", stats_.files_appended.load());
        spdlog::info("  Entries:         {} committed, {} failed",
                     stats_.entries_committed.load(), stats_.entries_failed.load());
        spdlog::info("  Uploaded {} bytes in {:.2f} seconds.",
                     stats_.bytes_uploaded.load(), static_cast<double>(stats_.elapsed_ms.load()) / 1000.0);
        spdlog::info("  Approximate overall speed: {:.2f} MB/s.", throughput_mb_per_s());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_batch_completed(const BatchCompletedEvent& e) {
        stats_.batches_completed++;
        stats_.bytes_uploaded += e.bytes_uploaded;
        stats_.elapsed_ms += static_cast<uint64_t>(e.duration.count());
    }

    EventBus& bus_;
    Stats stats_;
};

} // namespace pbu::events
