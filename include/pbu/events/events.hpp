/**
 * @file events.hpp
 * @brief Upload lifecycle events
 *
 * WHY THIS FILE EXISTS:
 * The batch coordinator reports progress without knowing who listens.
 * Logging and metrics subscribe to these events on the EventBus.
 *
 * NAMING CONVENTION:
 * - Events are past-tense: ChunkAppendedEvent, BatchCompletedEvent
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace pbu::events {

// ════════════════════════════════════════════════════════
// Batch Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once the sessions of a batch have been allocated
 *
 * WHO EMITS: BatchCoordinator, before dispatching any file
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct BatchStartedEvent {
    std::string batch_id;
    std::size_t file_count = 0;
    std::uint64_t total_bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted right before the batch finish call
 */
struct BatchFinishRequestedEvent {
    std::string batch_id;
    std::size_t entry_count = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted after every poll of an asynchronous finish job
 */
struct BatchPollEvent {
    std::string batch_id;
    std::string async_job_id;
    std::size_t attempt = 0;
    bool in_progress = true;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when the finish call produced per-entry results
 *
 * duration covers the whole batch, from session allocation to reconciliation.
 */
struct BatchCompletedEvent {
    std::string batch_id;
    std::size_t file_count = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::uint64_t bytes_uploaded = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when the batch was aborted before or during the finish call
 */
struct BatchFailedEvent {
    std::string batch_id;
    std::size_t file_count = 0;
    std::string error_message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// File Transfer Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted from a chunk worker after a successful append
 *
 * WHO EMITS: SessionAppender (inner pool threads, concurrently)
 */
struct ChunkAppendedEvent {
    std::string session_id;
    std::string commit_path;
    std::uint64_t offset = 0;
    std::size_t bytes = 0;
    bool is_final = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when every chunk of a file is durable in its session
 */
struct FileAppendsCompletedEvent {
    std::string session_id;
    std::string commit_path;
    std::uint64_t total_bytes = 0;
    std::size_t chunk_count = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct FileUploadFailedEvent {
    std::string session_id;
    std::string commit_path;
    std::string error_message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Commit Events
// ════════════════════════════════════════════════════════

struct EntryCommittedEvent {
    std::size_t index = 0;
    std::string remote_path;
    std::uint64_t bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct EntryFailedEvent {
    std::size_t index = 0;
    std::string commit_path;
    std::string reason;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace pbu::events
