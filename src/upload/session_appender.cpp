#include "pbu/upload/session_appender.hpp"

#include "pbu/upload/chunk_planner.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <exception>
#include <fstream>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pbu::upload {
namespace {

/**
 * @brief Failure bookkeeping shared by the appends of one file
 *
 * Outlives the appender call: queued appends may still run after upload()
 * returned with an error.
 */
struct AppendState {
    std::atomic<bool> abandoned{false};
    std::mutex mutex;
    std::optional<pbu::Error> first_error;

    void fail(pbu::Error error) {
        {
            std::lock_guard lock(mutex);
            if (!first_error) {
                first_error = std::move(error);
            }
        }
        abandoned = true;
    }

    pbu::Error error_or(const pbu::Error& fallback) {
        std::lock_guard lock(mutex);
        return first_error ? *first_error : fallback;
    }
};

pbu::Result<void> append_chunk(store::UploadStore& store,
                               events::EventBus& bus,
                               const std::shared_ptr<AppendState>& state,
                               const Cursor& cursor,
                               const std::vector<char>& data,
                               bool is_final,
                               const std::string& commit_path) {
    if (state->abandoned) {
        return pbu::Err<void>(ErrorCode::AppendFailed,
                              "session " + cursor.session_id + " abandoned before offset " +
                              std::to_string(cursor.offset) + " was sent");
    }

    spdlog::debug("Appending to upload session '{}' for '{}' at offset {}",
                  cursor.session_id, commit_path, cursor.offset);

    pbu::Result<void> result = pbu::Ok();
    try {
        result = store.append(cursor, data, is_final);
    } catch (const std::exception& e) {
        result = pbu::Err<void>(ErrorCode::AppendFailed, e.what());
    }

    if (result.is_error()) {
        pbu::Error error{ErrorCode::AppendFailed,
                         "append to session " + cursor.session_id + " at offset " +
                         std::to_string(cursor.offset) + " failed: " + result.error().message};
        state->fail(error);
        return pbu::Err<void>(std::move(error));
    }

    bus.emit(events::ChunkAppendedEvent{cursor.session_id, commit_path, cursor.offset, data.size(), is_final});
    return pbu::Ok();
}

} // namespace

SessionAppender::SessionAppender(store::UploadStore& store,
                                 concurrency::WorkerPool& chunk_pool,
                                 std::uint64_t chunk_size,
                                 events::EventBus& bus)
    : store_(store), chunk_pool_(chunk_pool), chunk_size_(chunk_size), bus_(bus) {}

pbu::Result<CommitDescriptor> SessionAppender::upload(FileUploadTask& task) const {
    if (auto begun = task.transition_to(TaskState::Appending); begun.is_error()) {
        return pbu::Err<CommitDescriptor>(begun.error());
    }

    auto result = append_all(task);
    if (result.is_error()) {
        if (auto failed = task.mark_failed(result.error().message); failed.is_error()) {
            spdlog::warn("Task #{} could not be marked failed: {}", task.index(), failed.error().message);
        }
        bus_.emit(events::FileUploadFailedEvent{task.session_id(), task.commit_path(), result.error().message});
        spdlog::error("Upload session '{}' failed.", task.session_id());
        return result;
    }

    if (auto closed = task.close(result.value()); closed.is_error()) {
        return pbu::Err<CommitDescriptor>(closed.error());
    }
    return result;
}

pbu::Result<CommitDescriptor> SessionAppender::append_all(const FileUploadTask& task) const {
    const auto started = std::chrono::steady_clock::now();
    const auto& source = task.source();
    const auto& session_id = task.session_id();
    const auto& commit_path = task.commit_path();

    spdlog::info("Using upload session with ID '{}' for file '{}'.", session_id, source.destination_name);

    std::ifstream input(source.path, std::ios::binary);
    if (!input) {
        return pbu::Err<CommitDescriptor>(ErrorCode::IoError,
                                          "failed to open source file: " + source.path.string());
    }

    auto state = std::make_shared<AppendState>();
    ChunkPlan plan(source.size, chunk_size_);
    std::uint64_t bytes_read = 0;

    if (source.size == 0) {
        // Empty file: one empty closing append, no chunk loop
        auto closed = append_chunk(store_, bus_, state, Cursor{session_id, 0}, {}, true, commit_path);
        if (closed.is_error()) {
            return pbu::Err<CommitDescriptor>(closed.error());
        }
    } else {
        std::vector<std::future<pbu::Result<void>>> pending;
        pending.reserve(plan.chunk_count());

        // Reads stay on this thread: the stream has a single position
        for (const auto& chunk : plan) {
            if (state->abandoned) {
                break;
            }

            std::vector<char> buffer(static_cast<std::size_t>(chunk.length));
            input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            if (static_cast<std::uint64_t>(input.gcount()) != chunk.length) {
                pbu::Error error{ErrorCode::IoError,
                                 "short read from " + source.path.string() + " at offset " +
                                 std::to_string(chunk.offset)};
                state->fail(error);
                return pbu::Err<CommitDescriptor>(std::move(error));
            }
            bytes_read += chunk.length;

            auto& store = store_;
            auto& bus = bus_;
            pending.push_back(chunk_pool_.submit(
                [&store, &bus, state, cursor = Cursor{session_id, chunk.offset},
                 data = std::move(buffer), is_final = chunk.is_final, commit_path]() {
                    return append_chunk(store, bus, state, cursor, data, is_final, commit_path);
                }));
        }

        for (auto& future : pending) {
            auto appended = future.get();
            if (appended.is_error()) {
                return pbu::Err<CommitDescriptor>(state->error_or(appended.error()));
            }
        }
    }

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    bus_.emit(events::FileAppendsCompletedEvent{session_id, commit_path, bytes_read, plan.chunk_count(), duration});

    return pbu::Ok(CommitDescriptor{Cursor{session_id, bytes_read}, commit_path});
}

} // namespace pbu::upload
