#include "pbu/store/local_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <system_error>

namespace pbu::store {
namespace fs = std::filesystem;
using upload::CommitDescriptor;
using upload::Cursor;
using upload::EntryOutcome;
using upload::FinishJobStatus;
using upload::FinishLaunch;
using upload::SessionId;
using upload::SessionType;

namespace {

EntryOutcome failure(std::string reason) {
    EntryOutcome outcome;
    outcome.kind = EntryOutcome::Kind::Failure;
    outcome.failure_reason = std::move(reason);
    return outcome;
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

bool is_malformed(const fs::path& relative) {
    if (relative.empty()) {
        return true;
    }
    for (const auto& part : relative) {
        if (part.string() == "..") {
            return true;
        }
    }
    return false;
}

pbu::Result<void> ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::exists(parent)) {
        return pbu::Err<void>(ErrorCode::IoError, "failed to create directory: " + parent.string());
    }
    return pbu::Ok();
}

} // namespace

LocalUploadStore::LocalUploadStore(Options options) : options_(std::move(options)) {
    fs::create_directories(staging_root());
}

pbu::Result<std::vector<SessionId>> LocalUploadStore::start_sessions(std::size_t count, SessionType type) {
    if (count == 0 || count > upload::kMaxBatchSize) {
        return pbu::Err<std::vector<SessionId>>(ErrorCode::InvalidArgument,
            "num_sessions must be between 1 and " + std::to_string(upload::kMaxBatchSize));
    }

    std::vector<SessionId> ids;
    ids.reserve(count);

    std::lock_guard lock(mutex_);
    for (std::size_t i = 0; i < count; ++i) {
        SessionId id = "pbu-session-" + std::to_string(++session_counter_);

        Session session;
        session.type = type;
        session.staging_path = staging_root() / id;
        std::ofstream create(session.staging_path, std::ios::binary | std::ios::trunc);
        if (!create) {
            return pbu::Err<std::vector<SessionId>>(ErrorCode::IoError,
                "failed to create staging file: " + session.staging_path.string());
        }

        sessions_.emplace(id, std::move(session));
        ids.push_back(std::move(id));
    }
    return pbu::Ok(std::move(ids));
}

pbu::Result<void> LocalUploadStore::append(const Cursor& cursor, const std::vector<char>& data, bool close) {
    auto reserved = reserve_range(cursor, data.size(), close);
    if (reserved.is_error()) {
        return pbu::Err<void>(reserved.error());
    }
    if (data.empty()) {
        return pbu::Ok();
    }

    std::fstream file(reserved.value(), std::ios::in | std::ios::out | std::ios::binary);
    if (file) {
        file.seekp(static_cast<std::streamoff>(cursor.offset));
        file.write(data.data(), static_cast<std::streamsize>(data.size()));
        file.flush();
    }
    if (!file) {
        release_range(cursor, close);
        return pbu::Err<void>(ErrorCode::IoError,
                              "failed to write staging file: " + reserved.value().string());
    }
    return pbu::Ok();
}

pbu::Result<fs::path> LocalUploadStore::reserve_range(const Cursor& cursor, std::uint64_t length, bool close) {
    std::lock_guard lock(mutex_);

    auto it = sessions_.find(cursor.session_id);
    if (it == sessions_.end()) {
        return pbu::Err<fs::path>(ErrorCode::AppendFailed, "not_found: unknown session " + cursor.session_id);
    }
    auto& session = it->second;
    const auto end = cursor.offset + length;

    if (session.closed_length && (close || end > *session.closed_length)) {
        return pbu::Err<fs::path>(ErrorCode::AppendFailed, "closed: session " + cursor.session_id + " is closed");
    }

    if (session.type == SessionType::Sequential) {
        if (cursor.offset != session.next_offset) {
            return pbu::Err<fs::path>(ErrorCode::AppendFailed,
                "incorrect_offset: expected " + std::to_string(session.next_offset));
        }
    } else {
        if (!close && length % upload::kChunkAlignment != 0) {
            return pbu::Err<fs::path>(ErrorCode::AppendFailed,
                "invalid_chunk_size: non-final appends must be a multiple of " +
                std::to_string(upload::kChunkAlignment) + " bytes");
        }
        // First range starting at or after our offset, and the one before it
        auto next = session.ranges.lower_bound(cursor.offset);
        if (next != session.ranges.end() && next->first < end) {
            return pbu::Err<fs::path>(ErrorCode::AppendFailed,
                "incorrect_offset: range at " + std::to_string(cursor.offset) + " overlaps received data");
        }
        if (next != session.ranges.begin()) {
            auto prev = std::prev(next);
            if (prev->first + prev->second > cursor.offset) {
                return pbu::Err<fs::path>(ErrorCode::AppendFailed,
                    "incorrect_offset: range at " + std::to_string(cursor.offset) + " overlaps received data");
            }
        }
        if (close && !session.ranges.empty()) {
            const auto& last = *session.ranges.rbegin();
            if (last.first + last.second > end) {
                return pbu::Err<fs::path>(ErrorCode::AppendFailed,
                    "incorrect_offset: closing append ends before received data");
            }
        }
    }

    if (length > 0) {
        session.ranges.emplace(cursor.offset, length);
    }
    session.next_offset = end;
    if (close) {
        session.closed_length = end;
    }
    return pbu::Ok(session.staging_path);
}

void LocalUploadStore::release_range(const Cursor& cursor, bool close) {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(cursor.session_id);
    if (it == sessions_.end()) {
        return;
    }
    it->second.ranges.erase(cursor.offset);
    if (close) {
        it->second.closed_length.reset();
    }
}

pbu::Result<FinishLaunch> LocalUploadStore::finish_batch(const std::vector<CommitDescriptor>& entries) {
    if (entries.size() > upload::kMaxBatchSize) {
        return pbu::Err<FinishLaunch>(ErrorCode::InvalidArgument,
            "finish batch accepts at most " + std::to_string(upload::kMaxBatchSize) + " entries");
    }

    std::lock_guard lock(mutex_);

    FinishLaunch launch;
    launch.entries.reserve(entries.size());
    for (const auto& entry : entries) {
        launch.entries.push_back(commit_entry(entry));
    }

    if (!options_.async_finish) {
        launch.kind = FinishLaunch::Kind::Complete;
        return pbu::Ok(std::move(launch));
    }

    const auto job_id = "pbu-job-" + std::to_string(++job_counter_);
    jobs_.emplace(job_id, FinishJob{std::move(launch.entries), options_.async_polls});
    spdlog::debug("Finish of {} entries queued as job '{}'", entries.size(), job_id);

    FinishLaunch async_launch;
    async_launch.kind = FinishLaunch::Kind::AsyncJob;
    async_launch.async_job_id = job_id;
    return pbu::Ok(std::move(async_launch));
}

pbu::Result<FinishJobStatus> LocalUploadStore::poll_finish_batch(const upload::AsyncJobId& job_id) {
    std::lock_guard lock(mutex_);

    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        return pbu::Err<FinishJobStatus>(ErrorCode::NotFound, "invalid_async_job_id: " + job_id);
    }

    FinishJobStatus status;
    if (it->second.polls_remaining > 0) {
        --it->second.polls_remaining;
        status.in_progress = true;
        return pbu::Ok(std::move(status));
    }

    status.in_progress = false;
    status.entries = std::move(it->second.entries);
    jobs_.erase(it);
    return pbu::Ok(std::move(status));
}

std::size_t LocalUploadStore::open_sessions() const {
    std::lock_guard lock(mutex_);
    return sessions_.size();
}

EntryOutcome LocalUploadStore::commit_entry(const CommitDescriptor& entry) {
    auto it = sessions_.find(entry.cursor.session_id);
    if (it == sessions_.end()) {
        return failure("lookup_failed/not_found");
    }
    auto& session = it->second;

    if (session.type == SessionType::Concurrent && !session.closed_length) {
        return failure("lookup_failed/not_closed");
    }
    if (session.closed_length && *session.closed_length != entry.cursor.offset) {
        return failure("lookup_failed/incorrect_offset: correct offset " + std::to_string(*session.closed_length));
    }
    if (auto gap = received_gap(session, entry.cursor.offset)) {
        return failure("lookup_failed/incorrect_offset: " + *gap);
    }

    const fs::path relative = fs::path(entry.path).relative_path();
    if (is_malformed(relative)) {
        return failure("path/malformed_path");
    }

    const fs::path destination = options_.root / relative;
    if (fs::exists(destination)) {
        return failure("path/conflict/file");
    }
    if (auto parent = ensure_parent_exists(destination); parent.is_error()) {
        return failure("path/io_error: " + parent.error().message);
    }

    std::error_code ec;
    fs::rename(session.staging_path, destination, ec);
    if (ec) {
        return failure("path/io_error: " + ec.message());
    }
    sessions_.erase(it);

    EntryOutcome outcome;
    outcome.kind = EntryOutcome::Kind::Success;
    outcome.path_lower = to_lower(entry.path);
    return outcome;
}

std::optional<std::string> LocalUploadStore::received_gap(const Session& session, std::uint64_t expected_length) {
    std::uint64_t covered = 0;
    for (const auto& [offset, length] : session.ranges) {
        if (offset != covered) {
            return "missing bytes at offset " + std::to_string(covered);
        }
        covered += length;
    }
    if (covered != expected_length) {
        return "received " + std::to_string(covered) + " of " + std::to_string(expected_length) + " bytes";
    }
    return std::nullopt;
}

} // namespace pbu::store
