#pragma once

#include "pbu/store/upload_store.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pbu::store {

/**
 * @brief Upload store backed by a local directory
 *
 * Models the remote store's upload-session protocol on disk:
 * - every session owns a staging file under <root>/.staging/
 * - appends write their bytes at the cursor offset; concurrent sessions accept
 *   them in any order as long as ranges never overlap
 * - finish moves each staging file to <root>/<commit path>
 *
 * Reasons reported in failures mirror the remote store's error tags
 * (incorrect_offset, closed, path/conflict/file, ...).
 *
 * THREAD SAFETY:
 * All methods may be called concurrently. Session bookkeeping is guarded by
 * one mutex; the byte writes themselves run outside the lock.
 */
class LocalUploadStore : public UploadStore {
public:
    struct Options {
        std::filesystem::path root;
        bool async_finish = false;       ///< Answer finish with a job id
        std::size_t async_polls = 0;     ///< In-progress answers before the job completes
    };

    explicit LocalUploadStore(Options options);

    pbu::Result<std::vector<upload::SessionId>> start_sessions(std::size_t count,
                                                               upload::SessionType type) override;

    pbu::Result<void> append(const upload::Cursor& cursor,
                             const std::vector<char>& data,
                             bool close) override;

    pbu::Result<upload::FinishLaunch> finish_batch(
        const std::vector<upload::CommitDescriptor>& entries) override;

    pbu::Result<upload::FinishJobStatus> poll_finish_batch(const upload::AsyncJobId& job_id) override;

    /// Sessions allocated but not yet committed.
    [[nodiscard]] std::size_t open_sessions() const;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return options_.root; }

    [[nodiscard]] std::filesystem::path staging_root() const { return options_.root / ".staging"; }

private:
    struct Session {
        upload::SessionType type = upload::SessionType::Concurrent;
        std::filesystem::path staging_path;
        std::map<std::uint64_t, std::uint64_t> ranges;   ///< offset -> length of received appends
        std::optional<std::uint64_t> closed_length;
        std::uint64_t next_offset = 0;                   ///< Sequential sessions only
    };

    struct FinishJob {
        std::vector<upload::EntryOutcome> entries;
        std::size_t polls_remaining = 0;
    };

    /// Validate cursor/data against the session and reserve the byte range.
    pbu::Result<std::filesystem::path> reserve_range(const upload::Cursor& cursor,
                                                     std::uint64_t length,
                                                     bool close);

    void release_range(const upload::Cursor& cursor, bool close);

    upload::EntryOutcome commit_entry(const upload::CommitDescriptor& entry);

    static std::optional<std::string> received_gap(const Session& session, std::uint64_t expected_length);

    Options options_;

    mutable std::mutex mutex_;
    std::unordered_map<upload::SessionId, Session> sessions_;
    std::unordered_map<upload::AsyncJobId, FinishJob> jobs_;

    std::atomic<std::uint64_t> session_counter_{0};
    std::atomic<std::uint64_t> job_counter_{0};
};

} // namespace pbu::store
