#pragma once

#include "pbu/core/result.hpp"
#include "pbu/upload/types.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace pbu::store {

/**
 * @brief Remote object store operations needed by the batch uploader
 *
 * Implementations receive an already authenticated transport. append() is
 * called concurrently from the chunk pool and must be thread-safe; the other
 * calls come from the coordinating thread.
 */
class UploadStore {
public:
    virtual ~UploadStore() = default;

    /**
     * @brief Pre-allocate `count` upload sessions in one call
     *
     * RETURNS: exactly `count` session ids, in allocation order
     */
    virtual pbu::Result<std::vector<upload::SessionId>> start_sessions(std::size_t count,
                                                                       upload::SessionType type) = 0;

    /**
     * @brief Write `data` at `cursor.offset` of the session
     *
     * @param close true for the last chunk; closes the session for appends
     */
    virtual pbu::Result<void> append(const upload::Cursor& cursor,
                                     const std::vector<char>& data,
                                     bool close) = 0;

    /**
     * @brief Commit every closed session to its destination path
     *
     * RETURNS: either the per-entry outcomes or an async job id to poll
     */
    virtual pbu::Result<upload::FinishLaunch> finish_batch(
        const std::vector<upload::CommitDescriptor>& entries) = 0;

    virtual pbu::Result<upload::FinishJobStatus> poll_finish_batch(const upload::AsyncJobId& job_id) = 0;
};

} // namespace pbu::store
