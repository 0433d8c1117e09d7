#pragma once

#include "pbu/concurrency/worker_pool.hpp"
#include "pbu/core/result.hpp"
#include "pbu/events/event_bus.hpp"
#include "pbu/events/events.hpp"
#include "pbu/store/upload_store.hpp"
#include "pbu/upload/task.hpp"
#include "pbu/upload/types.hpp"

#include <cstdint>

namespace pbu::upload {

/**
 * @brief Streams one file into one pre-allocated concurrent upload session
 *
 * The file is read chunk by chunk on the calling thread; only the filled
 * buffers, each with its own cursor, are handed to the shared chunk pool for
 * the append call. Appends may land in any order since each names its offset.
 * The final chunk's append closes the session.
 *
 * On the first failed append the task is abandoned: no further chunks are
 * read, queued appends are skipped, in-flight ones are left to finish and
 * their results ignored. The session is not closed; the store expires it.
 */
class SessionAppender {
public:
    SessionAppender(store::UploadStore& store,
                    concurrency::WorkerPool& chunk_pool,
                    std::uint64_t chunk_size,
                    events::EventBus& bus);

    /**
     * @brief Append every chunk of task.source() to task.session_id()
     *
     * Moves the task Pending -> Appending -> Closed, or to Failed.
     *
     * RETURNS: the commit descriptor (offset == file length) once every
     *          append succeeded, otherwise the first append/read error
     */
    pbu::Result<CommitDescriptor> upload(FileUploadTask& task) const;

private:
    pbu::Result<CommitDescriptor> append_all(const FileUploadTask& task) const;

    store::UploadStore& store_;
    concurrency::WorkerPool& chunk_pool_;
    std::uint64_t chunk_size_;
    events::EventBus& bus_;
};

} // namespace pbu::upload
