#pragma once

#include "pbu/core/result.hpp"
#include "pbu/events/event_bus.hpp"
#include "pbu/events/events.hpp"
#include "pbu/store/upload_store.hpp"
#include "pbu/upload/task.hpp"
#include "pbu/upload/types.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pbu::upload {

struct CoordinatorOptions {
    std::uint64_t chunk_size = 8 * kMiB;
    std::size_t batch_thread_count = 4;        ///< Files in flight
    std::size_t concurrent_thread_count = 8;   ///< Chunk appends in flight, shared by all files
    std::string remote_folder = "/";
    std::chrono::milliseconds poll_interval{500};
    std::size_t max_poll_attempts = 0;         ///< 0 polls until the job leaves in-progress
};

/**
 * @brief Build the destination path "/<folder>/<name>"
 *
 * Leading and trailing slashes of folder are ignored; an empty folder places
 * the file at the root.
 */
std::string make_commit_path(const std::string& remote_folder, const std::string& file_name);

/**
 * @brief Uploads up to kMaxBatchSize files and commits them with one finish call
 *
 * FLOW:
 * 1. Validate preconditions (no store call on failure)
 * 2. Allocate one concurrent session per file in a single call
 * 3. Run one SessionAppender per file on the file pool; chunks of every file
 *    share one chunk pool
 * 4. Wait for all files. Any failure aborts the whole batch: finish is not
 *    called and sessions of the other files stay open until they expire
 * 5. Finish the batch with every commit descriptor in file order, polling
 *    at poll_interval when the store answers asynchronously
 * 6. Reconcile per-entry outcomes
 *
 * upload() is not reentrant; both pools live for the duration of one call.
 */
class BatchCoordinator {
public:
    BatchCoordinator(store::UploadStore& store, CoordinatorOptions options, events::EventBus& bus);

    /**
     * RETURNS: one EntryResult per file in input order, or the batch error
     *          (precondition, first file failure, finish failure)
     */
    pbu::Result<BatchReport> upload(const std::vector<SourceFile>& files);

    static pbu::Result<void> validate(const CoordinatorOptions& options, std::size_t file_count);

private:
    pbu::Result<void> append_files(BatchJob& job);

    pbu::Result<std::vector<EntryOutcome>> finish(BatchJob& job,
                                                  const std::vector<CommitDescriptor>& descriptors);

    pbu::Result<std::vector<EntryOutcome>> poll_until_complete(BatchJob& job, const AsyncJobId& job_id);

    pbu::Error abort_batch(BatchJob& job, pbu::Error error);

    store::UploadStore& store_;
    CoordinatorOptions options_;
    events::EventBus& bus_;
    std::atomic<std::uint64_t> batch_counter_{0};
};

} // namespace pbu::upload
