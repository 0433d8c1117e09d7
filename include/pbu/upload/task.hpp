#pragma once

#include "pbu/core/result.hpp"
#include "pbu/upload/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pbu::upload {

enum class TaskState {
    Pending,     ///< Session allocated, no chunk sent
    Appending,   ///< Chunks in flight
    Closed,      ///< All chunks durable, commit descriptor available
    Committed,
    Failed
};

enum class BatchState {
    Started,
    Appending,
    FinishRequested,
    Polling,
    Complete,
    Failed
};

const char* to_string(TaskState state);
const char* to_string(BatchState state);

/**
 * @brief One source file travelling through one upload session
 *
 * Only the outer worker running the file's appender mutates the task until it
 * is Closed; afterwards only the coordinating thread does.
 */
class FileUploadTask {
public:
    FileUploadTask(std::size_t index, SourceFile source, SessionId session_id, std::string commit_path);

    [[nodiscard]] std::size_t index() const noexcept { return index_; }
    [[nodiscard]] const SourceFile& source() const noexcept { return source_; }
    [[nodiscard]] const SessionId& session_id() const noexcept { return session_id_; }
    [[nodiscard]] const std::string& commit_path() const noexcept { return commit_path_; }
    [[nodiscard]] TaskState state() const noexcept { return state_; }
    [[nodiscard]] const std::optional<CommitDescriptor>& commit() const noexcept { return commit_; }
    [[nodiscard]] const std::string& last_error() const noexcept { return last_error_; }

    pbu::Result<void> transition_to(TaskState next_state);

    /// Record the descriptor and move to Closed.
    pbu::Result<void> close(CommitDescriptor descriptor);

    pbu::Result<void> mark_failed(std::string error_message);

private:
    [[nodiscard]] bool can_transition(TaskState target) const noexcept;

    std::size_t index_;
    SourceFile source_;
    SessionId session_id_;
    std::string commit_path_;
    TaskState state_ = TaskState::Pending;
    std::optional<CommitDescriptor> commit_;
    std::string last_error_;
};

/**
 * @brief Ordered tasks of one batch plus the finish-job handle
 */
class BatchJob {
public:
    explicit BatchJob(std::string batch_id);

    [[nodiscard]] const std::string& batch_id() const noexcept { return batch_id_; }
    [[nodiscard]] BatchState state() const noexcept { return state_; }
    [[nodiscard]] const std::optional<AsyncJobId>& async_job_id() const noexcept { return async_job_id_; }
    [[nodiscard]] const std::string& last_error() const noexcept { return last_error_; }

    std::vector<FileUploadTask>& tasks() noexcept { return tasks_; }
    const std::vector<FileUploadTask>& tasks() const noexcept { return tasks_; }

    void add_task(FileUploadTask task);

    pbu::Result<void> transition_to(BatchState next_state);
    pbu::Result<void> mark_failed(std::string error_message);

    void set_async_job_id(AsyncJobId job_id) { async_job_id_ = std::move(job_id); }

    /// Descriptors of every Closed task, in task order.
    [[nodiscard]] std::vector<CommitDescriptor> commit_descriptors() const;

private:
    [[nodiscard]] bool can_transition(BatchState target) const noexcept;

    std::string batch_id_;
    BatchState state_ = BatchState::Started;
    std::vector<FileUploadTask> tasks_;
    std::optional<AsyncJobId> async_job_id_;
    std::string last_error_;
};

} // namespace pbu::upload
