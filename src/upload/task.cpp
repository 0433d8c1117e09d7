#include "pbu/upload/task.hpp"

#include <algorithm>
#include <unordered_map>

namespace pbu::upload {
namespace {

bool task_is_progressive(TaskState current, TaskState target) {
    static const std::unordered_map<TaskState, std::vector<TaskState>> transitions {
        {TaskState::Pending, {TaskState::Appending}},
        {TaskState::Appending, {TaskState::Closed}},
        {TaskState::Closed, {TaskState::Committed}},
    };

    if (target == TaskState::Failed) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), target) != allowed.end();
}

bool batch_is_progressive(BatchState current, BatchState target) {
    static const std::unordered_map<BatchState, std::vector<BatchState>> transitions {
        {BatchState::Started, {BatchState::Appending}},
        {BatchState::Appending, {BatchState::FinishRequested}},
        {BatchState::FinishRequested, {BatchState::Polling, BatchState::Complete}},
        {BatchState::Polling, {BatchState::Complete}},
    };

    if (target == BatchState::Failed) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), target) != allowed.end();
}

} // namespace

const char* to_string(TaskState state) {
    switch (state) {
        case TaskState::Pending: return "pending";
        case TaskState::Appending: return "appending";
        case TaskState::Closed: return "closed";
        case TaskState::Committed: return "committed";
        case TaskState::Failed: return "failed";
    }
    return "unknown";
}

const char* to_string(BatchState state) {
    switch (state) {
        case BatchState::Started: return "started";
        case BatchState::Appending: return "appending";
        case BatchState::FinishRequested: return "finish_requested";
        case BatchState::Polling: return "polling";
        case BatchState::Complete: return "complete";
        case BatchState::Failed: return "failed";
    }
    return "unknown";
}

FileUploadTask::FileUploadTask(std::size_t index, SourceFile source, SessionId session_id, std::string commit_path)
    : index_(index),
      source_(std::move(source)),
      session_id_(std::move(session_id)),
      commit_path_(std::move(commit_path)) {}

pbu::Result<void> FileUploadTask::transition_to(TaskState next_state) {
    if (state_ == next_state) {
        return pbu::Ok();
    }

    if (!can_transition(next_state)) {
        return pbu::Err<void>(ErrorCode::PreconditionFailed,
                              std::string("illegal task transition ") + to_string(state_) +
                              " -> " + to_string(next_state));
    }

    state_ = next_state;
    if (next_state != TaskState::Failed) {
        last_error_.clear();
    }
    return pbu::Ok();
}

pbu::Result<void> FileUploadTask::close(CommitDescriptor descriptor) {
    auto result = transition_to(TaskState::Closed);
    if (result.is_error()) {
        return result;
    }
    commit_ = std::move(descriptor);
    return pbu::Ok();
}

pbu::Result<void> FileUploadTask::mark_failed(std::string error_message) {
    last_error_ = std::move(error_message);
    return transition_to(TaskState::Failed);
}

bool FileUploadTask::can_transition(TaskState target) const noexcept {
    if (state_ == target) {
        return true;
    }
    if (state_ == TaskState::Committed || state_ == TaskState::Failed) {
        return false;
    }
    return task_is_progressive(state_, target);
}

BatchJob::BatchJob(std::string batch_id) : batch_id_(std::move(batch_id)) {}

void BatchJob::add_task(FileUploadTask task) {
    tasks_.push_back(std::move(task));
}

pbu::Result<void> BatchJob::transition_to(BatchState next_state) {
    // Polling repeats while the finish job is in progress
    if (state_ == next_state) {
        return pbu::Ok();
    }

    if (!can_transition(next_state)) {
        return pbu::Err<void>(ErrorCode::PreconditionFailed,
                              std::string("illegal batch transition ") + to_string(state_) +
                              " -> " + to_string(next_state));
    }

    state_ = next_state;
    if (next_state != BatchState::Failed) {
        last_error_.clear();
    }
    return pbu::Ok();
}

pbu::Result<void> BatchJob::mark_failed(std::string error_message) {
    last_error_ = std::move(error_message);
    return transition_to(BatchState::Failed);
}

std::vector<CommitDescriptor> BatchJob::commit_descriptors() const {
    std::vector<CommitDescriptor> descriptors;
    descriptors.reserve(tasks_.size());
    for (const auto& task : tasks_) {
        if (task.state() == TaskState::Closed && task.commit()) {
            descriptors.push_back(*task.commit());
        }
    }
    return descriptors;
}

bool BatchJob::can_transition(BatchState target) const noexcept {
    if (state_ == target) {
        return true;
    }
    if (state_ == BatchState::Complete || state_ == BatchState::Failed) {
        return false;
    }
    return batch_is_progressive(state_, target);
}

} // namespace pbu::upload
