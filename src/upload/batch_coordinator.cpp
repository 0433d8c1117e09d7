#include "pbu/upload/batch_coordinator.hpp"

#include "pbu/concurrency/worker_pool.hpp"
#include "pbu/upload/chunk_planner.hpp"
#include "pbu/upload/result_reconciler.hpp"
#include "pbu/upload/session_appender.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <future>
#include <optional>
#include <thread>

namespace pbu::upload {
namespace {

std::string trim_slashes(const std::string& value) {
    const auto first = value.find_first_not_of('/');
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of('/');
    return value.substr(first, last - first + 1);
}

} // namespace

std::string make_commit_path(const std::string& remote_folder, const std::string& file_name) {
    const auto folder = trim_slashes(remote_folder);
    if (folder.empty()) {
        return "/" + file_name;
    }
    return "/" + folder + "/" + file_name;
}

BatchCoordinator::BatchCoordinator(store::UploadStore& store, CoordinatorOptions options, events::EventBus& bus)
    : store_(store), options_(std::move(options)), bus_(bus) {}

pbu::Result<void> BatchCoordinator::validate(const CoordinatorOptions& options, std::size_t file_count) {
    if (file_count == 0) {
        return pbu::Err<void>(ErrorCode::PreconditionFailed, "batch must contain at least one file");
    }
    if (file_count > kMaxBatchSize) {
        return pbu::Err<void>(ErrorCode::PreconditionFailed,
                              "batch of " + std::to_string(file_count) + " files exceeds the maximum of " +
                              std::to_string(kMaxBatchSize));
    }
    if (auto aligned = validate_chunk_size(options.chunk_size); aligned.is_error()) {
        return aligned;
    }
    if (options.batch_thread_count == 0 || options.concurrent_thread_count == 0) {
        return pbu::Err<void>(ErrorCode::PreconditionFailed, "pool sizes must be at least 1");
    }
    return pbu::Ok();
}

pbu::Result<BatchReport> BatchCoordinator::upload(const std::vector<SourceFile>& files) {
    const auto started = std::chrono::steady_clock::now();

    if (auto valid = validate(options_, files.size()); valid.is_error()) {
        return pbu::Err<BatchReport>(valid.error());
    }

    BatchJob job("batch-" + std::to_string(++batch_counter_));

    spdlog::info("Starting batch of {} upload sessions.", files.size());
    auto sessions = store_.start_sessions(files.size(), SessionType::Concurrent);
    if (sessions.is_error()) {
        return pbu::Err<BatchReport>(abort_batch(job, pbu::Error{sessions.error().code,
            "starting " + std::to_string(files.size()) + " upload sessions failed: " + sessions.error().message}));
    }
    const auto& session_ids = sessions.value();
    if (session_ids.size() != files.size()) {
        return pbu::Err<BatchReport>(abort_batch(job, pbu::Error{ErrorCode::UnexpectedResponse,
            "store allocated " + std::to_string(session_ids.size()) + " sessions for " +
            std::to_string(files.size()) + " files"}));
    }

    std::uint64_t total_bytes = 0;
    for (std::size_t i = 0; i < files.size(); ++i) {
        job.add_task(FileUploadTask(i, files[i], session_ids[i],
                                    make_commit_path(options_.remote_folder, files[i].destination_name)));
        total_bytes += files[i].size;
    }
    bus_.emit(events::BatchStartedEvent{job.batch_id(), files.size(), total_bytes});

    if (auto appended = append_files(job); appended.is_error()) {
        return pbu::Err<BatchReport>(abort_batch(job, appended.error()));
    }

    const auto descriptors = job.commit_descriptors();
    if (descriptors.size() != files.size()) {
        return pbu::Err<BatchReport>(abort_batch(job, pbu::Error{ErrorCode::UnexpectedResponse,
            "only " + std::to_string(descriptors.size()) + " of " + std::to_string(files.size()) +
            " files produced a commit descriptor"}));
    }

    auto outcomes = finish(job, descriptors);
    if (outcomes.is_error()) {
        return pbu::Err<BatchReport>(abort_batch(job, outcomes.error()));
    }
    if (auto complete = job.transition_to(BatchState::Complete); complete.is_error()) {
        return pbu::Err<BatchReport>(abort_batch(job, complete.error()));
    }
    spdlog::info("Finished batch of {} entries.", descriptors.size());

    ResultReconciler reconciler(bus_);
    BatchReport report;
    report.entries = reconciler.reconcile(descriptors, outcomes.value());
    report.succeeded = ResultReconciler::count_successes(report.entries);
    report.failed = report.entries.size() - report.succeeded;

    for (const auto& entry : report.entries) {
        auto& task = job.tasks()[entry.index];
        auto moved = entry.success ? task.transition_to(TaskState::Committed) : task.mark_failed(entry.reason);
        if (moved.is_error()) {
            spdlog::warn("Task #{}: {}", entry.index, moved.error().message);
        }
    }
    for (const auto& descriptor : descriptors) {
        report.bytes_uploaded += descriptor.cursor.offset;
    }
    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    bus_.emit(events::BatchCompletedEvent{job.batch_id(), files.size(), report.succeeded, report.failed,
                                          report.bytes_uploaded, report.elapsed});
    return pbu::Ok(std::move(report));
}

pbu::Result<void> BatchCoordinator::append_files(BatchJob& job) {
    if (auto appending = job.transition_to(BatchState::Appending); appending.is_error()) {
        return appending;
    }

    // Declaration order matters: the file pool joins first, then the chunk
    // pool drains appends left behind by abandoned files.
    concurrency::WorkerPool chunk_pool(options_.concurrent_thread_count, job.batch_id() + "-chunks");
    SessionAppender appender(store_, chunk_pool, options_.chunk_size, bus_);
    concurrency::WorkerPool file_pool(options_.batch_thread_count, job.batch_id() + "-files");

    std::vector<std::future<pbu::Result<CommitDescriptor>>> futures;
    futures.reserve(job.tasks().size());
    for (auto& task : job.tasks()) {
        futures.push_back(file_pool.submit([&appender, &task]() {
            return appender.upload(task);
        }));
    }

    std::optional<pbu::Error> first_error;
    for (std::size_t i = 0; i < futures.size(); ++i) {
        const auto& task = job.tasks()[i];
        try {
            auto result = futures[i].get();
            if (result.is_error() && !first_error) {
                first_error = pbu::Error{result.error().code,
                                         "file '" + task.source().path.string() + "': " + result.error().message};
            }
        } catch (const std::exception& e) {
            if (!first_error) {
                first_error = pbu::Error{ErrorCode::AppendFailed,
                                         "file '" + task.source().path.string() + "' task threw: " + e.what()};
            }
        }
    }

    if (first_error) {
        return pbu::Err<void>(*first_error);
    }
    return pbu::Ok();
}

pbu::Result<std::vector<EntryOutcome>> BatchCoordinator::finish(BatchJob& job,
                                                               const std::vector<CommitDescriptor>& descriptors) {
    if (auto requested = job.transition_to(BatchState::FinishRequested); requested.is_error()) {
        return pbu::Err<std::vector<EntryOutcome>>(requested.error());
    }

    spdlog::info("Finishing batch of {} entries.", descriptors.size());
    bus_.emit(events::BatchFinishRequestedEvent{job.batch_id(), descriptors.size()});

    auto launch = store_.finish_batch(descriptors);
    if (launch.is_error()) {
        return pbu::Err<std::vector<EntryOutcome>>(ErrorCode::FinishFailed,
                                                   "finish batch call failed: " + launch.error().message);
    }

    std::vector<EntryOutcome> outcomes;
    switch (launch.value().kind) {
        case FinishLaunch::Kind::Complete:
            outcomes = std::move(launch.value().entries);
            break;
        case FinishLaunch::Kind::AsyncJob: {
            job.set_async_job_id(launch.value().async_job_id);
            auto polled = poll_until_complete(job, launch.value().async_job_id);
            if (polled.is_error()) {
                return polled;
            }
            outcomes = std::move(polled.value());
            break;
        }
        case FinishLaunch::Kind::Other:
            return pbu::Err<std::vector<EntryOutcome>>(ErrorCode::UnexpectedResponse,
                                                       "unknown finish result type");
    }

    if (outcomes.size() != descriptors.size()) {
        return pbu::Err<std::vector<EntryOutcome>>(ErrorCode::UnexpectedResponse,
            "finish returned " + std::to_string(outcomes.size()) + " entries for " +
            std::to_string(descriptors.size()) + " commits");
    }
    return pbu::Ok(std::move(outcomes));
}

pbu::Result<std::vector<EntryOutcome>> BatchCoordinator::poll_until_complete(BatchJob& job,
                                                                            const AsyncJobId& job_id) {
    if (auto polling = job.transition_to(BatchState::Polling); polling.is_error()) {
        return pbu::Err<std::vector<EntryOutcome>>(polling.error());
    }
    spdlog::info("Polling for status of batch {} (job '{}')...", job.batch_id(), job_id);

    for (std::size_t attempt = 1;; ++attempt) {
        auto status = store_.poll_finish_batch(job_id);
        if (status.is_error()) {
            return pbu::Err<std::vector<EntryOutcome>>(ErrorCode::FinishFailed,
                "polling finish job '" + job_id + "' failed: " + status.error().message);
        }

        bus_.emit(events::BatchPollEvent{job.batch_id(), job_id, attempt, status.value().in_progress});
        if (!status.value().in_progress) {
            return pbu::Ok(std::move(status.value().entries));
        }

        if (options_.max_poll_attempts != 0 && attempt >= options_.max_poll_attempts) {
            return pbu::Err<std::vector<EntryOutcome>>(ErrorCode::PollTimeout,
                "finish job '" + job_id + "' still in progress after " + std::to_string(attempt) + " polls");
        }
        std::this_thread::sleep_for(options_.poll_interval);
    }
}

pbu::Error BatchCoordinator::abort_batch(BatchJob& job, pbu::Error error) {
    if (auto failed = job.mark_failed(error.message); failed.is_error()) {
        spdlog::warn("Batch {}: {}", job.batch_id(), failed.error().message);
    }
    bus_.emit(events::BatchFailedEvent{job.batch_id(), job.tasks().size(), error.to_string()});
    return error;
}

} // namespace pbu::upload
