#include "pbu/upload/task.hpp"

#include <gtest/gtest.h>

using pbu::upload::BatchJob;
using pbu::upload::BatchState;
using pbu::upload::CommitDescriptor;
using pbu::upload::Cursor;
using pbu::upload::FileUploadTask;
using pbu::upload::SourceFile;
using pbu::upload::TaskState;

namespace {

FileUploadTask make_task(std::size_t index, const std::string& name) {
    return FileUploadTask(index, SourceFile{"/tmp/" + name, 100, name}, "session-" + std::to_string(index),
                          "/Uploads/" + name);
}

} // namespace

TEST(FileUploadTaskTest, StartsPending) {
    auto task = make_task(2, "a.txt");

    EXPECT_EQ(task.index(), 2u);
    EXPECT_EQ(task.session_id(), "session-2");
    EXPECT_EQ(task.commit_path(), "/Uploads/a.txt");
    EXPECT_EQ(task.state(), TaskState::Pending);
    EXPECT_FALSE(task.commit().has_value());
}

TEST(FileUploadTaskTest, EnforcesTransitionOrder) {
    auto task = make_task(0, "a.txt");

    EXPECT_TRUE(task.transition_to(TaskState::Closed).is_error());
    EXPECT_TRUE(task.transition_to(TaskState::Appending).is_ok());
    EXPECT_TRUE(task.close(CommitDescriptor{Cursor{"session-0", 100}, "/Uploads/a.txt"}).is_ok());
    EXPECT_EQ(task.state(), TaskState::Closed);
    ASSERT_TRUE(task.commit().has_value());
    EXPECT_EQ(task.commit()->cursor.offset, 100u);

    EXPECT_TRUE(task.transition_to(TaskState::Committed).is_ok());

    auto illegal = task.transition_to(TaskState::Appending);
    ASSERT_TRUE(illegal.is_error());
    EXPECT_EQ(illegal.error().code, pbu::ErrorCode::PreconditionFailed);
}

TEST(FileUploadTaskTest, CloseRequiresAppending) {
    auto task = make_task(0, "a.txt");

    EXPECT_TRUE(task.close(CommitDescriptor{Cursor{"session-0", 100}, "/Uploads/a.txt"}).is_error());
    EXPECT_FALSE(task.commit().has_value());
}

TEST(FileUploadTaskTest, AllowsFailureFromAnyLiveState) {
    auto task = make_task(0, "a.txt");
    ASSERT_TRUE(task.transition_to(TaskState::Appending).is_ok());

    auto failed = task.mark_failed("append to session session-0 at offset 0 failed: incorrect_offset");
    ASSERT_TRUE(failed.is_ok());
    EXPECT_EQ(task.state(), TaskState::Failed);
    EXPECT_NE(task.last_error().find("incorrect_offset"), std::string::npos);

    EXPECT_TRUE(task.transition_to(TaskState::Failed).is_ok());
    EXPECT_TRUE(task.transition_to(TaskState::Closed).is_error());
}

TEST(FileUploadTaskTest, CommittedTaskCannotFail) {
    auto task = make_task(0, "a.txt");
    ASSERT_TRUE(task.transition_to(TaskState::Appending).is_ok());
    ASSERT_TRUE(task.close(CommitDescriptor{Cursor{"session-0", 100}, "/Uploads/a.txt"}).is_ok());
    ASSERT_TRUE(task.transition_to(TaskState::Committed).is_ok());

    EXPECT_TRUE(task.mark_failed("late").is_error());
    EXPECT_EQ(task.state(), TaskState::Committed);
}

TEST(BatchJobTest, EnforcesTransitionOrder) {
    BatchJob job("batch-1");
    EXPECT_EQ(job.state(), BatchState::Started);

    EXPECT_TRUE(job.transition_to(BatchState::FinishRequested).is_error());
    EXPECT_TRUE(job.transition_to(BatchState::Appending).is_ok());
    EXPECT_TRUE(job.transition_to(BatchState::FinishRequested).is_ok());
    EXPECT_TRUE(job.transition_to(BatchState::Polling).is_ok());
    EXPECT_TRUE(job.transition_to(BatchState::Polling).is_ok());
    EXPECT_TRUE(job.transition_to(BatchState::Complete).is_ok());

    EXPECT_TRUE(job.transition_to(BatchState::Appending).is_error());
    EXPECT_TRUE(job.mark_failed("too late").is_error());
}

TEST(BatchJobTest, RecordsAsyncJobId) {
    BatchJob job("batch-3");
    EXPECT_FALSE(job.async_job_id().has_value());

    job.set_async_job_id("job-42");
    ASSERT_TRUE(job.async_job_id().has_value());
    EXPECT_EQ(*job.async_job_id(), "job-42");
}

TEST(BatchJobTest, SynchronousFinishSkipsPolling) {
    BatchJob job("batch-1");
    ASSERT_TRUE(job.transition_to(BatchState::Appending).is_ok());
    ASSERT_TRUE(job.transition_to(BatchState::FinishRequested).is_ok());
    EXPECT_TRUE(job.transition_to(BatchState::Complete).is_ok());
}

TEST(BatchJobTest, MarkFailedRecordsError) {
    BatchJob job("batch-7");
    ASSERT_TRUE(job.transition_to(BatchState::Appending).is_ok());

    ASSERT_TRUE(job.mark_failed("file 'b.bin': append_failed").is_ok());
    EXPECT_EQ(job.state(), BatchState::Failed);
    EXPECT_EQ(job.last_error(), "file 'b.bin': append_failed");
    EXPECT_EQ(job.batch_id(), "batch-7");
}

TEST(BatchJobTest, CommitDescriptorsFollowTaskOrderAndSkipUnclosed) {
    BatchJob job("batch-1");
    job.add_task(make_task(0, "a.txt"));
    job.add_task(make_task(1, "b.txt"));
    job.add_task(make_task(2, "c.txt"));

    for (std::size_t i : {0u, 2u}) {
        auto& task = job.tasks()[i];
        ASSERT_TRUE(task.transition_to(TaskState::Appending).is_ok());
        ASSERT_TRUE(task.close(CommitDescriptor{Cursor{task.session_id(), 100}, task.commit_path()}).is_ok());
    }

    auto descriptors = job.commit_descriptors();
    ASSERT_EQ(descriptors.size(), 2u);
    EXPECT_EQ(descriptors[0].path, "/Uploads/a.txt");
    EXPECT_EQ(descriptors[1].path, "/Uploads/c.txt");
    EXPECT_EQ(descriptors[1].cursor.session_id, "session-2");
}

TEST(BatchJobTest, StateNames) {
    EXPECT_STREQ(pbu::upload::to_string(TaskState::Appending), "appending");
    EXPECT_STREQ(pbu::upload::to_string(BatchState::FinishRequested), "finish_requested");
}
