#include "pbu/events/components.hpp"
#include "pbu/events/event_bus.hpp"
#include "pbu/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>

using pbu::events::BatchCompletedEvent;
using pbu::events::BatchFailedEvent;
using pbu::events::BatchPollEvent;
using pbu::events::BatchStartedEvent;
using pbu::events::ChunkAppendedEvent;
using pbu::events::EntryCommittedEvent;
using pbu::events::EntryFailedEvent;
using pbu::events::EventBus;
using pbu::events::FileAppendsCompletedEvent;
using pbu::events::FileUploadFailedEvent;
using pbu::events::MetricsComponent;

TEST(MetricsComponentTest, TracksAppendAndCommitCounters) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(BatchStartedEvent{"batch-1", 2, 3072});
    bus.emit(ChunkAppendedEvent{"s-0", "/a", 0, 1024, false});
    bus.emit(ChunkAppendedEvent{"s-0", "/a", 1024, 1024, true});
    bus.emit(ChunkAppendedEvent{"s-1", "/b", 0, 1024, true});
    bus.emit(FileAppendsCompletedEvent{"s-0", "/a", 2048, 2, std::chrono::milliseconds{5}});
    bus.emit(FileAppendsCompletedEvent{"s-1", "/b", 1024, 1, std::chrono::milliseconds{5}});
    bus.emit(BatchPollEvent{"batch-1", "job", 1, true});
    bus.emit(BatchPollEvent{"batch-1", "job", 2, false});
    bus.emit(EntryCommittedEvent{0, "/a", 2048});
    bus.emit(EntryFailedEvent{1, "/b", "path/conflict/file"});
    bus.emit(BatchCompletedEvent{"batch-1", 2, 1, 1, 3072, std::chrono::milliseconds{1000}});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.batches_started.load(), 1u);
    EXPECT_EQ(stats.chunks_appended.load(), 3u);
    EXPECT_EQ(stats.bytes_appended.load(), 3072u);
    EXPECT_EQ(stats.files_appended.load(), 2u);
    EXPECT_EQ(stats.finish_polls.load(), 2u);
    EXPECT_EQ(stats.entries_committed.load(), 1u);
    EXPECT_EQ(stats.entries_failed.load(), 1u);
    EXPECT_EQ(stats.batches_completed.load(), 1u);
    EXPECT_EQ(stats.bytes_uploaded.load(), 3072u);
    EXPECT_EQ(stats.elapsed_ms.load(), 1000u);
}

TEST(MetricsComponentTest, TracksFailures) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(FileUploadFailedEvent{"s-2", "/c", "append_failed: incorrect_offset"});
    bus.emit(BatchFailedEvent{"batch-1", 3, "append_failed"});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.files_failed.load(), 1u);
    EXPECT_EQ(stats.batches_failed.load(), 1u);
    EXPECT_EQ(stats.batches_completed.load(), 0u);
}

TEST(MetricsComponentTest, ThroughputInMegabytesPerSecond) {
    EventBus bus;
    MetricsComponent metrics(bus);

    EXPECT_DOUBLE_EQ(metrics.throughput_mb_per_s(), 0.0);

    bus.emit(BatchCompletedEvent{"batch-1", 1, 1, 0, 20ULL * 1024 * 1024, std::chrono::milliseconds{2000}});
    EXPECT_DOUBLE_EQ(metrics.throughput_mb_per_s(), 10.0);
}
