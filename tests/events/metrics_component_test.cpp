#include "clipcloud/events/event_bus.hpp"
#include "clipcloud/events/components.hpp"
#include "clipcloud/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>

using clipcloud::Error;
using clipcloud::ErrorKind;
using clipcloud::events::BucketChangedEvent;
using clipcloud::events::DownloadCompletedEvent;
using clipcloud::events::EventBus;
using clipcloud::events::LoggerComponent;
using clipcloud::events::MetricsComponent;
using clipcloud::events::ObjectDeletedEvent;
using clipcloud::events::PartUploadedEvent;
using clipcloud::events::TransferFailedEvent;
using clipcloud::events::UploadCompletedEvent;
using clipcloud::events::UploadStartedEvent;

TEST(MetricsComponentTest, TracksTransferAndChangeCounters) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(UploadCompletedEvent{"a.mp4", 1024, 1, std::chrono::milliseconds{200}});
    bus.emit(PartUploadedEvent{"b.mp4", 0, 2, 512, "t1"});
    bus.emit(PartUploadedEvent{"b.mp4", 1, 2, 100, "t2"});
    bus.emit(UploadCompletedEvent{"b.mp4", 612, 2, std::chrono::milliseconds{400}});
    bus.emit(DownloadCompletedEvent{"c.mp4", "/tmp/c.mp4", 2048, std::chrono::milliseconds{50}});
    bus.emit(ObjectDeletedEvent{"a.mp4"});
    bus.emit(TransferFailedEvent{"d.mov", "upload", Error(ErrorKind::UnsupportedType, "nope")});
    bus.emit(BucketChangedEvent{"guild", "1", "2"});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.uploads.load(), 2u);
    EXPECT_EQ(stats.bytes_uploaded.load(), 1636u);
    EXPECT_EQ(stats.parts_uploaded.load(), 2u);
    EXPECT_EQ(stats.downloads.load(), 1u);
    EXPECT_EQ(stats.bytes_downloaded.load(), 2048u);
    EXPECT_EQ(stats.deletions.load(), 1u);
    EXPECT_EQ(stats.failures.load(), 1u);
    EXPECT_EQ(stats.bucket_changes.load(), 1u);
}

TEST(MetricsComponentTest, UnsubscribesOnDestruction) {
    EventBus bus;
    {
        MetricsComponent metrics(bus);
        LoggerComponent logger(bus);
        EXPECT_EQ(bus.subscriber_count<BucketChangedEvent>(), 2u);
        EXPECT_EQ(bus.subscriber_count<UploadStartedEvent>(), 1u);
    }
    EXPECT_EQ(bus.subscriber_count<BucketChangedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<UploadStartedEvent>(), 0u);

    EXPECT_NO_THROW(bus.emit(BucketChangedEvent{"guild", "1", "2"}));
}
