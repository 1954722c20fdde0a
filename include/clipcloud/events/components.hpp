/**
 * @file components.hpp
 * @brief Ready-made bus subscribers
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Transfers and polling are now logged and counted
 */

#pragma once

#include "clipcloud/events/event_bus.hpp"
#include "clipcloud/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <vector>

namespace clipcloud::events {

/**
 * @brief Base for components that must drop their handlers on destruction
 */
class BusComponent {
public:
    explicit BusComponent(EventBus& bus) : bus_(bus) {}

    BusComponent(const BusComponent&) = delete;
    BusComponent& operator=(const BusComponent&) = delete;

    virtual ~BusComponent() {
        for (auto& unsubscribe : unsubscribers_) {
            unsubscribe();
        }
    }

protected:
    template<typename EventType>
    void listen(std::function<void(const EventType&)> handler) {
        const auto id = bus_.subscribe<EventType>(std::move(handler));
        unsubscribers_.push_back([this, id] { bus_.unsubscribe<EventType>(id); });
    }

    EventBus& bus_;

private:
    std::vector<std::function<void()>> unsubscribers_;
};

/**
 * @brief Logs transfer lifecycle and bucket changes with spdlog
 */
class LoggerComponent : public BusComponent {
public:
    explicit LoggerComponent(EventBus& bus) : BusComponent(bus) {
        listen<UploadStartedEvent>([this](const UploadStartedEvent& e) { on_upload_started(e); });
        listen<PartUploadedEvent>([this](const PartUploadedEvent& e) { on_part_uploaded(e); });
        listen<UploadCompletedEvent>([this](const UploadCompletedEvent& e) { on_upload_completed(e); });
        listen<DownloadCompletedEvent>([this](const DownloadCompletedEvent& e) { on_download_completed(e); });
        listen<ObjectDeletedEvent>([this](const ObjectDeletedEvent& e) { on_object_deleted(e); });
        listen<TransferFailedEvent>([this](const TransferFailedEvent& e) { on_transfer_failed(e); });
        listen<BucketChangedEvent>([this](const BucketChangedEvent& e) { on_bucket_changed(e); });
        listen<ClockAdvancedEvent>([this](const ClockAdvancedEvent& e) { on_clock_advanced(e); });
    }

private:
    void on_upload_started(const UploadStartedEvent& e) {
        spdlog::info("[UploadStarted] key={} bytes={} mode={}",
                     e.key, e.total_bytes, e.multipart ? "multipart" : "single");
    }

    void on_part_uploaded(const PartUploadedEvent& e) {
        spdlog::debug("[PartUploaded] key={} part={}/{} bytes={} etag={}",
                      e.key, e.part_index + 1, e.part_count, e.bytes, e.token);
    }

    void on_upload_completed(const UploadCompletedEvent& e) {
        spdlog::info("[UploadCompleted] key={} bytes={} parts={} duration={}ms",
                     e.key, e.total_bytes, e.parts, e.duration.count());
    }

    void on_download_completed(const DownloadCompletedEvent& e) {
        spdlog::info("[DownloadCompleted] key={} path={} bytes={} duration={}ms",
                     e.key, e.destination, e.total_bytes, e.duration.count());
    }

    void on_object_deleted(const ObjectDeletedEvent& e) {
        spdlog::info("[ObjectDeleted] key={}", e.key);
    }

    void on_transfer_failed(const TransferFailedEvent& e) {
        spdlog::error("[TransferFailed] key={} op={} {}", e.key, e.operation, e.error.describe());
    }

    void on_bucket_changed(const BucketChangedEvent& e) {
        spdlog::info("[BucketChanged] bucket={} clock {} -> {}", e.bucket, e.previous, e.current);
    }

    void on_clock_advanced(const ClockAdvancedEvent& e) {
        spdlog::debug("[ClockAdvanced] bucket={} clock={}", e.bucket, e.value);
    }
};

/**
 * @brief Counts transfers for status displays
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * const auto& stats = metrics.get_stats();
 * spdlog::info("Uploaded {} bytes", stats.bytes_uploaded.load());
 */
class MetricsComponent : public BusComponent {
public:
    struct Stats {
        std::atomic<uint64_t> uploads{0};
        std::atomic<uint64_t> bytes_uploaded{0};
        std::atomic<uint64_t> parts_uploaded{0};
        std::atomic<uint64_t> downloads{0};
        std::atomic<uint64_t> bytes_downloaded{0};
        std::atomic<uint64_t> deletions{0};
        std::atomic<uint64_t> failures{0};
        std::atomic<uint64_t> bucket_changes{0};
    };

    explicit MetricsComponent(EventBus& bus) : BusComponent(bus) {
        listen<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            stats_.uploads++;
            stats_.bytes_uploaded += e.total_bytes;
        });
        listen<PartUploadedEvent>([this](const PartUploadedEvent&) {
            stats_.parts_uploaded++;
        });
        listen<DownloadCompletedEvent>([this](const DownloadCompletedEvent& e) {
            stats_.downloads++;
            stats_.bytes_downloaded += e.total_bytes;
        });
        listen<ObjectDeletedEvent>([this](const ObjectDeletedEvent&) {
            stats_.deletions++;
        });
        listen<TransferFailedEvent>([this](const TransferFailedEvent&) {
            stats_.failures++;
        });
        listen<BucketChangedEvent>([this](const BucketChangedEvent&) {
            stats_.bucket_changes++;
        });
    }

    const Stats& get_stats() const { return stats_; }

private:
    Stats stats_;
};

} // namespace clipcloud::events
