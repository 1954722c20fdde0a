/**
 * @file change_detector.hpp
 * @brief Bucket change detection via a shared logical clock
 *
 * WHY THIS FILE EXISTS:
 * Several clients share one bucket. Listing it to spot changes is slow
 * and billed per call; a single clock value that every writer bumps is
 * neither.
 *
 * WHAT IT DOES:
 * - poll_init: read the clock, creating it when the bucket has none
 * - check_for_update: compare remote with cached, publish one event on drift
 * - advance_clock: issue a strictly larger value and push it
 * - start_polling/stop_polling: run checks on a Boost.Asio timer thread
 *
 * EXAMPLE:
 * ChangeDetector detector(gateway, bus);
 * if (detector.poll_init().is_ok()) {
 *     detector.start_polling(std::chrono::seconds(60));
 * }
 */

#pragma once

#include "clipcloud/core/result.hpp"
#include "clipcloud/events/event_bus.hpp"
#include "clipcloud/storage/signing_gateway.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace clipcloud::sync {

enum class DetectorState {
    Uninitialized,
    Initialized
};

/**
 * @brief Detects remote bucket changes through the bucket's logical clock
 *
 * Reading one small clock object replaces listing the bucket: every client
 * that mutates the bucket writes a fresh millisecond timestamp, and every
 * client polls it. A mismatch against the cached value publishes one
 * events::BucketChangedEvent on the bus.
 *
 * The cache is written on poll/init when the remote differs, and by
 * advance_clock() after this process mutates the bucket. Concurrent writers
 * are last-writer-wins; staleness corrects itself on the next tick.
 *
 * One instance per bucket; instances share nothing.
 *
 * Callbacks run on the polling thread. A BucketChangedEvent handler may
 * call stop_polling() but must not call start_polling() or destroy the
 * detector.
 */
class ChangeDetector {
public:
    ChangeDetector(storage::SigningGateway& gateway, events::EventBus& bus);
    ~ChangeDetector();

    ChangeDetector(const ChangeDetector&) = delete;
    ChangeDetector& operator=(const ChangeDetector&) = delete;

    /**
     * @brief Adopt the remote clock, creating it when the bucket has none
     *
     * Any failure other than "clock missing" is returned as Initialization
     * and leaves the detector Uninitialized with nothing written remotely.
     */
    Result<void> poll_init();

    /**
     * @brief Start checking every `interval`, replacing any running loop
     *
     * Ticks run on a dedicated thread and never overlap: the next tick is
     * armed only after the previous one returned. A failing tick is logged
     * and retried on the next one.
     */
    template<typename Rep, typename Period>
    void start_polling(std::chrono::duration<Rep, Period> interval) {
        start_polling_every(std::chrono::duration_cast<std::chrono::milliseconds>(interval));
    }

    void start_polling(unsigned int interval_seconds) {
        start_polling_every(std::chrono::seconds(interval_seconds));
    }

    /**
     * @brief Stop the polling loop; no-op when not polling
     *
     * An in-flight tick is allowed to finish first.
     */
    void stop_polling();

    bool is_polling() const noexcept { return polling_.load(); }

    /**
     * @brief One poll tick
     *
     * @return true when the remote clock differed and an event was published
     */
    Result<bool> check_for_update();

    /**
     * @brief Issue a new clock value and push it to the authority
     *
     * The cache is updated before the push. If the push fails the error is
     * returned and the cache stays ahead of the remote until the next
     * successful advance.
     *
     * @return the value issued
     */
    Result<std::string> advance_clock();

    std::string cached_clock() const;
    DetectorState state() const;
    bool initialized() const { return state() == DetectorState::Initialized; }

private:
    void start_polling_every(std::chrono::milliseconds interval);
    void arm_timer();
    void run_tick();
    std::string issue_clock_value();

    storage::SigningGateway& gateway_;
    events::EventBus& bus_;

    mutable std::mutex clock_mutex_;
    std::string cached_clock_ = "0";
    std::uint64_t last_issued_ = 0;
    DetectorState state_ = DetectorState::Uninitialized;

    std::mutex polling_mutex_;
    std::atomic<bool> polling_{false};
    std::atomic<std::thread::id> poll_thread_id_{};
    std::unique_ptr<boost::asio::io_context> io_;
    std::unique_ptr<boost::asio::steady_timer> timer_;
    std::thread poll_thread_;
    std::chrono::milliseconds interval_{0};
};

} // namespace clipcloud::sync
