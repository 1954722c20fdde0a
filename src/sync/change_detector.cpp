#include "clipcloud/sync/change_detector.hpp"

#include "clipcloud/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>

namespace clipcloud::sync {
namespace {

std::optional<std::uint64_t> parse_clock(const std::string& value) {
    if (value.empty() || value.size() > 20) {
        return std::nullopt;
    }
    for (unsigned char c : value) {
        if (!std::isdigit(c)) {
            return std::nullopt;
        }
    }
    return static_cast<std::uint64_t>(std::strtoull(value.c_str(), nullptr, 10));
}

std::uint64_t now_millis() {
    using namespace std::chrono;
    return static_cast<std::uint64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

} // namespace

ChangeDetector::ChangeDetector(storage::SigningGateway& gateway, events::EventBus& bus)
    : gateway_(gateway), bus_(bus) {}

ChangeDetector::~ChangeDetector() {
    stop_polling();
}

Result<void> ChangeDetector::poll_init() {
    spdlog::info("[ChangeDetector] Poll init for bucket {}", gateway_.bucket());

    auto remote = gateway_.get_clock();
    if (remote.is_ok()) {
        std::lock_guard lock(clock_mutex_);
        cached_clock_ = remote.value();
        state_ = DetectorState::Initialized;
        spdlog::info("[ChangeDetector] Initial clock is {}", cached_clock_);
        return Ok();
    }

    const auto& error = remote.error();
    if (!error.is(ErrorKind::NotFound)) {
        spdlog::error("[ChangeDetector] Error getting clock: {}", error.describe());
        return Fail<void>(ErrorKind::Initialization, "Error getting logical clock from store: " + error.message,
                          error.status, error.body);
    }

    spdlog::info("[ChangeDetector] Bucket has no clock yet, it will be created");
    auto created = advance_clock();
    if (created.is_error()) {
        const auto& cause = created.error();
        return Fail<void>(ErrorKind::Initialization, "Error creating logical clock: " + cause.message,
                          cause.status, cause.body);
    }

    std::lock_guard lock(clock_mutex_);
    state_ = DetectorState::Initialized;
    return Ok();
}

void ChangeDetector::start_polling_every(std::chrono::milliseconds interval) {
    if (std::this_thread::get_id() == poll_thread_id_.load()) {
        spdlog::warn("[ChangeDetector] start_polling called from the polling thread, ignored");
        return;
    }

    stop_polling();

    std::lock_guard lock(polling_mutex_);
    spdlog::info("[ChangeDetector] Start polling every {}ms", interval.count());

    interval_ = std::max(interval, std::chrono::milliseconds(1));
    io_ = std::make_unique<boost::asio::io_context>();
    timer_ = std::make_unique<boost::asio::steady_timer>(*io_);
    arm_timer();

    polling_ = true;
    poll_thread_ = std::thread([this, io = io_.get()] {
        poll_thread_id_ = std::this_thread::get_id();
        io->run();
    });
}

void ChangeDetector::stop_polling() {
    if (std::this_thread::get_id() == poll_thread_id_.load()) {
        // Joining ourselves would deadlock; the owner joins on the next start/stop
        polling_ = false;
        io_->stop();
        return;
    }

    std::lock_guard lock(polling_mutex_);
    if (!poll_thread_.joinable()) {
        return;
    }

    spdlog::info("[ChangeDetector] Stop polling");
    polling_ = false;
    io_->stop();
    poll_thread_.join();
    poll_thread_id_ = std::thread::id();
    timer_.reset();
    io_.reset();
}

void ChangeDetector::arm_timer() {
    timer_->expires_after(interval_);
    timer_->async_wait([this](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || !polling_) {
            return;
        }
        run_tick();
        if (polling_) {
            arm_timer();
        }
    });
}

void ChangeDetector::run_tick() {
    try {
        auto result = check_for_update();
        if (result.is_error()) {
            spdlog::warn("[ChangeDetector] Poll failed, retrying next tick: {}", result.error().describe());
        }
    } catch (const std::exception& e) {
        spdlog::error("[ChangeDetector] Poll tick threw, retrying next tick: {}", e.what());
    }
}

Result<bool> ChangeDetector::check_for_update() {
    auto remote = gateway_.get_clock();
    if (remote.is_error()) {
        return Err<bool>(remote.error());
    }

    std::string previous;
    {
        std::lock_guard lock(clock_mutex_);
        if (remote.value() == cached_clock_) {
            return Ok(false);
        }
        previous = cached_clock_;
        cached_clock_ = remote.value();
    }

    spdlog::info("[ChangeDetector] Cloud data changed: {} (was {})", remote.value(), previous);
    bus_.emit(events::BucketChangedEvent{gateway_.bucket(), previous, remote.value()});
    return Ok(true);
}

std::string ChangeDetector::issue_clock_value() {
    std::lock_guard lock(clock_mutex_);

    std::uint64_t next = std::max(now_millis(), last_issued_ + 1);
    if (auto cached = parse_clock(cached_clock_)) {
        next = std::max(next, *cached + 1);
    }

    last_issued_ = next;
    cached_clock_ = std::to_string(next);
    return cached_clock_;
}

Result<std::string> ChangeDetector::advance_clock() {
    const auto value = issue_clock_value();
    spdlog::info("[ChangeDetector] Updating last mod time to {}", value);

    auto pushed = gateway_.set_clock(value);
    if (pushed.is_error()) {
        spdlog::warn("[ChangeDetector] Clock push failed, local clock {} is ahead of remote: {}",
                     value, pushed.error().describe());
        return Err<std::string>(pushed.error());
    }

    bus_.emit(events::ClockAdvancedEvent{gateway_.bucket(), value});
    return Ok(value);
}

std::string ChangeDetector::cached_clock() const {
    std::lock_guard lock(clock_mutex_);
    return cached_clock_;
}

DetectorState ChangeDetector::state() const {
    std::lock_guard lock(clock_mutex_);
    return state_;
}

} // namespace clipcloud::sync
