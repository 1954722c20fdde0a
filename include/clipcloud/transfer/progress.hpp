#pragma once

#include "clipcloud/transfer/types.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace clipcloud::transfer {

/**
 * @brief Clamps and de-duplicates percentages before they reach the caller
 *
 * Values below the last one emitted are dropped, so a listener only ever
 * sees a non-decreasing sequence. finish() emits 100 if it was not reached.
 */
class ProgressReporter {
public:
    explicit ProgressReporter(ProgressCallback callback) : callback_(std::move(callback)) {}

    void report(int percent) {
        percent = std::clamp(percent, 0, 100);
        if (!callback_ || percent <= last_) {
            return;
        }
        last_ = percent;
        callback_(percent);
    }

    void report_fraction(std::uint64_t done, std::uint64_t total) {
        if (total == 0) {
            return;
        }
        report(percent_of(done, total));
    }

    void finish() { report(100); }

    int last() const { return last_; }

    static int percent_of(std::uint64_t done, std::uint64_t total) {
        return static_cast<int>(std::lround(100.0 * static_cast<double>(done) / static_cast<double>(total)));
    }

private:
    ProgressCallback callback_;
    int last_ = -1;
};

} // namespace clipcloud::transfer
