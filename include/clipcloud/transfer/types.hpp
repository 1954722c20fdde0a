#pragma once

#include "clipcloud/core/result.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace clipcloud::transfer {

/**
 * @brief Transfer progress in percent, 0-100, non-decreasing per call
 */
using ProgressCallback = std::function<void(int)>;

/**
 * @brief Bucket-scoped key and the byte length declared for it
 */
struct TransferTarget {
    std::string key;
    std::uint64_t length = 0;
};

/**
 * @brief One part of a multi-part upload
 */
struct ByteRange {
    std::size_t index = 0;
    std::uint64_t offset = 0;
    std::uint64_t length = 0;

    std::uint64_t end() const { return offset + length; }
};

/**
 * @brief Size rules shared by the strategy selector and the part planner
 *
 * Lengths below `single_part_threshold` go out in one PUT; anything at or
 * above it is split into `part_size` ranges.
 */
struct TransferPolicy {
    // Smallest integer not below 4.9 GiB (5261334937.6): a 5261334937-byte file still goes in one PUT
    static constexpr std::uint64_t kDefaultThreshold = 5261334938ULL;
    static constexpr std::uint64_t kDefaultPartSize = 1ULL << 30;

    std::uint64_t single_part_threshold = kDefaultThreshold;
    std::uint64_t part_size = kDefaultPartSize;

    bool use_multipart(std::uint64_t length) const { return length >= single_part_threshold; }

    Result<void> validate() const {
        if (part_size == 0) {
            return Fail<void>(ErrorKind::Configuration, "Part size must be positive");
        }
        if (part_size > single_part_threshold) {
            return Fail<void>(ErrorKind::Configuration, "Part size must not exceed the single-part threshold");
        }
        return Ok();
    }
};

} // namespace clipcloud::transfer
