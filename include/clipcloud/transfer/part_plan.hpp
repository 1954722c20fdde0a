#pragma once

#include "clipcloud/core/result.hpp"
#include "clipcloud/transfer/types.hpp"

#include <cstdint>
#include <vector>

namespace clipcloud::transfer {

/**
 * @brief Number of parts a file of `total` bytes needs, never less than one
 */
std::uint64_t expected_part_count(std::uint64_t total, std::uint64_t part_size);

/**
 * @brief Split [0, total) into `part_count` contiguous ranges
 *
 * Every range but the last is `part_size` long; the last absorbs the
 * remainder. Fails with Transfer when `part_count` is not what
 * expected_part_count() gives, since the authority and the client would
 * then disagree on where parts begin.
 */
Result<std::vector<ByteRange>> plan_parts(std::uint64_t total,
                                          std::uint64_t part_size,
                                          std::size_t part_count);

} // namespace clipcloud::transfer
