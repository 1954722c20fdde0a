#include "clipcloud/transfer/part_plan.hpp"

#include <string>

namespace clipcloud::transfer {

std::uint64_t expected_part_count(std::uint64_t total, std::uint64_t part_size) {
    if (part_size == 0 || total == 0) {
        return 1;
    }
    return (total + part_size - 1) / part_size;
}

Result<std::vector<ByteRange>> plan_parts(std::uint64_t total,
                                          std::uint64_t part_size,
                                          std::size_t part_count) {
    if (part_size == 0) {
        return Fail<std::vector<ByteRange>>(ErrorKind::Configuration, "Part size must be positive");
    }

    const auto expected = expected_part_count(total, part_size);
    if (part_count != expected) {
        return Fail<std::vector<ByteRange>>(
            ErrorKind::Transfer,
            "Multipart session has " + std::to_string(part_count) + " part URLs but " +
            std::to_string(total) + " bytes need " + std::to_string(expected));
    }

    std::vector<ByteRange> parts;
    parts.reserve(part_count);

    std::uint64_t offset = 0;
    for (std::size_t i = 0; i < part_count; ++i) {
        const bool last = (i + 1 == part_count);
        const std::uint64_t length = last ? total - offset : part_size;
        parts.push_back(ByteRange{i, offset, length});
        offset += length;
    }
    return Ok(std::move(parts));
}

} // namespace clipcloud::transfer
