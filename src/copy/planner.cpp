#include "mpcopy/copy/planner.hpp"

#include <string>

namespace mpcopy::copy {

using storage::limits::kMinimumPartSize;

Result<std::vector<PartRange>> plan_partitions(std::int64_t object_size, std::int64_t part_size) {
    if (object_size <= 0) {
        return Err<std::vector<PartRange>>(make_error(ErrorKind::InvalidInput,
            "object_size must be > 0", {{"object_size", object_size}}));
    }
    if (part_size < kMinimumPartSize) {
        return Err<std::vector<PartRange>>(make_error(ErrorKind::InvalidInput,
            "part_size must be at least " + std::to_string(kMinimumPartSize) + " bytes",
            {{"part_size", part_size}}));
    }

    std::vector<PartRange> ranges;
    const std::int64_t full_parts = object_size / part_size;
    const std::int64_t remainder = object_size % part_size;

    if (full_parts == 0) {
        ranges.push_back(PartRange{1, 0, object_size - 1});
        return Ok(std::move(ranges));
    }

    const bool trailing_part = remainder >= kMinimumPartSize;
    const std::int64_t part_count = full_parts + (trailing_part ? 1 : 0);

    ranges.reserve(static_cast<std::size_t>(part_count));
    for (std::int64_t index = 0; index < full_parts; ++index) {
        PartRange range;
        range.part_number = static_cast<int>(index + 1);
        range.first_byte = index * part_size;
        range.last_byte = range.first_byte + part_size - 1;
        if (index == full_parts - 1 && !trailing_part) {
            range.last_byte += remainder;
        }
        ranges.push_back(range);
    }

    if (trailing_part) {
        const std::int64_t first = full_parts * part_size;
        ranges.push_back(PartRange{static_cast<int>(full_parts + 1), first, first + remainder - 1});
    }

    return Ok(std::move(ranges));
}

} // namespace mpcopy::copy
