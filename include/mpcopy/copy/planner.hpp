#pragma once

#include "mpcopy/core/result.hpp"
#include "mpcopy/copy/types.hpp"

#include <cstdint>
#include <vector>

namespace mpcopy::copy {

inline constexpr std::int64_t kDefaultPartSize = 50'000'000;

/**
 * @brief Split an object into the byte ranges of a multipart copy
 *
 * Emits floor(object_size / part_size) ranges of part_size bytes. A remainder
 * of at least the protocol minimum becomes one more trailing range; a smaller
 * remainder is folded into the last full range so no part but the last falls
 * under the minimum. An object smaller than part_size is copied as one range,
 * whatever its size.
 *
 * Part numbers are 1..N in emission order.
 *
 * Fails with InvalidInput when object_size <= 0 or part_size is below
 * kMinimumPartSize. Upper bounds on part size and part count belong to the
 * storage service and surface as part copy errors.
 */
Result<std::vector<PartRange>> plan_partitions(std::int64_t object_size, std::int64_t part_size);

} // namespace mpcopy::copy
