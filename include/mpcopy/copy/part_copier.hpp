#pragma once

#include "mpcopy/core/result.hpp"
#include "mpcopy/copy/types.hpp"
#include "mpcopy/storage/client.hpp"

#include <exception>
#include <future>
#include <string>

namespace mpcopy::copy {

/**
 * @brief Copies one byte range of the source into one part of an upload
 *
 * One remote call per invocation, no retries. Client errors are returned
 * unchanged. Safe to call concurrently for different parts of the same upload.
 */
class PartCopier {
public:
    explicit PartCopier(storage::StorageClient& client) : client_(client) {}

    Result<PartResult> copy_part(const ObjectLocation& source,
                                 const ObjectLocation& destination,
                                 const std::string& upload_id,
                                 const PartRange& range) const;

private:
    storage::StorageClient& client_;
};

/// TransportFailure for a part task that threw instead of returning
CopyError part_exception_error(int part_number, const std::exception& e);

/**
 * @brief Read the outcome of a finished part task
 *
 * An exception stored in the future becomes a part_exception_error result,
 * so a failing task still takes the abort path.
 */
Result<PartResult> collect_part_result(std::future<Result<PartResult>>& pending, int part_number);

} // namespace mpcopy::copy
