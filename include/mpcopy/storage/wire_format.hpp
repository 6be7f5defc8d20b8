#pragma once

#include "mpcopy/core/result.hpp"
#include "mpcopy/storage/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace mpcopy::storage {

/**
 * @brief Copy-source reference for an upload-part-copy request
 *
 * "<bucket>/<key>" with every byte outside the unreserved set
 * (A-Z a-z 0-9 - _ . ! ~ * ' ( )) percent-encoded, the slash included.
 */
std::string encode_copy_source(const ObjectLocation& source);

/// Inverse of encode_copy_source. The bucket ends at the first '/'.
Result<ObjectLocation> decode_copy_source(std::string_view encoded);

/// "bytes=<first>-<last>"
std::string format_copy_source_range(const ByteRange& range);

Result<ByteRange> parse_copy_source_range(std::string_view header);

} // namespace mpcopy::storage
