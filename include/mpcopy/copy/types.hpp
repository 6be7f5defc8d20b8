#pragma once

#include "mpcopy/storage/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace mpcopy::copy {

using storage::CompletionManifest;
using storage::CompletionResponse;
using storage::DestinationOptions;
using storage::ObjectLocation;
using storage::PartResult;

/**
 * @brief Lifecycle of one multipart copy
 *
 * Success:  Initiating -> CopyingParts -> Finalizing -> Completed
 * Failure:  Initiating -> CopyingParts -> Aborting -> AbortVerified | AbortFailed
 * Failed is entered when initiate or complete fails, or when the abort
 * sequence itself errors.
 */
enum class CopyState {
    Initiating,
    CopyingParts,
    Finalizing,
    Completed,
    Aborting,
    AbortVerified,
    AbortFailed,
    Failed
};

const char* to_string(CopyState state) noexcept;

/**
 * @brief Everything needed to copy one object
 *
 * Treated as immutable once handed to the coordinator.
 */
struct CopyRequest {
    ObjectLocation source;
    ObjectLocation destination;
    std::int64_t object_size = 0;
    std::optional<std::int64_t> part_size;  ///< Falls back to the configured default
    DestinationOptions options;
};

/// Byte range of one part, offsets inclusive
struct PartRange {
    int part_number = 0;
    std::int64_t first_byte = 0;
    std::int64_t last_byte = 0;

    [[nodiscard]] std::int64_t size() const noexcept { return last_byte - first_byte + 1; }
    [[nodiscard]] storage::ByteRange bytes() const noexcept { return {first_byte, last_byte}; }
};

/**
 * @brief Summary of an upload session, kept by the coordinator for one run
 */
struct UploadSessionInfo {
    std::string upload_id;  ///< Empty until initiate succeeds
    ObjectLocation destination;
    CopyState state = CopyState::Initiating;
    std::chrono::system_clock::time_point started_at{};
    std::size_t parts_total = 0;
    std::string last_error;  ///< Populated when the run ends in a failure state
};

} // namespace mpcopy::copy
