#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mpcopy::storage {

namespace limits {

// Every part except the last must be at least this large
inline constexpr std::int64_t kMinimumPartSize = 5'242'880;
inline constexpr std::int64_t kMaximumPartSize = 5'368'709'120;
inline constexpr int kMaximumPartNumber = 10'000;

} // namespace limits

struct ObjectLocation {
    std::string bucket;
    std::string key;
};

inline bool operator==(const ObjectLocation& lhs, const ObjectLocation& rhs) {
    return lhs.bucket == rhs.bucket && lhs.key == rhs.key;
}

inline bool operator!=(const ObjectLocation& lhs, const ObjectLocation& rhs) {
    return !(lhs == rhs);
}

/**
 * @brief Settings applied to the object created by a multipart upload
 *
 * Each field is sent only when present. An empty string counts as absent.
 */
struct DestinationOptions {
    std::optional<std::string> acl;
    std::optional<std::string> expires;
    std::optional<std::string> server_side_encryption;
    std::optional<std::string> content_type;
    std::optional<std::string> content_disposition;
    std::optional<std::string> content_encoding;
    std::optional<std::string> content_language;
    std::optional<std::map<std::string, std::string>> metadata;
    std::optional<std::string> cache_control;
    std::optional<std::string> storage_class;
};

/// Initiate-request fields for the options that are present, keyed by their protocol names
nlohmann::json to_request_fields(const DestinationOptions& options);

/// Inclusive byte range
struct ByteRange {
    std::int64_t first = 0;
    std::int64_t last = 0;

    [[nodiscard]] std::int64_t size() const noexcept { return last - first + 1; }
};

struct UploadPartCopyRequest {
    ObjectLocation destination;
    std::string upload_id;
    int part_number = 0;
    std::string copy_source;        ///< URL-encoded "<bucket>/<key>"
    std::string copy_source_range;  ///< "bytes=<first>-<last>"
};

struct PartResult {
    int part_number = 0;
    std::string etag;
};

using CompletionManifest = std::vector<PartResult>;

struct CompletionResponse {
    std::string location;
    std::string bucket;
    std::string key;
    std::string etag;
};

struct ListedPart {
    int part_number = 0;
    std::string etag;
    std::int64_t size = 0;
};

struct PartListing {
    std::string upload_id;
    std::vector<ListedPart> parts;
};

void to_json(nlohmann::json& j, const ObjectLocation& location);
void to_json(nlohmann::json& j, const PartResult& part);
void to_json(nlohmann::json& j, const CompletionResponse& response);
void to_json(nlohmann::json& j, const ListedPart& part);
void to_json(nlohmann::json& j, const PartListing& listing);

} // namespace mpcopy::storage
