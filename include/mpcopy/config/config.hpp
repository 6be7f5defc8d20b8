#pragma once

/**
 * @file config.hpp
 * @brief Coordinator settings and copy requests read from JSON
 *
 * Coordinator config:
 * {
 *   "max_concurrency": 8,            // worker threads for part copies
 *   "default_part_size": 50000000,   // used when a request sets none
 *   "default_acl": "private",        // used when a request sets none
 *   "log_level": "info"              // spdlog level name
 * }
 *
 * Copy request keys: source_bucket, object_key, destination_bucket,
 * copied_object_name, object_size (required); copy_part_size_bytes,
 * copied_object_permissions, expiration_period, server_side_encryption,
 * content_type, content_disposition, content_encoding, content_language,
 * metadata (object of strings), cache_control, storage_class (optional).
 *
 * S3 client config (all keys optional):
 * {
 *   "region": "us-east-1",
 *   "endpoint_override": "localhost:9000",  // S3-compatible services
 *   "scheme": "https",                      // "http" or "https"
 *   "use_virtual_addressing": true,         // false for path-style buckets
 *   "verify_ssl": true,
 *   "connect_timeout_ms": 3000,
 *   "request_timeout_ms": 30000
 * }
 */

#include "mpcopy/core/result.hpp"
#include "mpcopy/copy/planner.hpp"
#include "mpcopy/copy/types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace mpcopy::config {

struct CoordinatorConfig {
    std::size_t max_concurrency = 8;
    std::int64_t default_part_size = copy::kDefaultPartSize;
    std::string default_acl = "private";
    std::string log_level = "info";
};

/// Connection settings for storage::S3StorageClient; empty strings keep the SDK defaults
struct S3ClientConfig {
    std::string region;
    std::string endpoint_override;
    std::string scheme = "https";
    bool use_virtual_addressing = true;
    bool verify_ssl = true;
    long connect_timeout_ms = 3000;
    long request_timeout_ms = 30000;
};

Result<CoordinatorConfig> parse_coordinator_config(const nlohmann::json& j);
Result<CoordinatorConfig> load_coordinator_config(const std::filesystem::path& path);

Result<copy::CopyRequest> parse_copy_request(const nlohmann::json& j);
Result<copy::CopyRequest> load_copy_request(const std::filesystem::path& path);

Result<S3ClientConfig> parse_s3_client_config(const nlohmann::json& j);
Result<S3ClientConfig> load_s3_client_config(const std::filesystem::path& path);

/// Sets the spdlog default level from config.log_level
Result<void> apply_log_level(const CoordinatorConfig& config);

void to_json(nlohmann::json& j, const CoordinatorConfig& config);
void to_json(nlohmann::json& j, const S3ClientConfig& config);

} // namespace mpcopy::config
