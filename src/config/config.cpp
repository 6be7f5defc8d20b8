#include "mpcopy/config/config.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <map>
#include <optional>

namespace mpcopy::config {
using json = nlohmann::json;

namespace {

CopyError invalid(std::string message, const std::string& key) {
    return make_error(ErrorKind::InvalidInput, std::move(message), {{"key", key}});
}

Result<json> read_json_file(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<json>(make_error(ErrorKind::InvalidInput, "Failed to open file: " + path.string(),
                                    {{"path", path.string()}}));
    }
    auto document = json::parse(input, nullptr, false);
    if (document.is_discarded()) {
        return Err<json>(make_error(ErrorKind::InvalidInput, "Malformed JSON in " + path.string(),
                                    {{"path", path.string()}}));
    }
    return Ok(std::move(document));
}

Result<std::string> required_string(const json& j, const std::string& key) {
    const auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return Err<std::string>(invalid("'" + key + "' is required and must be a string", key));
    }
    auto value = it->get<std::string>();
    if (value.empty()) {
        return Err<std::string>(invalid("'" + key + "' must not be empty", key));
    }
    return Ok(std::move(value));
}

Result<std::optional<std::string>> optional_string(const json& j, const std::string& key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return Ok(std::optional<std::string>{});
    }
    if (!it->is_string()) {
        return Err<std::optional<std::string>>(invalid("'" + key + "' must be a string", key));
    }
    return Ok(std::optional<std::string>{it->get<std::string>()});
}

Result<std::optional<std::int64_t>> optional_integer(const json& j, const std::string& key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return Ok(std::optional<std::int64_t>{});
    }
    if (!it->is_number_integer()) {
        return Err<std::optional<std::int64_t>>(invalid("'" + key + "' must be an integer", key));
    }
    return Ok(std::optional<std::int64_t>{it->get<std::int64_t>()});
}

Result<std::optional<bool>> optional_bool(const json& j, const std::string& key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return Ok(std::optional<bool>{});
    }
    if (!it->is_boolean()) {
        return Err<std::optional<bool>>(invalid("'" + key + "' must be true or false", key));
    }
    return Ok(std::optional<bool>{it->get<bool>()});
}

bool is_known_log_level(const std::string& name) {
    return name == "off" || spdlog::level::from_str(name) != spdlog::level::off;
}

} // namespace

Result<CoordinatorConfig> parse_coordinator_config(const json& j) {
    if (!j.is_object()) {
        return Err<CoordinatorConfig>(make_error(ErrorKind::InvalidInput, "Coordinator config must be a JSON object"));
    }

    CoordinatorConfig config;

    auto concurrency = optional_integer(j, "max_concurrency");
    if (concurrency.is_error()) {
        return Err<CoordinatorConfig>(concurrency.error());
    }
    if (concurrency.value()) {
        if (*concurrency.value() <= 0) {
            return Err<CoordinatorConfig>(invalid("'max_concurrency' must be > 0", "max_concurrency"));
        }
        config.max_concurrency = static_cast<std::size_t>(*concurrency.value());
    }

    auto part_size = optional_integer(j, "default_part_size");
    if (part_size.is_error()) {
        return Err<CoordinatorConfig>(part_size.error());
    }
    if (part_size.value()) {
        if (*part_size.value() < storage::limits::kMinimumPartSize) {
            return Err<CoordinatorConfig>(invalid("'default_part_size' must be at least "
                + std::to_string(storage::limits::kMinimumPartSize), "default_part_size"));
        }
        config.default_part_size = *part_size.value();
    }

    auto acl = optional_string(j, "default_acl");
    if (acl.is_error()) {
        return Err<CoordinatorConfig>(acl.error());
    }
    if (acl.value() && !acl.value()->empty()) {
        config.default_acl = *acl.value();
    }

    auto log_level = optional_string(j, "log_level");
    if (log_level.is_error()) {
        return Err<CoordinatorConfig>(log_level.error());
    }
    if (log_level.value()) {
        if (!is_known_log_level(*log_level.value())) {
            return Err<CoordinatorConfig>(invalid("Unknown log level '" + *log_level.value() + "'", "log_level"));
        }
        config.log_level = *log_level.value();
    }

    return Ok(config);
}

Result<CoordinatorConfig> load_coordinator_config(const std::filesystem::path& path) {
    auto document = read_json_file(path);
    if (document.is_error()) {
        return Err<CoordinatorConfig>(document.error());
    }
    return parse_coordinator_config(document.value());
}

Result<copy::CopyRequest> parse_copy_request(const json& j) {
    if (!j.is_object()) {
        return Err<copy::CopyRequest>(make_error(ErrorKind::InvalidInput, "Copy request must be a JSON object"));
    }

    copy::CopyRequest request;

    const std::pair<const char*, std::string*> required[] = {
        {"source_bucket", &request.source.bucket},
        {"object_key", &request.source.key},
        {"destination_bucket", &request.destination.bucket},
        {"copied_object_name", &request.destination.key},
    };
    for (const auto& [key, target] : required) {
        auto value = required_string(j, key);
        if (value.is_error()) {
            return Err<copy::CopyRequest>(value.error());
        }
        *target = std::move(value.value());
    }

    auto object_size = optional_integer(j, "object_size");
    if (object_size.is_error()) {
        return Err<copy::CopyRequest>(object_size.error());
    }
    if (!object_size.value() || *object_size.value() <= 0) {
        return Err<copy::CopyRequest>(invalid("'object_size' is required and must be > 0", "object_size"));
    }
    request.object_size = *object_size.value();

    auto part_size = optional_integer(j, "copy_part_size_bytes");
    if (part_size.is_error()) {
        return Err<copy::CopyRequest>(part_size.error());
    }
    request.part_size = part_size.value();

    auto& options = request.options;
    const std::pair<const char*, std::optional<std::string>*> optional_fields[] = {
        {"copied_object_permissions", &options.acl},
        {"expiration_period", &options.expires},
        {"server_side_encryption", &options.server_side_encryption},
        {"content_type", &options.content_type},
        {"content_disposition", &options.content_disposition},
        {"content_encoding", &options.content_encoding},
        {"content_language", &options.content_language},
        {"cache_control", &options.cache_control},
        {"storage_class", &options.storage_class},
    };
    for (const auto& [key, target] : optional_fields) {
        auto value = optional_string(j, key);
        if (value.is_error()) {
            return Err<copy::CopyRequest>(value.error());
        }
        *target = std::move(value.value());
    }

    if (const auto it = j.find("metadata"); it != j.end() && !it->is_null()) {
        if (!it->is_object()) {
            return Err<copy::CopyRequest>(invalid("'metadata' must be an object of strings", "metadata"));
        }
        std::map<std::string, std::string> metadata;
        for (const auto& item : it->items()) {
            if (!item.value().is_string()) {
                return Err<copy::CopyRequest>(invalid("'metadata." + item.key() + "' must be a string", "metadata"));
            }
            metadata.emplace(item.key(), item.value().get<std::string>());
        }
        options.metadata = std::move(metadata);
    }

    return Ok(std::move(request));
}

Result<copy::CopyRequest> load_copy_request(const std::filesystem::path& path) {
    auto document = read_json_file(path);
    if (document.is_error()) {
        return Err<copy::CopyRequest>(document.error());
    }
    return parse_copy_request(document.value());
}

Result<S3ClientConfig> parse_s3_client_config(const json& j) {
    if (!j.is_object()) {
        return Err<S3ClientConfig>(make_error(ErrorKind::InvalidInput, "S3 client config must be a JSON object"));
    }

    S3ClientConfig config;

    const std::pair<const char*, std::string*> strings[] = {
        {"region", &config.region},
        {"endpoint_override", &config.endpoint_override},
        {"scheme", &config.scheme},
    };
    for (const auto& [key, target] : strings) {
        auto value = optional_string(j, key);
        if (value.is_error()) {
            return Err<S3ClientConfig>(value.error());
        }
        if (value.value()) {
            *target = *value.value();
        }
    }
    if (config.scheme != "http" && config.scheme != "https") {
        return Err<S3ClientConfig>(invalid("'scheme' must be \"http\" or \"https\"", "scheme"));
    }

    const std::pair<const char*, bool*> flags[] = {
        {"use_virtual_addressing", &config.use_virtual_addressing},
        {"verify_ssl", &config.verify_ssl},
    };
    for (const auto& [key, target] : flags) {
        auto value = optional_bool(j, key);
        if (value.is_error()) {
            return Err<S3ClientConfig>(value.error());
        }
        if (value.value()) {
            *target = *value.value();
        }
    }

    const std::pair<const char*, long*> timeouts[] = {
        {"connect_timeout_ms", &config.connect_timeout_ms},
        {"request_timeout_ms", &config.request_timeout_ms},
    };
    for (const auto& [key, target] : timeouts) {
        auto value = optional_integer(j, key);
        if (value.is_error()) {
            return Err<S3ClientConfig>(value.error());
        }
        if (value.value()) {
            if (*value.value() <= 0) {
                return Err<S3ClientConfig>(invalid("'" + std::string(key) + "' must be > 0", key));
            }
            *target = static_cast<long>(*value.value());
        }
    }

    return Ok(config);
}

Result<S3ClientConfig> load_s3_client_config(const std::filesystem::path& path) {
    auto document = read_json_file(path);
    if (document.is_error()) {
        return Err<S3ClientConfig>(document.error());
    }
    return parse_s3_client_config(document.value());
}

Result<void> apply_log_level(const CoordinatorConfig& config) {
    if (!is_known_log_level(config.log_level)) {
        return Err<void>(invalid("Unknown log level '" + config.log_level + "'", "log_level"));
    }
    spdlog::set_level(spdlog::level::from_str(config.log_level));
    return Ok();
}

void to_json(json& j, const CoordinatorConfig& config) {
    j = json{
        {"max_concurrency", config.max_concurrency},
        {"default_part_size", config.default_part_size},
        {"default_acl", config.default_acl},
        {"log_level", config.log_level},
    };
}

void to_json(json& j, const S3ClientConfig& config) {
    j = json{
        {"region", config.region},
        {"endpoint_override", config.endpoint_override},
        {"scheme", config.scheme},
        {"use_virtual_addressing", config.use_virtual_addressing},
        {"verify_ssl", config.verify_ssl},
        {"connect_timeout_ms", config.connect_timeout_ms},
        {"request_timeout_ms", config.request_timeout_ms},
    };
}

} // namespace mpcopy::config
