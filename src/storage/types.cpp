#include "mpcopy/storage/types.hpp"

namespace mpcopy::storage {
namespace {

void put_if_present(nlohmann::json& fields, const char* name, const std::optional<std::string>& value) {
    if (value && !value->empty()) {
        fields[name] = *value;
    }
}

} // namespace

nlohmann::json to_request_fields(const DestinationOptions& options) {
    nlohmann::json fields = nlohmann::json::object();
    put_if_present(fields, "ACL", options.acl);
    put_if_present(fields, "Expires", options.expires);
    put_if_present(fields, "ContentType", options.content_type);
    put_if_present(fields, "ContentDisposition", options.content_disposition);
    put_if_present(fields, "ContentEncoding", options.content_encoding);
    put_if_present(fields, "ContentLanguage", options.content_language);
    if (options.metadata) {
        fields["Metadata"] = *options.metadata;
    }
    put_if_present(fields, "CacheControl", options.cache_control);
    put_if_present(fields, "ServerSideEncryption", options.server_side_encryption);
    put_if_present(fields, "StorageClass", options.storage_class);
    return fields;
}

void to_json(nlohmann::json& j, const ObjectLocation& location) {
    j = nlohmann::json{{"bucket", location.bucket}, {"key", location.key}};
}

void to_json(nlohmann::json& j, const PartResult& part) {
    j = nlohmann::json{{"PartNumber", part.part_number}, {"ETag", part.etag}};
}

void to_json(nlohmann::json& j, const CompletionResponse& response) {
    j = nlohmann::json{
        {"location", response.location},
        {"bucket", response.bucket},
        {"key", response.key},
        {"etag", response.etag},
    };
}

void to_json(nlohmann::json& j, const ListedPart& part) {
    j = nlohmann::json{{"PartNumber", part.part_number}, {"ETag", part.etag}, {"Size", part.size}};
}

void to_json(nlohmann::json& j, const PartListing& listing) {
    j = nlohmann::json{{"UploadId", listing.upload_id}, {"Parts", listing.parts}};
}

} // namespace mpcopy::storage
