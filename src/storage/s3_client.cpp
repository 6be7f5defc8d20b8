#include "mpcopy/storage/s3_client.hpp"

#include <aws/core/auth/AWSAuthSigner.h>
#include <aws/core/http/Scheme.h>
#include <aws/core/utils/DateTime.h>
#include <aws/core/utils/memory/AWSMemory.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/ListPartsRequest.h>
#include <aws/s3/model/ObjectCannedACL.h>
#include <aws/s3/model/ServerSideEncryption.h>
#include <aws/s3/model/StorageClass.h>
#include <spdlog/spdlog.h>

#include <optional>

namespace mpcopy::storage {
namespace {

constexpr const char* kAllocationTag = "mpcopy::S3StorageClient";

std::string location_label(const ObjectLocation& location) {
    return location.bucket + "/" + location.key;
}

} // namespace

AwsSdkSession::AwsSdkSession() {
    Aws::InitAPI(options_);
    spdlog::debug("aws-sdk-cpp initialized");
}

AwsSdkSession::~AwsSdkSession() {
    Aws::ShutdownAPI(options_);
}

S3StorageClient::S3StorageClient(const config::S3ClientConfig& config)
    : client_(Aws::MakeShared<Aws::S3::S3Client>(kAllocationTag,
                                                 detail::make_client_configuration(config),
                                                 Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
                                                 config.use_virtual_addressing)) {
    spdlog::info("S3 client ready (region={}, endpoint={}, virtual_addressing={})",
                 config.region.empty() ? "default" : config.region,
                 config.endpoint_override.empty() ? "default" : config.endpoint_override,
                 config.use_virtual_addressing);
}

S3StorageClient::S3StorageClient(std::shared_ptr<Aws::S3::S3Client> client)
    : client_(std::move(client)) {}

Result<std::string> S3StorageClient::initiate_multipart_upload(const ObjectLocation& destination,
                                                               const DestinationOptions& options) {
    auto request = detail::make_create_request(destination, options);
    if (request.is_error()) {
        return Err<std::string>(request.error());
    }

    spdlog::debug("CreateMultipartUpload {}", location_label(destination));
    auto outcome = client_->CreateMultipartUpload(request.value());
    if (!outcome.IsSuccess()) {
        return Err<std::string>(detail::to_copy_error(outcome.GetError(), "CreateMultipartUpload"));
    }

    auto upload_id = detail::from_aws(outcome.GetResult().GetUploadId());
    if (upload_id.empty()) {
        return Err<std::string>(make_error(ErrorKind::TransportFailure,
            "CreateMultipartUpload response carried no upload id",
            {{"bucket", destination.bucket}, {"key", destination.key}}));
    }
    return Ok(std::move(upload_id));
}

Result<std::string> S3StorageClient::upload_part_copy(const UploadPartCopyRequest& request) {
    spdlog::trace("UploadPartCopy {} part {} range {}",
                  location_label(request.destination), request.part_number, request.copy_source_range);

    auto outcome = client_->UploadPartCopy(detail::make_upload_part_copy_request(request));
    if (!outcome.IsSuccess()) {
        auto error = detail::to_copy_error(outcome.GetError(), "UploadPartCopy");
        error.details["part_number"] = request.part_number;
        return Err<std::string>(std::move(error));
    }
    return Ok(detail::from_aws(outcome.GetResult().GetCopyPartResult().GetETag()));
}

Result<CompletionResponse> S3StorageClient::complete_multipart_upload(const ObjectLocation& destination,
                                                                      const std::string& upload_id,
                                                                      const CompletionManifest& manifest) {
    spdlog::debug("CompleteMultipartUpload {} upload {} with {} parts",
                  location_label(destination), upload_id, manifest.size());

    auto outcome = client_->CompleteMultipartUpload(detail::make_complete_request(destination, upload_id, manifest));
    if (!outcome.IsSuccess()) {
        return Err<CompletionResponse>(detail::to_copy_error(outcome.GetError(), "CompleteMultipartUpload"));
    }

    const auto& result = outcome.GetResult();
    CompletionResponse response;
    response.location = detail::from_aws(result.GetLocation());
    response.bucket = detail::from_aws(result.GetBucket());
    response.key = detail::from_aws(result.GetKey());
    response.etag = detail::from_aws(result.GetETag());
    return Ok(std::move(response));
}

Result<void> S3StorageClient::abort_multipart_upload(const ObjectLocation& destination,
                                                     const std::string& upload_id) {
    spdlog::debug("AbortMultipartUpload {} upload {}", location_label(destination), upload_id);

    Aws::S3::Model::AbortMultipartUploadRequest request;
    request.SetBucket(detail::to_aws(destination.bucket));
    request.SetKey(detail::to_aws(destination.key));
    request.SetUploadId(detail::to_aws(upload_id));

    auto outcome = client_->AbortMultipartUpload(request);
    if (!outcome.IsSuccess()) {
        return Err<void>(detail::to_copy_error(outcome.GetError(), "AbortMultipartUpload"));
    }
    return Ok();
}

Result<PartListing> S3StorageClient::list_parts(const ObjectLocation& destination,
                                                const std::string& upload_id) {
    PartListing listing;
    listing.upload_id = upload_id;

    Aws::S3::Model::ListPartsRequest request;
    request.SetBucket(detail::to_aws(destination.bucket));
    request.SetKey(detail::to_aws(destination.key));
    request.SetUploadId(detail::to_aws(upload_id));

    while (true) {
        auto outcome = client_->ListParts(request);
        if (!outcome.IsSuccess()) {
            return Err<PartListing>(detail::to_copy_error(outcome.GetError(), "ListParts"));
        }

        const auto& result = outcome.GetResult();
        for (const auto& part : result.GetParts()) {
            listing.parts.push_back(ListedPart{part.GetPartNumber(), detail::from_aws(part.GetETag()),
                                               static_cast<std::int64_t>(part.GetSize())});
        }
        if (!result.GetIsTruncated()) {
            break;
        }
        request.SetPartNumberMarker(result.GetNextPartNumberMarker());
    }

    spdlog::debug("ListParts {} upload {}: {} parts", location_label(destination), upload_id, listing.parts.size());
    return Ok(std::move(listing));
}

namespace detail {

Aws::String to_aws(const std::string& value) {
    return Aws::String(value.data(), value.size());
}

std::string from_aws(const Aws::String& value) {
    return std::string(value.data(), value.size());
}

Aws::Client::ClientConfiguration make_client_configuration(const config::S3ClientConfig& config) {
    Aws::Client::ClientConfiguration client_config;
    if (!config.region.empty()) {
        client_config.region = to_aws(config.region);
    }
    if (!config.endpoint_override.empty()) {
        client_config.endpointOverride = to_aws(config.endpoint_override);
    }
    client_config.scheme = config.scheme == "http" ? Aws::Http::Scheme::HTTP : Aws::Http::Scheme::HTTPS;
    client_config.verifySSL = config.verify_ssl;
    client_config.connectTimeoutMs = config.connect_timeout_ms;
    client_config.requestTimeoutMs = config.request_timeout_ms;
    return client_config;
}

Result<Aws::S3::Model::CreateMultipartUploadRequest> make_create_request(const ObjectLocation& destination,
                                                                         const DestinationOptions& options) {
    namespace model = Aws::S3::Model;

    model::CreateMultipartUploadRequest request;
    request.SetBucket(to_aws(destination.bucket));
    request.SetKey(to_aws(destination.key));

    // Empty strings are treated like absent fields
    auto present = [](const std::optional<std::string>& field) { return field && !field->empty(); };

    if (present(options.acl)) {
        request.SetACL(model::ObjectCannedACLMapper::GetObjectCannedACLForName(to_aws(*options.acl)));
    }
    if (present(options.expires)) {
        Aws::Utils::DateTime expires(to_aws(*options.expires), Aws::Utils::DateFormat::AutoDetect);
        if (!expires.WasParseSuccessful()) {
            return Err<model::CreateMultipartUploadRequest>(make_error(ErrorKind::InvalidInput,
                "Expires is not a valid timestamp: " + *options.expires, {{"expires", *options.expires}}));
        }
        request.SetExpires(expires);
    }
    if (present(options.server_side_encryption)) {
        request.SetServerSideEncryption(
            model::ServerSideEncryptionMapper::GetServerSideEncryptionForName(to_aws(*options.server_side_encryption)));
    }
    if (present(options.storage_class)) {
        request.SetStorageClass(model::StorageClassMapper::GetStorageClassForName(to_aws(*options.storage_class)));
    }
    if (present(options.content_type)) {
        request.SetContentType(to_aws(*options.content_type));
    }
    if (present(options.content_disposition)) {
        request.SetContentDisposition(to_aws(*options.content_disposition));
    }
    if (present(options.content_encoding)) {
        request.SetContentEncoding(to_aws(*options.content_encoding));
    }
    if (present(options.content_language)) {
        request.SetContentLanguage(to_aws(*options.content_language));
    }
    if (present(options.cache_control)) {
        request.SetCacheControl(to_aws(*options.cache_control));
    }
    if (options.metadata) {
        for (const auto& [key, value] : *options.metadata) {
            request.AddMetadata(to_aws(key), to_aws(value));
        }
    }
    return Ok(std::move(request));
}

Aws::S3::Model::UploadPartCopyRequest make_upload_part_copy_request(const UploadPartCopyRequest& request) {
    Aws::S3::Model::UploadPartCopyRequest sdk_request;
    sdk_request.WithBucket(to_aws(request.destination.bucket))
        .WithKey(to_aws(request.destination.key))
        .WithUploadId(to_aws(request.upload_id))
        .WithPartNumber(request.part_number)
        .WithCopySource(to_aws(request.copy_source))
        .WithCopySourceRange(to_aws(request.copy_source_range));
    return sdk_request;
}

Aws::S3::Model::CompleteMultipartUploadRequest make_complete_request(const ObjectLocation& destination,
                                                                     const std::string& upload_id,
                                                                     const CompletionManifest& manifest) {
    Aws::S3::Model::CompletedMultipartUpload upload;
    for (const auto& entry : manifest) {
        Aws::S3::Model::CompletedPart part;
        part.SetPartNumber(entry.part_number);
        part.SetETag(to_aws(entry.etag));
        upload.AddParts(std::move(part));
    }

    Aws::S3::Model::CompleteMultipartUploadRequest request;
    request.WithBucket(to_aws(destination.bucket))
        .WithKey(to_aws(destination.key))
        .WithUploadId(to_aws(upload_id))
        .WithMultipartUpload(std::move(upload));
    return request;
}

CopyError to_copy_error(const Aws::Client::AWSError<Aws::S3::S3Errors>& error,
                        const std::string& operation) {
    auto code = from_aws(error.GetExceptionName());
    if (code.empty()) {
        code = "Unknown";
    }
    auto message = from_aws(error.GetMessage());
    if (message.empty()) {
        message = operation + " failed with " + code;
    }
    return make_error(ErrorKind::TransportFailure, std::move(message), {
        {"code", code},
        {"operation", operation},
        {"http_status", static_cast<int>(error.GetResponseCode())},
        {"retryable", error.ShouldRetry()},
    });
}

} // namespace detail

} // namespace mpcopy::storage
