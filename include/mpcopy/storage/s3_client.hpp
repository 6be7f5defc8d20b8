#pragma once

/**
 * @file s3_client.hpp
 * @brief StorageClient backed by aws-sdk-cpp
 *
 * USAGE:
 * mpcopy::storage::AwsSdkSession sdk;           // InitAPI .. ShutdownAPI
 * mpcopy::storage::S3StorageClient s3(s3_config);
 * mpcopy::copy::CompletionCoordinator coordinator(s3, config, bus);
 *
 * The session must outlive every S3StorageClient. Service errors come back as
 * TransportFailure with the S3 error code under details["code"].
 */

#include "mpcopy/config/config.hpp"
#include "mpcopy/core/result.hpp"
#include "mpcopy/storage/client.hpp"

#include <aws/core/Aws.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/UploadPartCopyRequest.h>

#include <memory>
#include <string>

namespace mpcopy::storage {

/// Owns Aws::InitAPI / Aws::ShutdownAPI for the lifetime of the object
class AwsSdkSession {
public:
    AwsSdkSession();
    ~AwsSdkSession();

    AwsSdkSession(const AwsSdkSession&) = delete;
    AwsSdkSession& operator=(const AwsSdkSession&) = delete;

private:
    Aws::SDKOptions options_;
};

class S3StorageClient final : public StorageClient {
public:
    explicit S3StorageClient(const config::S3ClientConfig& config);

    /// Uses an already configured SDK client
    explicit S3StorageClient(std::shared_ptr<Aws::S3::S3Client> client);

    Result<std::string> initiate_multipart_upload(const ObjectLocation& destination,
                                                  const DestinationOptions& options) override;

    Result<std::string> upload_part_copy(const UploadPartCopyRequest& request) override;

    Result<CompletionResponse> complete_multipart_upload(const ObjectLocation& destination,
                                                         const std::string& upload_id,
                                                         const CompletionManifest& manifest) override;

    Result<void> abort_multipart_upload(const ObjectLocation& destination,
                                        const std::string& upload_id) override;

    /// Follows the part-number marker until the listing is no longer truncated
    Result<PartListing> list_parts(const ObjectLocation& destination,
                                   const std::string& upload_id) override;

private:
    std::shared_ptr<Aws::S3::S3Client> client_;
};

namespace detail {

Aws::String to_aws(const std::string& value);
std::string from_aws(const Aws::String& value);

Aws::Client::ClientConfiguration make_client_configuration(const config::S3ClientConfig& config);

/// Fails with InvalidInput when options.expires is not an RFC 822 or ISO 8601 timestamp
Result<Aws::S3::Model::CreateMultipartUploadRequest> make_create_request(const ObjectLocation& destination,
                                                                         const DestinationOptions& options);

Aws::S3::Model::UploadPartCopyRequest make_upload_part_copy_request(const UploadPartCopyRequest& request);

Aws::S3::Model::CompleteMultipartUploadRequest make_complete_request(const ObjectLocation& destination,
                                                                     const std::string& upload_id,
                                                                     const CompletionManifest& manifest);

CopyError to_copy_error(const Aws::Client::AWSError<Aws::S3::S3Errors>& error,
                        const std::string& operation);

} // namespace detail

} // namespace mpcopy::storage
