#pragma once

#include "mpcopy/core/result.hpp"
#include "mpcopy/storage/types.hpp"

#include <string>

namespace mpcopy::storage {

/**
 * @brief Object-storage operations consumed by a multipart copy
 *
 * Implementations report every failure (network, auth, throttling, service
 * error codes) as ErrorKind::TransportFailure. Retries, if any, happen inside
 * the implementation. Calls may arrive concurrently from several threads for
 * the same upload id.
 */
class StorageClient {
public:
    virtual ~StorageClient() = default;

    /// Returns the upload id of a new multipart upload for `destination`
    virtual Result<std::string> initiate_multipart_upload(const ObjectLocation& destination,
                                                          const DestinationOptions& options) = 0;

    /// Copies a byte range of an existing object into one part. Returns the part's ETag.
    virtual Result<std::string> upload_part_copy(const UploadPartCopyRequest& request) = 0;

    virtual Result<CompletionResponse> complete_multipart_upload(const ObjectLocation& destination,
                                                                 const std::string& upload_id,
                                                                 const CompletionManifest& parts) = 0;

    virtual Result<void> abort_multipart_upload(const ObjectLocation& destination,
                                                const std::string& upload_id) = 0;

    virtual Result<PartListing> list_parts(const ObjectLocation& destination,
                                           const std::string& upload_id) = 0;
};

} // namespace mpcopy::storage
