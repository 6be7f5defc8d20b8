#include "mpcopy/storage/memory_client.hpp"
#include "mpcopy/storage/wire_format.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace mpcopy::storage {
namespace {

constexpr std::uint64_t kFnvOffset = 0xcbf29ce484222325ULL;
constexpr std::uint64_t kFnvPrime = 0x100000001b3ULL;

std::uint64_t fnv1a_byte(std::uint64_t hash, unsigned char byte) {
    return (hash ^ static_cast<std::uint64_t>(byte)) * kFnvPrime;
}

std::string to_hex(std::uint64_t hash) {
    std::ostringstream oss;
    oss << std::hex << std::setw(sizeof(hash) * 2) << std::setfill('0') << hash;
    return oss.str();
}

std::string quoted_etag(const std::vector<std::uint8_t>& data) {
    std::uint64_t hash = kFnvOffset;
    for (std::uint8_t byte : data) {
        hash = fnv1a_byte(hash, byte);
    }
    return "\"" + to_hex(hash) + "\"";
}

// Multipart objects get "<digest of part etags>-<part count>", as S3 does
std::string multipart_etag(const CompletionManifest& parts) {
    std::uint64_t hash = kFnvOffset;
    for (const auto& part : parts) {
        for (char c : part.etag) {
            hash = fnv1a_byte(hash, static_cast<unsigned char>(c));
        }
    }
    return "\"" + to_hex(hash) + "-" + std::to_string(parts.size()) + "\"";
}

CopyError service_error(const std::string& code, std::string message, nlohmann::json details = nlohmann::json::object()) {
    details["code"] = code;
    return make_error(ErrorKind::TransportFailure, std::move(message), std::move(details));
}

} // namespace

const char* to_string(InMemoryStorageClient::Operation operation) noexcept {
    switch (operation) {
        case InMemoryStorageClient::Operation::Initiate: return "CreateMultipartUpload";
        case InMemoryStorageClient::Operation::UploadPartCopy: return "UploadPartCopy";
        case InMemoryStorageClient::Operation::Complete: return "CompleteMultipartUpload";
        case InMemoryStorageClient::Operation::Abort: return "AbortMultipartUpload";
        case InMemoryStorageClient::Operation::ListParts: return "ListParts";
    }
    return "Unknown";
}

void InMemoryStorageClient::create_bucket(const std::string& bucket) {
    std::lock_guard lock(mutex_);
    buckets_.insert(bucket);
}

Result<void> InMemoryStorageClient::put_object(const ObjectLocation& location, std::vector<std::uint8_t> data) {
    std::lock_guard lock(mutex_);
    if (buckets_.count(location.bucket) == 0) {
        return Err<void>(service_error("NoSuchBucket", "Bucket does not exist: " + location.bucket));
    }
    StoredObject object;
    object.etag = quoted_etag(data);
    object.data = std::move(data);
    objects_[{location.bucket, location.key}] = std::move(object);
    return Ok();
}

Result<std::vector<std::uint8_t>> InMemoryStorageClient::get_object(const ObjectLocation& location) const {
    std::lock_guard lock(mutex_);
    const auto it = objects_.find({location.bucket, location.key});
    if (it == objects_.end()) {
        return Err<std::vector<std::uint8_t>>(
            service_error("NoSuchKey", "Object not found: " + location.bucket + "/" + location.key));
    }
    return Ok(it->second.data);
}

Result<InMemoryStorageClient::ObjectInfo> InMemoryStorageClient::head_object(const ObjectLocation& location) const {
    std::lock_guard lock(mutex_);
    const auto it = objects_.find({location.bucket, location.key});
    if (it == objects_.end()) {
        return Err<ObjectInfo>(service_error("NoSuchKey", "Object not found: " + location.bucket + "/" + location.key));
    }
    ObjectInfo info;
    info.size = static_cast<std::int64_t>(it->second.data.size());
    info.etag = it->second.etag;
    info.attributes = it->second.attributes;
    return Ok(info);
}

Result<std::string> InMemoryStorageClient::initiate_multipart_upload(const ObjectLocation& destination,
                                                                     const DestinationOptions& options) {
    std::lock_guard lock(mutex_);
    ++calls_[Operation::Initiate];
    if (auto fault = take_fault(Operation::Initiate, std::nullopt)) {
        return Err<std::string>(std::move(*fault));
    }
    if (buckets_.count(destination.bucket) == 0) {
        return Err<std::string>(service_error("NoSuchBucket", "Bucket does not exist: " + destination.bucket));
    }

    const auto upload_id = "upload-" + std::to_string(++upload_counter_);
    Upload upload;
    upload.destination = destination;
    upload.fields = to_request_fields(options);
    uploads_.emplace(upload_id, std::move(upload));

    spdlog::debug("Multipart upload {} created for {}/{}", upload_id, destination.bucket, destination.key);
    return Ok(upload_id);
}

Result<std::string> InMemoryStorageClient::upload_part_copy(const UploadPartCopyRequest& request) {
    std::function<void(int)> hook;
    {
        std::lock_guard lock(mutex_);
        ++calls_[Operation::UploadPartCopy];
        if (auto fault = take_fault(Operation::UploadPartCopy, request.part_number)) {
            return Err<std::string>(std::move(*fault));
        }
        hook = part_copy_hook_;
    }
    if (hook) {
        hook(request.part_number);
    }

    auto source = decode_copy_source(request.copy_source);
    if (source.is_error()) {
        return Err<std::string>(service_error("InvalidArgument", source.error().message));
    }
    auto range = parse_copy_source_range(request.copy_source_range);
    if (range.is_error()) {
        return Err<std::string>(service_error("InvalidArgument", range.error().message));
    }
    if (request.part_number < 1 || request.part_number > limits::kMaximumPartNumber) {
        return Err<std::string>(service_error("InvalidArgument", "Part number must be between 1 and 10000",
                                              {{"part_number", request.part_number}}));
    }

    std::lock_guard lock(mutex_);
    auto upload = find_active_upload(request.destination, request.upload_id);
    if (upload.is_error()) {
        return Err<std::string>(upload.error());
    }

    const auto object = objects_.find({source.value().bucket, source.value().key});
    if (object == objects_.end()) {
        return Err<std::string>(service_error("NoSuchKey",
            "Copy source not found: " + source.value().bucket + "/" + source.value().key));
    }

    const auto& data = object->second.data;
    const auto& bytes = range.value();
    if (bytes.last >= static_cast<std::int64_t>(data.size())) {
        return Err<std::string>(service_error("InvalidRange", "Copy source range exceeds object size",
            {{"range", request.copy_source_range}, {"object_size", data.size()}}));
    }

    StoredPart part;
    part.data.assign(data.begin() + bytes.first, data.begin() + bytes.last + 1);
    part.etag = quoted_etag(part.data);
    const auto etag = part.etag;
    upload.value()->parts[request.part_number] = std::move(part);

    spdlog::trace("Part {} of upload {} stored ({} bytes)", request.part_number, request.upload_id, bytes.size());
    return Ok(etag);
}

Result<CompletionResponse> InMemoryStorageClient::complete_multipart_upload(const ObjectLocation& destination,
                                                                           const std::string& upload_id,
                                                                           const CompletionManifest& parts) {
    std::lock_guard lock(mutex_);
    ++calls_[Operation::Complete];
    last_manifest_ = parts;
    if (auto fault = take_fault(Operation::Complete, std::nullopt)) {
        return Err<CompletionResponse>(std::move(*fault));
    }

    auto upload_result = find_active_upload(destination, upload_id);
    if (upload_result.is_error()) {
        return Err<CompletionResponse>(upload_result.error());
    }
    auto* upload = upload_result.value();

    if (parts.empty()) {
        return Err<CompletionResponse>(service_error("MalformedXML", "Completion manifest lists no parts"));
    }

    std::vector<std::uint8_t> assembled;
    int previous = 0;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        const auto& entry = parts[i];
        if (entry.part_number <= previous) {
            return Err<CompletionResponse>(service_error("InvalidPartOrder", "Parts must be listed in ascending order",
                                                         {{"part_number", entry.part_number}}));
        }
        previous = entry.part_number;

        const auto stored = upload->parts.find(entry.part_number);
        if (stored == upload->parts.end() || stored->second.etag != entry.etag) {
            return Err<CompletionResponse>(service_error("InvalidPart", "Part missing or ETag mismatch",
                                                         {{"part_number", entry.part_number}}));
        }
        const bool is_last = i + 1 == parts.size();
        if (!is_last && static_cast<std::int64_t>(stored->second.data.size()) < limits::kMinimumPartSize) {
            return Err<CompletionResponse>(service_error("EntityTooSmall", "Part is smaller than the minimum allowed size",
                {{"part_number", entry.part_number}, {"size", stored->second.data.size()}}));
        }
        assembled.insert(assembled.end(), stored->second.data.begin(), stored->second.data.end());
    }

    StoredObject object;
    object.data = std::move(assembled);
    object.etag = multipart_etag(parts);
    object.attributes = upload->fields;

    CompletionResponse response;
    response.location = "memory://" + destination.bucket + "/" + destination.key;
    response.bucket = destination.bucket;
    response.key = destination.key;
    response.etag = object.etag;

    objects_[{destination.bucket, destination.key}] = std::move(object);
    upload->state = UploadState::Completed;
    upload->parts.clear();

    spdlog::debug("Multipart upload {} completed with {} parts", upload_id, parts.size());
    return Ok(response);
}

Result<void> InMemoryStorageClient::abort_multipart_upload(const ObjectLocation& destination,
                                                           const std::string& upload_id) {
    std::lock_guard lock(mutex_);
    ++calls_[Operation::Abort];
    if (auto fault = take_fault(Operation::Abort, std::nullopt)) {
        return Err<void>(std::move(*fault));
    }

    const auto it = uploads_.find(upload_id);
    if (it == uploads_.end() || it->second.destination != destination || it->second.state == UploadState::Completed) {
        return Err<void>(service_error("NoSuchUpload", "Upload not found: " + upload_id));
    }

    it->second.state = UploadState::Aborted;
    if (!retain_parts_on_abort_) {
        it->second.parts.clear();
    }
    spdlog::debug("Multipart upload {} aborted ({} parts retained)", upload_id, it->second.parts.size());
    return Ok();
}

Result<PartListing> InMemoryStorageClient::list_parts(const ObjectLocation& destination,
                                                      const std::string& upload_id) {
    std::lock_guard lock(mutex_);
    ++calls_[Operation::ListParts];
    if (auto fault = take_fault(Operation::ListParts, std::nullopt)) {
        return Err<PartListing>(std::move(*fault));
    }

    const auto it = uploads_.find(upload_id);
    if (it == uploads_.end() || it->second.destination != destination || it->second.state == UploadState::Completed) {
        return Err<PartListing>(service_error("NoSuchUpload", "Upload not found: " + upload_id));
    }

    PartListing listing;
    listing.upload_id = upload_id;
    for (const auto& [number, part] : it->second.parts) {
        listing.parts.push_back(ListedPart{number, part.etag, static_cast<std::int64_t>(part.data.size())});
    }
    return Ok(listing);
}

void InMemoryStorageClient::fail_operation(Operation operation, std::string message, std::optional<int> part_number) {
    std::lock_guard lock(mutex_);
    faults_.push_back(InjectedFault{operation, std::move(message), part_number});
}

void InMemoryStorageClient::set_retain_parts_on_abort(bool retain) {
    std::lock_guard lock(mutex_);
    retain_parts_on_abort_ = retain;
}

void InMemoryStorageClient::set_part_copy_hook(std::function<void(int)> hook) {
    std::lock_guard lock(mutex_);
    part_copy_hook_ = std::move(hook);
}

std::size_t InMemoryStorageClient::call_count(Operation operation) const {
    std::lock_guard lock(mutex_);
    const auto it = calls_.find(operation);
    return it != calls_.end() ? it->second : 0;
}

std::size_t InMemoryStorageClient::active_upload_count() const {
    std::lock_guard lock(mutex_);
    return static_cast<std::size_t>(std::count_if(uploads_.begin(), uploads_.end(), [](const auto& entry) {
        return entry.second.state == UploadState::Active;
    }));
}

std::optional<nlohmann::json> InMemoryStorageClient::initiate_fields(const std::string& upload_id) const {
    std::lock_guard lock(mutex_);
    const auto it = uploads_.find(upload_id);
    if (it == uploads_.end()) {
        return std::nullopt;
    }
    return it->second.fields;
}

std::optional<CompletionManifest> InMemoryStorageClient::last_completion_manifest() const {
    std::lock_guard lock(mutex_);
    return last_manifest_;
}

std::optional<CopyError> InMemoryStorageClient::take_fault(Operation operation, std::optional<int> part_number) {
    const auto it = std::find_if(faults_.begin(), faults_.end(), [&](const InjectedFault& fault) {
        return fault.operation == operation && (!fault.part_number || fault.part_number == part_number);
    });
    if (it == faults_.end()) {
        return std::nullopt;
    }

    nlohmann::json details{{"operation", to_string(operation)}};
    if (part_number) {
        details["part_number"] = *part_number;
    }
    auto error = service_error("InternalError", it->message, std::move(details));
    faults_.erase(it);
    spdlog::debug("Injected failure for {}: {}", to_string(operation), error.message);
    return error;
}

Result<InMemoryStorageClient::Upload*> InMemoryStorageClient::find_active_upload(const ObjectLocation& destination,
                                                                                  const std::string& upload_id) {
    const auto it = uploads_.find(upload_id);
    if (it == uploads_.end() || it->second.destination != destination || it->second.state != UploadState::Active) {
        return Err<Upload*>(service_error("NoSuchUpload", "Upload not found or no longer active: " + upload_id));
    }
    return Ok(&it->second);
}

} // namespace mpcopy::storage
