#pragma once

#include "mpcopy/storage/client.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace mpcopy::storage {

/**
 * @brief Object store held in process memory
 *
 * Implements the multipart protocol with the same validation a real service
 * applies on complete (ascending part numbers, matching ETags, minimum part
 * size for all but the last part). Used by the demo and the tests; the fault
 * injection hooks let callers fail any operation on demand.
 *
 * THREAD SAFETY: all public methods may be called concurrently.
 */
class InMemoryStorageClient final : public StorageClient {
public:
    enum class Operation {
        Initiate,
        UploadPartCopy,
        Complete,
        Abort,
        ListParts
    };

    struct ObjectInfo {
        std::int64_t size = 0;
        std::string etag;
        nlohmann::json attributes = nlohmann::json::object();  ///< Initiate-request fields the object was created with
    };

    InMemoryStorageClient() = default;

    InMemoryStorageClient(const InMemoryStorageClient&) = delete;
    InMemoryStorageClient& operator=(const InMemoryStorageClient&) = delete;

    void create_bucket(const std::string& bucket);
    Result<void> put_object(const ObjectLocation& location, std::vector<std::uint8_t> data);
    Result<std::vector<std::uint8_t>> get_object(const ObjectLocation& location) const;
    Result<ObjectInfo> head_object(const ObjectLocation& location) const;

    Result<std::string> initiate_multipart_upload(const ObjectLocation& destination,
                                                  const DestinationOptions& options) override;
    Result<std::string> upload_part_copy(const UploadPartCopyRequest& request) override;
    Result<CompletionResponse> complete_multipart_upload(const ObjectLocation& destination,
                                                         const std::string& upload_id,
                                                         const CompletionManifest& parts) override;
    Result<void> abort_multipart_upload(const ObjectLocation& destination,
                                        const std::string& upload_id) override;
    Result<PartListing> list_parts(const ObjectLocation& destination,
                                   const std::string& upload_id) override;

    /// Fails the next matching call. With `part_number` set, only that part's copy matches.
    void fail_operation(Operation operation, std::string message, std::optional<int> part_number = std::nullopt);

    /// Abort reports success but keeps the uploaded parts listed
    void set_retain_parts_on_abort(bool retain);

    /// Runs at the start of every part copy, outside the store lock
    void set_part_copy_hook(std::function<void(int part_number)> hook);

    [[nodiscard]] std::size_t call_count(Operation operation) const;
    [[nodiscard]] std::size_t active_upload_count() const;

    /// Fields the upload was initiated with
    [[nodiscard]] std::optional<nlohmann::json> initiate_fields(const std::string& upload_id) const;

    /// Manifest received by the last successful or failed complete call
    [[nodiscard]] std::optional<CompletionManifest> last_completion_manifest() const;

private:
    struct StoredObject {
        std::vector<std::uint8_t> data;
        std::string etag;
        nlohmann::json attributes = nlohmann::json::object();
    };

    struct StoredPart {
        std::vector<std::uint8_t> data;
        std::string etag;
    };

    enum class UploadState {
        Active,
        Completed,
        Aborted
    };

    struct Upload {
        ObjectLocation destination;
        nlohmann::json fields;
        std::map<int, StoredPart> parts;
        UploadState state = UploadState::Active;
    };

    struct InjectedFault {
        Operation operation;
        std::string message;
        std::optional<int> part_number;
    };

    using ObjectKey = std::pair<std::string, std::string>;

    // Both expect mutex_ to be held
    std::optional<CopyError> take_fault(Operation operation, std::optional<int> part_number);
    Result<Upload*> find_active_upload(const ObjectLocation& destination, const std::string& upload_id);

    mutable std::mutex mutex_;
    std::unordered_set<std::string> buckets_;
    std::map<ObjectKey, StoredObject> objects_;
    std::unordered_map<std::string, Upload> uploads_;
    std::vector<InjectedFault> faults_;
    std::map<Operation, std::size_t> calls_;
    std::optional<CompletionManifest> last_manifest_;
    std::uint64_t upload_counter_ = 0;
    bool retain_parts_on_abort_ = false;
    std::function<void(int)> part_copy_hook_;
};

const char* to_string(InMemoryStorageClient::Operation operation) noexcept;

} // namespace mpcopy::storage
