#include "mpcopy/copy/coordinator.hpp"
#include "mpcopy/events/components.hpp"
#include "mpcopy/storage/memory_client.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <vector>

using mpcopy::CopyError;
using mpcopy::ErrorKind;
using mpcopy::config::CoordinatorConfig;
using mpcopy::copy::CompletionCoordinator;
using mpcopy::copy::CopyRequest;
using mpcopy::events::CopyAbortedEvent;
using mpcopy::events::CopyFailedEvent;
using mpcopy::events::CopyStartedEvent;
using mpcopy::events::EventBus;
using mpcopy::events::MetricsComponent;
using mpcopy::events::PartCopiedEvent;
using mpcopy::Result;
using mpcopy::storage::CompletionManifest;
using mpcopy::storage::CompletionResponse;
using mpcopy::storage::DestinationOptions;
using mpcopy::storage::InMemoryStorageClient;
using mpcopy::storage::PartListing;
using mpcopy::storage::StorageClient;
using mpcopy::storage::UploadPartCopyRequest;
using mpcopy::storage::ObjectLocation;
using mpcopy::storage::limits::kMinimumPartSize;
using Operation = InMemoryStorageClient::Operation;

namespace {

// 16 MiB at the minimum part size: two full parts and a widened third
constexpr std::int64_t kObjectSize = 16 * 1024 * 1024;

std::vector<std::uint8_t> make_bytes(std::size_t size) {
    std::vector<std::uint8_t> data(size);
    std::uint32_t state = 0x9e3779b9u;
    for (auto& byte : data) {
        state = state * 1664525u + 1013904223u;
        byte = static_cast<std::uint8_t>(state >> 24);
    }
    return data;
}

std::string error_code(const CopyError& error) {
    return error.details.value("code", std::string{});
}

// Forwards to the in-memory store but throws on one part copy
class ThrowingPartClient : public StorageClient {
public:
    ThrowingPartClient(InMemoryStorageClient& inner, int throwing_part)
        : inner_(inner), throwing_part_(throwing_part) {}

    Result<std::string> initiate_multipart_upload(const ObjectLocation& destination,
                                                  const DestinationOptions& options) override {
        return inner_.initiate_multipart_upload(destination, options);
    }

    Result<std::string> upload_part_copy(const UploadPartCopyRequest& request) override {
        if (request.part_number == throwing_part_) {
            throw std::runtime_error("socket closed mid-response");
        }
        return inner_.upload_part_copy(request);
    }

    Result<CompletionResponse> complete_multipart_upload(const ObjectLocation& destination,
                                                         const std::string& upload_id,
                                                         const CompletionManifest& manifest) override {
        return inner_.complete_multipart_upload(destination, upload_id, manifest);
    }

    Result<void> abort_multipart_upload(const ObjectLocation& destination, const std::string& upload_id) override {
        return inner_.abort_multipart_upload(destination, upload_id);
    }

    Result<PartListing> list_parts(const ObjectLocation& destination, const std::string& upload_id) override {
        return inner_.list_parts(destination, upload_id);
    }

private:
    InMemoryStorageClient& inner_;
    int throwing_part_;
};

class CompletionCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        client.create_bucket("src");
        client.create_bucket("dst");
        ASSERT_TRUE(client.put_object(source, make_bytes(kObjectSize)).is_ok());
    }

    CopyRequest make_request() const {
        CopyRequest request;
        request.source = source;
        request.destination = destination;
        request.object_size = kObjectSize;
        request.part_size = kMinimumPartSize;
        return request;
    }

    CoordinatorConfig make_config(std::size_t concurrency = 4) const {
        CoordinatorConfig config;
        config.max_concurrency = concurrency;
        return config;
    }

    InMemoryStorageClient client;
    EventBus bus;
    const ObjectLocation source{"src", "media/source file.bin"};
    const ObjectLocation destination{"dst", "media/copy.bin"};
};

} // namespace

TEST_F(CompletionCoordinatorTest, CopiesObjectAndReturnsCompletionResponse) {
    CompletionCoordinator coordinator(client, make_config(), bus);

    auto result = coordinator.copy_object(make_request());
    ASSERT_TRUE(result.is_ok()) << result.error().describe();

    EXPECT_EQ(result.value().bucket, "dst");
    EXPECT_EQ(result.value().key, "media/copy.bin");
    EXPECT_EQ(result.value().location, "memory://dst/media/copy.bin");
    EXPECT_NE(result.value().etag.find("-3\""), std::string::npos);

    auto copied = client.get_object(destination);
    auto original = client.get_object(source);
    ASSERT_TRUE(copied.is_ok());
    ASSERT_TRUE(original.is_ok());
    EXPECT_EQ(copied.value(), original.value());

    EXPECT_EQ(client.call_count(Operation::Initiate), 1u);
    EXPECT_EQ(client.call_count(Operation::UploadPartCopy), 3u);
    EXPECT_EQ(client.call_count(Operation::Complete), 1u);
    EXPECT_EQ(client.call_count(Operation::Abort), 0u);
    EXPECT_EQ(client.active_upload_count(), 0u);

    auto manifest = client.last_completion_manifest();
    ASSERT_TRUE(manifest.has_value());
    ASSERT_EQ(manifest->size(), 3u);
    EXPECT_EQ((*manifest)[2].part_number, 3);
}

TEST_F(CompletionCoordinatorTest, ManifestIsOrderedWhenPartsFinishInReverse) {
    // Part N may not start until every part above N has finished copying
    std::mutex mutex;
    std::condition_variable cv;
    int allowed = 3;
    std::vector<int> finished;

    client.set_part_copy_hook([&](int part_number) {
        std::unique_lock lock(mutex);
        cv.wait_for(lock, std::chrono::seconds(5), [&] { return allowed == part_number; });
    });
    bus.subscribe<PartCopiedEvent>([&](const PartCopiedEvent& e) {
        std::lock_guard lock(mutex);
        finished.push_back(e.part_number);
        --allowed;
        cv.notify_all();
    });

    CompletionCoordinator coordinator(client, make_config(3), bus);
    auto result = coordinator.copy_object(make_request());
    ASSERT_TRUE(result.is_ok()) << result.error().describe();

    EXPECT_EQ(finished, (std::vector<int>{3, 2, 1}));

    auto manifest = client.last_completion_manifest();
    ASSERT_TRUE(manifest.has_value());
    ASSERT_EQ(manifest->size(), 3u);
    for (std::size_t i = 0; i < manifest->size(); ++i) {
        EXPECT_EQ((*manifest)[i].part_number, static_cast<int>(i + 1));
    }
}

TEST_F(CompletionCoordinatorTest, SinglePartObject) {
    ASSERT_TRUE(client.put_object({"src", "small"}, make_bytes(3'000'000)).is_ok());
    CompletionCoordinator coordinator(client, make_config(), bus);

    auto request = make_request();
    request.source = {"src", "small"};
    request.object_size = 3'000'000;
    request.part_size.reset();

    auto result = coordinator.copy_object(request);
    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(client.call_count(Operation::UploadPartCopy), 1u);

    auto info = client.head_object(destination);
    ASSERT_TRUE(info.is_ok());
    EXPECT_EQ(info.value().size, 3'000'000);
}

TEST_F(CompletionCoordinatorTest, PartFailureAbortsAndVerifies) {
    client.fail_operation(Operation::UploadPartCopy, "connection reset", 2);
    CompletionCoordinator coordinator(client, make_config(), bus);

    auto result = coordinator.copy_object(make_request());
    ASSERT_TRUE(result.is_error());

    const auto& error = result.error();
    EXPECT_EQ(error.kind, ErrorKind::Aborted);
    EXPECT_EQ(error.details["bucket"], "dst");
    EXPECT_EQ(error.details["key"], "media/copy.bin");

    ASSERT_TRUE(error.cause);
    EXPECT_EQ(error.cause->kind, ErrorKind::PartCopyFailure);
    EXPECT_EQ(error.cause->details["part_number"], 2);
    EXPECT_EQ(error.cause->details["failed_parts"], nlohmann::json::array({2}));
    EXPECT_EQ(error.root_cause().message, "connection reset");
    EXPECT_EQ(error_code(error.root_cause()), "InternalError");

    EXPECT_EQ(client.call_count(Operation::Abort), 1u);
    EXPECT_EQ(client.call_count(Operation::ListParts), 1u);
    EXPECT_EQ(client.call_count(Operation::Complete), 0u);
    EXPECT_EQ(client.active_upload_count(), 0u);
    EXPECT_FALSE(client.head_object(destination).is_ok());
}

TEST_F(CompletionCoordinatorTest, ThrowingPartCopyIsAborted) {
    ThrowingPartClient throwing(client, 2);
    MetricsComponent metrics(bus);
    CompletionCoordinator coordinator(throwing, make_config(), bus);

    auto result = coordinator.copy_object(make_request());
    ASSERT_TRUE(result.is_error());

    const auto& error = result.error();
    EXPECT_EQ(error.kind, ErrorKind::Aborted);
    ASSERT_TRUE(error.cause);
    EXPECT_EQ(error.cause->kind, ErrorKind::PartCopyFailure);
    EXPECT_EQ(error.cause->details["part_number"], 2);
    EXPECT_EQ(error.root_cause().kind, ErrorKind::TransportFailure);
    EXPECT_EQ(error.root_cause().message.rfind("part copy threw:", 0), 0u);
    EXPECT_NE(error.root_cause().message.find("socket closed mid-response"), std::string::npos);

    EXPECT_EQ(client.call_count(Operation::Abort), 1u);
    EXPECT_EQ(client.call_count(Operation::ListParts), 1u);
    EXPECT_EQ(client.call_count(Operation::Complete), 0u);
    EXPECT_EQ(client.active_upload_count(), 0u);
    EXPECT_EQ(metrics.get_stats().parts_failed.load(), 1u);
}

TEST_F(CompletionCoordinatorTest, EveryFailedPartIsReported) {
    CompletionCoordinator coordinator(client, make_config(), bus);

    auto request = make_request();
    request.source = {"src", "does-not-exist"};

    auto result = coordinator.copy_object(request);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Aborted);
    ASSERT_TRUE(result.error().cause);
    EXPECT_EQ(result.error().cause->details["part_number"], 1);
    EXPECT_EQ(result.error().cause->details["failed_parts"], nlohmann::json::array({1, 2, 3}));
    EXPECT_EQ(error_code(result.error().root_cause()), "NoSuchKey");
}

TEST_F(CompletionCoordinatorTest, LeftoverPartsAfterAbortAreReported) {
    client.set_retain_parts_on_abort(true);
    client.fail_operation(Operation::UploadPartCopy, "throttled", 2);
    CompletionCoordinator coordinator(client, make_config(), bus);

    auto result = coordinator.copy_object(make_request());
    ASSERT_TRUE(result.is_error());

    const auto& error = result.error();
    EXPECT_EQ(error.kind, ErrorKind::AbortInconsistency);
    EXPECT_EQ(error.message, "abort procedure passed but copy parts were not removed");
    ASSERT_TRUE(error.details["Parts"].is_array());
    ASSERT_EQ(error.details["Parts"].size(), 2u);
    EXPECT_EQ(error.details["Parts"][0]["PartNumber"], 1);
    EXPECT_EQ(error.details["Parts"][1]["PartNumber"], 3);
    ASSERT_TRUE(error.cause);
    EXPECT_EQ(error.cause->kind, ErrorKind::PartCopyFailure);
}

TEST_F(CompletionCoordinatorTest, InitiationFailureCopiesNothing) {
    client.fail_operation(Operation::Initiate, "access denied");
    CompletionCoordinator coordinator(client, make_config(), bus);

    auto result = coordinator.copy_object(make_request());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::InitiationFailure);
    ASSERT_TRUE(result.error().cause);
    EXPECT_EQ(result.error().cause->kind, ErrorKind::TransportFailure);
    EXPECT_EQ(result.error().cause->message, "access denied");

    EXPECT_EQ(client.call_count(Operation::UploadPartCopy), 0u);
    EXPECT_EQ(client.call_count(Operation::Abort), 0u);
    EXPECT_EQ(client.call_count(Operation::Complete), 0u);
}

TEST_F(CompletionCoordinatorTest, MissingDestinationBucketFailsInitiation) {
    CompletionCoordinator coordinator(client, make_config(), bus);

    auto request = make_request();
    request.destination = {"no-such-bucket", "copy.bin"};

    auto result = coordinator.copy_object(request);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::InitiationFailure);
    EXPECT_EQ(error_code(result.error().root_cause()), "NoSuchBucket");
}

TEST_F(CompletionCoordinatorTest, FinalizationFailureDoesNotAbort) {
    client.fail_operation(Operation::Complete, "internal error");
    CompletionCoordinator coordinator(client, make_config(), bus);

    auto result = coordinator.copy_object(make_request());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::FinalizationFailure);
    EXPECT_EQ(result.error().details["upload_id"], "upload-1");
    ASSERT_TRUE(result.error().cause);
    EXPECT_EQ(result.error().cause->message, "internal error");

    EXPECT_EQ(client.call_count(Operation::UploadPartCopy), 3u);
    EXPECT_EQ(client.call_count(Operation::Abort), 0u);
    EXPECT_EQ(client.active_upload_count(), 1u);
}

TEST_F(CompletionCoordinatorTest, AbortFailureIsReturnedUnchanged) {
    client.fail_operation(Operation::UploadPartCopy, "reset", 1);
    client.fail_operation(Operation::Abort, "abort refused");
    CompletionCoordinator coordinator(client, make_config(), bus);

    auto result = coordinator.copy_object(make_request());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::TransportFailure);
    EXPECT_EQ(result.error().message, "abort refused");
    EXPECT_FALSE(result.error().cause);
    EXPECT_EQ(client.call_count(Operation::ListParts), 0u);
}

TEST_F(CompletionCoordinatorTest, ListPartsFailureIsReturnedUnchanged) {
    client.fail_operation(Operation::UploadPartCopy, "reset", 3);
    client.fail_operation(Operation::ListParts, "list unavailable");
    CompletionCoordinator coordinator(client, make_config(), bus);

    auto result = coordinator.copy_object(make_request());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::TransportFailure);
    EXPECT_EQ(result.error().message, "list unavailable");
    EXPECT_EQ(client.call_count(Operation::Abort), 1u);
}

TEST_F(CompletionCoordinatorTest, InvalidPartSizeMakesNoCalls) {
    CompletionCoordinator coordinator(client, make_config(), bus);

    auto request = make_request();
    request.part_size = kMinimumPartSize - 1;

    auto result = coordinator.copy_object(request);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidInput);

    for (auto op : {Operation::Initiate, Operation::UploadPartCopy, Operation::Complete,
                    Operation::Abort, Operation::ListParts}) {
        EXPECT_EQ(client.call_count(op), 0u) << mpcopy::storage::to_string(op);
    }
}

TEST_F(CompletionCoordinatorTest, EmptyLocationsAreRejected) {
    CompletionCoordinator coordinator(client, make_config(), bus);

    auto no_key = make_request();
    no_key.source.key.clear();
    auto result = coordinator.copy_object(no_key);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidInput);

    auto no_bucket = make_request();
    no_bucket.destination.bucket.clear();
    EXPECT_EQ(coordinator.copy_object(no_bucket).error().kind, ErrorKind::InvalidInput);

    auto no_size = make_request();
    no_size.object_size = 0;
    EXPECT_EQ(coordinator.copy_object(no_size).error().kind, ErrorKind::InvalidInput);

    EXPECT_EQ(client.call_count(Operation::Initiate), 0u);
}

TEST_F(CompletionCoordinatorTest, AbsentOptionsAreOmittedAndAclDefaults) {
    CompletionCoordinator coordinator(client, make_config(), bus);

    auto request = make_request();
    request.options.content_type = "application/octet-stream";
    request.options.expires = "";
    request.options.metadata = std::map<std::string, std::string>{{"copied-by", "mpcopy"}};

    ASSERT_TRUE(coordinator.copy_object(request).is_ok());

    auto fields = client.initiate_fields("upload-1");
    ASSERT_TRUE(fields.has_value());
    EXPECT_EQ((*fields)["ACL"], "private");
    EXPECT_EQ((*fields)["ContentType"], "application/octet-stream");
    EXPECT_EQ((*fields)["Metadata"]["copied-by"], "mpcopy");
    EXPECT_EQ(fields->count("Expires"), 0u);
    EXPECT_EQ(fields->count("StorageClass"), 0u);
    EXPECT_EQ(fields->count("ServerSideEncryption"), 0u);

    auto info = client.head_object(destination);
    ASSERT_TRUE(info.is_ok());
    EXPECT_EQ(info.value().attributes["ContentType"], "application/octet-stream");
}

TEST_F(CompletionCoordinatorTest, ExplicitAclOverridesDefault) {
    auto config = make_config();
    config.default_acl = "bucket-owner-read";
    CompletionCoordinator coordinator(client, config, bus);

    auto request = make_request();
    request.options.acl = "public-read";
    ASSERT_TRUE(coordinator.copy_object(request).is_ok());
    EXPECT_EQ((*client.initiate_fields("upload-1"))["ACL"], "public-read");

    request.options.acl.reset();
    ASSERT_TRUE(coordinator.copy_object(request).is_ok());
    EXPECT_EQ((*client.initiate_fields("upload-2"))["ACL"], "bucket-owner-read");
}

TEST_F(CompletionCoordinatorTest, ConfiguredPartSizeIsUsedWhenRequestHasNone) {
    auto config = make_config();
    config.default_part_size = 8 * 1024 * 1024;
    CompletionCoordinator coordinator(client, config, bus);

    auto request = make_request();
    request.part_size.reset();
    ASSERT_TRUE(coordinator.copy_object(request).is_ok());
    EXPECT_EQ(client.call_count(Operation::UploadPartCopy), 2u);
}

TEST_F(CompletionCoordinatorTest, EmitsLifecycleEventsWithRequestContext) {
    MetricsComponent metrics(bus);
    std::vector<std::string> contexts;
    bus.subscribe<CopyStartedEvent>([&](const CopyStartedEvent& e) {
        contexts.push_back(e.request_context.value_or("none"));
    });

    CompletionCoordinator coordinator(client, make_config(), bus);
    ASSERT_TRUE(coordinator.copy_object(make_request(), std::string("req-42")).is_ok());

    client.fail_operation(Operation::UploadPartCopy, "reset", 1);
    ASSERT_TRUE(coordinator.copy_object(make_request()).is_error());

    client.fail_operation(Operation::Initiate, "denied");
    ASSERT_TRUE(coordinator.copy_object(make_request()).is_error());

    EXPECT_EQ(contexts, (std::vector<std::string>{"req-42", "none", "none"}));

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.copies_started.load(), 3u);
    EXPECT_EQ(stats.copies_completed.load(), 1u);
    EXPECT_EQ(stats.copies_aborted.load(), 1u);
    EXPECT_EQ(stats.abort_inconsistencies.load(), 0u);
    EXPECT_EQ(stats.copies_failed.load(), 1u);
    EXPECT_EQ(stats.parts_copied.load(), 5u);
    EXPECT_EQ(stats.parts_failed.load(), 1u);
}

TEST_F(CompletionCoordinatorTest, AbortEventReportsLeftovers) {
    client.set_retain_parts_on_abort(true);
    client.fail_operation(Operation::UploadPartCopy, "reset", 1);

    std::vector<std::size_t> remaining;
    bus.subscribe<CopyAbortedEvent>([&](const CopyAbortedEvent& e) {
        EXPECT_FALSE(e.parts_removed);
        remaining.push_back(e.remaining_parts);
    });
    std::vector<std::string> failed_stages;
    bus.subscribe<CopyFailedEvent>([&](const CopyFailedEvent& e) { failed_stages.push_back(e.stage); });

    CompletionCoordinator coordinator(client, make_config(), bus);
    ASSERT_TRUE(coordinator.copy_object(make_request()).is_error());

    EXPECT_EQ(remaining, (std::vector<std::size_t>{2}));
    EXPECT_TRUE(failed_stages.empty());
}
