/**
 * @file events.hpp
 * @brief Events emitted while a multipart copy runs
 *
 * NAMING CONVENTION:
 * Events are past-tense: CopyStartedEvent, PartCopiedEvent
 *
 * Every event carries the caller's optional request context. It exists only
 * for correlation in logs and never changes what the coordinator does.
 */

#pragma once

#include "mpcopy/storage/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace mpcopy::events {

using RequestContext = std::optional<std::string>;

// ════════════════════════════════════════════════════════
// Copy lifecycle
// ════════════════════════════════════════════════════════

/**
 * @brief Request validated and planned, nothing sent yet
 *
 * WHO EMITS: CompletionCoordinator::copy_object
 * WHO SUBSCRIBES: LoggerComponent, MetricsComponent
 */
struct CopyStartedEvent {
    storage::ObjectLocation source;
    storage::ObjectLocation destination;
    std::int64_t object_size;
    std::int64_t part_size;
    std::size_t part_count;
    RequestContext request_context;
    std::chrono::system_clock::time_point timestamp;

    CopyStartedEvent(
        storage::ObjectLocation src,
        storage::ObjectLocation dst,
        std::int64_t size,
        std::int64_t part,
        std::size_t parts,
        RequestContext ctx = std::nullopt
    ) : source(std::move(src)),
        destination(std::move(dst)),
        object_size(size),
        part_size(part),
        part_count(parts),
        request_context(std::move(ctx)),
        timestamp(std::chrono::system_clock::now())
    {}
};

struct UploadInitiatedEvent {
    storage::ObjectLocation destination;
    std::string upload_id;
    RequestContext request_context;
    std::chrono::system_clock::time_point timestamp;

    UploadInitiatedEvent(
        storage::ObjectLocation dst,
        std::string id,
        RequestContext ctx = std::nullopt
    ) : destination(std::move(dst)),
        upload_id(std::move(id)),
        request_context(std::move(ctx)),
        timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Emitted from a worker thread when one part copy succeeds
 */
struct PartCopiedEvent {
    std::string upload_id;
    int part_number;
    std::int64_t bytes;
    std::string etag;
    std::chrono::milliseconds duration;
    RequestContext request_context;

    PartCopiedEvent(
        std::string id,
        int part,
        std::int64_t size,
        std::string tag,
        std::chrono::milliseconds took,
        RequestContext ctx = std::nullopt
    ) : upload_id(std::move(id)),
        part_number(part),
        bytes(size),
        etag(std::move(tag)),
        duration(took),
        request_context(std::move(ctx))
    {}
};

struct PartCopyFailedEvent {
    std::string upload_id;
    int part_number;
    std::string error;
    RequestContext request_context;

    PartCopyFailedEvent(
        std::string id,
        int part,
        std::string reason,
        RequestContext ctx = std::nullopt
    ) : upload_id(std::move(id)),
        part_number(part),
        error(std::move(reason)),
        request_context(std::move(ctx))
    {}
};

struct CopyCompletedEvent {
    storage::ObjectLocation destination;
    std::string upload_id;
    std::string etag;
    std::size_t part_count;
    std::int64_t bytes;
    std::chrono::milliseconds duration;
    RequestContext request_context;
    std::chrono::system_clock::time_point timestamp;

    CopyCompletedEvent(
        storage::ObjectLocation dst,
        std::string id,
        std::string tag,
        std::size_t parts,
        std::int64_t size,
        std::chrono::milliseconds took,
        RequestContext ctx = std::nullopt
    ) : destination(std::move(dst)),
        upload_id(std::move(id)),
        etag(std::move(tag)),
        part_count(parts),
        bytes(size),
        duration(took),
        request_context(std::move(ctx)),
        timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief A part failed and the upload was aborted
 *
 * parts_removed is false when list-parts still reported parts after the abort.
 */
struct CopyAbortedEvent {
    storage::ObjectLocation destination;
    std::string upload_id;
    bool parts_removed;
    std::size_t remaining_parts;
    std::string reason;
    RequestContext request_context;
    std::chrono::system_clock::time_point timestamp;

    CopyAbortedEvent(
        storage::ObjectLocation dst,
        std::string id,
        bool removed,
        std::size_t remaining,
        std::string why,
        RequestContext ctx = std::nullopt
    ) : destination(std::move(dst)),
        upload_id(std::move(id)),
        parts_removed(removed),
        remaining_parts(remaining),
        reason(std::move(why)),
        request_context(std::move(ctx)),
        timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief The copy ended on an error other than a verified abort
 *
 * stage is one of "initiate", "complete", "abort", "list-parts".
 */
struct CopyFailedEvent {
    storage::ObjectLocation destination;
    std::string stage;
    std::string error;
    RequestContext request_context;
    std::chrono::system_clock::time_point timestamp;

    CopyFailedEvent(
        storage::ObjectLocation dst,
        std::string where,
        std::string reason,
        RequestContext ctx = std::nullopt
    ) : destination(std::move(dst)),
        stage(std::move(where)),
        error(std::move(reason)),
        request_context(std::move(ctx)),
        timestamp(std::chrono::system_clock::now())
    {}
};

} // namespace mpcopy::events
