/**
 * @file components.hpp
 * @brief Event-driven logging and metrics for multipart copies
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Every copy run through a coordinator on `bus` is now logged and counted
 *
 * Components unsubscribe in their destructor, so they may be destroyed
 * before the bus.
 */

#pragma once

#include "mpcopy/events/event_bus.hpp"
#include "mpcopy/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace mpcopy::events {

namespace detail {

inline std::string context_label(const RequestContext& context) {
    return context ? *context : std::string("-");
}

/// Owns a set of subscriptions and drops them on destruction
class SubscriptionSet {
public:
    explicit SubscriptionSet(EventBus& bus) : bus_(bus) {}
    ~SubscriptionSet() {
        for (auto& cancel : cancels_) {
            cancel();
        }
    }

    SubscriptionSet(const SubscriptionSet&) = delete;
    SubscriptionSet& operator=(const SubscriptionSet&) = delete;

    template<typename EventType>
    void add(std::function<void(const EventType&)> handler) {
        const auto id = bus_.subscribe<EventType>(std::move(handler));
        cancels_.push_back([this, id]() { bus_.unsubscribe<EventType>(id); });
    }

private:
    EventBus& bus_;
    std::vector<std::function<void()>> cancels_;
};

} // namespace detail

/**
 * @brief Logs every copy lifecycle event with spdlog
 *
 * Per-part events go to debug, aborts and failures to warn/error,
 * everything else to info.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : subscriptions_(bus) {
        subscriptions_.add<CopyStartedEvent>([](const CopyStartedEvent& e) {
            spdlog::info("[CopyStarted] ctx={} src={}/{} dst={}/{} size={} part_size={} parts={}",
                detail::context_label(e.request_context),
                e.source.bucket, e.source.key,
                e.destination.bucket, e.destination.key,
                e.object_size, e.part_size, e.part_count);
        });

        subscriptions_.add<UploadInitiatedEvent>([](const UploadInitiatedEvent& e) {
            spdlog::info("[UploadInitiated] ctx={} dst={}/{} upload={}",
                detail::context_label(e.request_context),
                e.destination.bucket, e.destination.key, e.upload_id);
        });

        subscriptions_.add<PartCopiedEvent>([](const PartCopiedEvent& e) {
            spdlog::debug("[PartCopied] ctx={} upload={} part={} bytes={} etag={} duration={}ms",
                detail::context_label(e.request_context),
                e.upload_id, e.part_number, e.bytes, e.etag, e.duration.count());
        });

        subscriptions_.add<PartCopyFailedEvent>([](const PartCopyFailedEvent& e) {
            spdlog::warn("[PartCopyFailed] ctx={} upload={} part={} error={}",
                detail::context_label(e.request_context),
                e.upload_id, e.part_number, e.error);
        });

        subscriptions_.add<CopyCompletedEvent>([](const CopyCompletedEvent& e) {
            spdlog::info("[CopyCompleted] ctx={} dst={}/{} upload={} etag={} parts={} bytes={} duration={}ms",
                detail::context_label(e.request_context),
                e.destination.bucket, e.destination.key,
                e.upload_id, e.etag, e.part_count, e.bytes, e.duration.count());
        });

        subscriptions_.add<CopyAbortedEvent>([](const CopyAbortedEvent& e) {
            if (e.parts_removed) {
                spdlog::warn("[CopyAborted] ctx={} dst={}/{} upload={} reason={}",
                    detail::context_label(e.request_context),
                    e.destination.bucket, e.destination.key, e.upload_id, e.reason);
            } else {
                spdlog::error("[CopyAborted] ctx={} dst={}/{} upload={} remaining_parts={} reason={}",
                    detail::context_label(e.request_context),
                    e.destination.bucket, e.destination.key, e.upload_id,
                    e.remaining_parts, e.reason);
            }
        });

        subscriptions_.add<CopyFailedEvent>([](const CopyFailedEvent& e) {
            spdlog::error("[CopyFailed] ctx={} dst={}/{} stage={} error={}",
                detail::context_label(e.request_context),
                e.destination.bucket, e.destination.key, e.stage, e.error);
        });
    }

private:
    detail::SubscriptionSet subscriptions_;
};

/**
 * @brief Counts copies, parts and bytes
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.get_stats().copies_completed.load();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> copies_started{0};
        std::atomic<uint64_t> copies_completed{0};
        std::atomic<uint64_t> copies_aborted{0};
        std::atomic<uint64_t> copies_failed{0};
        std::atomic<uint64_t> abort_inconsistencies{0};
        std::atomic<uint64_t> parts_copied{0};
        std::atomic<uint64_t> parts_failed{0};
        std::atomic<uint64_t> bytes_copied{0};
    };

    explicit MetricsComponent(EventBus& bus) : subscriptions_(bus) {
        subscriptions_.add<CopyStartedEvent>([this](const CopyStartedEvent&) {
            stats_.copies_started++;
        });

        subscriptions_.add<PartCopiedEvent>([this](const PartCopiedEvent& e) {
            stats_.parts_copied++;
            stats_.bytes_copied += static_cast<uint64_t>(e.bytes);
        });

        subscriptions_.add<PartCopyFailedEvent>([this](const PartCopyFailedEvent&) {
            stats_.parts_failed++;
        });

        subscriptions_.add<CopyCompletedEvent>([this](const CopyCompletedEvent&) {
            stats_.copies_completed++;
        });

        subscriptions_.add<CopyAbortedEvent>([this](const CopyAbortedEvent& e) {
            stats_.copies_aborted++;
            if (!e.parts_removed) {
                stats_.abort_inconsistencies++;
            }
        });

        subscriptions_.add<CopyFailedEvent>([this](const CopyFailedEvent&) {
            stats_.copies_failed++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Copy Statistics:");
        spdlog::info("  Copies started:   {}", stats_.copies_started.load());
        spdlog::info("  Copies completed: {}", stats_.copies_completed.load());
        spdlog::info("  Copies aborted:   {}", stats_.copies_aborted.load());
        spdlog::info("  Copies failed:    {}", stats_.copies_failed.load());
        spdlog::info("  Abort leftovers:  {}", stats_.abort_inconsistencies.load());
        spdlog::info("  Parts copied:     {}", stats_.parts_copied.load());
        spdlog::info("  Parts failed:     {}", stats_.parts_failed.load());
        spdlog::info("  Bytes copied:     {}", stats_.bytes_copied.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    Stats stats_;
    detail::SubscriptionSet subscriptions_;
};

} // namespace mpcopy::events
