#include "mpcopy/copy/coordinator.hpp"
#include "mpcopy/copy/planner.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <utility>

namespace mpcopy::copy {
namespace asio = boost::asio;

namespace {

std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

nlohmann::json session_details(const UploadSession& session) {
    return nlohmann::json{
        {"bucket", session.destination().bucket},
        {"key", session.destination().key},
        {"upload_id", session.upload_id()},
    };
}

} // namespace

CompletionCoordinator::CompletionCoordinator(storage::StorageClient& client,
                                             config::CoordinatorConfig config,
                                             events::EventBus& bus)
    : client_(client),
      config_(std::move(config)),
      event_bus_(bus),
      part_copier_(client),
      pool_(std::max<std::size_t>(1, config_.max_concurrency)) {
}

CompletionCoordinator::~CompletionCoordinator() {
    pool_.join();
}

Result<CompletionResponse> CompletionCoordinator::copy_object(const CopyRequest& request,
                                                              const events::RequestContext& request_context) {
    auto planned = plan(request);
    if (planned.is_error()) {
        spdlog::warn("Rejected copy {}/{} -> {}/{}: {}",
                     request.source.bucket, request.source.key,
                     request.destination.bucket, request.destination.key,
                     planned.error().message);
        return Err<CompletionResponse>(planned.error());
    }
    const auto& ranges = planned.value();
    const auto started = std::chrono::steady_clock::now();

    event_bus_.emit(events::CopyStartedEvent{request.source, request.destination, request.object_size,
                                             request.part_size.value_or(config_.default_part_size),
                                             ranges.size(), request_context});

    UploadSession session(request.destination);

    auto upload_id = client_.initiate_multipart_upload(request.destination, resolve_options(request.options));
    if (upload_id.is_error()) {
        return fail(session, "initiate",
                    wrap_error(ErrorKind::InitiationFailure, "failed to initiate multipart copy", upload_id.error(),
                               {{"bucket", request.destination.bucket}, {"key", request.destination.key}}),
                    request_context);
    }
    if (auto attached = session.attach_upload_id(upload_id.value(), ranges.size()); attached.is_error()) {
        return fail(session, "initiate",
                    wrap_error(ErrorKind::InitiationFailure, "storage service returned an unusable upload id",
                               attached.error()),
                    request_context);
    }
    event_bus_.emit(events::UploadInitiatedEvent{request.destination, session.upload_id(), request_context});

    auto outcomes = copy_parts(request, session.upload_id(), ranges, request_context);

    std::vector<PartResult> results;
    results.reserve(outcomes.size());
    std::optional<std::size_t> first_failed;
    nlohmann::json failed_parts = nlohmann::json::array();
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        if (outcomes[i].is_ok()) {
            results.push_back(std::move(outcomes[i].value()));
            continue;
        }
        failed_parts.push_back(ranges[i].part_number);
        if (!first_failed) {
            first_failed = i;
        }
    }

    if (first_failed) {
        const int part_number = ranges[*first_failed].part_number;
        auto part_failure = wrap_error(ErrorKind::PartCopyFailure,
                                       "copy of part " + std::to_string(part_number) + " failed",
                                       std::move(outcomes[*first_failed].error()),
                                       {{"part_number", part_number},
                                        {"failed_parts", failed_parts},
                                        {"upload_id", session.upload_id()}});
        return abort_and_verify(session, std::move(part_failure), request_context);
    }

    if (auto moved = session.transition_to(CopyState::Finalizing); moved.is_error()) {
        return fail(session, "complete", moved.error(), request_context);
    }

    const auto manifest = build_manifest(std::move(results));
    auto completed = client_.complete_multipart_upload(request.destination, session.upload_id(), manifest);
    if (completed.is_error()) {
        return fail(session, "complete",
                    wrap_error(ErrorKind::FinalizationFailure, "failed to complete multipart copy",
                               completed.error(), session_details(session)),
                    request_context);
    }

    if (auto moved = session.transition_to(CopyState::Completed); moved.is_error()) {
        return fail(session, "complete", moved.error(), request_context);
    }

    event_bus_.emit(events::CopyCompletedEvent{request.destination, session.upload_id(), completed.value().etag,
                                               manifest.size(), request.object_size, elapsed_since(started),
                                               request_context});
    return Ok(std::move(completed.value()));
}

Result<std::vector<PartRange>> CompletionCoordinator::plan(const CopyRequest& request) const {
    const std::pair<const char*, const ObjectLocation*> locations[] = {
        {"source", &request.source},
        {"destination", &request.destination},
    };
    for (const auto& [name, location] : locations) {
        if (location->bucket.empty() || location->key.empty()) {
            return Err<std::vector<PartRange>>(make_error(ErrorKind::InvalidInput,
                std::string(name) + " bucket and key must not be empty", {{"location", name}}));
        }
    }

    return plan_partitions(request.object_size, request.part_size.value_or(config_.default_part_size));
}

DestinationOptions CompletionCoordinator::resolve_options(const DestinationOptions& options) const {
    auto resolved = options;
    if (!resolved.acl || resolved.acl->empty()) {
        resolved.acl = config_.default_acl;
    }
    return resolved;
}

std::vector<Result<PartResult>> CompletionCoordinator::copy_parts(const CopyRequest& request,
                                                                  const std::string& upload_id,
                                                                  const std::vector<PartRange>& ranges,
                                                                  const events::RequestContext& request_context) {
    spdlog::debug("Dispatching {} part copies for upload {} on {} workers",
                  ranges.size(), upload_id, config_.max_concurrency);

    std::vector<std::future<Result<PartResult>>> pending;
    pending.reserve(ranges.size());
    for (const auto& range : ranges) {
        auto task = std::make_shared<std::packaged_task<Result<PartResult>()>>(
            [this, &request, &upload_id, &request_context, range]() {
                return copy_one_part(request, upload_id, range, request_context);
            });
        pending.push_back(task->get_future());
        asio::post(pool_, [task]() { (*task)(); });
    }

    // Every task settles before any result is read; tasks hold references into this frame
    for (auto& future : pending) {
        future.wait();
    }

    std::vector<Result<PartResult>> outcomes;
    outcomes.reserve(pending.size());
    for (std::size_t index = 0; index < pending.size(); ++index) {
        outcomes.push_back(collect_part_result(pending[index], ranges[index].part_number));
    }
    return outcomes;
}

Result<PartResult> CompletionCoordinator::copy_one_part(const CopyRequest& request,
                                                        const std::string& upload_id,
                                                        const PartRange& range,
                                                        const events::RequestContext& request_context) {
    const auto started = std::chrono::steady_clock::now();

    auto result = [&]() -> Result<PartResult> {
        try {
            return part_copier_.copy_part(request.source, request.destination, upload_id, range);
        } catch (const std::exception& e) {
            return Err<PartResult>(part_exception_error(range.part_number, e));
        }
    }();

    if (result.is_ok()) {
        event_bus_.emit(events::PartCopiedEvent{upload_id, range.part_number, range.size(),
                                                result.value().etag, elapsed_since(started), request_context});
    } else {
        event_bus_.emit(events::PartCopyFailedEvent{upload_id, range.part_number,
                                                    result.error().describe(), request_context});
    }
    return result;
}

Result<CompletionResponse> CompletionCoordinator::abort_and_verify(UploadSession& session,
                                                                   CopyError part_failure,
                                                                   const events::RequestContext& request_context) {
    const auto reason = part_failure.describe();
    spdlog::warn("Aborting multipart copy to {}/{} (upload {}): {}",
                 session.destination().bucket, session.destination().key, session.upload_id(), reason);

    if (auto moved = session.transition_to(CopyState::Aborting); moved.is_error()) {
        return fail(session, "abort", moved.error(), request_context);
    }

    auto aborted = client_.abort_multipart_upload(session.destination(), session.upload_id());
    if (aborted.is_error()) {
        spdlog::error("Abort of upload {} failed; original failure was: {}", session.upload_id(), reason);
        return fail(session, "abort", aborted.error(), request_context);
    }

    auto listing = client_.list_parts(session.destination(), session.upload_id());
    if (listing.is_error()) {
        spdlog::error("Listing parts of aborted upload {} failed; original failure was: {}",
                      session.upload_id(), reason);
        return fail(session, "list-parts", listing.error(), request_context);
    }

    const auto remaining = listing.value().parts.size();
    if (remaining > 0) {
        auto error = wrap_error(ErrorKind::AbortInconsistency,
                                "abort procedure passed but copy parts were not removed",
                                std::move(part_failure), nlohmann::json(listing.value()));
        if (auto moved = session.transition_to(CopyState::AbortFailed); moved.is_error()) {
            return fail(session, "list-parts", moved.error(), request_context);
        }
        session.record_error(error.describe());
        event_bus_.emit(events::CopyAbortedEvent{session.destination(), session.upload_id(), false, remaining,
                                                 reason, request_context});
        return Err<CompletionResponse>(std::move(error));
    }

    auto error = wrap_error(ErrorKind::Aborted, "multipart copy aborted", std::move(part_failure),
                            session_details(session));
    if (auto moved = session.transition_to(CopyState::AbortVerified); moved.is_error()) {
        return fail(session, "list-parts", moved.error(), request_context);
    }
    session.record_error(error.describe());
    event_bus_.emit(events::CopyAbortedEvent{session.destination(), session.upload_id(), true, 0,
                                             reason, request_context});
    return Err<CompletionResponse>(std::move(error));
}

Result<CompletionResponse> CompletionCoordinator::fail(UploadSession& session,
                                                       const std::string& stage,
                                                       CopyError error,
                                                       const events::RequestContext& request_context) {
    const auto description = error.describe();
    if (auto marked = session.mark_failed(description); marked.is_error()) {
        spdlog::error("Upload session {} could not be marked failed: {}", session.upload_id(), marked.error().message);
    }
    event_bus_.emit(events::CopyFailedEvent{session.destination(), stage, description, request_context});
    return Err<CompletionResponse>(std::move(error));
}

CompletionManifest CompletionCoordinator::build_manifest(std::vector<PartResult> results) {
    std::sort(results.begin(), results.end(), [](const PartResult& lhs, const PartResult& rhs) {
        return lhs.part_number < rhs.part_number;
    });
    return results;
}

} // namespace mpcopy::copy
