#pragma once

#include "mpcopy/config/config.hpp"
#include "mpcopy/core/result.hpp"
#include "mpcopy/copy/part_copier.hpp"
#include "mpcopy/copy/types.hpp"
#include "mpcopy/copy/upload_session.hpp"
#include "mpcopy/events/event_bus.hpp"
#include "mpcopy/events/events.hpp"
#include "mpcopy/storage/client.hpp"

#include <boost/asio/thread_pool.hpp>

#include <optional>
#include <string>
#include <vector>

namespace mpcopy::copy {

/**
 * @brief Runs a multipart copy from initiate to complete or abort
 *
 * For each request: plan the ranges, initiate an upload, copy every part
 * concurrently on the worker pool, then complete with a manifest ordered by
 * part number. If any part fails the upload is aborted and list-parts is
 * called to confirm nothing was left behind; the caller gets an Aborted or
 * AbortInconsistency error either way.
 *
 * The storage client and event bus must outlive the coordinator. copy_object
 * may be called from several threads; each call owns its own UploadSession.
 */
class CompletionCoordinator {
public:
    CompletionCoordinator(storage::StorageClient& client,
                          config::CoordinatorConfig config,
                          events::EventBus& bus);
    ~CompletionCoordinator();

    CompletionCoordinator(const CompletionCoordinator&) = delete;
    CompletionCoordinator& operator=(const CompletionCoordinator&) = delete;

    /**
     * @brief Copy request.source to request.destination
     *
     * RETURNS: The storage service's completion response, or
     *  - InvalidInput before any storage call,
     *  - InitiationFailure / FinalizationFailure wrapping the client error,
     *  - Aborted / AbortInconsistency whose cause is the PartCopyFailure,
     *  - TransportFailure, unchanged, when abort or list-parts itself fails.
     */
    Result<CompletionResponse> copy_object(const CopyRequest& request,
                                           const events::RequestContext& request_context = std::nullopt);

    [[nodiscard]] const config::CoordinatorConfig& config() const noexcept { return config_; }

private:
    Result<std::vector<PartRange>> plan(const CopyRequest& request) const;
    DestinationOptions resolve_options(const DestinationOptions& options) const;

    std::vector<Result<PartResult>> copy_parts(const CopyRequest& request,
                                               const std::string& upload_id,
                                               const std::vector<PartRange>& ranges,
                                               const events::RequestContext& request_context);

    Result<PartResult> copy_one_part(const CopyRequest& request,
                                     const std::string& upload_id,
                                     const PartRange& range,
                                     const events::RequestContext& request_context);

    Result<CompletionResponse> abort_and_verify(UploadSession& session,
                                                CopyError part_failure,
                                                const events::RequestContext& request_context);

    Result<CompletionResponse> fail(UploadSession& session,
                                    const std::string& stage,
                                    CopyError error,
                                    const events::RequestContext& request_context);

    static CompletionManifest build_manifest(std::vector<PartResult> results);

    storage::StorageClient& client_;
    config::CoordinatorConfig config_;
    events::EventBus& event_bus_;
    PartCopier part_copier_;
    boost::asio::thread_pool pool_;
};

} // namespace mpcopy::copy
