#pragma once

#include "mpcopy/core/result.hpp"
#include "mpcopy/copy/types.hpp"

#include <chrono>
#include <string>

namespace mpcopy::copy {

/**
 * @brief State machine of one multipart upload session
 *
 * Created in Initiating for a single CopyRequest and driven to a terminal
 * state (Completed, AbortVerified, AbortFailed or Failed) by the coordinator
 * that owns it. Sessions are never reused.
 */
class UploadSession {
public:
    explicit UploadSession(ObjectLocation destination);

    [[nodiscard]] const std::string& upload_id() const noexcept { return info_.upload_id; }
    [[nodiscard]] const ObjectLocation& destination() const noexcept { return info_.destination; }
    [[nodiscard]] CopyState state() const noexcept { return info_.state; }
    [[nodiscard]] const UploadSessionInfo& info() const noexcept { return info_; }
    [[nodiscard]] bool is_terminal() const noexcept;

    /// Records the id returned by initiate and moves to CopyingParts
    Result<void> attach_upload_id(std::string upload_id, std::size_t parts_total);

    Result<void> transition_to(CopyState next_state);
    Result<void> mark_failed(std::string error_message);

    void record_error(std::string error_message);

    [[nodiscard]] std::chrono::system_clock::time_point last_transition() const noexcept {
        return last_transition_;
    }

private:
    [[nodiscard]] bool can_transition(CopyState target) const noexcept;

    UploadSessionInfo info_;
    std::chrono::system_clock::time_point last_transition_{};
};

} // namespace mpcopy::copy
