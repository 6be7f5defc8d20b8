#include "mpcopy/copy/upload_session.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace mpcopy::copy {
namespace {

bool is_progressive(CopyState current, CopyState target) {
    static const std::unordered_map<CopyState, std::vector<CopyState>> transitions {
        {CopyState::Initiating, {CopyState::CopyingParts}},
        {CopyState::CopyingParts, {CopyState::Finalizing, CopyState::Aborting}},
        {CopyState::Finalizing, {CopyState::Completed}},
        {CopyState::Aborting, {CopyState::AbortVerified, CopyState::AbortFailed}},
    };

    if (target == CopyState::Failed) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

CopyError illegal_transition(CopyState from, CopyState to) {
    return make_error(ErrorKind::InvalidInput,
                      std::string("Illegal upload session transition ") + to_string(from) + " -> " + to_string(to),
                      {{"from", to_string(from)}, {"to", to_string(to)}});
}

} // namespace

const char* to_string(CopyState state) noexcept {
    switch (state) {
        case CopyState::Initiating: return "Initiating";
        case CopyState::CopyingParts: return "CopyingParts";
        case CopyState::Finalizing: return "Finalizing";
        case CopyState::Completed: return "Completed";
        case CopyState::Aborting: return "Aborting";
        case CopyState::AbortVerified: return "AbortVerified";
        case CopyState::AbortFailed: return "AbortFailed";
        case CopyState::Failed: return "Failed";
    }
    return "Unknown";
}

UploadSession::UploadSession(ObjectLocation destination) {
    info_.destination = std::move(destination);
    info_.state = CopyState::Initiating;
    info_.started_at = std::chrono::system_clock::now();
    last_transition_ = info_.started_at;
}

bool UploadSession::is_terminal() const noexcept {
    switch (info_.state) {
        case CopyState::Completed:
        case CopyState::AbortVerified:
        case CopyState::AbortFailed:
        case CopyState::Failed:
            return true;
        default:
            return false;
    }
}

Result<void> UploadSession::attach_upload_id(std::string upload_id, std::size_t parts_total) {
    if (info_.state != CopyState::Initiating) {
        return Err<void>(illegal_transition(info_.state, CopyState::CopyingParts));
    }
    if (upload_id.empty()) {
        return Err<void>(make_error(ErrorKind::InvalidInput, "Storage service returned an empty upload id"));
    }
    info_.upload_id = std::move(upload_id);
    info_.parts_total = parts_total;
    return transition_to(CopyState::CopyingParts);
}

Result<void> UploadSession::transition_to(CopyState next_state) {
    if (info_.state == next_state) {
        return Ok();
    }

    if (!can_transition(next_state)) {
        return Err<void>(illegal_transition(info_.state, next_state));
    }

    info_.state = next_state;
    last_transition_ = std::chrono::system_clock::now();
    return Ok();
}

Result<void> UploadSession::mark_failed(std::string error_message) {
    info_.last_error = std::move(error_message);
    return transition_to(CopyState::Failed);
}

void UploadSession::record_error(std::string error_message) {
    info_.last_error = std::move(error_message);
}

bool UploadSession::can_transition(CopyState target) const noexcept {
    if (info_.state == target) {
        return true;
    }

    if (is_terminal()) {
        return false;
    }

    return is_progressive(info_.state, target);
}

} // namespace mpcopy::copy
