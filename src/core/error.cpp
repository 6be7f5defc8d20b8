#include "mpcopy/core/error.hpp"

#include <sstream>
#include <utility>

namespace mpcopy {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidInput: return "InvalidInput";
        case ErrorKind::InitiationFailure: return "InitiationFailure";
        case ErrorKind::PartCopyFailure: return "PartCopyFailure";
        case ErrorKind::FinalizationFailure: return "FinalizationFailure";
        case ErrorKind::Aborted: return "Aborted";
        case ErrorKind::AbortInconsistency: return "AbortInconsistency";
        case ErrorKind::TransportFailure: return "TransportFailure";
    }
    return "Unknown";
}

const CopyError& CopyError::root_cause() const noexcept {
    const CopyError* current = this;
    while (current->cause) {
        current = current->cause.get();
    }
    return *current;
}

std::string CopyError::describe() const {
    std::ostringstream oss;
    oss << to_string(kind) << ": " << message;
    for (const CopyError* next = cause.get(); next != nullptr; next = next->cause.get()) {
        oss << " <- " << to_string(next->kind) << ": " << next->message;
    }
    return oss.str();
}

CopyError make_error(ErrorKind kind, std::string message, nlohmann::json details) {
    CopyError error;
    error.kind = kind;
    error.message = std::move(message);
    error.details = details.is_null() ? nlohmann::json::object() : std::move(details);
    return error;
}

CopyError wrap_error(ErrorKind kind, std::string message, CopyError cause, nlohmann::json details) {
    auto error = make_error(kind, std::move(message), std::move(details));
    error.cause = std::make_shared<const CopyError>(std::move(cause));
    return error;
}

void to_json(nlohmann::json& j, const CopyError& error) {
    j = nlohmann::json{
        {"kind", to_string(error.kind)},
        {"message", error.message},
        {"details", error.details},
    };
    if (error.cause) {
        j["cause"] = *error.cause;
    }
}

} // namespace mpcopy
