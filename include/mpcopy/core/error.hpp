#pragma once

/**
 * @file error.hpp
 * @brief Structured error reported by every stage of a multipart copy
 *
 * A CopyError names what went wrong (kind), says it in words (message),
 * carries machine-readable context (details) and optionally the lower-level
 * error it was raised from (cause). Stage errors raised by the coordinator
 * always keep the storage client's error as their cause so nothing is lost
 * on the way up.
 */

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace mpcopy {

enum class ErrorKind {
    InvalidInput,         // Rejected before any call to the storage service
    InitiationFailure,    // initiate-multipart failed, no session exists
    PartCopyFailure,      // At least one part copy failed
    FinalizationFailure,  // complete-multipart failed after all parts succeeded
    Aborted,              // Copy abandoned, abort verified clean
    AbortInconsistency,   // Abort succeeded but parts are still listed
    TransportFailure      // Anything reported by the storage client itself
};

const char* to_string(ErrorKind kind) noexcept;

struct CopyError {
    ErrorKind kind = ErrorKind::TransportFailure;
    std::string message;
    nlohmann::json details = nlohmann::json::object();
    std::shared_ptr<const CopyError> cause;

    /// Innermost error of the cause chain (this error when there is no cause)
    [[nodiscard]] const CopyError& root_cause() const noexcept;

    /// One line: "kind: message <- kind: message <- ..."
    [[nodiscard]] std::string describe() const;
};

CopyError make_error(ErrorKind kind,
                     std::string message,
                     nlohmann::json details = nlohmann::json::object());

CopyError wrap_error(ErrorKind kind,
                     std::string message,
                     CopyError cause,
                     nlohmann::json details = nlohmann::json::object());

void to_json(nlohmann::json& j, const CopyError& error);

} // namespace mpcopy
