#pragma once

#include <string>

namespace clipcloud {

/**
 * @brief Failure categories surfaced by the transfer engine
 *
 * Callers branch on the kind; the message is meant to be shown as-is.
 */
enum class ErrorKind {
    Authorization,   ///< 401/403 from the signing/metadata authority
    UnsupportedType, ///< Key suffix outside the upload allow-list
    Transfer,        ///< Any other failed sign/upload/download/finalize step
    Initialization,  ///< Logical clock bootstrap failed
    NotFound,        ///< Remote logical clock has not been created yet
    Configuration    ///< Invalid settings or transfer policy
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Authorization: return "AuthorizationError";
        case ErrorKind::UnsupportedType: return "UnsupportedTypeError";
        case ErrorKind::Transfer: return "TransferError";
        case ErrorKind::Initialization: return "InitializationError";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::Configuration: return "ConfigurationError";
    }
    return "Unknown";
}

struct Error {
    ErrorKind kind = ErrorKind::Transfer;
    int status = 0;        ///< HTTP status when one was received, 0 otherwise
    std::string message;
    std::string body;      ///< Response body captured for diagnostics

    Error() = default;
    Error(ErrorKind k, std::string msg, int http_status = 0, std::string response_body = {})
        : kind(k), status(http_status), message(std::move(msg)), body(std::move(response_body)) {}

    bool is(ErrorKind k) const noexcept { return kind == k; }

    /**
     * @brief Render for logs: "TransferError: message (status 500): body"
     */
    std::string describe() const {
        std::string text = std::string(to_string(kind)) + ": " + message;
        if (status != 0) {
            text += " (status " + std::to_string(status) + ")";
        }
        if (!body.empty()) {
            text += ": " + body;
        }
        return text;
    }
};

inline Error make_error(ErrorKind kind, std::string message, int status = 0, std::string body = {}) {
    return Error(kind, std::move(message), status, std::move(body));
}

} // namespace clipcloud
