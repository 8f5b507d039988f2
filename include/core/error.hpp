#pragma once

#include <string>
#include <optional>

namespace rulegate {

/// Why a request or operation failed; drives both the reason string and
/// the HTTP status of a locally generated error response
enum class ErrorCategory {
    NONE,
    RULE_NOT_FOUND,
    PERMISSION_DENIED,
    ROLE_DENIED,
    UNAUTHENTICATED,
    METHOD_NOT_ALLOWED,
    UPSTREAM_AUTH_REJECTED,
    UPSTREAM_UNREACHABLE,
    CREDENTIAL_FAILED,
    PRE_PROCESSOR_ABORTED,
    POST_PROCESSOR_FAILED,
    CONFIG_ERROR,
    SHUTTING_DOWN,
    INTERNAL_ERROR
};

/// Value of the "error" field in JSON error bodies
inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                   return "none";
        case ErrorCategory::RULE_NOT_FOUND:         return "rule_not_found";
        case ErrorCategory::PERMISSION_DENIED:      return "permission_denied";
        case ErrorCategory::ROLE_DENIED:            return "role_denied";
        case ErrorCategory::UNAUTHENTICATED:        return "unauthenticated";
        case ErrorCategory::METHOD_NOT_ALLOWED:     return "method_not_allowed";
        case ErrorCategory::UPSTREAM_AUTH_REJECTED: return "upstream_auth_rejected";
        case ErrorCategory::UPSTREAM_UNREACHABLE:   return "upstream_unreachable";
        case ErrorCategory::CREDENTIAL_FAILED:      return "credential_failed";
        case ErrorCategory::PRE_PROCESSOR_ABORTED:  return "pre_processor_aborted";
        case ErrorCategory::POST_PROCESSOR_FAILED:  return "post_processor_failed";
        case ErrorCategory::CONFIG_ERROR:           return "config_error";
        case ErrorCategory::SHUTTING_DOWN:          return "shutting_down";
        case ErrorCategory::INTERNAL_ERROR:         return "internal_error";
    }
    return "unknown";
}

/// Status used when no explicit override is given
inline int error_category_to_http_status(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::RULE_NOT_FOUND:
        case ErrorCategory::PERMISSION_DENIED:
        case ErrorCategory::ROLE_DENIED:
        case ErrorCategory::PRE_PROCESSOR_ABORTED:
            return 403;
        case ErrorCategory::UNAUTHENTICATED:        return 401;
        case ErrorCategory::METHOD_NOT_ALLOWED:     return 405;
        case ErrorCategory::UPSTREAM_AUTH_REJECTED:
        case ErrorCategory::UPSTREAM_UNREACHABLE:
        case ErrorCategory::CREDENTIAL_FAILED:
            return 502;
        case ErrorCategory::SHUTTING_DOWN:          return 503;
        default:                                    return 500;
    }
}

/**
 * @brief Value or (category, message) pair
 *
 * Failures that the caller is expected to handle travel as Result; only
 * programming errors and construction failures throw.
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

    /// Same failure, different value type
    template<typename U>
    Result<U> forward_error() const {
        return Result<U>::error(error_category_, error_message_);
    }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

} // namespace rulegate
