#pragma once

/// @file error.h
/// @brief tracescore error handling on top of absl::Status

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace tracescore {

/// @brief Service error codes, mapped onto absl status codes
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kPermissionDenied,
    kResourceExhausted,
    kFailedPrecondition,
    kInternal,
    kUnavailable,

    kConnectionFailed,
    kDeserializationError,  ///< Malformed stream envelope
    kTimeout,
    kRateLimited,
    kConfigurationError,
    kValidationError,
    kTransientProviderError,  ///< Network failure or 5xx, worth retrying
    kPermanentRequestError,   ///< 4xx or malformed request, never retried
    kParseError,              ///< Provider answer is not the expected JSON
};

/// @brief Convert a service error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Create an error status with the given code and message
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief True for failures a retry may fix: unavailable, deadline exceeded,
/// resource exhausted (rate limits) and aborted
bool IsTransient(const absl::Status& status);

/// @brief Prefix a failure's message with context, keeping its code
/// @return status unchanged when it is OK
absl::Status Annotate(const absl::Status& status, std::string_view context);

#define TRACESCORE_RETURN_IF_ERROR(expr)                                       \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

#define TRACESCORE_ASSIGN_OR_RETURN(lhs, rhs)                                  \
    TRACESCORE_ASSIGN_OR_RETURN_IMPL(                                          \
        TRACESCORE_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define TRACESCORE_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                   \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define TRACESCORE_CONCAT(a, b) TRACESCORE_CONCAT_IMPL(a, b)
#define TRACESCORE_CONCAT_IMPL(a, b) a##b

}  // namespace tracescore
