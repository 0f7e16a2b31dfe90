#include "error.h"

namespace tracescore {

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kValidationError:
        case ErrorCode::kPermanentRequestError:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kPermissionDenied:
            return absl::StatusCode::kPermissionDenied;
        case ErrorCode::kResourceExhausted:
        case ErrorCode::kRateLimited:
            return absl::StatusCode::kResourceExhausted;
        case ErrorCode::kFailedPrecondition:
        case ErrorCode::kConfigurationError:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kInternal:
        case ErrorCode::kParseError:
            return absl::StatusCode::kInternal;
        case ErrorCode::kUnavailable:
        case ErrorCode::kConnectionFailed:
        case ErrorCode::kTransientProviderError:
            return absl::StatusCode::kUnavailable;
        case ErrorCode::kDeserializationError:
            return absl::StatusCode::kDataLoss;
        case ErrorCode::kTimeout:
            return absl::StatusCode::kDeadlineExceeded;
        case ErrorCode::kUnknown:
            return absl::StatusCode::kUnknown;
    }
    return absl::StatusCode::kUnknown;
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    return absl::Status(ToAbslCode(code), std::string(message));
}

absl::Status Annotate(const absl::Status& status, std::string_view context) {
    if (status.ok()) {
        return status;
    }
    return absl::Status(status.code(), absl::StrCat(std::string(context), ": ", status.message()));
}

bool IsTransient(const absl::Status& status) {
    switch (status.code()) {
        case absl::StatusCode::kUnavailable:
        case absl::StatusCode::kDeadlineExceeded:
        case absl::StatusCode::kResourceExhausted:
        case absl::StatusCode::kAborted:
            return true;
        default:
            return false;
    }
}

}  // namespace tracescore
