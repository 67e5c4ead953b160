#pragma once

#include <string>

namespace hubcache {

enum class HubErrorCode : int {
    kOk = 0,
    kNotFound,
    kUnauthorized,
    kForbidden,
    kRangeNotSatisfiable,
    kInvalidLock,
    kTransferFailed,
    kVerifyFailed,
    kHttpError,
    kTimeout,
    kNotCached,
    kNotArchive,
    kChecksumMismatch,
    kConnectionFailed,
    kInvalidResponse,
    kIoError,
    kCancelled,
};

inline const char* to_string(HubErrorCode code) {
    switch (code) {
        case HubErrorCode::kOk:
            return "OK";
        case HubErrorCode::kNotFound:
            return "NOT_FOUND";
        case HubErrorCode::kUnauthorized:
            return "UNAUTHORIZED";
        case HubErrorCode::kForbidden:
            return "FORBIDDEN";
        case HubErrorCode::kRangeNotSatisfiable:
            return "RANGE_NOT_SATISFIABLE";
        case HubErrorCode::kInvalidLock:
            return "INVALID_LOCK";
        case HubErrorCode::kTransferFailed:
            return "TRANSFER_FAILED";
        case HubErrorCode::kVerifyFailed:
            return "VERIFY_FAILED";
        case HubErrorCode::kHttpError:
            return "HTTP_ERROR";
        case HubErrorCode::kTimeout:
            return "TIMEOUT";
        case HubErrorCode::kNotCached:
            return "NOT_CACHED";
        case HubErrorCode::kNotArchive:
            return "NOT_ARCHIVE";
        case HubErrorCode::kChecksumMismatch:
            return "CHECKSUM_MISMATCH";
        case HubErrorCode::kConnectionFailed:
            return "CONNECTION_FAILED";
        case HubErrorCode::kInvalidResponse:
            return "INVALID_RESPONSE";
        case HubErrorCode::kIoError:
            return "IO_ERROR";
        case HubErrorCode::kCancelled:
            return "CANCELLED";
    }
    return "UNKNOWN";
}

// Error value shared by every public operation.
// status is the HTTP status when the error came from a response (0 otherwise);
// body keeps the response body for TransferFailed.
struct HubError {
    HubErrorCode code{HubErrorCode::kOk};
    int status{0};
    std::string message;
    std::string body;

    bool ok() const { return code == HubErrorCode::kOk; }

    static HubError make(HubErrorCode code, std::string message, int status = 0) {
        HubError err;
        err.code = code;
        err.status = status;
        err.message = std::move(message);
        return err;
    }

    // Map a non-2xx HTTP status onto the taxonomy (401/403/404 get their own codes).
    static HubError fromStatus(int status, std::string body = {}) {
        HubError err;
        err.status = status;
        err.body = std::move(body);
        switch (status) {
            case 401:
                err.code = HubErrorCode::kUnauthorized;
                err.message = "unauthorized";
                break;
            case 403:
                err.code = HubErrorCode::kForbidden;
                err.message = "forbidden";
                break;
            case 404:
                err.code = HubErrorCode::kNotFound;
                err.message = "not found";
                break;
            case 416:
                err.code = HubErrorCode::kRangeNotSatisfiable;
                err.message = "range not satisfiable";
                break;
            default:
                err.code = HubErrorCode::kHttpError;
                err.message = "http error status=" + std::to_string(status);
                break;
        }
        return err;
    }

    std::string describe() const {
        std::string out = to_string(code);
        if (status != 0) out += " (" + std::to_string(status) + ")";
        if (!message.empty()) out += ": " + message;
        return out;
    }
};

}  // namespace hubcache
