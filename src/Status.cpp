/**
 * @file Status.cpp
 * @brief Error code names and classification
 */

#include "Status.h"

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                   return "ok";
        case ErrorCode::INVALID_CREDENTIALS:  return "invalid credentials";
        case ErrorCode::SESSION_EXPIRED:      return "session expired";
        case ErrorCode::NOT_AUTHENTICATED:    return "not authenticated";
        case ErrorCode::RATE_LIMITED:         return "rate limited";
        case ErrorCode::MALFORMED_RESPONSE:   return "malformed response";
        case ErrorCode::CONNECTION_FAILURE:   return "connection failure";
        case ErrorCode::SERVICE_ERROR:        return "service error";
        case ErrorCode::TIMEOUT:              return "timeout";
        case ErrorCode::CONNECTION_RESET:     return "connection reset";
        case ErrorCode::HTTP_CLIENT_ERROR:    return "http client error";
        case ErrorCode::HTTP_SERVER_ERROR:    return "http server error";
        case ErrorCode::DOWNLOAD_UNRETRYABLE: return "download failed";
        case ErrorCode::CACHE_IO_FAILURE:     return "cache i/o failure";
        case ErrorCode::DECODE_FAILURE:       return "decode failure";
        case ErrorCode::UNSUPPORTED_FORMAT:   return "unsupported format";
        case ErrorCode::CANCELLED:            return "cancelled";
    }
    return "unknown";
}

bool isTransient(ErrorCode code) {
    switch (code) {
        case ErrorCode::RATE_LIMITED:
        case ErrorCode::CONNECTION_FAILURE:
        case ErrorCode::TIMEOUT:
        case ErrorCode::CONNECTION_RESET:
        case ErrorCode::HTTP_SERVER_ERROR:
            return true;
        default:
            return false;
    }
}

bool isSessionExpiry(ErrorCode code) {
    return code == ErrorCode::SESSION_EXPIRED || code == ErrorCode::NOT_AUTHENTICATED;
}

std::string Status::toString() const {
    if (ok()) return "ok";
    if (message.empty()) return errorCodeName(code);
    return std::string(errorCodeName(code)) + ": " + message;
}

std::ostream& operator<<(std::ostream& os, const Status& status) {
    return os << status.toString();
}
