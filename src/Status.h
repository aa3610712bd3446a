/**
 * @file Status.h
 * @brief Error taxonomy shared by every stationplay component
 *
 * Fallible operations return a Status instead of throwing. The code
 * classifies the failure so the retry policy and the playback state
 * machine can decide between retrying, skipping a track, re-authenticating
 * or surfacing a notification.
 */

#ifndef STATIONPLAY_STATUS_H
#define STATIONPLAY_STATUS_H

#include <string>
#include <ostream>
#include <utility>

enum class ErrorCode {
    OK = 0,

    // Authentication (terminal until new credentials are supplied)
    INVALID_CREDENTIALS,

    // Session (recovered automatically by SessionManager)
    SESSION_EXPIRED,
    NOT_AUTHENTICATED,

    // Station / playlist / feedback API
    RATE_LIMITED,
    MALFORMED_RESPONSE,
    CONNECTION_FAILURE,
    SERVICE_ERROR,

    // Track download
    TIMEOUT,
    CONNECTION_RESET,
    HTTP_CLIENT_ERROR,
    HTTP_SERVER_ERROR,
    DOWNLOAD_UNRETRYABLE,

    // Local storage
    CACHE_IO_FAILURE,

    // Audio
    DECODE_FAILURE,
    UNSUPPORTED_FORMAT,

    CANCELLED
};

const char* errorCodeName(ErrorCode code);

// Worth retrying with backoff (network hiccups, throttling, 5xx)
bool isTransient(ErrorCode code);

// Requires SessionManager to re-authenticate before retrying
bool isSessionExpiry(ErrorCode code);

struct Status {
    ErrorCode code = ErrorCode::OK;
    std::string message;

    Status() = default;
    Status(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    static Status success() { return Status(); }
    static Status error(ErrorCode c, std::string msg) { return Status(c, std::move(msg)); }

    bool ok() const { return code == ErrorCode::OK; }

    std::string toString() const;
};

std::ostream& operator<<(std::ostream& os, const Status& status);

#endif // STATIONPLAY_STATUS_H
