/**
 * @file HttpFetcher.h
 * @brief Minimal HTTP/1.0 client used to download track audio
 *
 * One GET per connection over a plain POSIX socket, following up to a
 * few redirects. Socket waits use poll() with a short slice so a
 * CancelToken is honoured between reads. Failures are mapped onto the
 * ErrorCode taxonomy so the prefetch retry policy can classify them.
 */

#ifndef STATIONPLAY_HTTP_FETCHER_H
#define STATIONPLAY_HTTP_FETCHER_H

#include "CancelToken.h"
#include "Status.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

struct HttpUrl {
    std::string scheme;     // "http" (https is recognised but not supported)
    std::string host;
    uint16_t port = 80;
    std::string path = "/"; // Includes the query string
};

struct HttpResponseHead {
    int status = 0;
    std::map<std::string, std::string> headers;     // Lower-case names

    // Value of a header, empty if absent
    std::string header(const std::string& name) const;
};

class HttpFetcher {
public:
    struct Options {
        std::chrono::milliseconds connectTimeout{10000};
        std::chrono::milliseconds readTimeout{15000};
        int maxRedirects = 5;
        uint64_t maxBodyBytes = 256ull * 1024 * 1024;
        std::string userAgent = "stationplay";
    };

    HttpFetcher();
    explicit HttpFetcher(Options options);

    /**
     * @brief GET url into out
     *
     * @return TIMEOUT, CONNECTION_RESET or CONNECTION_FAILURE for network
     *         trouble, HTTP_CLIENT_ERROR / HTTP_SERVER_ERROR / RATE_LIMITED
     *         for error statuses, MALFORMED_RESPONSE for garbage,
     *         UNSUPPORTED_FORMAT for https, CANCELLED if cancel fired
     */
    Status get(const std::string& url, const CancelToken& cancel,
               std::vector<uint8_t>& out) const;

    static Status parseUrl(const std::string& url, HttpUrl& out);
    static Status parseHead(const std::string& head, HttpResponseHead& out);

    // Absolute target of a Location header relative to base
    static std::string resolveLocation(const HttpUrl& base, const std::string& location);

    // ErrorCode for a non-2xx, non-redirect status
    static ErrorCode errorForStatus(int status);

private:
    Status fetchOnce(const HttpUrl& url, const CancelToken& cancel,
                     HttpResponseHead& head, std::vector<uint8_t>& body) const;

    Options m_options;
};

#endif // STATIONPLAY_HTTP_FETCHER_H
