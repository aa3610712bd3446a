/**
 * @file HttpFetcher.cpp
 * @brief HTTP/1.0 download client implementation
 */

#include "HttpFetcher.h"
#include "LogLevel.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace {

// poll() slice between cancellation checks
constexpr int POLL_SLICE_MS = 100;
constexpr size_t MAX_HEADER_BYTES = 16384;

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

class Socket {
public:
    Socket() = default;
    ~Socket() {
        if (m_fd >= 0) {
            shutdown(m_fd, SHUT_RDWR);
            close(m_fd);
        }
    }
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    void reset(int fd) { m_fd = fd; }
    int fd() const { return m_fd; }

private:
    int m_fd = -1;
};

// Wait for events on fd, checking cancel every slice
Status waitFor(int fd, short events, std::chrono::milliseconds timeout,
               const CancelToken& cancel, const char* what) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (cancel.isCancelled()) {
            return Status::error(ErrorCode::CANCELLED, std::string(what) + " cancelled");
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) {
            return Status::error(ErrorCode::TIMEOUT, std::string(what) + " timed out");
        }

        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = events;
        pfd.revents = 0;
        int ready = poll(&pfd, 1, static_cast<int>(std::min<long long>(left, POLL_SLICE_MS)));
        if (ready < 0) {
            if (errno == EINTR) continue;
            return Status::error(ErrorCode::CONNECTION_FAILURE,
                                 std::string("poll: ") + std::strerror(errno));
        }
        if (ready > 0) return Status::success();
    }
}

Status sendAll(int fd, const std::string& data, std::chrono::milliseconds timeout,
               const CancelToken& cancel) {
    const char* ptr = data.data();
    size_t remaining = data.size();

    while (remaining > 0) {
        Status status = waitFor(fd, POLLOUT, timeout, cancel, "request");
        if (!status.ok()) return status;

        ssize_t n = send(fd, ptr, remaining, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            return Status::error(ErrorCode::CONNECTION_RESET,
                                 std::string("send: ") + std::strerror(errno));
        }
        ptr += n;
        remaining -= static_cast<size_t>(n);
    }
    return Status::success();
}

} // namespace

std::string HttpResponseHead::header(const std::string& name) const {
    auto it = headers.find(toLower(name));
    return it == headers.end() ? std::string() : it->second;
}

HttpFetcher::HttpFetcher() : HttpFetcher(Options()) {}

HttpFetcher::HttpFetcher(Options options) : m_options(std::move(options)) {}

// ============================================
// Parsing
// ============================================

Status HttpFetcher::parseUrl(const std::string& url, HttpUrl& out) {
    size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return Status::error(ErrorCode::MALFORMED_RESPONSE, "not an absolute URL: " + url);
    }

    HttpUrl parsed;
    parsed.scheme = toLower(url.substr(0, schemeEnd));
    if (parsed.scheme == "https") {
        return Status::error(ErrorCode::UNSUPPORTED_FORMAT, "https is not supported: " + url);
    }
    if (parsed.scheme != "http") {
        return Status::error(ErrorCode::UNSUPPORTED_FORMAT,
                             "unsupported URL scheme '" + parsed.scheme + "'");
    }

    size_t hostStart = schemeEnd + 3;
    size_t pathStart = url.find_first_of("/?", hostStart);
    std::string authority = url.substr(hostStart, pathStart == std::string::npos
                                                      ? std::string::npos
                                                      : pathStart - hostStart);
    // Drop userinfo
    size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    size_t colon = authority.rfind(':');
    size_t bracket = authority.find(']');
    if (colon != std::string::npos && (bracket == std::string::npos || colon > bracket)) {
        std::string portStr = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
        char* end = nullptr;
        long port = std::strtol(portStr.c_str(), &end, 10);
        if (portStr.empty() || *end != '\0' || port <= 0 || port > 65535) {
            return Status::error(ErrorCode::MALFORMED_RESPONSE, "bad port in URL: " + url);
        }
        parsed.port = static_cast<uint16_t>(port);
    }
    if (authority.size() > 2 && authority.front() == '[' && authority.back() == ']') {
        authority = authority.substr(1, authority.size() - 2);
    }
    if (authority.empty()) {
        return Status::error(ErrorCode::MALFORMED_RESPONSE, "no host in URL: " + url);
    }
    parsed.host = authority;

    if (pathStart != std::string::npos) {
        parsed.path = url.substr(pathStart);
        if (parsed.path[0] == '?') parsed.path = "/" + parsed.path;
    }
    size_t fragment = parsed.path.find('#');
    if (fragment != std::string::npos) {
        parsed.path.erase(fragment);
    }

    out = parsed;
    return Status::success();
}

Status HttpFetcher::parseHead(const std::string& head, HttpResponseHead& out) {
    HttpResponseHead parsed;

    size_t lineEnd = head.find("\r\n");
    std::string statusLine = head.substr(0, lineEnd);
    // Expected: "HTTP/1.x 200 OK" (or "ICY 200 OK" from shoutcast servers)
    if (statusLine.compare(0, 5, "HTTP/") != 0 && statusLine.compare(0, 4, "ICY ") != 0) {
        return Status::error(ErrorCode::MALFORMED_RESPONSE, "bad status line: " + statusLine);
    }
    size_t space = statusLine.find(' ');
    if (space == std::string::npos) {
        return Status::error(ErrorCode::MALFORMED_RESPONSE, "bad status line: " + statusLine);
    }
    std::string code = statusLine.substr(space + 1, 3);
    if (code.size() != 3 || !std::all_of(code.begin(), code.end(),
                                         [](unsigned char c) { return std::isdigit(c); })) {
        return Status::error(ErrorCode::MALFORMED_RESPONSE, "bad status code: " + statusLine);
    }
    parsed.status = std::atoi(code.c_str());

    size_t pos = (lineEnd == std::string::npos) ? head.size() : lineEnd + 2;
    while (pos < head.size()) {
        size_t end = head.find("\r\n", pos);
        if (end == std::string::npos) end = head.size();
        std::string line = head.substr(pos, end - pos);
        pos = end + 2;
        if (line.empty()) break;

        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            LOG_DEBUG("[HTTP] Ignoring header line: " << line);
            continue;
        }
        parsed.headers[toLower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }

    out = std::move(parsed);
    return Status::success();
}

std::string HttpFetcher::resolveLocation(const HttpUrl& base, const std::string& location) {
    if (location.find("://") != std::string::npos) {
        return location;
    }

    std::string origin = base.scheme + "://" + base.host;
    if (base.port != 80) {
        origin += ":" + std::to_string(base.port);
    }
    if (location.compare(0, 2, "//") == 0) {
        return base.scheme + ":" + location;
    }
    if (!location.empty() && location[0] == '/') {
        return origin + location;
    }

    // Relative to the directory of the current path
    std::string dir = base.path.substr(0, base.path.find('?'));
    dir = dir.substr(0, dir.rfind('/') + 1);
    return origin + dir + location;
}

ErrorCode HttpFetcher::errorForStatus(int status) {
    if (status == 429) return ErrorCode::RATE_LIMITED;
    if (status == 408) return ErrorCode::TIMEOUT;
    if (status >= 400 && status < 500) return ErrorCode::HTTP_CLIENT_ERROR;
    if (status >= 500 && status < 600) return ErrorCode::HTTP_SERVER_ERROR;
    return ErrorCode::MALFORMED_RESPONSE;
}

// ============================================
// Fetching
// ============================================

Status HttpFetcher::get(const std::string& url, const CancelToken& cancel,
                        std::vector<uint8_t>& out) const {
    std::string current = url;

    for (int redirects = 0; ; redirects++) {
        HttpUrl parsed;
        Status status = parseUrl(current, parsed);
        if (!status.ok()) return status;

        HttpResponseHead head;
        std::vector<uint8_t> body;
        status = fetchOnce(parsed, cancel, head, body);
        if (!status.ok()) return status;

        if (head.status >= 200 && head.status < 300) {
            out = std::move(body);
            return Status::success();
        }

        if (head.status == 301 || head.status == 302 || head.status == 303 ||
            head.status == 307 || head.status == 308) {
            std::string location = head.header("location");
            if (location.empty()) {
                return Status::error(ErrorCode::MALFORMED_RESPONSE,
                                     "redirect without Location from " + parsed.host);
            }
            if (redirects >= m_options.maxRedirects) {
                return Status::error(ErrorCode::MALFORMED_RESPONSE,
                                     "too many redirects for " + url);
            }
            current = resolveLocation(parsed, location);
            LOG_DEBUG("[HTTP] " << head.status << " -> " << current);
            continue;
        }

        return Status::error(errorForStatus(head.status),
                             "HTTP " + std::to_string(head.status) + " from " + parsed.host);
    }
}

Status HttpFetcher::fetchOnce(const HttpUrl& url, const CancelToken& cancel,
                              HttpResponseHead& head, std::vector<uint8_t>& body) const {
    // Resolve
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* addrs = nullptr;
    const std::string port = std::to_string(url.port);
    int rc = getaddrinfo(url.host.c_str(), port.c_str(), &hints, &addrs);
    if (rc != 0) {
        return Status::error(ErrorCode::CONNECTION_FAILURE,
                             "cannot resolve " + url.host + ": " + gai_strerror(rc));
    }

    // Connect (non-blocking, bounded by connectTimeout)
    Socket sock;
    Status status = Status::error(ErrorCode::CONNECTION_FAILURE, "no address for " + url.host);
    for (struct addrinfo* ai = addrs; ai; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) continue;
        sock.reset(fd);
        fcntl(fd, F_SETFL, fcntl(fd, F_GETFL, 0) | O_NONBLOCK);

        int flag = 1;
        setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));

        if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            status = Status::success();
            break;
        }
        if (errno != EINPROGRESS) {
            status = Status::error(ErrorCode::CONNECTION_FAILURE,
                                   "connect to " + url.host + ": " + std::strerror(errno));
            close(fd);
            sock.reset(-1);
            continue;
        }

        status = waitFor(fd, POLLOUT, m_options.connectTimeout, cancel, "connect");
        if (status.ok()) {
            int soError = 0;
            socklen_t len = sizeof(soError);
            getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len);
            if (soError == 0) break;
            status = Status::error(ErrorCode::CONNECTION_FAILURE,
                                   "connect to " + url.host + ": " + std::strerror(soError));
        }
        close(fd);
        sock.reset(-1);
        if (status.code == ErrorCode::CANCELLED) break;
    }
    freeaddrinfo(addrs);
    if (!status.ok()) return status;

    LOG_DEBUG("[HTTP] Connected to " << url.host << ":" << url.port);

    std::string request = "GET " + url.path + " HTTP/1.0\r\n"
                          "Host: " + url.host + (url.port != 80 ? ":" + port : "") + "\r\n"
                          "User-Agent: " + m_options.userAgent + "\r\n"
                          "Accept: */*\r\n"
                          "Connection: close\r\n\r\n";
    status = sendAll(sock.fd(), request, m_options.readTimeout, cancel);
    if (!status.ok()) return status;

    // Read until the connection closes
    std::string headBuf;
    bool headDone = false;
    uint64_t expected = 0;
    bool haveLength = false;
    uint8_t buffer[65536];

    while (true) {
        status = waitFor(sock.fd(), POLLIN, m_options.readTimeout, cancel, "read");
        if (!status.ok()) return status;

        ssize_t n = recv(sock.fd(), buffer, sizeof(buffer), 0);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            return Status::error(ErrorCode::CONNECTION_RESET,
                                 std::string("recv: ") + std::strerror(errno));
        }
        if (n == 0) break;

        if (headDone) {
            body.insert(body.end(), buffer, buffer + n);
        } else {
            headBuf.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(n));
            size_t end = headBuf.find("\r\n\r\n");
            if (end == std::string::npos) {
                if (headBuf.size() > MAX_HEADER_BYTES) {
                    return Status::error(ErrorCode::MALFORMED_RESPONSE, "headers too large");
                }
                continue;
            }

            status = parseHead(headBuf.substr(0, end + 2), head);
            if (!status.ok()) return status;
            headDone = true;

            // Redirect and error bodies are not needed
            if (head.status < 200 || head.status >= 300) {
                return Status::success();
            }

            std::string length = head.header("content-length");
            if (!length.empty()) {
                expected = std::strtoull(length.c_str(), nullptr, 10);
                haveLength = true;
                if (expected > m_options.maxBodyBytes) {
                    return Status::error(ErrorCode::MALFORMED_RESPONSE,
                                         "body too large (" + length + " bytes)");
                }
                body.reserve(expected);
            }
            body.insert(body.end(), headBuf.begin() + end + 4, headBuf.end());
        }

        if (body.size() > m_options.maxBodyBytes) {
            return Status::error(ErrorCode::MALFORMED_RESPONSE, "body exceeds size limit");
        }
        if (haveLength && body.size() >= expected) break;
    }

    if (!headDone) {
        return Status::error(headBuf.empty() ? ErrorCode::CONNECTION_RESET
                                             : ErrorCode::MALFORMED_RESPONSE,
                             "connection closed before response headers");
    }
    if (haveLength && body.size() < expected) {
        return Status::error(ErrorCode::CONNECTION_RESET,
                             "truncated body: " + std::to_string(body.size()) + " of " +
                             std::to_string(expected) + " bytes");
    }
    if (haveLength && body.size() > expected) {
        body.resize(expected);
    }

    LOG_DEBUG("[HTTP] " << head.status << ", " << body.size() << " bytes from " << url.host);
    return Status::success();
}
