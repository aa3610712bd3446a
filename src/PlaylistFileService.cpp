/**
 * @file PlaylistFileService.cpp
 * @brief M3U directory service implementation
 */

#include "PlaylistFileService.h"
#include "LogLevel.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool startsWith(const std::string& s, const char* prefix) {
    return s.compare(0, std::strlen(prefix), prefix) == 0;
}

// "Station_Name" -> "Station Name"
std::string displayName(const std::string& stem) {
    std::string name = stem;
    std::replace(name.begin(), name.end(), '_', ' ');
    return name;
}

AudioEncoding encodingForLocation(const std::string& location) {
    std::string path = location.substr(0, location.find_first_of("?#"));
    size_t dot = path.rfind('.');
    size_t slash = path.rfind('/');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return AudioEncoding::UNKNOWN;
    }
    return encodingFromExtension(path.substr(dot + 1));
}

} // namespace

PlaylistFileService::PlaylistFileService(fs::path directory)
    : PlaylistFileService(std::move(directory), Options()) {}

PlaylistFileService::PlaylistFileService(fs::path directory, Options options)
    : m_directory(std::move(directory))
    , m_options(options)
{
    m_options.pageSize = std::max<size_t>(m_options.pageSize, 1);
    m_quickMix.station = Station{QUICKMIX_ID, "QuickMix", true};
}

// ============================================
// Loading
// ============================================

std::string PlaylistFileService::trackIdFor(const std::string& location) {
    uint64_t hash = 14695981039346656037ull;
    for (unsigned char c : location) {
        hash ^= c;
        hash *= 1099511628211ull;
    }
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
    return buf;
}

std::vector<Track> PlaylistFileService::parseM3u(const std::string& text,
                                                 const fs::path& baseDir,
                                                 const std::string& stationId) {
    std::vector<Track> tracks;
    std::istringstream in(text);
    std::string line;

    Track pending;
    bool havePending = false;

    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty()) continue;

        if (startsWith(line, "#EXTINF:")) {
            pending = Track();
            havePending = true;

            std::string info = line.substr(8);
            size_t comma = info.find(',');
            long seconds = std::strtol(info.c_str(), nullptr, 10);
            if (seconds > 0) {
                pending.duration = std::chrono::seconds(seconds);
            }
            std::string label = comma == std::string::npos ? "" : trim(info.substr(comma + 1));
            size_t dash = label.find(" - ");
            if (dash != std::string::npos) {
                pending.artist = trim(label.substr(0, dash));
                pending.title = trim(label.substr(dash + 3));
            } else {
                pending.title = label;
            }
            continue;
        }
        if (startsWith(line, "#EXTALB:")) {
            if (!havePending) {
                pending = Track();
                havePending = true;
            }
            pending.album = trim(line.substr(8));
            continue;
        }
        if (line[0] == '#') continue;

        Track track = havePending ? pending : Track();
        havePending = false;

        std::string location = line;
        if (location.find("://") == std::string::npos) {
            fs::path path(location);
            if (path.is_relative()) {
                path = baseDir / path;
            }
            location = path.lexically_normal().string();
        }

        track.id = trackIdFor(location);
        track.stationId = stationId;
        track.audioUrl = location;
        track.encoding = encodingForLocation(location);
        if (track.title.empty()) {
            std::string name = location.substr(location.find_last_of('/') + 1);
            track.title = name.substr(0, name.rfind('.'));
        }
        if (track.artist.empty()) {
            track.artist = "Unknown artist";
        }
        tracks.push_back(std::move(track));
    }
    return tracks;
}

Status PlaylistFileService::load() {
    std::error_code ec;
    if (!fs::is_directory(m_directory, ec)) {
        return Status::error(ErrorCode::SERVICE_ERROR,
                             "station directory " + m_directory.string() + " not found");
    }

    std::vector<Playlist> playlists;
    for (const auto& entry : fs::directory_iterator(m_directory, ec)) {
        if (!entry.is_regular_file()) continue;
        std::string ext = entry.path().extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (ext != ".m3u" && ext != ".m3u8") continue;

        std::ifstream file(entry.path());
        if (!file) {
            LOG_WARN("[Stations] Cannot read " << entry.path().string());
            continue;
        }
        std::stringstream text;
        text << file.rdbuf();

        Playlist playlist;
        playlist.station.id = entry.path().stem().string();
        playlist.station.name = displayName(playlist.station.id);
        playlist.tracks = parseM3u(text.str(), entry.path().parent_path(), playlist.station.id);
        LOG_DEBUG("[Stations] " << playlist.station.name << ": "
                  << playlist.tracks.size() << " track(s)");
        playlists.push_back(std::move(playlist));
    }
    if (ec) {
        return Status::error(ErrorCode::SERVICE_ERROR,
                             "cannot list " + m_directory.string() + ": " + ec.message());
    }

    std::sort(playlists.begin(), playlists.end(), [](const Playlist& a, const Playlist& b) {
        return a.station.name < b.station.name;
    });

    // QuickMix: round-robin over every station
    std::vector<Track> mix;
    for (size_t i = 0; ; i++) {
        bool any = false;
        for (const auto& playlist : playlists) {
            if (i < playlist.tracks.size()) {
                mix.push_back(playlist.tracks[i]);
                any = true;
            }
        }
        if (!any) break;
    }

    std::map<std::string, std::string> accounts;
    std::ifstream credentials(m_directory / "credentials");
    std::string line;
    while (credentials && std::getline(credentials, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        accounts[line.substr(0, colon)] = line.substr(colon + 1);
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_playlists = std::move(playlists);
    m_quickMix.tracks = std::move(mix);
    m_quickMix.cursor = 0;
    m_accounts = std::move(accounts);

    LOG_INFO("[Stations] Loaded " << m_playlists.size() << " station(s) from "
             << m_directory.string());
    return Status::success();
}

// ============================================
// ServiceClient
// ============================================

Status PlaylistFileService::checkSessionLocked(const SessionToken& session) const {
    auto it = m_sessions.find(session.authToken);
    if (it == m_sessions.end()) {
        return Status::error(ErrorCode::NOT_AUTHENTICATED, "unknown session");
    }
    if (Clock::now() >= it->second) {
        return Status::error(ErrorCode::SESSION_EXPIRED, "session expired");
    }
    return Status::success();
}

Status PlaylistFileService::authenticate(const Credentials& credentials, SessionToken& out) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (credentials.username.empty()) {
        return Status::error(ErrorCode::INVALID_CREDENTIALS, "no user name");
    }
    if (!m_accounts.empty()) {
        auto it = m_accounts.find(credentials.username);
        if (it == m_accounts.end() || it->second != credentials.password) {
            return Status::error(ErrorCode::INVALID_CREDENTIALS,
                                 "wrong user name or password");
        }
    }

    // Drop expired tokens
    const auto now = Clock::now();
    for (auto it = m_sessions.begin(); it != m_sessions.end();) {
        if (now >= it->second) {
            it = m_sessions.erase(it);
        } else {
            ++it;
        }
    }

    SessionToken token;
    token.authToken = "session-" + std::to_string(++m_tokenCounter);
    token.userId = credentials.username;
    token.partnerId = "local";
    m_sessions[token.authToken] = now + m_options.sessionLifetime;

    out = token;
    return Status::success();
}

Status PlaylistFileService::listStations(const SessionToken& session, std::vector<Station>& out) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Status status = checkSessionLocked(session);
    if (!status.ok()) return status;

    out.clear();
    for (const auto& playlist : m_playlists) {
        out.push_back(playlist.station);
    }
    if (!m_playlists.empty()) {
        out.push_back(m_quickMix.station);
    }
    return Status::success();
}

Status PlaylistFileService::getPlaylist(const SessionToken& session, const Station& station,
                                        std::vector<Track>& out) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Status status = checkSessionLocked(session);
    if (!status.ok()) return status;

    Playlist* playlist = nullptr;
    if (station.id == QUICKMIX_ID) {
        playlist = &m_quickMix;
    } else {
        for (auto& p : m_playlists) {
            if (p.station.id == station.id) {
                playlist = &p;
                break;
            }
        }
    }
    if (!playlist) {
        return Status::error(ErrorCode::SERVICE_ERROR, "no such station: " + station.id);
    }

    out.clear();
    const size_t count = std::min(m_options.pageSize, playlist->tracks.size());
    for (size_t i = 0; i < count; i++) {
        Track track = playlist->tracks[playlist->cursor];
        playlist->cursor = (playlist->cursor + 1) % playlist->tracks.size();

        auto rating = m_ratings.find(track.id);
        if (rating != m_ratings.end()) {
            track.rating = rating->second;
        }
        auto tired = m_tired.find(track.id);
        if (tired != m_tired.end()) {
            track.tiredUntil = tired->second;
        }
        out.push_back(std::move(track));
    }
    return Status::success();
}

Status PlaylistFileService::downloadTrackAudio(const std::string& url, const CancelToken& cancel,
                                               std::vector<uint8_t>& out) {
    if (startsWith(url, "http://") || startsWith(url, "https://")) {
        return m_http.get(url, cancel, out);
    }
    if (startsWith(url, "file://")) {
        return readFile(fs::path(url.substr(7)), cancel, out);
    }
    return readFile(fs::path(url), cancel, out);
}

Status PlaylistFileService::readFile(const fs::path& path, const CancelToken& cancel,
                                     std::vector<uint8_t>& out) const {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Status::error(ErrorCode::HTTP_CLIENT_ERROR,
                             "cannot open " + path.string() + ": " + std::strerror(errno));
    }

    out.clear();
    char buffer[65536];
    while (file) {
        if (cancel.isCancelled()) {
            return Status::error(ErrorCode::CANCELLED, "read of " + path.string() + " cancelled");
        }
        file.read(buffer, sizeof(buffer));
        out.insert(out.end(), buffer, buffer + file.gcount());
    }
    if (file.bad()) {
        return Status::error(ErrorCode::CONNECTION_RESET, "read error on " + path.string());
    }
    return Status::success();
}

Status PlaylistFileService::rateTrack(const SessionToken& session, const Track& track,
                                      Rating rating) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Status status = checkSessionLocked(session);
    if (!status.ok()) return status;

    if (rating == Rating::UNRATED) {
        m_ratings.erase(track.id);
    } else {
        m_ratings[track.id] = rating;
    }
    LOG_DEBUG("[Stations] \"" << track.title << "\" is now " << ratingName(rating));
    return Status::success();
}

Status PlaylistFileService::markTired(const SessionToken& session, const Track& track) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Status status = checkSessionLocked(session);
    if (!status.ok()) return status;

    m_tired[track.id] = Clock::now() + m_options.tiredPeriod;
    return Status::success();
}

Rating PlaylistFileService::ratingOf(const std::string& trackId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_ratings.find(trackId);
    return it == m_ratings.end() ? Rating::UNRATED : it->second;
}
