/**
 * @file PlaylistFileService.h
 * @brief ServiceClient backed by a directory of M3U playlists
 *
 * Every "<name>.m3u" file in the directory is one station; a QuickMix
 * station plays all of them interleaved. getPlaylist() hands out pages
 * of a few tracks and wraps around at the end of the file, the way a
 * radio service keeps a station going. Ratings and tired marks live in
 * memory for the life of the process.
 *
 * An optional "credentials" file holds "user:password" lines; without
 * it any non-empty user name is accepted. Session tokens expire after
 * sessionLifetime, which exercises the re-authentication path.
 *
 * Track entries may be local paths (relative to the playlist), file://
 * URLs or http:// URLs (fetched with HttpFetcher).
 */

#ifndef STATIONPLAY_PLAYLIST_FILE_SERVICE_H
#define STATIONPLAY_PLAYLIST_FILE_SERVICE_H

#include "HttpFetcher.h"
#include "ServiceClient.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

class PlaylistFileService : public ServiceClient {
public:
    static constexpr const char* QUICKMIX_ID = "quickmix";

    struct Options {
        size_t pageSize = 4;
        std::chrono::seconds sessionLifetime{3600};
        std::chrono::hours tiredPeriod{24 * 30};
    };

    explicit PlaylistFileService(std::filesystem::path directory);
    PlaylistFileService(std::filesystem::path directory, Options options);

    // Non-copyable
    PlaylistFileService(const PlaylistFileService&) = delete;
    PlaylistFileService& operator=(const PlaylistFileService&) = delete;

    /**
     * @brief Scan the directory for playlists and the credentials file
     * @return SERVICE_ERROR if the directory cannot be read
     */
    Status load();

    Status authenticate(const Credentials& credentials, SessionToken& out) override;
    Status listStations(const SessionToken& session, std::vector<Station>& out) override;
    Status getPlaylist(const SessionToken& session, const Station& station,
                       std::vector<Track>& out) override;
    Status downloadTrackAudio(const std::string& url, const CancelToken& cancel,
                              std::vector<uint8_t>& out) override;
    Status rateTrack(const SessionToken& session, const Track& track, Rating rating) override;
    Status markTired(const SessionToken& session, const Track& track) override;

    /**
     * @brief Parse M3U / extended M3U text
     *
     * Understands #EXTINF:<seconds>,<artist> - <title> and #EXTALB:<album>;
     * other directives are ignored. Relative paths resolve against baseDir.
     */
    static std::vector<Track> parseM3u(const std::string& text,
                                       const std::filesystem::path& baseDir,
                                       const std::string& stationId);

    // Stable track id for an entry location (FNV-1a, hex)
    static std::string trackIdFor(const std::string& location);

    Rating ratingOf(const std::string& trackId) const;

private:
    struct Playlist {
        Station station;
        std::vector<Track> tracks;
        size_t cursor = 0;
    };

    // Caller holds m_mutex
    Status checkSessionLocked(const SessionToken& session) const;
    Status readFile(const std::filesystem::path& path, const CancelToken& cancel,
                    std::vector<uint8_t>& out) const;

    std::filesystem::path m_directory;
    Options m_options;
    HttpFetcher m_http;

    mutable std::mutex m_mutex;
    std::vector<Playlist> m_playlists;
    Playlist m_quickMix;
    std::map<std::string, std::string> m_accounts;      // user -> password
    std::map<std::string, Clock::time_point> m_sessions; // token -> expiry
    std::map<std::string, Rating> m_ratings;
    std::map<std::string, Clock::time_point> m_tired;
    uint64_t m_tokenCounter = 0;
};

#endif // STATIONPLAY_PLAYLIST_FILE_SERVICE_H
