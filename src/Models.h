/**
 * @file Models.h
 * @brief Stations, tracks, credentials and session handles
 */

#ifndef STATIONPLAY_MODELS_H
#define STATIONPLAY_MODELS_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

using Clock = std::chrono::system_clock;

enum class Rating { UNRATED, THUMBS_UP, THUMBS_DOWN };

// Container/codec of a track's audio as announced by the service
enum class AudioEncoding { UNKNOWN, MP3, AAC_ADTS };

const char* ratingName(Rating rating);
const char* encodingName(AudioEncoding encoding);
// File extension used for cache blobs ("mp3", "aac", "bin")
const char* encodingExtension(AudioEncoding encoding);
AudioEncoding encodingFromExtension(const std::string& ext);

struct Station {
    std::string id;
    std::string name;
    bool isQuickMix = false;
};

struct Track {
    std::string id;             // Service track identifier, also the cache key
    std::string stationId;
    std::string title;
    std::string artist;
    std::string album;
    std::string audioUrl;
    AudioEncoding encoding = AudioEncoding::UNKNOWN;
    std::chrono::seconds duration{0};   // 0 if the service did not say

    Rating rating = Rating::UNRATED;
    std::optional<Clock::time_point> tiredUntil;

    bool isTired(Clock::time_point now = Clock::now()) const {
        return tiredUntil && *tiredUntil > now;
    }
};

struct Credentials {
    std::string username;
    std::string password;

    bool empty() const { return username.empty(); }
};

// What the service hands back on a successful login
struct SessionToken {
    std::string authToken;
    std::string userId;
    std::string partnerId;
};

// A SessionToken as lent out by SessionManager. Valid for one call;
// generation identifies which login produced it.
struct SessionHandle {
    SessionToken token;
    uint64_t generation = 0;
};

#endif // STATIONPLAY_MODELS_H
