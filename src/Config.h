/**
 * @file Config.h
 * @brief Configuration for stationplay
 */

#ifndef STATIONPLAY_CONFIG_H
#define STATIONPLAY_CONFIG_H

#include "Backoff.h"

#include <chrono>
#include <cstdint>
#include <string>

struct Config {
    // Service
    std::string stationsDir;            // PlaylistFileService root (one .m3u per station)
    std::string username;
    std::string passwordEnv = "STATIONPLAY_PASSWORD";   // Env var holding the password
    std::string initialStation;         // Station id or name to tune at startup

    // Track cache
    std::string cacheDir;               // empty = $XDG_CACHE_HOME/stationplay
    uint64_t cacheCapacityBytes = 512ull * 1024 * 1024;
    size_t cacheMaxEntries = 0;         // 0 = byte budget only

    // Prefetch
    size_t lookahead = 2;               // Tracks downloaded ahead of the playing one
    size_t downloadWorkers = 1;         // Sequential by default

    // Retry policies
    BackoffPolicy authRetry{4, std::chrono::milliseconds(1000), std::chrono::milliseconds(8000), 2.0};
    BackoffPolicy stationRetry{5, std::chrono::milliseconds(1000), std::chrono::milliseconds(16000), 2.0};
    BackoffPolicy downloadRetry{4, std::chrono::milliseconds(500), std::chrono::milliseconds(8000), 2.0};
    BackoffPolicy feedbackRetry{2, std::chrono::milliseconds(1000), std::chrono::milliseconds(1000), 1.0};
    std::chrono::milliseconds stationRetryInterval{30000};  // After a persistent failure

    // Playback
    float initialVolume = 1.0f;
    float volumeStep = 0.1f;
    std::chrono::hours tiredPeriod{24 * 30};
    std::chrono::milliseconds statusInterval{1000};
    std::string outputCommand = "aplay -q -t raw -f S32_LE -c {channels} -r {rate}";
    std::string outputFile;             // Write raw PCM here instead of a command

    // Logging
    bool verbose = false;
    bool quiet = false;

    // Actions
    bool listStations = false;
    bool showVersion = false;
};

#endif // STATIONPLAY_CONFIG_H
