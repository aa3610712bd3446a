/**
 * @file main.cpp
 * @brief Main entry point for stationplay
 *
 * Terminal radio player: tunes a station, keeps the next tracks
 * downloaded, and plays them through an external PCM player. Commands
 * are read line by line from stdin.
 */

#include "Commands.h"
#include "Config.h"
#include "CredentialStore.h"
#include "DecodingSink.h"
#include "FeedbackWorker.h"
#include "LogLevel.h"
#include "PcmOutput.h"
#include "PlaybackEngine.h"
#include "PlaylistFileService.h"
#include "PrefetchPipeline.h"
#include "SessionManager.h"
#include "TiredList.h"
#include "TrackCache.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <poll.h>
#include <unistd.h>

#define STATIONPLAY_VERSION "0.1.0"

// ============================================
// Signal Handling
// ============================================

std::atomic<bool> g_running{true};

void signalHandler(int signal) {
    std::cout << "\nSignal " << signal << " received, shutting down..." << std::endl;
    g_running.store(false, std::memory_order_release);
}

// ============================================
// CLI Parsing
// ============================================

std::string defaultCacheDir() {
    const char* xdg = std::getenv("XDG_CACHE_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/stationplay";
    const char* home = std::getenv("HOME");
    if (home && *home) return std::string(home) + "/.cache/stationplay";
    return ".stationplay-cache";
}

Config parseArguments(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if ((arg == "--stations" || arg == "-d") && i + 1 < argc) {
            config.stationsDir = argv[++i];
        }
        else if ((arg == "--user" || arg == "-u") && i + 1 < argc) {
            config.username = argv[++i];
        }
        else if (arg == "--password-env" && i + 1 < argc) {
            config.passwordEnv = argv[++i];
        }
        else if ((arg == "--station" || arg == "-s") && i + 1 < argc) {
            config.initialStation = argv[++i];
        }
        else if (arg == "--cache-dir" && i + 1 < argc) {
            config.cacheDir = argv[++i];
        }
        else if (arg == "--cache-size" && i + 1 < argc) {
            long mib = std::atol(argv[++i]);
            if (mib < 1) {
                std::cerr << "Invalid cache size. Must be >= 1 MiB" << std::endl;
                exit(1);
            }
            config.cacheCapacityBytes = static_cast<uint64_t>(mib) * 1024 * 1024;
        }
        else if (arg == "--cache-entries" && i + 1 < argc) {
            config.cacheMaxEntries = static_cast<size_t>(std::atol(argv[++i]));
        }
        else if (arg == "--lookahead" && i + 1 < argc) {
            int n = std::atoi(argv[++i]);
            if (n < 1) {
                std::cerr << "Invalid lookahead. Must be >= 1" << std::endl;
                exit(1);
            }
            config.lookahead = static_cast<size_t>(n);
        }
        else if (arg == "--downloads" && i + 1 < argc) {
            int n = std::atoi(argv[++i]);
            if (n < 1) {
                std::cerr << "Invalid download worker count. Must be >= 1" << std::endl;
                exit(1);
            }
            config.downloadWorkers = static_cast<size_t>(n);
        }
        else if ((arg == "--output" || arg == "-o") && i + 1 < argc) {
            config.outputCommand = argv[++i];
        }
        else if (arg == "--output-file" && i + 1 < argc) {
            config.outputFile = argv[++i];
        }
        else if (arg == "--volume" && i + 1 < argc) {
            int percent = std::atoi(argv[++i]);
            if (percent < 0 || percent > 100) {
                std::cerr << "Invalid volume. Must be 0-100" << std::endl;
                exit(1);
            }
            config.initialVolume = static_cast<float>(percent) / 100.0f;
        }
        else if (arg == "--list-stations" || arg == "-l") {
            config.listStations = true;
        }
        else if (arg == "--version" || arg == "-V") {
            config.showVersion = true;
        }
        else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        }
        else if (arg == "--quiet" || arg == "-q") {
            config.quiet = true;
        }
        else if (arg == "--help" || arg == "-h") {
            std::cout << "stationplay - Terminal client for personalized radio stations\n\n"
                      << "Usage: " << argv[0] << " --stations <dir> --user <name> [options]\n\n"
                      << "Service:\n"
                      << "  -d, --stations <dir>     Directory of .m3u station playlists\n"
                      << "  -u, --user <name>        Account name\n"
                      << "  --password-env <var>     Env var holding the password (default: STATIONPLAY_PASSWORD)\n"
                      << "  -s, --station <id|name>  Station to tune at startup\n"
                      << "  -l, --list-stations      List stations and exit\n"
                      << "\n"
                      << "Cache:\n"
                      << "  --cache-dir <dir>        Track cache (default: $XDG_CACHE_HOME/stationplay)\n"
                      << "  --cache-size <MiB>       Cache byte budget (default: 512)\n"
                      << "  --cache-entries <n>      Max cached tracks, 0 = no limit (default: 0)\n"
                      << "  --lookahead <n>          Tracks downloaded ahead (default: 2)\n"
                      << "  --downloads <n>          Concurrent downloads (default: 1)\n"
                      << "\n"
                      << "Audio:\n"
                      << "  -o, --output <cmd>       PCM player command, {rate} and {channels} substituted\n"
                      << "                           (default: aplay -q -t raw -f S32_LE -c {channels} -r {rate})\n"
                      << "  --output-file <path>     Append raw S32_LE PCM to a file instead\n"
                      << "  --volume <0-100>         Initial volume (default: 100)\n"
                      << "\n"
                      << "Logging:\n"
                      << "  -v, --verbose            Debug output (log level: DEBUG)\n"
                      << "  -q, --quiet              Errors and warnings only (log level: WARN)\n"
                      << "\n"
                      << "Other:\n"
                      << "  -V, --version            Show version information\n"
                      << "  -h, --help               Show this help\n"
                      << "\n"
                      << "Examples:\n"
                      << "  STATIONPLAY_PASSWORD=secret " << argv[0] << " -d ~/radio -u alice -s quickmix\n"
                      << "  " << argv[0] << " -d ~/radio -u alice -l\n"
                      << std::endl;
            exit(0);
        }
        else {
            std::cerr << "Unknown option: " << arg << std::endl;
            std::cerr << "Use --help for usage information" << std::endl;
            exit(1);
        }
    }

    if (config.cacheDir.empty()) {
        config.cacheDir = defaultCacheDir();
    }
    return config;
}

// ============================================
// Status Display
// ============================================

std::string formatTime(std::chrono::milliseconds position) {
    long long total = position.count() / 1000;
    std::ostringstream out;
    out << total / 60 << ":" << std::setw(2) << std::setfill('0') << total % 60;
    return out.str();
}

/**
 * @brief Prints a line whenever something the user sees changes
 *
 * Position ticks alone do not produce output; "i" shows them on demand.
 */
class StatusPrinter {
public:
    void operator()(const PlayerStatus& status) {
        std::string line = describe(status, false);
        std::lock_guard<std::mutex> lock(m_mutex);
        if (line == m_lastLine) return;
        m_lastLine = line;
        std::lock_guard<std::mutex> logLock(g_logMutex);
        std::cout << line << std::endl;
    }

    static std::string describe(const PlayerStatus& status, bool withPosition) {
        std::ostringstream out;
        out << "[" << playerStateName(status.state) << "]";
        if (status.station) {
            out << " " << status.station->name;
        }
        if (status.track) {
            out << " | " << status.track->artist << " - " << status.track->title;
            if (!status.track->album.empty()) out << " (" << status.track->album << ")";
            if (status.track->rating != Rating::UNRATED) {
                out << " [" << ratingName(status.track->rating) << "]";
            }
        }
        if (withPosition && status.track) {
            out << " " << formatTime(status.position);
            if (status.duration.count() > 0) {
                out << "/" << formatTime(status.duration);
            }
        }
        out << " | vol " << static_cast<int>(status.volume * 100.0f + 0.5f) << "%";
        if (status.muted) out << " (muted)";
        if (!status.notice.empty()) out << " | " << status.notice;
        return out.str();
    }

private:
    std::mutex m_mutex;
    std::string m_lastLine;
};

void printStations(const std::vector<Station>& stations) {
    std::cout << "Stations:" << std::endl;
    for (const auto& station : stations) {
        std::cout << "  " << std::left << std::setw(24) << station.id
                  << station.name << (station.isQuickMix ? "  (QuickMix)" : "")
                  << std::endl;
    }
}

void printKeys() {
    std::cout << "Commands:\n"
              << "  p            pause / resume      n   skip\n"
              << "  + / -        volume up / down    v <0-100>  set volume\n"
              << "  m            mute / unmute       t   tired of this track\n"
              << "  u / d / c    thumbs up / down / clear rating\n"
              << "  s <station>  tune station        l   list stations\n"
              << "  i            track info          x   stop\n"
              << "  login <user> <password>          q   quit\n"
              << std::endl;
}

// ============================================
// Main
// ============================================

int main(int argc, char* argv[]) {
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    Config config = parseArguments(argc, argv);

    // Apply log level
    if (config.verbose) {
        g_logLevel = LogLevel::DEBUG;
        LOG_INFO("Verbose mode enabled (log level: DEBUG)");
    } else if (config.quiet) {
        g_logLevel = LogLevel::WARN;
    }

    if (config.showVersion) {
        std::cout << "Version:  " << STATIONPLAY_VERSION << std::endl;
        std::cout << "Build:    " << __DATE__ << " " << __TIME__ << std::endl;
        return 0;
    }

    std::cout << "═══════════════════════════════════════════════════════\n"
              << "  stationplay v" << STATIONPLAY_VERSION << "\n"
              << "  Terminal client for personalized radio stations\n"
              << "═══════════════════════════════════════════════════════\n"
              << std::endl;

    if (config.stationsDir.empty()) {
        std::cerr << "Error: station directory required (--stations <dir>)" << std::endl;
        return 1;
    }

    Credentials credentials;
    credentials.username = config.username;
    if (const char* password = std::getenv(config.passwordEnv.c_str())) {
        credentials.password = password;
    }

    // Print configuration
    std::cout << "Configuration:" << std::endl;
    std::cout << "  Stations:   " << config.stationsDir << std::endl;
    std::cout << "  User:       " << (config.username.empty() ? "(none)" : config.username) << std::endl;
    std::cout << "  Cache:      " << config.cacheDir << " ("
              << config.cacheCapacityBytes / (1024 * 1024) << " MiB";
    if (config.cacheMaxEntries > 0) std::cout << ", " << config.cacheMaxEntries << " tracks";
    std::cout << ")" << std::endl;
    std::cout << "  Lookahead:  " << config.lookahead << " track(s), "
              << config.downloadWorkers << " download worker(s)" << std::endl;
    std::cout << "  Output:     "
              << (config.outputFile.empty() ? config.outputCommand : config.outputFile) << std::endl;
    std::cout << std::endl;

    PlaylistFileService::Options serviceOptions;
    serviceOptions.tiredPeriod = config.tiredPeriod;
    PlaylistFileService service(config.stationsDir, serviceOptions);
    Status status = service.load();
    if (!status.ok()) {
        std::cerr << "Failed to load stations: " << status << std::endl;
        return 1;
    }

    TrackCache cache(config.cacheDir, config.cacheCapacityBytes, config.cacheMaxEntries);
    status = cache.open();
    if (!status.ok()) {
        std::cerr << "Failed to open track cache: " << status << std::endl;
        return 1;
    }

    MemoryCredentialStore credentialStore;
    if (!credentials.empty()) {
        credentialStore.save(credentials);
    }

    SessionManager session(service, credentialStore, config.authRetry);

    PrefetchPipeline::Options prefetchOptions;
    prefetchOptions.lookahead = config.lookahead;
    prefetchOptions.workers = config.downloadWorkers;
    prefetchOptions.retry = config.downloadRetry;
    PrefetchPipeline prefetch(service, cache, prefetchOptions);

    FeedbackWorker feedback(session, config.feedbackRetry);
    TiredList tired;

    std::unique_ptr<PcmOutput> output;
    if (!config.outputFile.empty()) {
        output = std::make_unique<PipeOutput>(PipeOutput::file(config.outputFile));
    } else {
        output = std::make_unique<PipeOutput>(PipeOutput::command(config.outputCommand));
    }
    DecodingSink sink(std::move(output));

    PlaybackEngine engine(config, session, service, prefetch, feedback, tired, sink);

    if (config.listStations) {
        std::vector<Station> stations;
        status = engine.refreshStations(stations);
        if (!status.ok()) {
            std::cerr << "Failed to list stations: " << status << std::endl;
            return 1;
        }
        printStations(stations);
        return 0;
    }

    StatusPrinter printer;
    engine.onStatus([&printer](const PlayerStatus& playerStatus) { printer(playerStatus); });

    prefetch.start();
    feedback.start();
    engine.start();

    std::vector<Station> stations;
    status = engine.refreshStations(stations);
    if (status.ok()) {
        printStations(stations);
    } else {
        LOG_WARN("Station list unavailable: " << status);
    }
    printKeys();

    if (!config.initialStation.empty()) {
        engine.post(Command::selectStation(config.initialStation));
    }

    // Command input loop; poll so a signal is noticed without a keypress
    std::string pending;
    while (g_running.load(std::memory_order_acquire)) {
        if (engine.status().state == PlayerState::STOPPED) break;

        struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
        int ready = poll(&pfd, 1, 200);
        if (ready <= 0) continue;

        char buf[512];
        ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
        if (n <= 0) {
            // stdin closed: keep playing until a signal arrives
            while (g_running.load(std::memory_order_acquire) &&
                   engine.status().state != PlayerState::STOPPED) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
            break;
        }
        pending.append(buf, static_cast<size_t>(n));

        size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);

            std::istringstream words(line);
            std::string word;
            words >> word;

            if (word.empty()) {
                continue;
            }
            if (word == "l" || word == "list") {
                stations.clear();
                status = engine.refreshStations(stations);
                if (status.ok()) {
                    printStations(stations);
                } else {
                    LOG_WARN("Station list unavailable: " << status);
                }
            }
            else if (word == "i" || word == "info") {
                std::lock_guard<std::mutex> logLock(g_logMutex);
                std::cout << StatusPrinter::describe(engine.status(), true) << std::endl;
            }
            else if (word == "h" || word == "help" || word == "?") {
                printKeys();
            }
            else if (word == "login") {
                Credentials fresh;
                words >> fresh.username >> fresh.password;
                if (fresh.username.empty()) {
                    std::cout << "Usage: login <user> <password>" << std::endl;
                } else {
                    credentialStore.save(fresh);
                    engine.updateCredentials(fresh);
                }
            }
            else if (auto command = parseCommandLine(line)) {
                engine.post(*command);
            }
            else {
                std::cout << "Unknown command: " << line << " (h for help)" << std::endl;
            }
        }
    }

    std::cout << "\nShutting down..." << std::endl;

    session.shutdown();
    engine.stop();
    feedback.stop();
    prefetch.stop();

    return 0;
}
