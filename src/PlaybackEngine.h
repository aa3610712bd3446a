/**
 * @file PlaybackEngine.h
 * @brief Playback state machine driving the audio sink from a command queue
 *
 * States: IDLE -> LOADING -> PLAYING <-> PAUSED -> LOADING (next) ... -> STOPPED
 *
 * All state is owned by a single command-loop thread. The UI posts
 * Commands; network work (station list, playlist pages, waiting for a
 * track download) happens on a loader thread and on the prefetch pool and
 * comes back as events tagged with the load generation that requested it.
 * Events from an abandoned load (skip, station switch) are dropped.
 *
 * The sink reports the end of a track from its own thread; that report is
 * posted to the same queue, tagged with the play generation.
 */

#ifndef STATIONPLAY_PLAYBACK_ENGINE_H
#define STATIONPLAY_PLAYBACK_ENGINE_H

#include "AudioSink.h"
#include "CancelToken.h"
#include "Commands.h"
#include "Config.h"
#include "FeedbackWorker.h"
#include "Models.h"
#include "PrefetchPipeline.h"
#include "ServiceClient.h"
#include "SessionManager.h"
#include "Status.h"
#include "TiredList.h"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

class PlaybackEngine {
public:
    using StatusCallback = std::function<void(const PlayerStatus& status)>;

    PlaybackEngine(const Config& config,
                   SessionManager& session,
                   ServiceClient& client,
                   PrefetchPipeline& prefetch,
                   FeedbackWorker& feedback,
                   TiredList& tired,
                   AudioSink& sink);
    ~PlaybackEngine();

    // Non-copyable
    PlaybackEngine(const PlaybackEngine&) = delete;
    PlaybackEngine& operator=(const PlaybackEngine&) = delete;

    // Start the command loop and loader threads
    void start();

    // QUIT (if not already) and join all threads
    void stop();

    // Wait until the command loop has processed QUIT
    void waitStopped();

    // Command channel; safe from any thread
    void post(Command command);

    // Status channel: called on every change and periodically while playing.
    // Runs on the command-loop thread; must not block.
    void onStatus(StatusCallback cb);

    PlayerStatus status() const;

    // Upcoming tracks, current one first
    std::vector<Track> queue() const;

    // Commands and events not yet handled by the command loop
    size_t pendingEvents() const;

    /**
     * @brief Fetch the station list (network, blocks the caller)
     *
     * The list is kept as the catalog used to resolve SELECT_STATION.
     */
    Status refreshStations(std::vector<Station>& out);

    // Match by id, then by case-insensitive name, against the catalog
    std::optional<Station> findStation(const std::string& key) const;

    // New credentials after a rejected login; reloads the current station
    void updateCredentials(const Credentials& credentials);

private:
    struct Event {
        enum class Kind {
            COMMAND,
            PLAYLIST_READY,
            PLAYLIST_FAILED,
            STATION_UNKNOWN,
            AUTH_FAILED,
            TRACK_READY,
            TRACK_FINISHED,
            SESSION_CHANGED
        };

        Kind kind = Kind::COMMAND;
        uint64_t generation = 0;
        Command command{CommandType::QUIT};
        std::optional<Station> station;
        std::vector<Track> tracks;
        Track track;
        PrefetchResult result;
        Status status;
    };

    struct LoadRequest {
        enum class Kind { PLAYLIST, TRACK };

        Kind kind = Kind::PLAYLIST;
        uint64_t generation = 0;
        std::string stationKey;                 // Unresolved SELECT_STATION argument
        std::optional<Station> station;
        Track track;
        std::chrono::milliseconds delay{0};     // Wait before starting
        CancelToken cancel;
    };

    void pushEvent(Event event);

    // Command loop
    void runLoop();
    void handleEvent(Event& event);
    void handleCommand(const Command& command);
    void handlePlaylistReady(Event& event);
    void handleTrackReady(Event& event);

    void selectStation(const std::string& key);
    void skip(const char* reason);
    void markTired();
    void rate(Rating rating);
    void pause();
    void resume();
    void changeVolume(float volume);
    void setMuted(bool muted);
    float effectiveVolume() const;

    // Cancel loads and downloads, stop output, clear the cursor
    void resetStation();

    // Abandon the current load and start loading the head of the queue
    void loadNext();
    void advance();
    void requestPlaylist(std::chrono::milliseconds delay);
    void requestLoad(LoadRequest request);
    void abandonLoad();
    void stopOutput();
    void setState(PlayerState state);
    void publish();

    // Loader thread
    void runLoader();
    void loadPlaylist(LoadRequest& request);
    void loadTrack(LoadRequest& request);
    Status fetchStationList(const CancelToken& cancel, std::vector<Station>& out);

    Config m_config;
    SessionManager& m_session;
    ServiceClient& m_client;
    PrefetchPipeline& m_prefetch;
    FeedbackWorker& m_feedback;
    TiredList& m_tired;
    AudioSink& m_sink;

    // Event queue (commands + internal events)
    mutable std::mutex m_eventMutex;
    std::condition_variable m_eventCv;
    std::deque<Event> m_events;
    bool m_eventsClosed = false;    // Set when the command loop exits

    // Loader: at most one pending request; a newer one replaces it
    std::mutex m_loadMutex;
    std::condition_variable m_loadCv;
    std::optional<LoadRequest> m_loadRequest;
    bool m_loaderRunning = false;

    // Owned by the command-loop thread
    PlayerState m_state = PlayerState::IDLE;
    std::optional<Station> m_station;
    std::string m_stationKey;
    std::deque<Track> m_queue;
    std::optional<Track> m_current;
    CacheHandle m_currentPin;
    uint64_t m_loadGeneration = 0;
    uint64_t m_playGeneration = 0;
    CancelToken m_loadCancel;
    size_t m_emptyPages = 0;
    float m_volume = 1.0f;
    bool m_muted = false;
    std::string m_notice;
    bool m_authFailed = false;
    bool m_quit = false;

    // Published snapshot, readable from any thread
    mutable std::mutex m_statusMutex;
    PlayerStatus m_snapshot;
    std::vector<Track> m_queueSnapshot;
    std::string m_selectedKey;      // Station id, or the unresolved key
    bool m_stopped = false;
    std::condition_variable m_stoppedCv;

    std::mutex m_callbackMutex;
    StatusCallback m_statusCb;

    mutable std::mutex m_catalogMutex;
    std::vector<Station> m_stations;

    std::thread m_loopThread;
    std::thread m_loaderThread;
};

#endif // STATIONPLAY_PLAYBACK_ENGINE_H
