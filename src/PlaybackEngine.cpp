/**
 * @file PlaybackEngine.cpp
 * @brief Playback state machine implementation
 */

#include "PlaybackEngine.h"
#include "Backoff.h"
#include "LogLevel.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace {

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// A station fetch is retried unless the login itself was rejected
bool isStationFetchRetryable(const Status& status) {
    return status.code != ErrorCode::INVALID_CREDENTIALS &&
           status.code != ErrorCode::CANCELLED;
}

} // namespace

PlaybackEngine::PlaybackEngine(const Config& config,
                               SessionManager& session,
                               ServiceClient& client,
                               PrefetchPipeline& prefetch,
                               FeedbackWorker& feedback,
                               TiredList& tired,
                               AudioSink& sink)
    : m_config(config)
    , m_session(session)
    , m_client(client)
    , m_prefetch(prefetch)
    , m_feedback(feedback)
    , m_tired(tired)
    , m_sink(sink)
{
    if (m_config.statusInterval.count() <= 0) {
        m_config.statusInterval = std::chrono::milliseconds(1000);
    }
    m_volume = std::min(1.0f, std::max(0.0f, m_config.initialVolume));
    m_snapshot.volume = m_volume;
}

PlaybackEngine::~PlaybackEngine() {
    stop();
}

// ============================================
// Lifecycle
// ============================================

void PlaybackEngine::start() {
    if (m_loopThread.joinable()) return;

    m_session.onStateChange([this](SessionManager::State, const Status&) {
        Event event;
        event.kind = Event::Kind::SESSION_CHANGED;
        pushEvent(std::move(event));
    });
    m_sink.setVolume(effectiveVolume());

    {
        std::lock_guard<std::mutex> lock(m_loadMutex);
        m_loaderRunning = true;
    }
    m_loaderThread = std::thread(&PlaybackEngine::runLoader, this);
    m_loopThread = std::thread(&PlaybackEngine::runLoop, this);
    LOG_DEBUG("[Player] Engine started");
}

void PlaybackEngine::stop() {
    if (m_loopThread.joinable()) {
        post(Command{CommandType::QUIT});
        m_loopThread.join();
    }

    {
        std::lock_guard<std::mutex> lock(m_loadMutex);
        m_loaderRunning = false;
        m_loadRequest.reset();
    }
    m_loadCv.notify_all();
    if (m_loaderThread.joinable()) {
        m_loaderThread.join();
    }

    m_session.onStateChange(nullptr);
    m_sink.onFinished(nullptr);
}

void PlaybackEngine::waitStopped() {
    std::unique_lock<std::mutex> lock(m_statusMutex);
    m_stoppedCv.wait(lock, [this] { return m_stopped; });
}

void PlaybackEngine::post(Command command) {
    Event event;
    event.kind = Event::Kind::COMMAND;
    event.command = std::move(command);
    pushEvent(std::move(event));
}

void PlaybackEngine::pushEvent(Event event) {
    {
        std::lock_guard<std::mutex> lock(m_eventMutex);
        if (m_eventsClosed) return;    // Command loop is gone
        m_events.push_back(std::move(event));
    }
    m_eventCv.notify_one();
}

void PlaybackEngine::onStatus(StatusCallback cb) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_statusCb = std::move(cb);
}

PlayerStatus PlaybackEngine::status() const {
    PlayerStatus snapshot;
    {
        std::lock_guard<std::mutex> lock(m_statusMutex);
        snapshot = m_snapshot;
    }
    if (snapshot.state == PlayerState::PLAYING || snapshot.state == PlayerState::PAUSED) {
        snapshot.position = m_sink.position();
    }
    return snapshot;
}

size_t PlaybackEngine::pendingEvents() const {
    std::lock_guard<std::mutex> lock(m_eventMutex);
    return m_events.size();
}

std::vector<Track> PlaybackEngine::queue() const {
    std::lock_guard<std::mutex> lock(m_statusMutex);
    return m_queueSnapshot;
}

void PlaybackEngine::updateCredentials(const Credentials& credentials) {
    m_session.setCredentials(credentials);

    std::string key;
    {
        std::lock_guard<std::mutex> lock(m_statusMutex);
        key = m_selectedKey;
    }
    if (!key.empty()) {
        post(Command::selectStation(key));
    }
}

// ============================================
// Station catalog
// ============================================

Status PlaybackEngine::fetchStationList(const CancelToken& cancel, std::vector<Station>& out) {
    std::vector<Station> stations;
    Status status = retryWithBackoff(m_config.stationRetry, cancel, "station list", [&]() {
        stations.clear();
        return m_session.withSession([&](const SessionToken& token) {
            return m_client.listStations(token, stations);
        });
    }, isStationFetchRetryable);

    if (!status.ok()) {
        LOG_WARN("[Player] Could not fetch station list: " << status);
        return status;
    }

    LOG_DEBUG("[Player] " << stations.size() << " station(s) available");
    {
        std::lock_guard<std::mutex> lock(m_catalogMutex);
        m_stations = stations;
    }
    out = std::move(stations);
    return status;
}

Status PlaybackEngine::refreshStations(std::vector<Station>& out) {
    CancelToken cancel;
    return fetchStationList(cancel, out);
}

std::optional<Station> PlaybackEngine::findStation(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_catalogMutex);
    for (const auto& station : m_stations) {
        if (station.id == key) return station;
    }
    for (const auto& station : m_stations) {
        if (equalsIgnoreCase(station.name, key)) return station;
    }
    return std::nullopt;
}

// ============================================
// Command loop
// ============================================

void PlaybackEngine::runLoop() {
    LOG_DEBUG("[Player] Command loop running");
    publish();

    auto nextTick = std::chrono::steady_clock::now() + m_config.statusInterval;
    while (!m_quit) {
        std::optional<Event> event;
        {
            std::unique_lock<std::mutex> lock(m_eventMutex);
            m_eventCv.wait_until(lock, nextTick, [this] { return !m_events.empty(); });
            if (!m_events.empty()) {
                event.emplace(std::move(m_events.front()));
                m_events.pop_front();
            }
        }

        if (event) {
            handleEvent(*event);
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= nextTick) {
            if (m_state == PlayerState::PLAYING) {
                publish();
            }
            nextTick = now + m_config.statusInterval;
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_eventMutex);
        m_events.clear();
        m_eventsClosed = true;
    }
    {
        std::lock_guard<std::mutex> lock(m_statusMutex);
        m_stopped = true;
    }
    m_stoppedCv.notify_all();
    LOG_DEBUG("[Player] Command loop exiting");
}

void PlaybackEngine::handleEvent(Event& event) {
    using Kind = Event::Kind;

    switch (event.kind) {
        case Kind::COMMAND:
            handleCommand(event.command);
            break;

        case Kind::PLAYLIST_READY:
            if (event.generation != m_loadGeneration) {
                LOG_DEBUG("[Player] Dropping stale playlist");
                break;
            }
            handlePlaylistReady(event);
            break;

        case Kind::PLAYLIST_FAILED:
            if (event.generation != m_loadGeneration) break;
            m_notice = "Station unavailable (" + event.status.message + "), retrying";
            publish();
            break;

        case Kind::STATION_UNKNOWN:
            if (event.generation != m_loadGeneration) break;
            LOG_WARN("[Player] No station matches \"" << m_stationKey << "\"");
            resetStation();
            m_station.reset();
            m_notice = "Unknown station: " + m_stationKey;
            m_stationKey.clear();
            setState(PlayerState::IDLE);
            break;

        case Kind::AUTH_FAILED:
            if (event.generation != m_loadGeneration) break;
            LOG_ERROR("[Player] Login rejected: " << event.status.message);
            resetStation();
            m_authFailed = true;
            m_notice = "Login rejected, new credentials required (login <user> <password>)";
            setState(PlayerState::IDLE);
            break;

        case Kind::TRACK_READY:
            if (event.generation != m_loadGeneration) {
                LOG_DEBUG("[Player] Dropping stale track \"" << event.track.title << "\"");
                break;
            }
            handleTrackReady(event);
            break;

        case Kind::TRACK_FINISHED:
            if (event.generation != m_playGeneration || m_state != PlayerState::PLAYING) {
                break;
            }
            if (m_current) {
                LOG_DEBUG("[Player] Finished \"" << m_current->title << "\"");
            }
            advance();
            break;

        case Kind::SESSION_CHANGED:
            publish();
            break;
    }
}

void PlaybackEngine::handleCommand(const Command& command) {
    LOG_DEBUG("[Player] Command " << commandName(command.type)
              << " in state " << playerStateName(m_state));

    if (m_state == PlayerState::STOPPED) return;

    switch (command.type) {
        case CommandType::SELECT_STATION:
            selectStation(command.stationId);
            break;
        case CommandType::PAUSE:
            pause();
            break;
        case CommandType::RESUME:
            resume();
            break;
        case CommandType::TOGGLE_PAUSE:
            if (m_state == PlayerState::PLAYING) {
                pause();
            } else {
                resume();
            }
            break;
        case CommandType::VOLUME_UP:
            changeVolume(m_volume + m_config.volumeStep);
            break;
        case CommandType::VOLUME_DOWN:
            changeVolume(m_volume - m_config.volumeStep);
            break;
        case CommandType::SET_VOLUME:
            changeVolume(command.volume);
            break;
        case CommandType::MUTE:
            setMuted(true);
            break;
        case CommandType::UNMUTE:
            setMuted(false);
            break;
        case CommandType::TOGGLE_MUTE:
            setMuted(!m_muted);
            break;
        case CommandType::SKIP:
            skip("skip");
            break;
        case CommandType::TIRED:
            markTired();
            break;
        case CommandType::THUMBS_UP:
            rate(Rating::THUMBS_UP);
            break;
        case CommandType::THUMBS_DOWN:
            rate(Rating::THUMBS_DOWN);
            break;
        case CommandType::CLEAR_RATING:
            rate(Rating::UNRATED);
            break;
        case CommandType::STOP:
            LOG_INFO("[Player] Stopped");
            resetStation();
            m_station.reset();
            m_stationKey.clear();
            m_notice.clear();
            setState(PlayerState::IDLE);
            break;
        case CommandType::QUIT:
            LOG_INFO("[Player] Quitting");
            resetStation();
            m_quit = true;
            setState(PlayerState::STOPPED);
            break;
    }
}

// ============================================
// Loading
// ============================================

void PlaybackEngine::selectStation(const std::string& key) {
    if (key.empty()) {
        LOG_WARN("[Player] Station selection without a station");
        return;
    }

    resetStation();
    m_station = findStation(key);
    m_stationKey = key;
    m_notice.clear();
    m_authFailed = false;

    LOG_INFO("[Player] Tuning to " << (m_station ? m_station->name : key));
    setState(PlayerState::LOADING);
    requestPlaylist(std::chrono::milliseconds(0));
}

void PlaybackEngine::handlePlaylistReady(Event& event) {
    if (event.station) {
        m_station = event.station;
    }
    std::vector<Track> tracks = std::move(event.tracks);
    size_t tiredCount = m_tired.filter(tracks);
    if (tiredCount > 0) {
        LOG_INFO("[Player] Left out " << tiredCount << " tired track(s)");
    }
    m_authFailed = false;

    const std::string name = m_station ? m_station->name : m_stationKey;
    if (tracks.empty()) {
        m_emptyPages++;
        const size_t limit = static_cast<size_t>(std::max(1, m_config.stationRetry.maxAttempts));
        LOG_WARN("[Player] Playlist page for " << name << " has nothing playable");
        if (m_emptyPages >= limit) {
            m_notice = "No playable tracks on " + name + ", retrying";
            publish();
            requestPlaylist(m_config.stationRetryInterval);
        } else {
            requestPlaylist(std::chrono::milliseconds(0));
        }
        return;
    }

    m_emptyPages = 0;
    m_notice.clear();
    LOG_DEBUG("[Player] Queued " << tracks.size() << " track(s) from " << name);
    for (auto& track : tracks) {
        if (track.stationId.empty() && m_station) {
            track.stationId = m_station->id;
        }
        m_queue.push_back(std::move(track));
    }
    loadNext();
}

void PlaybackEngine::handleTrackReady(Event& event) {
    if (m_queue.empty() || m_queue.front().id != event.track.id) {
        return;
    }
    const Track& track = m_queue.front();
    PrefetchResult& result = event.result;

    if (!result.status.ok()) {
        if (result.status.code == ErrorCode::CANCELLED) {
            LOG_DEBUG("[Player] Load of \"" << track.title << "\" cancelled");
            return;
        }
        LOG_WARN("[Player] Skipping \"" << track.title << "\": " << result.status);
        advance();
        return;
    }

    AudioEncoding encoding = result.audio->encoding;
    if (encoding == AudioEncoding::UNKNOWN) {
        encoding = track.encoding;
    }

    const uint64_t playGeneration = ++m_playGeneration;
    m_sink.onFinished([this, playGeneration]() {
        Event finished;
        finished.kind = Event::Kind::TRACK_FINISHED;
        finished.generation = playGeneration;
        pushEvent(std::move(finished));
    });

    Status status = m_sink.load(result.audio->bytes, encoding);
    if (!status.ok()) {
        LOG_WARN("[Player] Cannot play \"" << track.title << "\": " << status);
        advance();
        return;
    }

    m_current = track;
    m_currentPin = std::move(result.handle);
    m_notice.clear();
    m_sink.setVolume(effectiveVolume());
    m_sink.play();

    LOG_INFO("[Player] Playing \"" << track.title << "\" by " << track.artist
             << (track.album.empty() ? "" : " on " + track.album));
    setState(PlayerState::PLAYING);

    // Keep the following tracks downloading and pinned
    std::vector<Track> upcoming(m_queue.begin() + 1, m_queue.end());
    m_prefetch.ensureReady(upcoming);
}

void PlaybackEngine::loadNext() {
    abandonLoad();
    m_current.reset();
    m_currentPin.release();
    setState(PlayerState::LOADING);

    if (m_queue.empty()) {
        LOG_DEBUG("[Player] Queue empty, fetching playlist");
        requestPlaylist(std::chrono::milliseconds(0));
        return;
    }

    m_prefetch.ensureReady(std::vector<Track>(m_queue.begin(), m_queue.end()));

    LoadRequest request;
    request.kind = LoadRequest::Kind::TRACK;
    request.track = m_queue.front();
    requestLoad(std::move(request));
}

void PlaybackEngine::advance() {
    stopOutput();
    m_current.reset();
    m_currentPin.release();
    if (!m_queue.empty()) {
        m_queue.pop_front();
    }
    loadNext();
}

void PlaybackEngine::requestPlaylist(std::chrono::milliseconds delay) {
    LoadRequest request;
    request.kind = LoadRequest::Kind::PLAYLIST;
    request.station = m_station;
    request.stationKey = m_stationKey;
    request.delay = delay;
    requestLoad(std::move(request));
}

void PlaybackEngine::requestLoad(LoadRequest request) {
    request.generation = m_loadGeneration;
    request.cancel = m_loadCancel;
    {
        std::lock_guard<std::mutex> lock(m_loadMutex);
        m_loadRequest = std::move(request);
    }
    m_loadCv.notify_one();
}

void PlaybackEngine::abandonLoad() {
    m_loadGeneration++;
    m_loadCancel.cancel();
    m_loadCancel = CancelToken();

    std::lock_guard<std::mutex> lock(m_loadMutex);
    m_loadRequest.reset();
}

void PlaybackEngine::stopOutput() {
    // Invalidates any finished report already on its way
    m_playGeneration++;
    m_sink.stop();
}

void PlaybackEngine::resetStation() {
    abandonLoad();
    m_prefetch.cancelAll();
    stopOutput();
    m_queue.clear();
    m_current.reset();
    m_currentPin.release();
    m_emptyPages = 0;
}

// ============================================
// Playback controls
// ============================================

void PlaybackEngine::skip(const char* reason) {
    switch (m_state) {
        case PlayerState::PLAYING:
        case PlayerState::PAUSED:
            if (m_current) {
                LOG_INFO("[Player] " << reason << ": \"" << m_current->title << "\"");
            }
            advance();
            break;
        case PlayerState::LOADING:
            if (!m_queue.empty()) {
                LOG_INFO("[Player] " << reason << ": \"" << m_queue.front().title
                         << "\" (not started)");
                advance();
            }
            break;
        default:
            LOG_DEBUG("[Player] Nothing to skip");
            break;
    }
}

void PlaybackEngine::markTired() {
    if (!m_current) {
        LOG_INFO("[Player] No current track to mark tired");
        return;
    }

    const Clock::time_point until = Clock::now() + m_config.tiredPeriod;
    Track track = *m_current;
    track.tiredUntil = until;
    m_current = track;
    m_tired.mark(track.id, until);

    // Drop queued copies; the head is the current track and goes with the skip
    if (m_queue.size() > 1) {
        auto first = m_queue.begin() + 1;
        m_queue.erase(std::remove_if(first, m_queue.end(),
                                     [&](const Track& t) { return t.id == track.id; }),
                      m_queue.end());
    }

    auto days = std::chrono::duration_cast<std::chrono::hours>(m_config.tiredPeriod).count() / 24;
    LOG_INFO("[Player] Tired of \"" << track.title << "\" for " << days << " days");

    m_feedback.submit("tired \"" + track.title + "\"", [this, track](const SessionToken& session) {
        return m_client.markTired(session, track);
    });

    skip("Tired");
}

void PlaybackEngine::rate(Rating rating) {
    if (!m_current) {
        LOG_INFO("[Player] No current track to rate");
        return;
    }
    if (m_current->rating == rating) {
        LOG_DEBUG("[Player] \"" << m_current->title << "\" already " << ratingName(rating));
        return;
    }

    m_current->rating = rating;
    if (!m_queue.empty() && m_queue.front().id == m_current->id) {
        m_queue.front().rating = rating;
    }

    Track track = *m_current;
    LOG_INFO("[Player] \"" << track.title << "\" rated " << ratingName(rating));
    m_feedback.submit(std::string(ratingName(rating)) + " \"" + track.title + "\"",
                      [this, track, rating](const SessionToken& session) {
        return m_client.rateTrack(session, track, rating);
    });
    publish();
}

void PlaybackEngine::pause() {
    if (m_state != PlayerState::PLAYING) {
        LOG_DEBUG("[Player] Not playing, pause ignored");
        return;
    }
    m_sink.pause();
    setState(PlayerState::PAUSED);
}

void PlaybackEngine::resume() {
    if (m_state != PlayerState::PAUSED) {
        LOG_DEBUG("[Player] Not paused, resume ignored");
        return;
    }
    m_sink.play();
    setState(PlayerState::PLAYING);
}

void PlaybackEngine::changeVolume(float volume) {
    volume = std::min(1.0f, std::max(0.0f, volume));
    // Keep repeated steps on the 0.01 grid
    volume = std::round(volume * 100.0f) / 100.0f;
    if (volume == m_volume) return;

    m_volume = volume;
    m_sink.setVolume(effectiveVolume());
    LOG_DEBUG("[Player] Volume " << static_cast<int>(m_volume * 100.0f) << "%");
    publish();
}

void PlaybackEngine::setMuted(bool muted) {
    if (muted == m_muted) return;

    m_muted = muted;
    m_sink.setVolume(effectiveVolume());
    LOG_DEBUG("[Player] " << (muted ? "Muted" : "Unmuted"));
    publish();
}

float PlaybackEngine::effectiveVolume() const {
    return m_muted ? 0.0f : m_volume;
}

// ============================================
// Status
// ============================================

void PlaybackEngine::setState(PlayerState state) {
    if (state != m_state) {
        LOG_DEBUG("[Player] " << playerStateName(m_state) << " -> " << playerStateName(state));
        m_state = state;
    }
    publish();
}

void PlaybackEngine::publish() {
    PlayerStatus status;
    status.state = m_state;
    status.station = m_station;
    status.track = m_current;
    if (m_current) {
        status.duration = m_current->duration;
    }
    if (m_state == PlayerState::PLAYING || m_state == PlayerState::PAUSED) {
        status.position = m_sink.position();
    }
    status.volume = m_volume;
    status.muted = m_muted;
    status.session = m_session.state();
    status.notice = m_notice;
    status.authFailed = m_authFailed;

    {
        std::lock_guard<std::mutex> lock(m_statusMutex);
        m_snapshot = status;
        m_queueSnapshot.assign(m_queue.begin(), m_queue.end());
        m_selectedKey = m_station ? m_station->id : m_stationKey;
    }

    StatusCallback cb;
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        cb = m_statusCb;
    }
    if (cb) {
        cb(status);
    }
}

// ============================================
// Loader thread
// ============================================

void PlaybackEngine::runLoader() {
    LOG_DEBUG("[Loader] Running");

    while (true) {
        LoadRequest request;
        {
            std::unique_lock<std::mutex> lock(m_loadMutex);
            m_loadCv.wait(lock, [this] { return m_loadRequest.has_value() || !m_loaderRunning; });
            if (!m_loaderRunning) break;
            request = std::move(*m_loadRequest);
            m_loadRequest.reset();
        }

        if (request.delay.count() > 0 && !request.cancel.sleepFor(request.delay)) {
            continue;
        }

        if (request.kind == LoadRequest::Kind::PLAYLIST) {
            loadPlaylist(request);
        } else {
            loadTrack(request);
        }
    }

    LOG_DEBUG("[Loader] Exiting");
}

void PlaybackEngine::loadPlaylist(LoadRequest& request) {
    std::optional<Station> station = request.station;

    while (!request.cancel.isCancelled()) {
        Status status;
        std::vector<Track> tracks;

        if (!station) {
            std::vector<Station> stations;
            status = fetchStationList(request.cancel, stations);
            if (status.ok()) {
                station = findStation(request.stationKey);
                if (!station) {
                    Event event;
                    event.kind = Event::Kind::STATION_UNKNOWN;
                    event.generation = request.generation;
                    pushEvent(std::move(event));
                    return;
                }
            }
        }

        if (station) {
            status = retryWithBackoff(m_config.stationRetry, request.cancel, "playlist fetch", [&]() {
                tracks.clear();
                return m_session.withSession([&](const SessionToken& token) {
                    return m_client.getPlaylist(token, *station, tracks);
                });
            }, isStationFetchRetryable);
        }

        if (status.ok()) {
            Event event;
            event.kind = Event::Kind::PLAYLIST_READY;
            event.generation = request.generation;
            event.station = station;
            event.tracks = std::move(tracks);
            pushEvent(std::move(event));
            return;
        }

        if (status.code == ErrorCode::CANCELLED) return;

        if (status.code == ErrorCode::INVALID_CREDENTIALS) {
            Event event;
            event.kind = Event::Kind::AUTH_FAILED;
            event.generation = request.generation;
            event.status = status;
            pushEvent(std::move(event));
            return;
        }

        LOG_WARN("[Loader] Station fetch keeps failing (" << status << "), next try in "
                 << m_config.stationRetryInterval.count() / 1000 << "s");
        Event event;
        event.kind = Event::Kind::PLAYLIST_FAILED;
        event.generation = request.generation;
        event.status = status;
        pushEvent(std::move(event));

        if (!request.cancel.sleepFor(m_config.stationRetryInterval)) return;
    }
}

void PlaybackEngine::loadTrack(LoadRequest& request) {
    PrefetchResult result = m_prefetch.acquire(request.track, request.cancel);
    if (result.status.code == ErrorCode::CANCELLED && request.cancel.isCancelled()) {
        return;
    }

    Event event;
    event.kind = Event::Kind::TRACK_READY;
    event.generation = request.generation;
    event.track = request.track;
    event.result = std::move(result);
    pushEvent(std::move(event));
}
