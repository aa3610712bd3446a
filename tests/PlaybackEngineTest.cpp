/**
 * @file PlaybackEngineTest.cpp
 * @brief State machine behaviour against the fake service and sink
 */

#include "PlaybackEngine.h"

#include "CredentialStore.h"
#include "Fakes.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <memory>

namespace {

BackoffPolicy fastPolicy(int attempts) {
    return BackoffPolicy{attempts, std::chrono::milliseconds(1), std::chrono::milliseconds(2), 2.0};
}

class PlaybackEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.lookahead = 2;
        config.downloadWorkers = 1;
        config.authRetry = fastPolicy(2);
        config.stationRetry = fastPolicy(5);
        config.downloadRetry = fastPolicy(3);
        config.feedbackRetry = fastPolicy(2);
        config.stationRetryInterval = std::chrono::seconds(60);
        config.statusInterval = std::chrono::milliseconds(20);
    }

    void TearDown() override {
        if (session) session->shutdown();
        if (engine) engine->stop();
        if (feedback) feedback->stop();
        if (prefetch) prefetch->stop();
        engine.reset();
        feedback.reset();
        prefetch.reset();
        cache.reset();
        session.reset();
    }

    // Build and start every component; call after scripting the service
    void startEngine(uint64_t cacheCapacity = 1024 * 1024) {
        session = std::make_unique<SessionManager>(service, credentials, config.authRetry);

        cache = std::make_unique<TrackCache>(dir.path(), cacheCapacity);
        ASSERT_TRUE(cache->open().ok());

        PrefetchPipeline::Options options;
        options.lookahead = config.lookahead;
        options.workers = config.downloadWorkers;
        options.retry = config.downloadRetry;
        prefetch = std::make_unique<PrefetchPipeline>(service, *cache, options);

        feedback = std::make_unique<FeedbackWorker>(*session, config.feedbackRetry);

        engine = std::make_unique<PlaybackEngine>(config, *session, service, *prefetch,
                                                  *feedback, tired, sink);
        engine->onStatus([this](const PlayerStatus& status) {
            std::lock_guard<std::mutex> lock(m_statesMutex);
            if (m_states.empty() || m_states.back() != status.state) {
                m_states.push_back(status.state);
            }
        });

        prefetch->start();
        feedback->start();
        engine->start();
    }

    bool waitForTrack(const std::string& id, size_t loads) {
        return waitUntil([&] {
            PlayerStatus status = engine->status();
            return status.state == PlayerState::PLAYING && status.track &&
                   status.track->id == id && sink.loadCount() >= loads;
        });
    }

    bool waitForState(PlayerState state) {
        return waitUntil([&] { return engine->status().state == state; });
    }

    // Barrier: returns once every command posted before it has been handled
    void sync() {
        float volume = 0.2f + 0.01f * static_cast<float>(m_syncCount++ % 50);
        volume = std::round(volume * 100.0f) / 100.0f;
        engine->post(Command::setVolume(volume));
        ASSERT_TRUE(waitUntil([&] { return std::fabs(engine->status().volume - volume) < 0.001f; }));
    }

    std::vector<PlayerState> states() {
        std::lock_guard<std::mutex> lock(m_statesMutex);
        return m_states;
    }

    void clearStates() {
        std::lock_guard<std::mutex> lock(m_statesMutex);
        m_states.clear();
    }

    Config config;
    TempDir dir{"engine"};
    FakeServiceClient service;
    MemoryCredentialStore credentials{Credentials{"alice", "secret"}};
    TiredList tired;
    FakeAudioSink sink;

    std::unique_ptr<SessionManager> session;
    std::unique_ptr<TrackCache> cache;
    std::unique_ptr<PrefetchPipeline> prefetch;
    std::unique_ptr<FeedbackWorker> feedback;
    std::unique_ptr<PlaybackEngine> engine;

private:
    std::mutex m_statesMutex;
    std::vector<PlayerState> m_states;
    int m_syncCount = 0;
};

} // namespace

// ============================================
// Station selection
// ============================================

TEST_F(PlaybackEngineTest, SelectStationPlaysFirstTrack) {
    service.addStation("jazz", "Jazz", {"a", "b", "c"});
    startEngine();

    engine->post(Command::selectStation("jazz"));
    ASSERT_TRUE(waitForTrack("a", 1));

    PlayerStatus status = engine->status();
    ASSERT_TRUE(status.station);
    EXPECT_EQ(status.station->name, "Jazz");
    EXPECT_EQ(status.duration, std::chrono::seconds(180));
    EXPECT_EQ(status.position, std::chrono::milliseconds(1500));
    EXPECT_TRUE(sink.playing());
    EXPECT_EQ(sink.loaded().at(0), "audio:a");

    auto queue = engine->queue();
    ASSERT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue[0].id, "a");

    auto seen = states();
    ASSERT_GE(seen.size(), 3u);
    EXPECT_EQ(seen[0], PlayerState::IDLE);
    EXPECT_EQ(seen[1], PlayerState::LOADING);
    EXPECT_EQ(seen.back(), PlayerState::PLAYING);
}

TEST_F(PlaybackEngineTest, SelectStationByName) {
    service.addStation("jazz", "Jazz", {"a"});
    service.addStation("lnj", "Late Night Jazz", {"x", "y"});
    startEngine();

    std::vector<Station> stations;
    ASSERT_TRUE(engine->refreshStations(stations).ok());
    ASSERT_EQ(stations.size(), 2u);
    ASSERT_TRUE(engine->findStation("late night JAZZ"));

    engine->post(Command::selectStation("late night jazz"));
    ASSERT_TRUE(waitForTrack("x", 1));
    EXPECT_EQ(engine->status().station->id, "lnj");
}

TEST_F(PlaybackEngineTest, UnknownStationReturnsToIdle) {
    service.addStation("jazz", "Jazz", {"a"});
    startEngine();

    engine->post(Command::selectStation("nope"));
    ASSERT_TRUE(waitUntil([&] { return !engine->status().notice.empty(); }));

    PlayerStatus status = engine->status();
    EXPECT_EQ(status.state, PlayerState::IDLE);
    EXPECT_NE(status.notice.find("nope"), std::string::npos);
    EXPECT_FALSE(status.station);
    EXPECT_EQ(service.playlistCalls(), 0);
}

TEST_F(PlaybackEngineTest, SwitchingStationsDropsOldQueue) {
    service.addStation("jazz", "Jazz", {"a", "b"});
    service.addStation("rock", "Rock", {"r1", "r2"});
    startEngine();

    engine->post(Command::selectStation("jazz"));
    ASSERT_TRUE(waitForTrack("a", 1));

    engine->post(Command::selectStation("rock"));
    ASSERT_TRUE(waitForTrack("r1", 2));

    for (const auto& track : engine->queue()) {
        EXPECT_EQ(track.stationId, "rock");
    }
}

// ============================================
// Queue progression
// ============================================

TEST_F(PlaybackEngineTest, FinishedTrackAdvances) {
    service.addStation("jazz", "Jazz", {"a", "b", "c"});
    startEngine();

    engine->post(Command::selectStation("jazz"));
    ASSERT_TRUE(waitForTrack("a", 1));

    sink.finish();
    ASSERT_TRUE(waitForTrack("b", 2));
    EXPECT_EQ(sink.loaded().at(1), "audio:b");
    EXPECT_EQ(engine->queue().front().id, "b");
}

TEST_F(PlaybackEngineTest, EmptyQueueFetchesNextPage) {
    service.pageSize = 1;
    service.addStation("jazz", "Jazz", {"a", "b"});
    startEngine();

    engine->post(Command::selectStation("jazz"));
    ASSERT_TRUE(waitForTrack("a", 1));
    EXPECT_EQ(service.playlistCalls(), 1);

    sink.finish();
    ASSERT_TRUE(waitForTrack("b", 2));
    EXPECT_EQ(service.playlistCalls(), 2);
}

TEST_F(PlaybackEngineTest, SkipLoadsNextWithoutFeedback) {
    service.addStation("jazz", "Jazz", {"a", "b", "c"});
    startEngine();

    engine->post(Command::selectStation("jazz"));
    ASSERT_TRUE(waitForTrack("a", 1));
    clearStates();

    engine->post(Command{CommandType::SKIP});
    ASSERT_TRUE(waitForTrack("b", 2));

    auto seen = states();
    auto loading = std::find(seen.begin(), seen.end(), PlayerState::LOADING);
    ASSERT_NE(loading, seen.end());
    EXPECT_NE(std::find(loading, seen.end(), PlayerState::PLAYING), seen.end());

    feedback->waitIdle();
    EXPECT_TRUE(service.ratings().empty());
    EXPECT_TRUE(service.tiredMarks().empty());
}

TEST_F(PlaybackEngineTest, UndownloadableTrackIsSkipped) {
    service.addStation("jazz", "Jazz", {"a", "b"});
    service.failDownload("a", 1, ErrorCode::HTTP_CLIENT_ERROR);
    startEngine();

    engine->post(Command::selectStation("jazz"));
    ASSERT_TRUE(waitForTrack("b", 1));
    EXPECT_EQ(sink.loaded().at(0), "audio:b");
    EXPECT_EQ(service.downloadCalls("a"), 1);
}

TEST_F(PlaybackEngineTest, UndecodableTrackIsSkipped) {
    service.addStation("jazz", "Jazz", {"a", "b"});
    sink.rejectPayload = "audio:a";
    startEngine();

    engine->post(Command::selectStation("jazz"));
    ASSERT_TRUE(waitForTrack("b", 1));
    EXPECT_EQ(sink.loaded().size(), 1u);
}

TEST_F(PlaybackEngineTest, EvictedTrackIsDownloadedAgainOnce) {
    service.audioBytes = 100;
    service.addStation("jazz", "Jazz", {"a", "b", "c", "d"});
    config.lookahead = 1;
    startEngine(250);

    engine->post(Command::selectStation("jazz"));
    ASSERT_TRUE(waitForTrack("a", 1));
    sink.finish();
    ASSERT_TRUE(waitForTrack("b", 2));
    sink.finish();
    ASSERT_TRUE(waitForTrack("c", 3));

    // c displaced a
    ASSERT_TRUE(waitUntil([&] { return !cache->contains("a"); }));

    sink.finish();
    ASSERT_TRUE(waitForTrack("d", 4));
    sink.finish();
    ASSERT_TRUE(waitForTrack("a", 5));

    EXPECT_EQ(service.downloadCalls("a"), 2);
    EXPECT_EQ(sink.loaded().at(4), "audio:a");
}

// ============================================
// Tired and ratings
// ============================================

TEST_F(PlaybackEngineTest, TiredTrackIsNotRequeued) {
    service.pageSize = 2;
    service.addStation("jazz", "Jazz", {"a", "b"});
    startEngine();

    engine->post(Command::selectStation("jazz"));
    ASSERT_TRUE(waitForTrack("a", 1));

    engine->post(Command{CommandType::TIRED});
    ASSERT_TRUE(waitForTrack("b", 2));
    EXPECT_TRUE(tired.isTired("a"));

    // The next page wraps to [a, b]; a stays out
    sink.finish();
    ASSERT_TRUE(waitForTrack("b", 3));
    sink.finish();
    ASSERT_TRUE(waitForTrack("b", 4));

    auto loaded = sink.loaded();
    for (size_t i = 1; i < loaded.size(); i++) {
        EXPECT_EQ(loaded[i], "audio:b");
    }

    feedback->waitIdle();
    ASSERT_EQ(service.tiredMarks().size(), 1u);
    EXPECT_EQ(service.tiredMarks()[0], "a");
}

TEST_F(PlaybackEngineTest, TiredRemovesQueuedCopies) {
    service.addStation("jazz", "Jazz", {"a", "b", "a", "c"});
    startEngine();

    engine->post(Command::selectStation("jazz"));
    ASSERT_TRUE(waitForTrack("a", 1));

    engine->post(Command{CommandType::TIRED});
    ASSERT_TRUE(waitForTrack("b", 2));

    sink.finish();
    ASSERT_TRUE(waitForTrack("c", 3));
}

TEST_F(PlaybackEngineTest, RatingChangesAreSentOnce) {
    service.addStation("jazz", "Jazz", {"a", "b"});
    startEngine();

    engine->post(Command::selectStation("jazz"));
    ASSERT_TRUE(waitForTrack("a", 1));

    // Already unrated
    engine->post(Command{CommandType::CLEAR_RATING});
    sync();
    feedback->waitIdle();
    EXPECT_EQ(service.ratings().size(), 0u);

    engine->post(Command{CommandType::THUMBS_UP});
    ASSERT_TRUE(waitUntil([&] {
        auto track = engine->status().track;
        return track && track->rating == Rating::THUMBS_UP;
    }));
    feedback->waitIdle();
    EXPECT_EQ(service.ratings().size(), 1u);

    engine->post(Command{CommandType::THUMBS_UP});
    sync();
    feedback->waitIdle();
    EXPECT_EQ(service.ratings().size(), 1u);

    engine->post(Command{CommandType::CLEAR_RATING});
    ASSERT_TRUE(waitUntil([&] {
        auto track = engine->status().track;
        return track && track->rating == Rating::UNRATED;
    }));
    feedback->waitIdle();
    ASSERT_EQ(service.ratings().size(), 2u);
    EXPECT_EQ(service.ratings()[1].first, "a");
    EXPECT_EQ(service.ratings()[1].second, Rating::UNRATED);

    engine->post(Command{CommandType::CLEAR_RATING});
    sync();
    feedback->waitIdle();
    EXPECT_EQ(service.ratings().size(), 2u);
}

TEST_F(PlaybackEngineTest, ThumbsDownKeepsPlaying) {
    service.addStation("jazz", "Jazz", {"a", "b"});
    startEngine();

    engine->post(Command::selectStation("jazz"));
    ASSERT_TRUE(waitForTrack("a", 1));

    engine->post(Command{CommandType::THUMBS_DOWN});
    sync();
    feedback->waitIdle();

    ASSERT_EQ(service.ratings().size(), 1u);
    EXPECT_EQ(service.ratings()[0].second, Rating::THUMBS_DOWN);
    EXPECT_EQ(engine->status().track->id, "a");
    EXPECT_EQ(sink.loadCount(), 1u);
}

TEST_F(PlaybackEngineTest, RatingWithoutTrackIsIgnored) {
    startEngine();

    engine->post(Command{CommandType::THUMBS_UP});
    engine->post(Command{CommandType::TIRED});
    sync();
    feedback->waitIdle();

    EXPECT_TRUE(service.ratings().empty());
    EXPECT_TRUE(service.tiredMarks().empty());
    EXPECT_EQ(engine->status().state, PlayerState::IDLE);
}

// ============================================
// Failures
// ============================================

TEST_F(PlaybackEngineTest, TransientPlaylistFailuresAreRetried) {
    service.addStation("jazz", "Jazz", {"a"});
    service.failPlaylist(2, ErrorCode::CONNECTION_FAILURE);
    startEngine();

    engine->post(Command::selectStation("jazz"));
    ASSERT_TRUE(waitForTrack("a", 1));
    EXPECT_EQ(service.playlistCalls(), 3);
    EXPECT_TRUE(engine->status().notice.empty());
}

TEST_F(PlaybackEngineTest, PersistentPlaylistFailureIsBounded) {
    service.addStation("jazz", "Jazz", {"a"});
    service.alwaysFailPlaylist(ErrorCode::HTTP_SERVER_ERROR);
    startEngine();

    engine->post(Command::selectStation("jazz"));
    ASSERT_TRUE(waitUntil([&] { return !engine->status().notice.empty(); }));
    EXPECT_EQ(service.playlistCalls(), 5);

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(service.playlistCalls(), 5);
    EXPECT_EQ(engine->status().state, PlayerState::LOADING);
    EXPECT_TRUE(sink.loaded().empty());
}

TEST_F(PlaybackEngineTest, PageOfTiredTracksCountsAsFailure) {
    service.addStation("jazz", "Jazz", {"a"});
    tired.mark("a", Clock::now() + std::chrono::hours(1));
    startEngine();

    engine->post(Command::selectStation("jazz"));
    ASSERT_TRUE(waitUntil([&] { return !engine->status().notice.empty(); }));

    EXPECT_NE(engine->status().notice.find("No playable tracks"), std::string::npos);
    EXPECT_EQ(service.playlistCalls(), 5);
    EXPECT_EQ(engine->status().state, PlayerState::LOADING);
}

TEST_F(PlaybackEngineTest, ExpiredSessionIsRenewedTransparently) {
    service.pageSize = 1;
    service.addStation("jazz", "Jazz", {"a", "b"});
    startEngine();

    engine->post(Command::selectStation("jazz"));
    ASSERT_TRUE(waitForTrack("a", 1));
    EXPECT_EQ(service.authCalls(), 1);

    service.expireSessions();
    sink.finish();
    ASSERT_TRUE(waitForTrack("b", 2));
    EXPECT_EQ(service.authCalls(), 2);
    EXPECT_TRUE(engine->status().notice.empty());
}

TEST_F(PlaybackEngineTest, RejectedLoginWaitsForNewCredentials) {
    service.addStation("jazz", "Jazz", {"a"});
    credentials.save(Credentials{"alice", "wrong"});
    startEngine();

    engine->post(Command::selectStation("jazz"));
    ASSERT_TRUE(waitUntil([&] { return engine->status().authFailed; }));
    EXPECT_EQ(engine->status().state, PlayerState::IDLE);
    EXPECT_EQ(service.authCalls(), 1);

    engine->updateCredentials(Credentials{"alice", "secret"});
    ASSERT_TRUE(waitForTrack("a", 1));
    EXPECT_FALSE(engine->status().authFailed);
    EXPECT_EQ(service.authCalls(), 2);
}

// ============================================
// Controls
// ============================================

TEST_F(PlaybackEngineTest, PauseAndResume) {
    service.addStation("jazz", "Jazz", {"a"});
    startEngine();

    engine->post(Command::selectStation("jazz"));
    ASSERT_TRUE(waitForTrack("a", 1));

    engine->post(Command{CommandType::PAUSE});
    ASSERT_TRUE(waitForState(PlayerState::PAUSED));
    EXPECT_FALSE(sink.playing());
    EXPECT_EQ(sink.pauses(), 1);

    // Already paused
    engine->post(Command{CommandType::PAUSE});
    sync();
    EXPECT_EQ(sink.pauses(), 1);

    engine->post(Command{CommandType::TOGGLE_PAUSE});
    ASSERT_TRUE(waitForState(PlayerState::PLAYING));
    EXPECT_TRUE(sink.playing());

    engine->post(Command{CommandType::TOGGLE_PAUSE});
    ASSERT_TRUE(waitForState(PlayerState::PAUSED));
    engine->post(Command{CommandType::RESUME});
    ASSERT_TRUE(waitForState(PlayerState::PLAYING));
}

TEST_F(PlaybackEngineTest, VolumeIsClampedAndMuteKeepsLevel) {
    startEngine();

    for (int i = 0; i < 3; i++) {
        engine->post(Command{CommandType::VOLUME_DOWN});
    }
    ASSERT_TRUE(waitUntil([&] { return std::fabs(engine->status().volume - 0.7f) < 0.001f; }));
    EXPECT_NEAR(sink.volume(), 0.7f, 0.001f);

    engine->post(Command{CommandType::MUTE});
    ASSERT_TRUE(waitUntil([&] { return engine->status().muted; }));
    EXPECT_EQ(sink.volume(), 0.0f);
    EXPECT_NEAR(engine->status().volume, 0.7f, 0.001f);

    engine->post(Command{CommandType::TOGGLE_MUTE});
    ASSERT_TRUE(waitUntil([&] { return !engine->status().muted; }));
    EXPECT_NEAR(sink.volume(), 0.7f, 0.001f);

    engine->post(Command::setVolume(1.5f));
    ASSERT_TRUE(waitUntil([&] { return engine->status().volume == 1.0f; }));

    engine->post(Command::setVolume(-2.0f));
    ASSERT_TRUE(waitUntil([&] { return engine->status().volume == 0.0f; }));
    EXPECT_EQ(sink.volume(), 0.0f);
}

TEST_F(PlaybackEngineTest, StopClearsStation) {
    service.addStation("jazz", "Jazz", {"a", "b"});
    startEngine();

    engine->post(Command::selectStation("jazz"));
    ASSERT_TRUE(waitForTrack("a", 1));

    engine->post(Command{CommandType::STOP});
    ASSERT_TRUE(waitForState(PlayerState::IDLE));

    PlayerStatus status = engine->status();
    EXPECT_FALSE(status.station);
    EXPECT_FALSE(status.track);
    EXPECT_FALSE(sink.playing());
    EXPECT_TRUE(engine->queue().empty());

    // A late report from the stopped track is ignored
    sink.finish();
    sync();
    EXPECT_EQ(engine->status().state, PlayerState::IDLE);
    EXPECT_EQ(sink.loadCount(), 1u);
}

TEST_F(PlaybackEngineTest, QuitStopsCommandLoop) {
    service.addStation("jazz", "Jazz", {"a"});
    startEngine();

    engine->post(Command{CommandType::QUIT});
    engine->waitStopped();
    EXPECT_EQ(engine->status().state, PlayerState::STOPPED);

    engine->post(Command::selectStation("jazz"));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(engine->status().state, PlayerState::STOPPED);
    EXPECT_EQ(service.playlistCalls(), 0);
}

TEST_F(PlaybackEngineTest, RatingAndTiredApplyWhilePaused) {
    service.addStation("jazz", "Jazz", {"a", "b"});
    startEngine();

    engine->post(Command::selectStation("jazz"));
    ASSERT_TRUE(waitForTrack("a", 1));
    engine->post(Command{CommandType::PAUSE});
    ASSERT_TRUE(waitForState(PlayerState::PAUSED));

    engine->post(Command{CommandType::THUMBS_UP});
    ASSERT_TRUE(waitUntil([&] {
        auto track = engine->status().track;
        return track && track->rating == Rating::THUMBS_UP;
    }));
    EXPECT_EQ(engine->status().state, PlayerState::PAUSED);
    feedback->waitIdle();
    ASSERT_EQ(service.ratings().size(), 1u);
    EXPECT_EQ(service.ratings()[0].first, "a");

    engine->post(Command{CommandType::TIRED});
    ASSERT_TRUE(waitForTrack("b", 2));
    EXPECT_TRUE(tired.isTired("a"));
    feedback->waitIdle();
    ASSERT_EQ(service.tiredMarks().size(), 1u);
    EXPECT_EQ(service.tiredMarks()[0], "a");
}

TEST_F(PlaybackEngineTest, CommandsAfterQuitAreDropped) {
    startEngine();

    engine->post(Command{CommandType::QUIT});
    engine->waitStopped();

    for (int i = 0; i < 10; i++) {
        engine->post(Command{CommandType::VOLUME_DOWN});
    }
    sink.finish();
    EXPECT_EQ(engine->pendingEvents(), 0u);
}
