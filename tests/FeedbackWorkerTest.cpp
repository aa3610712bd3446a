/**
 * @file FeedbackWorkerTest.cpp
 * @brief Ordered, best-effort rating and tired submission
 */

#include "FeedbackWorker.h"

#include "Fakes.h"

#include <gtest/gtest.h>

namespace {

class FeedbackWorkerTest : public ::testing::Test {
protected:
    FeedbackWorkerTest()
        : credentials(Credentials{"alice", "secret"})
        , session(service, credentials,
                  BackoffPolicy{2, std::chrono::milliseconds(1), std::chrono::milliseconds(1), 1.0})
        , worker(session,
                 BackoffPolicy{2, std::chrono::milliseconds(1), std::chrono::milliseconds(1), 1.0})
    {
        worker.start();
    }

    void rate(const Track& track, Rating rating) {
        worker.submit("rate " + track.id, [this, track, rating](const SessionToken& token) {
            return service.rateTrack(token, track, rating);
        });
    }

    FakeServiceClient service;
    MemoryCredentialStore credentials;
    SessionManager session;
    FeedbackWorker worker;
};

} // namespace

TEST_F(FeedbackWorkerTest, RequestsReachServiceInOrder) {
    Track track = makeTrack("a");
    rate(track, Rating::THUMBS_UP);
    rate(track, Rating::THUMBS_DOWN);
    rate(track, Rating::UNRATED);
    worker.waitIdle();

    auto ratings = service.ratings();
    ASSERT_EQ(ratings.size(), 3u);
    EXPECT_EQ(ratings[0].second, Rating::THUMBS_UP);
    EXPECT_EQ(ratings[1].second, Rating::THUMBS_DOWN);
    EXPECT_EQ(ratings[2].second, Rating::UNRATED);
    EXPECT_EQ(worker.failures(), 0u);
}

TEST_F(FeedbackWorkerTest, TransientFailureIsRetried) {
    service.failFeedback(1, ErrorCode::RATE_LIMITED);
    rate(makeTrack("a"), Rating::THUMBS_UP);
    worker.waitIdle();

    EXPECT_EQ(service.ratings().size(), 1u);
    EXPECT_EQ(worker.failures(), 0u);
}

TEST_F(FeedbackWorkerTest, PersistentFailureIsDroppedAndCounted) {
    service.failFeedback(2, ErrorCode::HTTP_SERVER_ERROR);
    rate(makeTrack("a"), Rating::THUMBS_UP);
    rate(makeTrack("b"), Rating::THUMBS_UP);
    worker.waitIdle();

    auto ratings = service.ratings();
    ASSERT_EQ(ratings.size(), 1u);
    EXPECT_EQ(ratings[0].first, "b");
    EXPECT_EQ(worker.failures(), 1u);
}

TEST_F(FeedbackWorkerTest, ExpiredSessionIsRenewed) {
    rate(makeTrack("a"), Rating::THUMBS_UP);
    worker.waitIdle();

    service.expireSessions();
    worker.submit("tired b", [this](const SessionToken& token) {
        return service.markTired(token, makeTrack("b"));
    });
    worker.waitIdle();

    ASSERT_EQ(service.tiredMarks().size(), 1u);
    EXPECT_EQ(service.authCalls(), 2);
}

TEST_F(FeedbackWorkerTest, SubmitAfterStopIsDropped) {
    worker.stop();
    rate(makeTrack("a"), Rating::THUMBS_UP);
    worker.waitIdle();
    EXPECT_TRUE(service.ratings().empty());
}
