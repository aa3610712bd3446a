/**
 * @file PrefetchPipeline.h
 * @brief Downloads upcoming tracks into the TrackCache ahead of playback
 *
 * A small pool of worker threads (one by default: tracks are large and
 * parallel downloads only split the bandwidth) pulls download jobs from a
 * queue. Each track id has at most one job at a time, so a track is never
 * downloaded twice concurrently and never gets two cache entries.
 *
 * Transient failures are retried with bounded backoff; anything else
 * fails the job with DOWNLOAD_UNRETRYABLE and the caller skips the track.
 */

#ifndef STATIONPLAY_PREFETCH_PIPELINE_H
#define STATIONPLAY_PREFETCH_PIPELINE_H

#include "Backoff.h"
#include "CancelToken.h"
#include "Models.h"
#include "ServiceClient.h"
#include "Status.h"
#include "TrackCache.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

struct PrefetchResult {
    Status status;
    CacheHandle handle;                         // Pin on the cache entry (may be invalid
                                                // if the cache write failed)
    std::shared_ptr<const CachedAudio> audio;   // Set when status is OK
};

class PrefetchPipeline {
public:
    struct Options {
        size_t lookahead = 2;       // Tracks kept downloaded ahead
        size_t workers = 1;         // Concurrent downloads
        BackoffPolicy retry{4, std::chrono::milliseconds(500), std::chrono::milliseconds(8000), 2.0};
    };

    PrefetchPipeline(ServiceClient& client, TrackCache& cache, Options options);
    ~PrefetchPipeline();

    // Non-copyable
    PrefetchPipeline(const PrefetchPipeline&) = delete;
    PrefetchPipeline& operator=(const PrefetchPipeline&) = delete;

    void start();
    void stop();

    /**
     * @brief Schedule downloads for the head of the upcoming queue
     *
     * Only the first `lookahead` tracks are considered; tracks already
     * cached or already scheduled are left alone. Those tracks stay pinned
     * in the cache until a later call moves the window past them.
     */
    void ensureReady(const std::vector<Track>& upcoming);

    /**
     * @brief Wait until track's audio is available (scheduling it if needed)
     *
     * Blocks the calling thread, never the command loop: callers are the
     * engine's loader thread. Returns CANCELLED if cancel fires or the
     * track's job is cancelled by cancelAll().
     */
    PrefetchResult acquire(const Track& track, const CancelToken& cancel);

    // Cancel every queued and in-flight download (station switch, quit)
    void cancelAll();

    bool isPending(const std::string& trackId) const;
    size_t pendingCount() const;
    size_t windowPins() const;

private:
    struct Job {
        Track track;
        CancelToken cancel;
        bool done = false;
        Status status;
        CacheHandle pin;                             // Held until the last waiter is done
        std::shared_ptr<const CachedAudio> memory;   // Only if the cache write failed
    };
    using JobPtr = std::shared_ptr<Job>;

    JobPtr scheduleLocked(const Track& track, bool urgent);
    void pinWindowLocked(const std::string& trackId);
    void finishLocked(const JobPtr& job, Status status);
    void workerLoop(size_t index);
    void runJob(const JobPtr& job);

    ServiceClient& m_client;
    TrackCache& m_cache;
    Options m_options;

    mutable std::mutex m_mutex;
    std::condition_variable m_workCv;
    std::condition_variable m_doneCv;
    std::deque<JobPtr> m_queue;
    std::unordered_map<std::string, JobPtr> m_jobs;     // Queued or running, by track id
    std::vector<std::string> m_window;                  // Lookahead ids from ensureReady()
    std::unordered_map<std::string, CacheHandle> m_windowPins;

    std::vector<std::thread> m_workers;
    std::atomic<bool> m_running{false};
};

#endif // STATIONPLAY_PREFETCH_PIPELINE_H
