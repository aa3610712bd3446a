/**
 * @file PrefetchPipeline.cpp
 * @brief Track prefetch worker pool implementation
 */

#include "PrefetchPipeline.h"
#include "LogLevel.h"

#include <algorithm>

PrefetchPipeline::PrefetchPipeline(ServiceClient& client, TrackCache& cache, Options options)
    : m_client(client)
    , m_cache(cache)
    , m_options(options)
{
    m_options.lookahead = std::max<size_t>(m_options.lookahead, 1);
    m_options.workers = std::max<size_t>(m_options.workers, 1);
}

PrefetchPipeline::~PrefetchPipeline() {
    stop();
}

// ============================================
// Lifecycle
// ============================================

void PrefetchPipeline::start() {
    if (m_running.exchange(true)) return;

    for (size_t i = 0; i < m_options.workers; i++) {
        m_workers.emplace_back(&PrefetchPipeline::workerLoop, this, i);
    }
    LOG_DEBUG("[Prefetch] Started " << m_options.workers << " worker(s), lookahead "
              << m_options.lookahead);
}

void PrefetchPipeline::stop() {
    if (!m_running.exchange(false)) return;

    cancelAll();
    m_workCv.notify_all();
    m_doneCv.notify_all();

    for (auto& t : m_workers) {
        if (t.joinable()) t.join();
    }
    m_workers.clear();
    LOG_DEBUG("[Prefetch] Stopped");
}

// ============================================
// Scheduling
// ============================================

PrefetchPipeline::JobPtr PrefetchPipeline::scheduleLocked(const Track& track, bool urgent) {
    auto it = m_jobs.find(track.id);
    if (it != m_jobs.end()) {
        if (urgent) {
            // Move a queued job to the front; a running one is not in the queue
            auto qit = std::find(m_queue.begin(), m_queue.end(), it->second);
            if (qit != m_queue.end() && qit != m_queue.begin()) {
                JobPtr job = *qit;
                m_queue.erase(qit);
                m_queue.push_front(job);
            }
        }
        return it->second;
    }

    auto job = std::make_shared<Job>();
    job->track = track;
    m_jobs[track.id] = job;
    if (urgent) {
        m_queue.push_front(job);
    } else {
        m_queue.push_back(job);
    }
    m_workCv.notify_one();

    LOG_DEBUG("[Prefetch] Queued \"" << track.title << "\" (" << track.id << ")"
              << (urgent ? " [urgent]" : ""));
    return job;
}

void PrefetchPipeline::finishLocked(const JobPtr& job, Status status) {
    job->done = true;
    job->status = std::move(status);

    auto it = m_jobs.find(job->track.id);
    if (it != m_jobs.end() && it->second == job) {
        m_jobs.erase(it);
    }
    m_doneCv.notify_all();
}

void PrefetchPipeline::ensureReady(const std::vector<Track>& upcoming) {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_window.clear();
    for (const auto& track : upcoming) {
        if (m_window.size() >= m_options.lookahead) break;
        m_window.push_back(track.id);
    }

    // Release pins that fell out of the window
    for (auto it = m_windowPins.begin(); it != m_windowPins.end();) {
        if (std::find(m_window.begin(), m_window.end(), it->first) == m_window.end()) {
            it = m_windowPins.erase(it);
        } else {
            ++it;
        }
    }

    for (size_t i = 0; i < m_window.size(); i++) {
        const Track& track = upcoming[i];
        if (m_cache.contains(track.id)) {
            pinWindowLocked(track.id);
            continue;
        }
        scheduleLocked(track, false);
    }
}

void PrefetchPipeline::pinWindowLocked(const std::string& trackId) {
    if (m_windowPins.count(trackId)) return;
    if (std::find(m_window.begin(), m_window.end(), trackId) == m_window.end()) return;

    CacheHandle handle = m_cache.pin(trackId);
    if (handle.valid()) {
        m_windowPins.emplace(trackId, std::move(handle));
    }
}

PrefetchResult PrefetchPipeline::acquire(const Track& track, const CancelToken& cancel) {
    PrefetchResult result;

    // Cache hit: pin first so the entry cannot be evicted under us
    {
        CacheHandle handle = m_cache.pin(track.id);
        if (handle.valid()) {
            auto audio = m_cache.get(track.id);
            if (audio) {
                LOG_DEBUG("[Prefetch] Cache hit for \"" << track.title << "\"");
                result.handle = std::move(handle);
                result.audio = std::make_shared<const CachedAudio>(std::move(*audio));
                return result;
            }
            // Unreadable entry was dropped by get(): download again below
        }
    }

    std::unique_lock<std::mutex> lock(m_mutex);
    if (!m_running.load(std::memory_order_acquire)) {
        result.status = Status::error(ErrorCode::CANCELLED, "prefetch pipeline stopped");
        return result;
    }

    JobPtr job;
    if (m_cache.contains(track.id)) {
        // Finished between the check above and taking the lock
        lock.unlock();
        return acquire(track, cancel);
    }
    job = scheduleLocked(track, true);

    while (!job->done) {
        if (cancel.isCancelled() || !m_running.load(std::memory_order_acquire)) {
            result.status = Status::error(ErrorCode::CANCELLED, "waiting for " + track.id);
            return result;
        }
        m_doneCv.wait_for(lock, std::chrono::milliseconds(50));
    }

    if (!job->status.ok()) {
        result.status = job->status;
        return result;
    }

    if (job->memory) {
        // Cache write failed; play from memory without a pin
        result.audio = job->memory;
        return result;
    }

    result.handle = m_cache.pin(track.id);
    lock.unlock();

    auto audio = m_cache.get(track.id);
    if (!audio) {
        result.handle.release();
        result.status = Status::error(ErrorCode::CACHE_IO_FAILURE,
                                      "cached audio for " + track.id + " disappeared");
        return result;
    }
    result.audio = std::make_shared<const CachedAudio>(std::move(*audio));
    return result;
}

void PrefetchPipeline::cancelAll() {
    std::lock_guard<std::mutex> lock(m_mutex);

    size_t cancelled = m_jobs.size();
    for (auto& entry : m_jobs) {
        entry.second->cancel.cancel();
    }
    for (auto& job : m_queue) {
        job->done = true;
        job->status = Status::error(ErrorCode::CANCELLED, "download cancelled");
    }
    m_queue.clear();
    m_jobs.clear();
    m_window.clear();
    m_windowPins.clear();
    m_doneCv.notify_all();

    if (cancelled > 0) {
        LOG_DEBUG("[Prefetch] Cancelled " << cancelled << " download(s)");
    }
}

bool PrefetchPipeline::isPending(const std::string& trackId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_jobs.count(trackId) > 0;
}

size_t PrefetchPipeline::pendingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_jobs.size();
}

size_t PrefetchPipeline::windowPins() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_windowPins.size();
}

// ============================================
// Workers
// ============================================

void PrefetchPipeline::workerLoop(size_t index) {
    LOG_DEBUG("[Prefetch] Worker " << index << " running");

    while (true) {
        JobPtr job;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_workCv.wait(lock, [this] {
                return !m_queue.empty() || !m_running.load(std::memory_order_acquire);
            });
            if (!m_running.load(std::memory_order_acquire)) break;

            job = m_queue.front();
            m_queue.pop_front();
        }

        runJob(job);
    }

    LOG_DEBUG("[Prefetch] Worker " << index << " exiting");
}

void PrefetchPipeline::runJob(const JobPtr& job) {
    const Track& track = job->track;

    // Already cached (e.g. by a previous run or a racing job)
    if (m_cache.contains(track.id)) {
        std::lock_guard<std::mutex> lock(m_mutex);
        job->pin = m_cache.pin(track.id);
        pinWindowLocked(track.id);
        finishLocked(job, Status::success());
        return;
    }

    LOG_INFO("[Prefetch] Downloading \"" << track.title << "\" by " << track.artist);

    std::vector<uint8_t> bytes;
    std::string what = "download of \"" + track.title + "\"";
    Status status = retryWithBackoff(m_options.retry, job->cancel, what.c_str(), [&]() {
        bytes.clear();
        Status s = m_client.downloadTrackAudio(track.audioUrl, job->cancel, bytes);
        if (s.ok() && bytes.empty()) {
            s = Status::error(ErrorCode::MALFORMED_RESPONSE, "empty audio body");
        }
        return s;
    });

    if (status.ok() && job->cancel.isCancelled()) {
        status = Status::error(ErrorCode::CANCELLED, "download cancelled");
    }

    if (!status.ok()) {
        if (status.code != ErrorCode::CANCELLED) {
            LOG_WARN("[Prefetch] Giving up on \"" << track.title << "\": " << status);
            status = Status::error(ErrorCode::DOWNLOAD_UNRETRYABLE, status.toString());
        } else {
            LOG_DEBUG("[Prefetch] Download of \"" << track.title << "\" cancelled");
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        finishLocked(job, status);
        return;
    }

    // Not interrupted once started, so the entry is never left half written
    CacheHandle pin;
    Status cacheStatus = m_cache.put(track.id, bytes, track.encoding, &pin);

    std::lock_guard<std::mutex> lock(m_mutex);
    if (cacheStatus.ok()) {
        job->pin = std::move(pin);
        pinWindowLocked(track.id);
        LOG_DEBUG("[Prefetch] \"" << track.title << "\" ready (" << bytes.size() << " bytes)");
    } else {
        LOG_WARN("[Prefetch] Could not cache \"" << track.title << "\": " << cacheStatus
                 << " (keeping it in memory)");
        auto audio = std::make_shared<CachedAudio>();
        audio->bytes = std::move(bytes);
        audio->encoding = track.encoding;
        job->memory = std::move(audio);
    }
    finishLocked(job, Status::success());
}
