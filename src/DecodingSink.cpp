/**
 * @file DecodingSink.cpp
 * @brief Decoding audio sink implementation
 */

#include "DecodingSink.h"
#include "LogLevel.h"

#include <algorithm>

namespace {
constexpr size_t CHUNK_FRAMES = 4096;
}

DecodingSink::DecodingSink(std::unique_ptr<PcmOutput> output)
    : m_output(std::move(output))
{
    m_thread = std::thread(&DecodingSink::run, this);
}

DecodingSink::~DecodingSink() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shutdown = true;
        m_session++;
        m_decoder.reset();
    }
    m_cv.notify_all();
    if (m_thread.joinable()) {
        m_thread.join();
    }
    m_output->close();
}

Status DecodingSink::load(const std::vector<uint8_t>& bytes, AudioEncoding encoding) {
    if (encoding == AudioEncoding::UNKNOWN) {
        encoding = Decoder::sniff(bytes.data(), bytes.size());
    }

    std::unique_ptr<Decoder> decoder = Decoder::create(encoding);
    if (!decoder) {
        return Status::error(ErrorCode::UNSUPPORTED_FORMAT,
                             std::string("no decoder for ") + encodingName(encoding));
    }

    auto copy = std::make_shared<const std::vector<uint8_t>>(bytes);
    Status status = decoder->open(copy->data(), copy->size());
    if (!status.ok()) {
        return status;
    }
    const PcmFormat format = decoder->format();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_session++;
        m_decoder = std::move(decoder);
        m_bytes = std::move(copy);
        m_playing = false;
        m_framesPlayed = 0;
        m_sampleRate = format.sampleRate;
    }
    LOG_DEBUG("[Sink] Loaded " << encodingName(encoding) << " track, "
              << format.sampleRate << " Hz, " << format.channels << " ch");
    return Status::success();
}

void DecodingSink::play() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_decoder) return;
        m_playing = true;
    }
    m_cv.notify_all();
}

void DecodingSink::pause() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_playing = false;
}

void DecodingSink::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_session++;
        m_playing = false;
        m_decoder.reset();
        m_bytes.reset();
        m_framesPlayed = 0;
    }
    m_cv.notify_all();

    // Wait out a finished callback that is already running
    std::lock_guard<std::mutex> barrier(m_callbackMutex);
}

void DecodingSink::setVolume(float volume) {
    m_volume = std::min(1.0f, std::max(0.0f, volume));
}

std::chrono::milliseconds DecodingSink::position() const {
    const uint32_t rate = m_sampleRate.load();
    if (rate == 0) return std::chrono::milliseconds(0);
    return std::chrono::milliseconds(m_framesPlayed.load() * 1000 / rate);
}

void DecodingSink::onFinished(FinishedCallback cb) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_finishedCb = std::move(cb);
}

// ============================================
// Playback thread
// ============================================

void DecodingSink::run() {
    std::vector<int32_t> chunk;
    PcmFormat format;

    while (true) {
        uint64_t session = 0;
        size_t frames = 0;
        bool finished = false;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return m_shutdown || (m_playing && m_decoder); });
            if (m_shutdown) break;

            session = m_session;
            format = m_decoder->format();
            chunk.resize(CHUNK_FRAMES * format.channels);
            frames = m_decoder->read(chunk.data(), CHUNK_FRAMES);
            // read() returns 0 only once the track is exhausted
            finished = (frames == 0);
        }

        if (finished) {
            std::lock_guard<std::mutex> cbLock(m_callbackMutex);
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_session != session) continue;
                m_decoder.reset();
                m_bytes.reset();
                m_playing = false;
            }
            LOG_DEBUG("[Sink] Track finished after " << position().count() / 1000 << "s");
            if (m_finishedCb) {
                m_finishedCb();
            }
            continue;
        }

        // Volume as 16.16 fixed point gain
        const int64_t gain = static_cast<int64_t>(m_volume.load() * 65536.0f);
        if (gain < 65536) {
            for (size_t i = 0; i < frames * format.channels; i++) {
                chunk[i] = static_cast<int32_t>((static_cast<int64_t>(chunk[i]) * gain) >> 16);
            }
        }

        Status status = m_output->open(format);
        if (status.ok()) {
            status = m_output->write(chunk.data(), frames);
        }
        if (!status.ok()) {
            LOG_ERROR("[Sink] " << status.message);
            // Do not spin on a dead output
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait_for(lock, std::chrono::milliseconds(500),
                          [this, session] { return m_shutdown || m_session != session; });
            continue;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_session == session) {
            m_framesPlayed += frames;
        }
    }
}
