/**
 * @file Mp3Decoder.cpp
 * @brief MP3 track decoder implementation using libmpg123
 *
 * mpg123 runs in feed mode over the complete file:
 * - MPG123_NEW_FORMAT reports sample rate and channel count
 * - MPG123_NEED_MORE / MPG123_DONE mean the file is exhausted
 * - MPG123_ERR on a damaged frame is retried a few times (mpg123 resyncs)
 *
 * Output is MPG123_ENC_SIGNED_32, already full-scale and MSB-aligned.
 */

#include "Mp3Decoder.h"
#include "LogLevel.h"

#include <algorithm>
#include <cstring>

namespace {
constexpr int MAX_DECODE_ERRORS = 16;
}

std::once_flag Mp3Decoder::s_initFlag;

Mp3Decoder::Mp3Decoder() {
    std::call_once(s_initFlag, [] {
        mpg123_init();
    });
    m_pending.reserve(16384);
}

Mp3Decoder::~Mp3Decoder() {
    if (m_handle) {
        mpg123_close(m_handle);
        mpg123_delete(m_handle);
    }
}

Status Mp3Decoder::open(const uint8_t* data, size_t len) {
    int err = MPG123_OK;
    m_handle = mpg123_new(nullptr, &err);
    if (!m_handle) {
        return Status::error(ErrorCode::DECODE_FAILURE,
                             std::string("mpg123_new: ") + mpg123_plain_strerror(err));
    }

    mpg123_param(m_handle, MPG123_ADD_FLAGS, MPG123_QUIET, 0.0);

    if (mpg123_open_feed(m_handle) != MPG123_OK) {
        return Status::error(ErrorCode::DECODE_FAILURE,
                             std::string("mpg123_open_feed: ") + mpg123_strerror(m_handle));
    }

    // Any rate, mono or stereo, 32-bit signed output
    mpg123_format_none(m_handle);
    const long rates[] = {
        8000, 11025, 12000, 16000, 22050, 24000,
        32000, 44100, 48000
    };
    for (long rate : rates) {
        mpg123_format(m_handle, rate, MPG123_MONO | MPG123_STEREO, MPG123_ENC_SIGNED_32);
    }

    if (mpg123_feed(m_handle, data, len) != MPG123_OK) {
        return Status::error(ErrorCode::DECODE_FAILURE,
                             std::string("mpg123_feed: ") + mpg123_strerror(m_handle));
    }

    // Decode until the first format announcement
    while (!m_formatReady) {
        if (!decodeMore()) break;
    }
    if (!m_formatReady) {
        return Status::error(ErrorCode::DECODE_FAILURE, "no MPEG audio frames found");
    }

    LOG_DEBUG("[MP3] " << m_format.sampleRate << " Hz, " << m_format.channels << " ch");
    return Status::success();
}

bool Mp3Decoder::decodeMore() {
    if (m_finished) return false;

    unsigned char buffer[1152 * 2 * sizeof(int32_t)];
    size_t done = 0;
    int ret = mpg123_read(m_handle, buffer, sizeof(buffer), &done);

    if (ret == MPG123_NEW_FORMAT) {
        long rate = 0;
        int channels = 0;
        int encoding = 0;
        mpg123_getformat(m_handle, &rate, &channels, &encoding);

        if (m_formatReady && (static_cast<uint32_t>(rate) != m_format.sampleRate ||
                              static_cast<uint32_t>(channels) != m_format.channels)) {
            LOG_WARN("[MP3] Format change mid-track ignored: " << rate << " Hz, "
                     << channels << " ch");
        } else {
            m_format.sampleRate = static_cast<uint32_t>(rate);
            m_format.channels = static_cast<uint32_t>(channels);
            m_format.bitDepth = 32;
            m_formatReady = true;
        }
    }

    if (done > 0) {
        const int32_t* samples = reinterpret_cast<const int32_t*>(buffer);
        m_pending.insert(m_pending.end(), samples, samples + done / sizeof(int32_t));
    }

    switch (ret) {
        case MPG123_NEED_MORE:
        case MPG123_DONE:
            // Everything was fed at open(): no more input will come
            m_finished = true;
            return false;
        case MPG123_ERR:
            if (++m_errors > MAX_DECODE_ERRORS) {
                LOG_WARN("[MP3] Too many decode errors, ending track: "
                         << mpg123_strerror(m_handle));
                m_finished = true;
                return false;
            }
            LOG_DEBUG("[MP3] Decode error (resyncing): " << mpg123_strerror(m_handle));
            return true;
        default:
            return true;
    }
}

size_t Mp3Decoder::read(int32_t* out, size_t maxFrames) {
    if (!m_formatReady || m_format.channels == 0) return 0;
    const size_t channels = m_format.channels;

    while ((m_pending.size() - m_pendingPos) / channels < maxFrames) {
        if (!decodeMore()) break;
    }

    size_t frames = std::min((m_pending.size() - m_pendingPos) / channels, maxFrames);
    if (frames == 0) {
        // Drop a trailing partial frame
        if (m_finished) {
            m_pending.clear();
            m_pendingPos = 0;
        }
        return 0;
    }

    std::memcpy(out, m_pending.data() + m_pendingPos, frames * channels * sizeof(int32_t));
    m_pendingPos += frames * channels;
    m_framesRead += frames;

    m_pending.erase(m_pending.begin(), m_pending.begin() + m_pendingPos);
    m_pendingPos = 0;
    return frames;
}
