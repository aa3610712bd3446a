/**
 * @file AacDecoder.cpp
 * @brief ADTS AAC track decoder implementation using fdk-aac
 *
 * INT_PCM output (16-bit) is shifted left by 16 to S32 MSB-aligned.
 * The output sample rate is the post-SBR rate from CStreamInfo, not the
 * core AAC rate.
 */

#include "AacDecoder.h"
#include "LogLevel.h"

#include <algorithm>
#include <cstring>

namespace {
constexpr int MAX_DECODE_ERRORS = 16;
constexpr int PCM_SHIFT = 16;
}

AacDecoder::AacDecoder() {
    m_frame.resize(2048 * 2);   // Max frame length * output channels
    m_pending.reserve(16384);
}

AacDecoder::~AacDecoder() {
    if (m_handle) {
        aacDecoder_Close(m_handle);
    }
}

Status AacDecoder::open(const uint8_t* data, size_t len) {
    m_handle = aacDecoder_Open(TT_MP4_ADTS, 1 /* nrOfLayers */);
    if (!m_handle) {
        return Status::error(ErrorCode::DECODE_FAILURE, "aacDecoder_Open failed");
    }
    aacDecoder_SetParam(m_handle, AAC_PCM_MAX_OUTPUT_CHANNELS, 2);

    m_input = data;
    m_inputLen = len;
    m_inputPos = 0;

    while (!m_formatReady) {
        if (!decodeFrame()) break;
    }
    if (!m_formatReady) {
        return Status::error(ErrorCode::DECODE_FAILURE, "no ADTS frames found");
    }

    LOG_DEBUG("[AAC] " << m_format.sampleRate << " Hz, " << m_format.channels << " ch");
    return Status::success();
}

bool AacDecoder::decodeFrame() {
    if (m_finished) return false;

    while (true) {
        // Top up fdk-aac's internal buffer from the file
        if (m_inputPos < m_inputLen) {
            UCHAR* slice = const_cast<UCHAR*>(m_input + m_inputPos);
            UINT size = static_cast<UINT>(std::min<size_t>(m_inputLen - m_inputPos, 65536));
            UINT valid = size;
            aacDecoder_Fill(m_handle, &slice, &size, &valid);
            m_inputPos += size - valid;
        }

        AAC_DECODER_ERROR err = aacDecoder_DecodeFrame(
            m_handle, m_frame.data(), static_cast<INT>(m_frame.size()), 0);

        if (err == AAC_DEC_OK) {
            CStreamInfo* info = aacDecoder_GetStreamInfo(m_handle);
            if (!info || info->frameSize <= 0 || info->numChannels <= 0) continue;

            if (!m_formatReady) {
                m_format.sampleRate = static_cast<uint32_t>(info->sampleRate);
                m_format.channels = static_cast<uint32_t>(info->numChannels);
                m_format.bitDepth = 16;
                m_formatReady = true;
            } else if (static_cast<uint32_t>(info->numChannels) != m_format.channels) {
                // Output layout is fixed once the sink is configured
                LOG_DEBUG("[AAC] Dropping frame with " << info->numChannels << " ch");
                continue;
            }

            const int samples = info->frameSize * info->numChannels;
            for (int i = 0; i < samples; i++) {
                m_pending.push_back(static_cast<int32_t>(m_frame[i]) << PCM_SHIFT);
            }
            return true;
        }

        if (err == AAC_DEC_NOT_ENOUGH_BITS) {
            if (m_inputPos >= m_inputLen) {
                m_finished = true;
                return false;
            }
            continue;
        }

        if (err == AAC_DEC_TRANSPORT_SYNC_ERROR) {
            LOG_DEBUG("[AAC] Transport sync error (resyncing)");
        } else {
            LOG_DEBUG("[AAC] Decode error 0x" << std::hex << err << std::dec);
        }
        if (++m_errors > MAX_DECODE_ERRORS || m_inputPos >= m_inputLen) {
            if (m_inputPos < m_inputLen) {
                LOG_WARN("[AAC] Too many decode errors, ending track");
            }
            m_finished = true;
            return false;
        }
    }
}

size_t AacDecoder::read(int32_t* out, size_t maxFrames) {
    if (!m_formatReady || m_format.channels == 0) return 0;
    const size_t channels = m_format.channels;

    while (m_pending.size() / channels < maxFrames) {
        if (!decodeFrame()) break;
    }

    size_t frames = std::min(m_pending.size() / channels, maxFrames);
    if (frames == 0) {
        if (m_finished) m_pending.clear();
        return 0;
    }

    const size_t samples = frames * channels;
    std::memcpy(out, m_pending.data(), samples * sizeof(int32_t));
    m_pending.erase(m_pending.begin(), m_pending.begin() + samples);
    m_framesRead += frames;
    return frames;
}
