/**
 * @file AacDecoder.h
 * @brief ADTS AAC track decoder using fdk-aac
 *
 * The encoded file is handed to aacDecoder_Fill() in slices as the
 * decoder's internal buffer drains; aacDecoder_DecodeFrame() produces one
 * frame at a time. HE-AAC (SBR) and HE-AAC v2 (PS) are decoded natively,
 * mono PS streams come out as stereo.
 */

#ifndef STATIONPLAY_AAC_DECODER_H
#define STATIONPLAY_AAC_DECODER_H

#include "Decoder.h"

#include <fdk-aac/aacdecoder_lib.h>
#include <vector>

class AacDecoder : public Decoder {
public:
    AacDecoder();
    ~AacDecoder() override;

    Status open(const uint8_t* data, size_t len) override;
    size_t read(int32_t* out, size_t maxFrames) override;
    PcmFormat format() const override { return m_format; }
    bool isFinished() const override { return m_finished && m_pending.empty(); }
    uint64_t framesRead() const override { return m_framesRead; }

private:
    bool decodeFrame();

    HANDLE_AACDECODER m_handle = nullptr;

    const uint8_t* m_input = nullptr;
    size_t m_inputLen = 0;
    size_t m_inputPos = 0;

    std::vector<INT_PCM> m_frame;       // One decoded frame from fdk-aac
    std::vector<int32_t> m_pending;     // S32 MSB-aligned, not yet read

    PcmFormat m_format;
    bool m_formatReady = false;
    bool m_finished = false;
    int m_errors = 0;
    uint64_t m_framesRead = 0;
};

#endif // STATIONPLAY_AAC_DECODER_H
