/**
 * @file Mp3Decoder.h
 * @brief MP3 track decoder using libmpg123
 *
 * The whole file is pushed into mpg123 with mpg123_feed() at open(), then
 * read() pulls MPG123_ENC_SIGNED_32 samples with mpg123_read(). ID3v2
 * tags and VBR headers are handled by mpg123; corrupt frames are skipped
 * by its resync.
 */

#ifndef STATIONPLAY_MP3_DECODER_H
#define STATIONPLAY_MP3_DECODER_H

#include "Decoder.h"

#include <mpg123.h>
#include <mutex>
#include <vector>

class Mp3Decoder : public Decoder {
public:
    Mp3Decoder();
    ~Mp3Decoder() override;

    Status open(const uint8_t* data, size_t len) override;
    size_t read(int32_t* out, size_t maxFrames) override;
    PcmFormat format() const override { return m_format; }
    bool isFinished() const override { return m_finished && m_pending.empty(); }
    uint64_t framesRead() const override { return m_framesRead; }

private:
    // Decode one chunk into m_pending; false once nothing more will come
    bool decodeMore();

    mpg123_handle* m_handle = nullptr;

    std::vector<int32_t> m_pending;     // Decoded, not yet read
    size_t m_pendingPos = 0;

    PcmFormat m_format;
    bool m_formatReady = false;
    bool m_finished = false;
    int m_errors = 0;
    uint64_t m_framesRead = 0;

    static std::once_flag s_initFlag;
};

#endif // STATIONPLAY_MP3_DECODER_H
