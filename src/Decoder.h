/**
 * @file Decoder.h
 * @brief Abstract decoder for a complete, in-memory track file
 *
 * Tracks arrive whole from the TrackCache, so a decoder is opened on the
 * full encoded buffer and then drained. Output is S32_LE interleaved,
 * MSB-aligned, whatever the source bit depth.
 */

#ifndef STATIONPLAY_DECODER_H
#define STATIONPLAY_DECODER_H

#include "Models.h"
#include "Status.h"

#include <cstddef>
#include <cstdint>
#include <memory>

struct PcmFormat {
    uint32_t sampleRate = 0;
    uint32_t channels = 0;
    uint32_t bitDepth = 0;      // Source precision (16 for AAC, 32 for mpg123 output)
};

class Decoder {
public:
    virtual ~Decoder() = default;

    // Non-copyable
    Decoder() = default;
    Decoder(const Decoder&) = delete;
    Decoder& operator=(const Decoder&) = delete;

    /**
     * @brief Start decoding data[0..len) and determine the output format
     *
     * The buffer must stay alive until the decoder is destroyed.
     * @return DECODE_FAILURE if not a single frame can be decoded
     */
    virtual Status open(const uint8_t* data, size_t len) = 0;

    /**
     * @brief Read decoded frames
     * @param out Buffer for maxFrames * channels samples
     * @return Frames written; 0 once the track is exhausted
     */
    virtual size_t read(int32_t* out, size_t maxFrames) = 0;

    virtual PcmFormat format() const = 0;
    virtual bool isFinished() const = 0;

    // Frames handed out by read() so far
    virtual uint64_t framesRead() const = 0;

    /**
     * @brief Create a decoder for the encoding
     * @return nullptr if the encoding is not compiled in
     */
    static std::unique_ptr<Decoder> create(AudioEncoding encoding);

    /**
     * @brief Guess the encoding from the first bytes of a file
     *
     * ID3v2 tags and MPEG audio sync words give MP3; an ADTS header gives
     * AAC_ADTS.
     */
    static AudioEncoding sniff(const uint8_t* data, size_t len);
};

#endif // STATIONPLAY_DECODER_H
