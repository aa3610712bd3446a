/**
 * @file Decoder.cpp
 * @brief Decoder factory and format sniffing
 */

#include "Decoder.h"

#ifdef ENABLE_MP3
#include "Mp3Decoder.h"
#endif
#ifdef ENABLE_AAC
#include "AacDecoder.h"
#endif

std::unique_ptr<Decoder> Decoder::create(AudioEncoding encoding) {
    switch (encoding) {
#ifdef ENABLE_MP3
        case AudioEncoding::MP3:
            return std::make_unique<Mp3Decoder>();
#endif
#ifdef ENABLE_AAC
        case AudioEncoding::AAC_ADTS:
            return std::make_unique<AacDecoder>();
#endif
        default:
            return nullptr;
    }
}

AudioEncoding Decoder::sniff(const uint8_t* data, size_t len) {
    if (len >= 3 && data[0] == 'I' && data[1] == 'D' && data[2] == '3') {
        return AudioEncoding::MP3;
    }
    if (len < 2 || data[0] != 0xFF || (data[1] & 0xE0) != 0xE0) {
        return AudioEncoding::UNKNOWN;
    }

    // 12-bit sync + layer 00 is ADTS; MPEG audio has a non-zero layer
    if ((data[1] & 0xF0) == 0xF0 && (data[1] & 0x06) == 0x00) {
        return AudioEncoding::AAC_ADTS;
    }
    if ((data[1] & 0x06) != 0x00) {
        return AudioEncoding::MP3;
    }
    return AudioEncoding::UNKNOWN;
}
