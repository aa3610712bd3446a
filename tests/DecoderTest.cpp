/**
 * @file DecoderTest.cpp
 * @brief Format sniffing and PCM output helpers
 */

#include "Decoder.h"
#include "PcmOutput.h"

#include <gtest/gtest.h>

#include <cstdint>

TEST(DecoderTest, SniffId3AsMp3) {
    const uint8_t data[] = {'I', 'D', '3', 0x04, 0x00};
    EXPECT_EQ(Decoder::sniff(data, sizeof(data)), AudioEncoding::MP3);
}

TEST(DecoderTest, SniffMpegFrameSync) {
    // MPEG-1 Layer III
    const uint8_t data[] = {0xFF, 0xFB, 0x90, 0x64};
    EXPECT_EQ(Decoder::sniff(data, sizeof(data)), AudioEncoding::MP3);
}

TEST(DecoderTest, SniffAdts) {
    const uint8_t data[] = {0xFF, 0xF1, 0x50, 0x80};
    EXPECT_EQ(Decoder::sniff(data, sizeof(data)), AudioEncoding::AAC_ADTS);
}

TEST(DecoderTest, SniffUnknown) {
    const uint8_t riff[] = {'R', 'I', 'F', 'F'};
    EXPECT_EQ(Decoder::sniff(riff, sizeof(riff)), AudioEncoding::UNKNOWN);
    EXPECT_EQ(Decoder::sniff(riff, 1), AudioEncoding::UNKNOWN);
    EXPECT_EQ(Decoder::sniff(nullptr, 0), AudioEncoding::UNKNOWN);
}

TEST(DecoderTest, NoDecoderForUnknownEncoding) {
    EXPECT_EQ(Decoder::create(AudioEncoding::UNKNOWN), nullptr);
}

TEST(DecoderTest, OutputCommandSubstitution) {
    PcmFormat format;
    format.sampleRate = 44100;
    format.channels = 2;
    format.bitDepth = 32;
    EXPECT_EQ(PipeOutput::expandCommand("aplay -c {channels} -r {rate} -", format),
              "aplay -c 2 -r 44100 -");
    EXPECT_EQ(PipeOutput::expandCommand("cat > /dev/null", format), "cat > /dev/null");
}
