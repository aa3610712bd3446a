/**
 * @file DecodingSink.h
 * @brief AudioSink that decodes tracks and streams PCM to a PcmOutput
 *
 * A dedicated playback thread pulls frames from the loaded track's
 * decoder, applies the volume and writes them to the output, which paces
 * the thread. Position is derived from the frames written.
 */

#ifndef STATIONPLAY_DECODING_SINK_H
#define STATIONPLAY_DECODING_SINK_H

#include "AudioSink.h"
#include "Decoder.h"
#include "PcmOutput.h"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

class DecodingSink : public AudioSink {
public:
    explicit DecodingSink(std::unique_ptr<PcmOutput> output);
    ~DecodingSink() override;

    // Non-copyable
    DecodingSink(const DecodingSink&) = delete;
    DecodingSink& operator=(const DecodingSink&) = delete;

    Status load(const std::vector<uint8_t>& bytes, AudioEncoding encoding) override;
    void play() override;
    void pause() override;
    void stop() override;
    void setVolume(float volume) override;
    std::chrono::milliseconds position() const override;
    void onFinished(FinishedCallback cb) override;

private:
    void run();

    std::unique_ptr<PcmOutput> m_output;

    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::shared_ptr<const std::vector<uint8_t>> m_bytes;    // Backing store for m_decoder
    std::unique_ptr<Decoder> m_decoder;
    uint64_t m_session = 0;         // Bumped on every load/stop
    bool m_playing = false;
    bool m_shutdown = false;

    std::atomic<float> m_volume{1.0f};
    std::atomic<uint64_t> m_framesPlayed{0};
    std::atomic<uint32_t> m_sampleRate{0};

    // Held while the finished callback runs; stop() waits on it
    std::mutex m_callbackMutex;
    FinishedCallback m_finishedCb;

    std::thread m_thread;
};

#endif // STATIONPLAY_DECODING_SINK_H
