/**
 * @file AudioSink.h
 * @brief Audio output commanded by the playback engine
 *
 * The sink owns its own execution context. The finished callback is
 * invoked from that context once the loaded track has played out; it is
 * not invoked after stop().
 */

#ifndef STATIONPLAY_AUDIO_SINK_H
#define STATIONPLAY_AUDIO_SINK_H

#include "Models.h"
#include "Status.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <vector>

class AudioSink {
public:
    using FinishedCallback = std::function<void()>;

    virtual ~AudioSink() = default;

    // Replace whatever is loaded. DECODE_FAILURE / UNSUPPORTED_FORMAT if the
    // bytes cannot be played.
    virtual Status load(const std::vector<uint8_t>& bytes, AudioEncoding encoding) = 0;

    virtual void play() = 0;
    virtual void pause() = 0;
    virtual void stop() = 0;

    // 0.0 (silent) .. 1.0 (full scale)
    virtual void setVolume(float volume) = 0;

    virtual std::chrono::milliseconds position() const = 0;

    virtual void onFinished(FinishedCallback cb) = 0;
};

#endif // STATIONPLAY_AUDIO_SINK_H
