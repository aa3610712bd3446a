/**
 * @file PcmOutput.h
 * @brief Destination for decoded S32_LE PCM
 */

#ifndef STATIONPLAY_PCM_OUTPUT_H
#define STATIONPLAY_PCM_OUTPUT_H

#include "Decoder.h"
#include "Status.h"

#include <cstdint>
#include <cstdio>
#include <string>

class PcmOutput {
public:
    virtual ~PcmOutput() = default;

    // (Re)configure for a track's format. Re-opening with the same format
    // keeps the device open so consecutive tracks play without a gap.
    virtual Status open(const PcmFormat& format) = 0;

    // Blocks until the frames are accepted (device pacing)
    virtual Status write(const int32_t* samples, size_t frames) = 0;

    virtual void close() = 0;
};

/**
 * @brief Writes raw PCM to an external player's stdin, or to a file
 *
 * The command may contain {rate} and {channels}, substituted on open().
 * Example: "aplay -q -t raw -f S32_LE -c {channels} -r {rate}"
 */
class PipeOutput : public PcmOutput {
public:
    static PipeOutput command(std::string commandTemplate);
    static PipeOutput file(std::string path);

    PipeOutput(PipeOutput&& other) noexcept;
    ~PipeOutput() override;

    PipeOutput(const PipeOutput&) = delete;
    PipeOutput& operator=(const PipeOutput&) = delete;
    PipeOutput& operator=(PipeOutput&&) = delete;

    Status open(const PcmFormat& format) override;
    Status write(const int32_t* samples, size_t frames) override;
    void close() override;

    static std::string expandCommand(const std::string& commandTemplate,
                                     const PcmFormat& format);

private:
    PipeOutput(std::string target, bool isCommand);

    std::string m_target;
    bool m_isCommand;
    FILE* m_stream = nullptr;
    PcmFormat m_format;
};

#endif // STATIONPLAY_PCM_OUTPUT_H
