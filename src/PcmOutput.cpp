/**
 * @file PcmOutput.cpp
 * @brief Pipe/file PCM output implementation
 */

#include "PcmOutput.h"
#include "LogLevel.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>

namespace {

std::once_flag s_sigpipeFlag;

void replaceAll(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

PipeOutput PipeOutput::command(std::string commandTemplate) {
    return PipeOutput(std::move(commandTemplate), true);
}

PipeOutput PipeOutput::file(std::string path) {
    return PipeOutput(std::move(path), false);
}

PipeOutput::PipeOutput(std::string target, bool isCommand)
    : m_target(std::move(target))
    , m_isCommand(isCommand)
{
    if (m_isCommand) {
        // A player that exits must surface as a write error, not kill us
        std::call_once(s_sigpipeFlag, [] { std::signal(SIGPIPE, SIG_IGN); });
    }
}

PipeOutput::PipeOutput(PipeOutput&& other) noexcept
    : m_target(std::move(other.m_target))
    , m_isCommand(other.m_isCommand)
    , m_stream(other.m_stream)
    , m_format(other.m_format)
{
    other.m_stream = nullptr;
}

PipeOutput::~PipeOutput() {
    close();
}

std::string PipeOutput::expandCommand(const std::string& commandTemplate,
                                      const PcmFormat& format) {
    std::string cmd = commandTemplate;
    replaceAll(cmd, "{rate}", std::to_string(format.sampleRate));
    replaceAll(cmd, "{channels}", std::to_string(format.channels));
    return cmd;
}

Status PipeOutput::open(const PcmFormat& format) {
    if (m_stream && format.sampleRate == m_format.sampleRate &&
        format.channels == m_format.channels) {
        return Status::success();
    }
    close();

    if (m_isCommand) {
        std::string cmd = expandCommand(m_target, format);
        LOG_DEBUG("[Output] Starting: " << cmd);
        m_stream = popen(cmd.c_str(), "w");
        if (!m_stream) {
            return Status::error(ErrorCode::DECODE_FAILURE,
                                 "cannot start '" + cmd + "': " + std::strerror(errno));
        }
    } else {
        m_stream = std::fopen(m_target.c_str(), "ab");
        if (!m_stream) {
            return Status::error(ErrorCode::DECODE_FAILURE,
                                 "cannot open " + m_target + ": " + std::strerror(errno));
        }
    }

    m_format = format;
    LOG_DEBUG("[Output] " << format.sampleRate << " Hz, " << format.channels << " ch, S32_LE");
    return Status::success();
}

Status PipeOutput::write(const int32_t* samples, size_t frames) {
    if (!m_stream) {
        return Status::error(ErrorCode::DECODE_FAILURE, "output not open");
    }
    const size_t count = frames * m_format.channels;
    if (std::fwrite(samples, sizeof(int32_t), count, m_stream) != count) {
        Status status = Status::error(ErrorCode::DECODE_FAILURE,
                                      std::string("output write failed: ") + std::strerror(errno));
        close();
        return status;
    }
    return Status::success();
}

void PipeOutput::close() {
    if (!m_stream) return;

    if (m_isCommand) {
        int rc = pclose(m_stream);
        if (rc != 0) {
            LOG_DEBUG("[Output] Player exited with status " << rc);
        }
    } else {
        std::fclose(m_stream);
    }
    m_stream = nullptr;
    m_format = PcmFormat();
}
