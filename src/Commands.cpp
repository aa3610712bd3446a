/**
 * @file Commands.cpp
 * @brief Command names and the line-oriented command parser
 */

#include "Commands.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

const char* commandName(CommandType type) {
    switch (type) {
        case CommandType::SELECT_STATION: return "select-station";
        case CommandType::PAUSE:          return "pause";
        case CommandType::RESUME:         return "resume";
        case CommandType::TOGGLE_PAUSE:   return "toggle-pause";
        case CommandType::VOLUME_UP:      return "volume-up";
        case CommandType::VOLUME_DOWN:    return "volume-down";
        case CommandType::SET_VOLUME:     return "set-volume";
        case CommandType::MUTE:           return "mute";
        case CommandType::UNMUTE:         return "unmute";
        case CommandType::TOGGLE_MUTE:    return "toggle-mute";
        case CommandType::SKIP:           return "skip";
        case CommandType::TIRED:          return "tired";
        case CommandType::THUMBS_UP:      return "thumbs-up";
        case CommandType::THUMBS_DOWN:    return "thumbs-down";
        case CommandType::CLEAR_RATING:   return "clear-rating";
        case CommandType::STOP:           return "stop";
        case CommandType::QUIT:           return "quit";
    }
    return "unknown";
}

const char* playerStateName(PlayerState state) {
    switch (state) {
        case PlayerState::IDLE:    return "idle";
        case PlayerState::LOADING: return "loading";
        case PlayerState::PLAYING: return "playing";
        case PlayerState::PAUSED:  return "paused";
        case PlayerState::STOPPED: return "stopped";
    }
    return "unknown";
}

std::optional<Command> parseCommandLine(const std::string& line) {
    size_t start = line.find_first_not_of(" \t");
    if (start == std::string::npos) return std::nullopt;
    size_t end = line.find_last_not_of(" \t\r\n");

    std::string text = line.substr(start, end - start + 1);
    size_t space = text.find(' ');
    std::string word = text.substr(0, space);
    std::string arg;
    if (space != std::string::npos) {
        size_t argStart = text.find_first_not_of(' ', space);
        if (argStart != std::string::npos) arg = text.substr(argStart);
    }
    std::transform(word.begin(), word.end(), word.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (word == "p" || word == "toggle")         return Command{CommandType::TOGGLE_PAUSE};
    if (word == "pause")                         return Command{CommandType::PAUSE};
    if (word == "resume" || word == "play")      return Command{CommandType::RESUME};
    if (word == "n" || word == "skip" || word == "next") return Command{CommandType::SKIP};
    if (word == "t" || word == "tired")          return Command{CommandType::TIRED};
    if (word == "+" || word == "up")             return Command{CommandType::VOLUME_UP};
    if (word == "-" || word == "down")           return Command{CommandType::VOLUME_DOWN};
    if (word == "m" || word == "mute")           return Command{CommandType::TOGGLE_MUTE};
    if (word == "u" || word == "love")           return Command{CommandType::THUMBS_UP};
    if (word == "d" || word == "ban")            return Command{CommandType::THUMBS_DOWN};
    if (word == "c" || word == "clear")          return Command{CommandType::CLEAR_RATING};
    if (word == "x" || word == "stop")           return Command{CommandType::STOP};
    if (word == "q" || word == "quit")           return Command{CommandType::QUIT};

    if (word == "s" || word == "station") {
        if (arg.empty()) return std::nullopt;
        return Command::selectStation(arg);
    }
    if (word == "v" || word == "volume") {
        char* endPtr = nullptr;
        long percent = std::strtol(arg.c_str(), &endPtr, 10);
        if (arg.empty() || *endPtr != '\0' || percent < 0 || percent > 100) {
            return std::nullopt;
        }
        return Command::setVolume(static_cast<float>(percent) / 100.0f);
    }
    return std::nullopt;
}
