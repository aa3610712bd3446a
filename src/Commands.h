/**
 * @file Commands.h
 * @brief Command and status types exchanged with the UI layer
 */

#ifndef STATIONPLAY_COMMANDS_H
#define STATIONPLAY_COMMANDS_H

#include "Models.h"
#include "SessionManager.h"

#include <chrono>
#include <optional>
#include <string>

enum class CommandType {
    SELECT_STATION,
    PAUSE,
    RESUME,
    TOGGLE_PAUSE,
    VOLUME_UP,
    VOLUME_DOWN,
    SET_VOLUME,
    MUTE,
    UNMUTE,
    TOGGLE_MUTE,
    SKIP,
    TIRED,
    THUMBS_UP,
    THUMBS_DOWN,
    CLEAR_RATING,
    STOP,
    QUIT
};

struct Command {
    CommandType type;
    std::string stationId;      // SELECT_STATION
    float volume = 0.0f;        // SET_VOLUME

    static Command selectStation(std::string id) {
        Command c{CommandType::SELECT_STATION};
        c.stationId = std::move(id);
        return c;
    }
    static Command setVolume(float v) {
        Command c{CommandType::SET_VOLUME};
        c.volume = v;
        return c;
    }
};

const char* commandName(CommandType type);

/**
 * @brief Parse one line typed by the user into a Command
 *
 * Keys: p (toggle pause), n (skip), t (tired), + / - (volume), v <0-100>,
 * m (mute), u / d / c (thumbs up, down, clear), s <station>, x (stop),
 * q (quit). Long forms such as "skip" or "pause" are accepted too.
 */
std::optional<Command> parseCommandLine(const std::string& line);

enum class PlayerState { IDLE, LOADING, PLAYING, PAUSED, STOPPED };

const char* playerStateName(PlayerState state);

struct PlayerStatus {
    PlayerState state = PlayerState::IDLE;
    std::optional<Station> station;
    std::optional<Track> track;                 // Current track metadata
    std::chrono::milliseconds position{0};
    std::chrono::seconds duration{0};
    float volume = 1.0f;
    bool muted = false;
    SessionManager::State session = SessionManager::State::UNAUTHENTICATED;

    std::string notice;         // Transient problem ("playlist fetch failing, retrying")
    bool authFailed = false;    // Blocking: credentials must be re-entered
};

#endif // STATIONPLAY_COMMANDS_H
