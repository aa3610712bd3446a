/**
 * @file TiredList.h
 * @brief Tracks the user marked "tired of", until their cooldown ends
 *
 * The service stops returning a tired track eventually, but a freshly
 * fetched playlist can still contain it. Every playlist page passes
 * through filter() before it is queued.
 */

#ifndef STATIONPLAY_TIRED_LIST_H
#define STATIONPLAY_TIRED_LIST_H

#include "Models.h"

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

class TiredList {
public:
    void mark(const std::string& trackId, Clock::time_point until);
    bool isTired(const std::string& trackId, Clock::time_point now = Clock::now()) const;

    /**
     * @brief Remove tracks that are still cooling down
     * @return Number of tracks removed
     */
    size_t filter(std::vector<Track>& tracks, Clock::time_point now = Clock::now());

    size_t size() const;

private:
    void purgeLocked(Clock::time_point now);

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Clock::time_point> m_until;
};

#endif // STATIONPLAY_TIRED_LIST_H
