/**
 * @file TiredList.cpp
 * @brief Tired track registry
 */

#include "TiredList.h"
#include "LogLevel.h"

#include <algorithm>

void TiredList::mark(const std::string& trackId, Clock::time_point until) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto& current = m_until[trackId];
    current = std::max(current, until);
}

bool TiredList::isTired(const std::string& trackId, Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_until.find(trackId);
    return it != m_until.end() && it->second > now;
}

size_t TiredList::filter(std::vector<Track>& tracks, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(m_mutex);
    purgeLocked(now);

    size_t before = tracks.size();
    tracks.erase(std::remove_if(tracks.begin(), tracks.end(), [&](const Track& t) {
        if (t.isTired(now)) return true;
        auto it = m_until.find(t.id);
        if (it != m_until.end() && it->second > now) {
            LOG_DEBUG("[Tired] Dropping \"" << t.title << "\" from playlist");
            return true;
        }
        return false;
    }), tracks.end());
    return before - tracks.size();
}

size_t TiredList::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_until.size();
}

void TiredList::purgeLocked(Clock::time_point now) {
    for (auto it = m_until.begin(); it != m_until.end();) {
        if (it->second <= now) {
            it = m_until.erase(it);
        } else {
            ++it;
        }
    }
}
