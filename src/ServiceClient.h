/**
 * @file ServiceClient.h
 * @brief Remote radio service capability consumed by the playback core
 *
 * The wire protocol lives behind this interface. Implementations must be
 * safe to call from several threads at once (loader, prefetch workers,
 * feedback worker) and must report failures with the ErrorCode that
 * matches their cause:
 *   - rejected login          -> INVALID_CREDENTIALS
 *   - expired/unknown token   -> SESSION_EXPIRED
 *   - throttling              -> RATE_LIMITED
 *   - unparseable reply       -> MALFORMED_RESPONSE
 *   - cannot reach service    -> CONNECTION_FAILURE
 */

#ifndef STATIONPLAY_SERVICE_CLIENT_H
#define STATIONPLAY_SERVICE_CLIENT_H

#include "CancelToken.h"
#include "Models.h"
#include "Status.h"

#include <cstdint>
#include <vector>

class ServiceClient {
public:
    virtual ~ServiceClient() = default;

    virtual Status authenticate(const Credentials& credentials, SessionToken& out) = 0;

    virtual Status listStations(const SessionToken& session,
                                std::vector<Station>& out) = 0;

    // One page of upcoming tracks for the station
    virtual Status getPlaylist(const SessionToken& session, const Station& station,
                               std::vector<Track>& out) = 0;

    // Fetch the audio bytes behind a track's URL. Checks cancel between reads.
    virtual Status downloadTrackAudio(const std::string& url, const CancelToken& cancel,
                                      std::vector<uint8_t>& out) = 0;

    // Rating::UNRATED removes any existing feedback
    virtual Status rateTrack(const SessionToken& session, const Track& track,
                             Rating rating) = 0;

    virtual Status markTired(const SessionToken& session, const Track& track) = 0;
};

#endif // STATIONPLAY_SERVICE_CLIENT_H
