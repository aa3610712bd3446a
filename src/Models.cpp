/**
 * @file Models.cpp
 * @brief Enum names for the data model
 */

#include "Models.h"

#include <algorithm>
#include <cctype>

const char* ratingName(Rating rating) {
    switch (rating) {
        case Rating::UNRATED:     return "unrated";
        case Rating::THUMBS_UP:   return "thumbs up";
        case Rating::THUMBS_DOWN: return "thumbs down";
    }
    return "unrated";
}

const char* encodingName(AudioEncoding encoding) {
    switch (encoding) {
        case AudioEncoding::MP3:      return "MP3";
        case AudioEncoding::AAC_ADTS: return "AAC (ADTS)";
        case AudioEncoding::UNKNOWN:  break;
    }
    return "unknown";
}

const char* encodingExtension(AudioEncoding encoding) {
    switch (encoding) {
        case AudioEncoding::MP3:      return "mp3";
        case AudioEncoding::AAC_ADTS: return "aac";
        case AudioEncoding::UNKNOWN:  break;
    }
    return "bin";
}

AudioEncoding encodingFromExtension(const std::string& ext) {
    std::string lower = ext;
    if (!lower.empty() && lower[0] == '.') lower.erase(0, 1);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "mp3") return AudioEncoding::MP3;
    if (lower == "aac" || lower == "adts") return AudioEncoding::AAC_ADTS;
    return AudioEncoding::UNKNOWN;
}
