#pragma once

#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace protocol {

// One catalog entry. Integers are -1 and strings empty when the server
// omitted the field.
struct MediaItem {
    std::string id;  // "<session-id>-<item-id>"
    std::string uri;
    int64_t track_number = -1;
    std::string title;
    std::string album;
    std::string artist;
    std::string genre;
    int64_t duration = -1;  // milliseconds
    int64_t size = -1;      // bytes
    int64_t bitrate = -1;   // kbit/s
    int64_t year = -1;
    std::string format;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(MediaItem, id, uri, track_number, title, album, artist, genre,
                                   duration, size, bitrate, year, format)

} // namespace protocol
