#pragma once

#include "protocol/chunk.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace protocol {

namespace tags {
constexpr std::string_view STATUS = "mstt";
constexpr std::string_view LOGIN_RESPONSE = "mlog";
constexpr std::string_view SESSION_ID = "mlid";
constexpr std::string_view UPDATE_RESPONSE = "mupd";
constexpr std::string_view REVISION_ID = "musr";
constexpr std::string_view DATABASE_ITEMS = "adbs";
constexpr std::string_view LISTING = "mlcl";
constexpr std::string_view LISTING_ITEM = "mlit";
constexpr std::string_view ITEM_ID = "miid";
constexpr std::string_view ITEM_NAME = "minm";
constexpr std::string_view SONG_FORMAT = "asfm";
constexpr std::string_view SONG_ALBUM = "asal";
constexpr std::string_view SONG_ARTIST = "asar";
constexpr std::string_view SONG_GENRE = "asgn";
constexpr std::string_view SONG_TRACK_NUMBER = "astn";
constexpr std::string_view SONG_TIME = "astm";
constexpr std::string_view SONG_SIZE = "assz";
constexpr std::string_view SONG_BITRATE = "asbr";
constexpr std::string_view SONG_YEAR = "asyr";
} // namespace tags

// Sentinels for optional fields the server left out.
constexpr int64_t kMissingInt = -1;
inline const std::string kMissingString;

int64_t extract_int(const Chunk& chunk, std::string_view tag);
std::string extract_string(const Chunk& chunk, std::string_view tag);

} // namespace protocol
