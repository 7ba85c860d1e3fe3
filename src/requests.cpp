#include "requests.hpp"
#include "protocol/fields.hpp"
#include <utility>

namespace requests {

namespace {

// asbr and asyr are 16-bit fields; as_integer() places them in the upper half.
int64_t upper_half(int64_t value) {
    if (value == protocol::kMissingInt) {
        return value;
    }
    return value >> 16;
}

std::string join(const std::vector<std::string>& parts, char separator) {
    std::string joined;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) joined += separator;
        joined += parts[i];
    }
    return joined;
}

} // namespace

Outcome Request::on_response(const std::string& body) const {
    protocol::DecodeResult root = protocol::decode(body, 0);
    if (!root.ok()) {
        return RequestFailed{kStatusMalformedResponse};
    }
    try {
        return interpret(*root.chunk);
    } catch (const protocol::DecodeError&) {
        return RequestFailed{kStatusMalformedResponse};
    }
}

// ─── LoginRequest ───────────────────────────────────────────────────────────

std::string LoginRequest::uri() const {
    return "login";
}

Outcome LoginRequest::interpret(const protocol::Chunk& response) const {
    auto mlid = response.seek_first(protocol::tags::SESSION_ID);
    if (!mlid) {
        return ProtocolViolation{"login response carries no session id (mlid)"};
    }
    return SessionIdAcquired{mlid->as_integer()};
}

// ─── UpdateRequest ──────────────────────────────────────────────────────────

std::string UpdateRequest::uri() const {
    return "update?session-id=" + std::to_string(session_id_);
}

Outcome UpdateRequest::interpret(const protocol::Chunk& response) const {
    auto musr = response.seek_first(protocol::tags::REVISION_ID);
    if (!musr) {
        return ProtocolViolation{"update response carries no revision id (musr)"};
    }
    return RevisionIdAcquired{musr->as_integer()};
}

// ─── DatabaseRequest ────────────────────────────────────────────────────────

DatabaseRequest::DatabaseRequest(uint32_t session_id, uint32_t revision_id, std::string server)
    : session_id_(session_id), revision_id_(revision_id), server_(std::move(server)) {}

const std::vector<std::string>& DatabaseRequest::requested_fields() {
    static const std::vector<std::string> fields = {
        "dmap.itemid",
        "daap.songformat",
        "dmap.itemname",
        "daap.songalbum",
        "daap.songartist",
        "daap.songgenre",
        "daap.songtracknumber",
        "daap.songtime",
        "daap.songsize",
        "daap.songyear",
        "daap.songbitrate"
    };
    return fields;
}

std::string DatabaseRequest::uri() const {
    return "databases/1/items?type=music&session-id=" + std::to_string(session_id_) +
           "&revision-id=" + std::to_string(revision_id_) +
           "&meta=" + join(requested_fields(), ',');
}

Outcome DatabaseRequest::interpret(const protocol::Chunk& response) const {
    auto mlcl = response.seek_first(protocol::tags::LISTING);
    if (!mlcl) {
        return ProtocolViolation{"database response carries no listing (mlcl)"};
    }

    ItemsFetched fetched;
    for (const auto& mlit : mlcl->seek_all(protocol::tags::LISTING_ITEM)) {
        fetched.items.push_back(make_item(mlit));
    }
    return std::move(fetched);
}

protocol::MediaItem DatabaseRequest::make_item(const protocol::Chunk& mlit) const {
    using namespace protocol;

    MediaItem item;
    int64_t item_id = extract_int(mlit, tags::ITEM_ID);
    item.format = extract_string(mlit, tags::SONG_FORMAT);
    item.id = std::to_string(session_id_) + "-" + std::to_string(item_id);
    item.uri = server_ + "/databases/1/items/" + std::to_string(item_id) + "." + item.format +
               "?session-id=" + std::to_string(session_id_);
    item.track_number = extract_int(mlit, tags::SONG_TRACK_NUMBER);
    item.title = extract_string(mlit, tags::ITEM_NAME);
    item.album = extract_string(mlit, tags::SONG_ALBUM);
    item.artist = extract_string(mlit, tags::SONG_ARTIST);
    item.genre = extract_string(mlit, tags::SONG_GENRE);
    item.duration = extract_int(mlit, tags::SONG_TIME);
    item.size = extract_int(mlit, tags::SONG_SIZE);
    item.bitrate = upper_half(extract_int(mlit, tags::SONG_BITRATE));
    item.year = upper_half(extract_int(mlit, tags::SONG_YEAR));
    return item;
}

} // namespace requests
