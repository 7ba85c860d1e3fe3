#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace protocol {

// DAAP chunk layout: 4 byte tag | 4 byte big-endian length | payload
constexpr std::size_t kTagLength = 4;
constexpr std::size_t kSizeLength = 4;
constexpr std::size_t kHeaderLength = kTagLength + kSizeLength;

enum class DecodeStatus {
    OK,
    EXHAUSTED,          // no bytes left; normal end of a child sequence
    INCOMPLETE_HEADER,  // fewer than 8 bytes left
    INCOMPLETE_BODY     // declared length runs past the end of the buffer
};

const char* to_string(DecodeStatus status);

// Thrown by the seek helpers when a child sequence is structurally broken.
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(DecodeStatus status);
    DecodeStatus status() const { return status_; }

private:
    DecodeStatus status_;
};

struct DecodeResult;

class Chunk {
public:
    Chunk(std::string tag, std::string payload);

    const std::string& tag() const { return tag_; }
    const std::string& payload() const { return payload_; }
    uint32_t length() const { return static_cast<uint32_t>(payload_.size()); }

    // Size of this chunk on the wire, header included.
    std::size_t size() const { return payload_.size() + kHeaderLength; }

    bool code_equals(std::string_view other) const { return tag_ == other; }

    // Decodes the child starting at `cursor` within the payload. The cursor of
    // the following child is returned in DecodeResult::next_offset.
    DecodeResult next_child(std::size_t cursor) const;

    std::optional<Chunk> seek_first(std::string_view tag) const;
    std::vector<Chunk> seek_all(std::string_view tag) const;

    uint32_t as_integer() const;
    std::string as_string() const { return payload_; }

private:
    std::string tag_;
    std::string payload_;
};

struct DecodeResult {
    DecodeStatus status = DecodeStatus::EXHAUSTED;
    std::optional<Chunk> chunk;
    std::size_t next_offset = 0;

    bool ok() const { return status == DecodeStatus::OK; }
    bool malformed() const {
        return status == DecodeStatus::INCOMPLETE_HEADER || status == DecodeStatus::INCOMPLETE_BODY;
    }
};

// Decodes one chunk starting at `offset`. An offset at or past the end of the
// buffer yields INCOMPLETE_HEADER; only next_child reports EXHAUSTED.
DecodeResult decode(std::string_view buffer, std::size_t offset = 0);

uint32_t read_uint32(std::string_view data, std::size_t offset);

std::string encode_chunk(std::string_view tag, std::string_view payload);
std::string encode_uint32(std::string_view tag, uint32_t value);

} // namespace protocol
