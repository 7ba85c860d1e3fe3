#include "protocol/chunk.hpp"
#include <arpa/inet.h>
#include <algorithm>
#include <cstring>
#include <utility>

namespace protocol {

const char* to_string(DecodeStatus status) {
    switch (status) {
        case DecodeStatus::OK:
            return "ok";
        case DecodeStatus::EXHAUSTED:
            return "exhausted";
        case DecodeStatus::INCOMPLETE_HEADER:
            return "incomplete header";
        case DecodeStatus::INCOMPLETE_BODY:
            return "incomplete body";
    }
    return "unknown";
}

DecodeError::DecodeError(DecodeStatus status)
    : std::runtime_error(std::string("DAAP decode error: ") + to_string(status)),
      status_(status) {}

Chunk::Chunk(std::string tag, std::string payload)
    : tag_(std::move(tag)), payload_(std::move(payload)) {}

DecodeResult decode(std::string_view buffer, std::size_t offset) {
    DecodeResult result;
    result.next_offset = offset;

    std::size_t remaining = offset < buffer.size() ? buffer.size() - offset : 0;
    if (remaining < kHeaderLength) {
        result.status = DecodeStatus::INCOMPLETE_HEADER;
        return result;
    }

    uint32_t length = read_uint32(buffer, offset + kTagLength);
    if (remaining - kHeaderLength < length) {
        result.status = DecodeStatus::INCOMPLETE_BODY;
        return result;
    }

    result.status = DecodeStatus::OK;
    result.chunk.emplace(std::string(buffer.substr(offset, kTagLength)),
                         std::string(buffer.substr(offset + kHeaderLength, length)));
    result.next_offset = offset + kHeaderLength + length;
    return result;
}

DecodeResult Chunk::next_child(std::size_t cursor) const {
    if (cursor >= payload_.size()) {
        DecodeResult end;
        end.status = DecodeStatus::EXHAUSTED;
        end.next_offset = cursor;
        return end;
    }
    return decode(payload_, cursor);
}

std::optional<Chunk> Chunk::seek_first(std::string_view tag) const {
    std::size_t cursor = 0;
    while (true) {
        DecodeResult step = next_child(cursor);
        if (step.status == DecodeStatus::EXHAUSTED) {
            return std::nullopt;
        }
        if (step.malformed()) {
            throw DecodeError(step.status);
        }
        if (step.chunk->code_equals(tag)) {
            return std::move(step.chunk);
        }
        cursor = step.next_offset;
    }
}

std::vector<Chunk> Chunk::seek_all(std::string_view tag) const {
    std::vector<Chunk> matches;
    std::size_t cursor = 0;
    while (true) {
        DecodeResult step = next_child(cursor);
        if (step.status == DecodeStatus::EXHAUSTED) {
            break;
        }
        if (step.malformed()) {
            throw DecodeError(step.status);
        }
        if (step.chunk->code_equals(tag)) {
            matches.push_back(std::move(*step.chunk));
        }
        cursor = step.next_offset;
    }
    return matches;
}

uint32_t Chunk::as_integer() const {
    return read_uint32(payload_, 0);
}

// Bytes past the end of `data` read as zero, so a 2 byte field lands in the
// upper half of the result.
uint32_t read_uint32(std::string_view data, std::size_t offset) {
    uint32_t value = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        uint32_t byte = 0;
        if (offset + i < data.size()) {
            byte = static_cast<uint32_t>(static_cast<unsigned char>(data[offset + i])) & 0xFF;
        }
        value = (value << 8) | byte;
    }
    return value;
}

std::string encode_chunk(std::string_view tag, std::string_view payload) {
    std::string buffer(kHeaderLength + payload.size(), '\0');
    uint32_t length = htonl(static_cast<uint32_t>(payload.size()));

    std::memcpy(buffer.data(), tag.data(), std::min(tag.size(), kTagLength));
    std::memcpy(buffer.data() + kTagLength, &length, kSizeLength);
    if (!payload.empty()) {
        std::memcpy(buffer.data() + kHeaderLength, payload.data(), payload.size());
    }
    return buffer;
}

std::string encode_uint32(std::string_view tag, uint32_t value) {
    std::string payload(4, '\0');
    uint32_t be = htonl(value);
    std::memcpy(payload.data(), &be, 4);
    return encode_chunk(tag, payload);
}

} // namespace protocol
