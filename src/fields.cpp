#include "protocol/fields.hpp"

namespace protocol {

int64_t extract_int(const Chunk& chunk, std::string_view tag) {
    auto field = chunk.seek_first(tag);
    if (!field) {
        return kMissingInt;
    }
    return static_cast<int64_t>(field->as_integer());
}

std::string extract_string(const Chunk& chunk, std::string_view tag) {
    auto field = chunk.seek_first(tag);
    if (!field) {
        return kMissingString;
    }
    return field->as_string();
}

} // namespace protocol
