#include "security.hpp"
#include <sodium.h>
#include <stdexcept>
#include <vector>

namespace security {

std::string base64_encode(const std::string& data) {
    if (sodium_init() < 0) {
        throw std::runtime_error("libsodium initialization failed");
    }

    const int variant = sodium_base64_VARIANT_ORIGINAL;
    std::vector<char> encoded(sodium_base64_ENCODED_LEN(data.size(), variant));
    sodium_bin2base64(encoded.data(), encoded.size(),
                      reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                      variant);
    return std::string(encoded.data());
}

std::string basic_authorization(const std::string& user, const std::string& password) {
    return "Basic " + base64_encode(user + ":" + password);
}

} // namespace security
