#pragma once

#include <string>

namespace security {

// DAAP servers ignore the user name; iTunes sends "admin".
constexpr const char* kDefaultUser = "admin";

// Base64 (standard alphabet, padded) using libsodium
std::string base64_encode(const std::string& data);

// Builds an HTTP Basic Authorization header value: "Basic <base64(user:password)>"
std::string basic_authorization(const std::string& user, const std::string& password);

} // namespace security
