#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace config {

constexpr unsigned short kDefaultDaapPort = 3689;

struct ClientConfig {
    std::string host;
    unsigned short port = kDefaultDaapPort;
    std::string user = "admin";
    std::optional<std::string> password;
    uint32_t timeout_ms = 10000;
};

// Reads a JSON object such as
//   { "host": "10.0.1.6", "port": 3689, "password": "secret", "timeout_ms": 5000 }
// A missing file yields the defaults; unparsable JSON throws std::runtime_error.
ClientConfig load_config(const std::string& path);

ClientConfig parse_config(const std::string& json_text);

// Parses a TCP port in [1, 65535]; anything else throws std::runtime_error.
unsigned short parse_port(const std::string& text);

} // namespace config
