#include "config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace config {

namespace {

[[noreturn]] void invalid(const std::string& reason) {
    throw std::runtime_error("Invalid client config: " + reason);
}

int64_t read_integer(const nlohmann::json& j, const std::string& key, int64_t fallback,
                     int64_t min, int64_t max) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& field = j.at(key);
    if (!field.is_number_integer()) {
        invalid(key + " must be an integer");
    }
    if (field.is_number_unsigned() && field.get<uint64_t>() > static_cast<uint64_t>(max)) {
        invalid(key + " out of range [" + std::to_string(min) + ", " + std::to_string(max) + "]");
    }
    int64_t value = field.get<int64_t>();
    if (value < min || value > max) {
        invalid(key + " out of range [" + std::to_string(min) + ", " + std::to_string(max) + "]");
    }
    return value;
}

} // namespace

unsigned short parse_port(const std::string& text) {
    std::size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid port: " + text);
    }
    if (consumed != text.size() || value < 1 || value > 65535) {
        throw std::runtime_error("Invalid port: " + text);
    }
    return static_cast<unsigned short>(value);
}

ClientConfig parse_config(const std::string& json_text) {
    ClientConfig config;
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid client config: ") + e.what());
    }
    if (!j.is_object()) {
        throw std::runtime_error("Invalid client config: expected a JSON object");
    }

    try {
        config.host = j.value("host", config.host);
        config.port = static_cast<unsigned short>(read_integer(j, "port", config.port, 1, 65535));
        config.user = j.value("user", config.user);
        config.timeout_ms = static_cast<uint32_t>(
            read_integer(j, "timeout_ms", config.timeout_ms, 1, std::numeric_limits<uint32_t>::max()));
        if (j.contains("password") && !j["password"].is_null()) {
            config.password = j["password"].get<std::string>();
        }
    } catch (const nlohmann::json::type_error& e) {
        throw std::runtime_error(std::string("Invalid client config: ") + e.what());
    }
    return config;
}

ClientConfig load_config(const std::string& path) {
    std::ifstream stream(path);
    if (!stream.is_open()) {
        std::cerr << "[WARN] Unable to open config file " << path
                  << ", falling back to defaults\n";
        return ClientConfig{};
    }
    std::ostringstream contents;
    contents << stream.rdbuf();
    return parse_config(contents.str());
}

} // namespace config
