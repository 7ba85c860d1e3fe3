#include <iostream>
#include <string>
#include <cstdint>
#include <chrono>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "daap_client.hpp"
#include "transport.hpp"

namespace {

void print_usage() {
    std::cerr << "Usage: daap-client <host> [port] [--password <pw>] [--config <file>] [--json]\n";
}

void print_items(const std::vector<protocol::MediaItem>& items, bool as_json) {
    if (as_json) {
        nlohmann::json j = items;
        std::cout << j.dump(2) << "\n";
        return;
    }
    for (const auto& item : items) {
        std::cout << item.artist << " - " << item.album << " - ";
        if (item.track_number >= 0) {
            std::cout << item.track_number << ". ";
        }
        std::cout << item.title << " (" << item.id << ")\n";
    }
    std::cout << "Total items: " << items.size() << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    config::ClientConfig cfg;
    bool as_json = false;
    std::vector<std::string> positional;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--json") {
                as_json = true;
            } else if (arg == "--config" && i + 1 < argc) {
                cfg = config::load_config(argv[++i]);
            } else if (arg == "--password" && i + 1 < argc) {
                cfg.password = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            } else {
                positional.push_back(arg);
            }
        }
        if (!positional.empty()) {
            cfg.host = positional[0];
        }
        if (positional.size() > 1) {
            cfg.port = config::parse_port(positional[1]);
        }
    } catch (std::exception& e) {
        std::cerr << "Invalid arguments: " << e.what() << "\n";
        return 1;
    }

    if (cfg.host.empty()) {
        print_usage();
        return 1;
    }

    networking::HttpTransport transport(cfg.host, cfg.port, std::chrono::milliseconds(cfg.timeout_ms));
    client::DaapClient daap(cfg.host, cfg.port, transport);
    daap.set_user(cfg.user);

    int exit_code = 1;
    bool retried = false;

    auto on_items = [&](int status, const std::optional<std::vector<protocol::MediaItem>>& items) {
        if (status != 200 || !items) {
            std::cerr << "Could not fetch items: [HTTP status " << status << "]\n";
            return;
        }
        print_items(*items, as_json);
        exit_code = 0;
    };

    client::LoginCallback on_login;
    on_login = [&](int status) {
        if (status == 200) {
            std::cerr << "Logged in to " << daap.server() << " (session " << *daap.session().session_id
                      << ", revision " << *daap.session().revision_id << ")\n";
            daap.fetch_catalog(on_items);
        } else if (status == 401 && !retried) {
            retried = true;
            std::string password;
            std::cerr << "Enter password for " << daap.server() << ": ";
            std::getline(std::cin, password);
            daap.login_with_password(password, on_login);
        } else {
            std::cerr << "Could not login to the DAAP server: [HTTP status " << status << "]\n";
        }
    };

    try {
        if (cfg.password) {
            retried = true;
            daap.login_with_password(*cfg.password, on_login);
        } else {
            daap.login(on_login);
        }
    } catch (std::exception& e) {
        std::cerr << "Client Exception: " << e.what() << "\n";
        return 1;
    }
    return exit_code;
}
