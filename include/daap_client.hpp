#pragma once

#include "login_sequencer.hpp"
#include "protocol/media_item.hpp"
#include "requests.hpp"
#include "transport.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace client {

// fetch_catalog() was called before a login completed.
class NotLoggedIn : public std::logic_error {
public:
    NotLoggedIn() : std::logic_error("Login not completed.") {}
};

using LoginCallback = session::LoginCallback;
// Items are present only when status is 200.
using CatalogCallback =
    std::function<void(int status, const std::optional<std::vector<protocol::MediaItem>>& items)>;

// Client for one DAAP server. Requests go out one at a time through the
// transport; the client is not safe to share between threads.
//
//   networking::HttpTransport transport("10.0.1.6", 3689);
//   client::DaapClient daap("10.0.1.6", 3689, transport);
//   daap.login([&](int status) {
//       if (status == 200) daap.fetch_catalog(on_items);
//       else if (status == 401) daap.login_with_password(read_password(), ...);
//   });
class DaapClient {
public:
    DaapClient(std::string host, unsigned short port, networking::Transport& transport);

    void login(LoginCallback callback);
    // Every later request carries the credentials, not only this login.
    void login_with_password(const std::string& password, LoginCallback callback);
    // Throws NotLoggedIn without contacting the server when no login completed.
    void fetch_catalog(CatalogCallback callback);

    void set_user(std::string user) { user_ = std::move(user); }

    const session::Session& session() const { return session_; }
    // "http://<host>:<port>", the prefix of every MediaItem uri.
    const std::string& server() const { return server_; }
    const std::optional<std::string>& authorization() const { return authorization_; }

private:
    void execute(std::shared_ptr<const requests::Request> request,
                 std::function<void(const requests::Outcome&)> on_outcome);

    std::string server_;
    networking::Transport& transport_;
    std::string user_;
    std::optional<std::string> authorization_;
    session::Session session_;
    std::shared_ptr<session::LoginSequencer> login_;
};

} // namespace client
