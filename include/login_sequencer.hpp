#pragma once

#include "requests.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace session {

// Server-assigned handshake tokens. Both are required after login.
struct Session {
    std::optional<uint32_t> session_id;
    std::optional<uint32_t> revision_id;

    bool logged_in() const { return session_id.has_value() && revision_id.has_value(); }
    void clear() {
        session_id.reset();
        revision_id.reset();
    }
};

enum class LoginState {
    IDLE,
    AWAITING_SESSION,
    AWAITING_REVISION,
    COMPLETED,
    FAILED
};

const char* to_string(LoginState state);

using LoginCallback = std::function<void(int status)>;
using RequestDispatcher = std::function<void(std::shared_ptr<const requests::Request>)>;

// Two-step DAAP login: `login` yields the session id, then `update` yields the
// revision id. Requests go out through the dispatcher and their outcomes come
// back through handle(). The callback fires once, on the terminal state.
class LoginSequencer {
public:
    LoginSequencer(Session& session, RequestDispatcher dispatch, LoginCallback callback);

    void start();
    void handle(const requests::Outcome& outcome);

    LoginState state() const { return state_; }
    // Status of the terminal state: 200 when completed, the failure otherwise.
    std::optional<int> final_status() const { return final_status_; }

private:
    void complete();
    void fail(int status);

    Session& session_;
    RequestDispatcher dispatch_;
    LoginCallback callback_;
    LoginState state_ = LoginState::IDLE;
    std::optional<int> final_status_;
};

} // namespace session
