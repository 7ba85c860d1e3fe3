#include "login_sequencer.hpp"
#include <iostream>
#include <memory>
#include <utility>

namespace session {

namespace {
constexpr int kStatusOk = 200;
}

const char* to_string(LoginState state) {
    switch (state) {
        case LoginState::IDLE:
            return "idle";
        case LoginState::AWAITING_SESSION:
            return "awaiting session";
        case LoginState::AWAITING_REVISION:
            return "awaiting revision";
        case LoginState::COMPLETED:
            return "completed";
        case LoginState::FAILED:
            return "failed";
    }
    return "unknown";
}

LoginSequencer::LoginSequencer(Session& session, RequestDispatcher dispatch, LoginCallback callback)
    : session_(session), dispatch_(std::move(dispatch)), callback_(std::move(callback)) {}

void LoginSequencer::start() {
    if (state_ != LoginState::IDLE) {
        return;
    }
    session_.clear();
    state_ = LoginState::AWAITING_SESSION;
    dispatch_(std::make_shared<requests::LoginRequest>());
}

void LoginSequencer::handle(const requests::Outcome& outcome) {
    if (state_ == LoginState::COMPLETED || state_ == LoginState::FAILED || state_ == LoginState::IDLE) {
        return;
    }

    if (auto* failed = std::get_if<requests::RequestFailed>(&outcome)) {
        fail(failed->status);
        return;
    }
    if (auto* violation = std::get_if<requests::ProtocolViolation>(&outcome)) {
        std::cerr << "LoginSequencer: " << violation->reason << "\n";
        fail(requests::kStatusProtocolViolation);
        return;
    }

    if (state_ == LoginState::AWAITING_SESSION) {
        if (auto* acquired = std::get_if<requests::SessionIdAcquired>(&outcome)) {
            session_.session_id = acquired->session_id;
            state_ = LoginState::AWAITING_REVISION;
            dispatch_(std::make_shared<requests::UpdateRequest>(acquired->session_id));
            return;
        }
    } else if (state_ == LoginState::AWAITING_REVISION) {
        if (auto* acquired = std::get_if<requests::RevisionIdAcquired>(&outcome)) {
            session_.revision_id = acquired->revision_id;
            complete();
            return;
        }
    }

    std::cerr << "LoginSequencer: unexpected outcome while " << to_string(state_) << "\n";
    fail(requests::kStatusProtocolViolation);
}

void LoginSequencer::complete() {
    state_ = LoginState::COMPLETED;
    final_status_ = kStatusOk;
    if (callback_) callback_(kStatusOk);
}

void LoginSequencer::fail(int status) {
    state_ = LoginState::FAILED;
    final_status_ = status;
    if (callback_) callback_(status);
}

} // namespace session
