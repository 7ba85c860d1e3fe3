#include "daap_client.hpp"
#include "security.hpp"
#include <iostream>
#include <utility>

namespace client {

DaapClient::DaapClient(std::string host, unsigned short port, networking::Transport& transport)
    : server_("http://" + host + ":" + std::to_string(port)),
      transport_(transport),
      user_(security::kDefaultUser) {}

void DaapClient::execute(std::shared_ptr<const requests::Request> request,
                         std::function<void(const requests::Outcome&)> on_outcome) {
    std::string uri = request->uri();
    transport_.execute(uri, authorization_,
        [request, on_outcome](const networking::TransportResponse& response) {
            if (!response.ok()) {
                on_outcome(request->on_failure(response.status));
            } else {
                on_outcome(request->on_response(response.body));
            }
        });
}

void DaapClient::login(LoginCallback callback) {
    // Each sequencer dispatches for itself; a later login() must not take over
    // the requests of one still in flight.
    auto owner = std::make_shared<std::weak_ptr<session::LoginSequencer>>();
    auto sequencer = std::make_shared<session::LoginSequencer>(
        session_,
        [this, owner](std::shared_ptr<const requests::Request> request) {
            // The handler keeps the sequencer alive: the completion callback may
            // start another login and replace login_ before handle() returns.
            auto self = owner->lock();
            if (!self) return;
            execute(std::move(request), [self](const requests::Outcome& outcome) {
                self->handle(outcome);
            });
        },
        std::move(callback));
    *owner = sequencer;
    login_ = sequencer;
    sequencer->start();
}

void DaapClient::login_with_password(const std::string& password, LoginCallback callback) {
    authorization_ = security::basic_authorization(user_, password);
    login(std::move(callback));
}

void DaapClient::fetch_catalog(CatalogCallback callback) {
    if (!session_.logged_in()) {
        throw NotLoggedIn();
    }

    auto request = std::make_shared<requests::DatabaseRequest>(
        *session_.session_id, *session_.revision_id, server_);
    execute(std::move(request), [callback](const requests::Outcome& outcome) {
        if (auto* fetched = std::get_if<requests::ItemsFetched>(&outcome)) {
            callback(200, fetched->items);
        } else if (auto* failed = std::get_if<requests::RequestFailed>(&outcome)) {
            callback(failed->status, std::nullopt);
        } else if (auto* violation = std::get_if<requests::ProtocolViolation>(&outcome)) {
            std::cerr << "DaapClient: " << violation->reason << "\n";
            callback(requests::kStatusProtocolViolation, std::nullopt);
        } else {
            std::cerr << "DaapClient: unexpected outcome for database request\n";
            callback(requests::kStatusProtocolViolation, std::nullopt);
        }
    });
}

} // namespace client
