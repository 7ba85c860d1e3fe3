#pragma once

#include "protocol/chunk.hpp"
#include "protocol/media_item.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace requests {

// Status reported when a 200 response body does not decode.
constexpr int kStatusMalformedResponse = 400;
// Status reported when a response decodes but lacks a required field.
constexpr int kStatusProtocolViolation = 502;

struct SessionIdAcquired {
    uint32_t session_id;
};

struct RevisionIdAcquired {
    uint32_t revision_id;
};

struct ItemsFetched {
    std::vector<protocol::MediaItem> items;
};

struct RequestFailed {
    int status;
};

struct ProtocolViolation {
    std::string reason;
};

using Outcome = std::variant<SessionIdAcquired, RevisionIdAcquired, ItemsFetched,
                             RequestFailed, ProtocolViolation>;

class Request {
public:
    virtual ~Request() = default;

    // Path relative to the server root, without the leading slash.
    virtual std::string uri() const = 0;

    // Decodes the first top-level chunk of `body` and interprets it.
    // Truncated data becomes RequestFailed{400}.
    Outcome on_response(const std::string& body) const;
    Outcome on_failure(int status) const { return RequestFailed{status}; }

protected:
    virtual Outcome interpret(const protocol::Chunk& response) const = 0;
};

// login: acquires the session id (mlid).
class LoginRequest : public Request {
public:
    std::string uri() const override;

protected:
    Outcome interpret(const protocol::Chunk& response) const override;
};

// update: acquires the revision id (musr) for a session.
class UpdateRequest : public Request {
public:
    explicit UpdateRequest(uint32_t session_id) : session_id_(session_id) {}

    std::string uri() const override;
    uint32_t session_id() const { return session_id_; }

protected:
    Outcome interpret(const protocol::Chunk& response) const override;

private:
    uint32_t session_id_;
};

// databases/1/items: lists the music catalog.
class DatabaseRequest : public Request {
public:
    // `server` is the "http://host:port" prefix used to build item URIs.
    DatabaseRequest(uint32_t session_id, uint32_t revision_id, std::string server);

    std::string uri() const override;

    static const std::vector<std::string>& requested_fields();

protected:
    Outcome interpret(const protocol::Chunk& response) const override;

private:
    protocol::MediaItem make_item(const protocol::Chunk& mlit) const;

    uint32_t session_id_;
    uint32_t revision_id_;
    std::string server_;
};

} // namespace requests
