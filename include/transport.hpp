#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace networking {

// Status used when no HTTP response was received at all.
constexpr int kStatusNetworkError = 0;
constexpr int kStatusTimeout = 408;

struct TransportResponse {
    int status;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

using ResponseHandler = std::function<void(const TransportResponse&)>;

// Executes GET requests relative to the DAAP server root. The handler is
// called exactly once per request.
class Transport {
public:
    virtual ~Transport() = default;
    virtual void execute(const std::string& relative_uri,
                         const std::optional<std::string>& authorization,
                         ResponseHandler handler) = 0;
};

// Blocking HTTP/1.1 transport; the handler runs before execute() returns.
class HttpTransport : public Transport {
public:
    HttpTransport(std::string host, unsigned short port,
                  std::chrono::milliseconds timeout = std::chrono::seconds(10));

    void execute(const std::string& relative_uri,
                 const std::optional<std::string>& authorization,
                 ResponseHandler handler) override;

    const std::string& host() const { return host_; }
    unsigned short port() const { return port_; }

private:
    std::string host_;
    unsigned short port_;
    std::chrono::milliseconds timeout_;
};

} // namespace networking
