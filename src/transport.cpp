#include "transport.hpp"
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <iostream>
#include <limits>
#include <utility>

namespace beast = boost::beast;
namespace http = boost::beast::http;
using boost::asio::ip::tcp;

namespace networking {

namespace {
constexpr const char* kUserAgent = "daap-client/1.0";
constexpr const char* kDaapVersion = "3.0";
}

HttpTransport::HttpTransport(std::string host, unsigned short port, std::chrono::milliseconds timeout)
    : host_(std::move(host)), port_(port), timeout_(timeout) {}

void HttpTransport::execute(const std::string& relative_uri,
                            const std::optional<std::string>& authorization,
                            ResponseHandler handler) {
    boost::asio::io_context io_context;
    tcp::resolver resolver(io_context);
    beast::tcp_stream stream(io_context);
    beast::flat_buffer buffer;

    http::request<http::empty_body> request{http::verb::get, "/" + relative_uri, 11};
    request.set(http::field::host, host_ + ":" + std::to_string(port_));
    request.set(http::field::user_agent, kUserAgent);
    request.set("Client-DAAP-Version", kDaapVersion);
    if (authorization) {
        request.set(http::field::authorization, *authorization);
    }

    // Catalog listings easily exceed beast's default body limit.
    http::response_parser<http::string_body> parser;
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());

    beast::error_code result_ec;
    std::string failed_step;
    auto on_error = [&](const beast::error_code& ec, const char* step) {
        result_ec = ec;
        failed_step = step;
    };

    resolver.async_resolve(host_, std::to_string(port_),
        [&](const beast::error_code& ec, tcp::resolver::results_type results) {
            if (ec) return on_error(ec, "resolve");
            stream.expires_after(timeout_);
            stream.async_connect(results,
                [&](const beast::error_code& ec, const tcp::endpoint&) {
                    if (ec) return on_error(ec, "connect");
                    stream.expires_after(timeout_);
                    http::async_write(stream, request,
                        [&](const beast::error_code& ec, std::size_t) {
                            if (ec) return on_error(ec, "write");
                            stream.expires_after(timeout_);
                            http::async_read(stream, buffer, parser,
                                [&](const beast::error_code& ec, std::size_t) {
                                    if (ec) return on_error(ec, "read");
                                });
                        });
                });
        });

    io_context.run();

    beast::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

    if (result_ec) {
        std::cerr << "HttpTransport Exception (" << failed_step << " /" << relative_uri << "): "
                  << result_ec.message() << "\n";
        int status = result_ec == beast::error::timeout ? kStatusTimeout : kStatusNetworkError;
        handler(TransportResponse{status, ""});
        return;
    }

    auto response = parser.release();
    handler(TransportResponse{static_cast<int>(response.result_int()), std::move(response.body())});
}

} // namespace networking
