#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <boost/asio.hpp>
#include <boost/beast/http.hpp>

#include "ddmstatus/runtime/Context.hpp"

namespace ddmstatus {

using HttpRequest  = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

// Routes one request against the current board. No I/O.
//   GET  /status   JSON snapshot
//   GET  /metrics  Prometheus text
//   GET  /summary  plain text
//   POST /refresh  schedule an immediate refresh (202)
HttpResponse handleRequest(const HttpRequest& req, Context& ctx);

class HttpServer {
public:
    // io_timeout bounds reading a request and writing its response.
    HttpServer(const std::string& address, uint16_t port, Context& ctx,
               std::chrono::milliseconds io_timeout = std::chrono::seconds(5));

    // Binds the listening socket. False (and logged) on failure.
    bool open();

    // Port actually bound; differs from the configured one when that is 0.
    uint16_t boundPort() const;

    void run();   // serves until ctx_.running goes false

private:
    void serve(boost::asio::ip::tcp::socket socket);

    std::string address_;
    uint16_t port_;
    Context& ctx_;
    std::chrono::milliseconds io_timeout_;
    boost::asio::io_context ioc_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
};

}
