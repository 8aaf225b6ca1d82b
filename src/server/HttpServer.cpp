#include "ddmstatus/server/HttpServer.hpp"
#include "ddmstatus/status/StatusRender.hpp"
#include <boost/beast.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <functional>
#include <thread>

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp = asio::ip::tcp;

namespace ddmstatus {

static HttpResponse makeResponse(const HttpRequest& req, http::status status,
                                 const char* content_type, std::string body) {
    HttpResponse res;
    res.version(req.version());
    res.result(status);
    res.set(http::field::server, "ddmstatus");
    res.set(http::field::content_type, content_type);
    res.keep_alive(false);
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

static HttpResponse methodNotAllowed(const HttpRequest& req, const char* allow) {
    auto res = makeResponse(req, http::status::method_not_allowed,
                            "application/json", "{\"error\":\"method not allowed\"}");
    res.set(http::field::allow, allow);
    return res;
}

HttpResponse handleRequest(const HttpRequest& req, Context& ctx) {
    auto raw = req.target();
    std::string target(raw.data(), raw.size());
    size_t q = target.find('?');
    if (q != std::string::npos) target.resize(q);

    if (target == "/refresh") {
        if (req.method() != http::verb::post) return methodNotAllowed(req, "POST");
        ctx.refresh_requested.store(true);
        return makeResponse(req, http::status::accepted,
                            "application/json", "{\"refresh\":\"scheduled\"}");
    }

    if (target != "/status" && target != "/metrics" && target != "/summary") {
        return makeResponse(req, http::status::not_found,
                            "application/json", "{\"error\":\"not found\"}");
    }
    if (req.method() != http::verb::get) return methodNotAllowed(req, "GET");

    auto snap = ctx.board.current();
    if (!snap) {
        return makeResponse(req, http::status::service_unavailable,
                            "application/json", "{\"error\":\"no snapshot yet\"}");
    }

    if (target == "/metrics") {
        return makeResponse(req, http::status::ok, "text/plain; version=0.0.4",
                            toPrometheus(*snap));
    }
    if (target == "/summary") {
        return makeResponse(req, http::status::ok, "text/plain; charset=utf-8",
                            toSummary(*snap));
    }
    // Log and os-release text are raw bytes; invalid UTF-8 becomes U+FFFD.
    return makeResponse(req, http::status::ok, "application/json",
                        toJson(*snap).dump(-1, ' ', false,
                                           nlohmann::json::error_handler_t::replace));
}

HttpServer::HttpServer(const std::string& address, uint16_t port, Context& ctx,
                       std::chrono::milliseconds io_timeout)
    : address_(address), port_(port), ctx_(ctx), io_timeout_(io_timeout) {}

bool HttpServer::open() {
    try {
        auto addr = asio::ip::make_address(address_);
        acceptor_ = std::make_unique<tcp::acceptor>(ioc_);
        tcp::endpoint ep(addr, port_);
        acceptor_->open(ep.protocol());
        acceptor_->set_option(tcp::acceptor::reuse_address(true));
        acceptor_->bind(ep);
        acceptor_->listen();
        acceptor_->non_blocking(true);
    } catch (const std::exception& e) {
        std::cerr << "[HTTP] cannot listen on " << address_ << ":" << port_
                  << ": " << e.what() << "\n";
        acceptor_.reset();
        return false;
    }

    std::cout << "[HTTP] Listening on " << address_ << ":" << boundPort() << "\n";
    return true;
}

uint16_t HttpServer::boundPort() const {
    if (!acceptor_) return 0;
    beast::error_code ec;
    auto ep = acceptor_->local_endpoint(ec);
    return ec ? 0 : ep.port();
}

// Runs one async operation on ioc_ to completion. The stream's expiry
// cancels it, so a silent client cannot hold the loop.
static beast::error_code runToCompletion(asio::io_context& ioc,
                                         const std::function<void(beast::error_code&)>& start) {
    beast::error_code result;
    start(result);
    ioc.restart();
    ioc.run();
    return result;
}

void HttpServer::serve(tcp::socket socket) {
    beast::tcp_stream stream(std::move(socket));
    beast::flat_buffer buffer;
    HttpRequest req;

    stream.expires_after(io_timeout_);
    auto ec = runToCompletion(ioc_, [&](beast::error_code& out) {
        http::async_read(stream, buffer, req,
                         [&out](beast::error_code e, std::size_t) { out = e; });
    });
    if (ec) {
        std::cerr << "[HTTP] request dropped: " << ec.message() << "\n";
        return;
    }

    HttpResponse res = handleRequest(req, ctx_);

    stream.expires_after(io_timeout_);
    ec = runToCompletion(ioc_, [&](beast::error_code& out) {
        http::async_write(stream, res,
                          [&out](beast::error_code e, std::size_t) { out = e; });
    });
    if (ec) {
        std::cerr << "[HTTP] response not sent: " << ec.message() << "\n";
        return;
    }

    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

void HttpServer::run() {
    if (!acceptor_) return;

    while (ctx_.running.load()) {
        tcp::socket socket(ioc_);
        beast::error_code ec;
        acceptor_->accept(socket, ec);

        if (ec == asio::error::would_block || ec == asio::error::try_again) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }
        if (ec) {
            std::cerr << "[HTTP] accept: " << ec.message() << "\n";
            continue;
        }

        try {
            serve(std::move(socket));
        } catch (const std::exception& e) {
            // Malformed request: drop it, keep serving.
            std::cerr << "[HTTP] request dropped: " << e.what() << "\n";
        }
    }

    std::cout << "[HTTP] stopped\n";
}

}
