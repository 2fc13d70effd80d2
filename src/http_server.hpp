#pragma once
#include "config.hpp"
#include "request_handler.hpp"
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <chrono>
#include <memory>

using tcp = boost::asio::ip::tcp;

struct HttpSession {
    explicit HttpSession(tcp::socket s) : socket(std::move(s)) {}

    tcp::socket socket;
    boost::beast::flat_buffer buffer;
    http_request request;
    http_response response;
};

// Delay before re-arming accept after `failures` consecutive accept errors.
std::chrono::milliseconds accept_retry_delay(unsigned failures);

class UpdateServer {
public:
    // Binds config.host:config.port; port 0 picks an ephemeral port.
    UpdateServer(const ServerConfig& config, RequestHandler& handler);

    // Blocks serving requests on config.threads threads until stop().
    void run();
    void stop();
    tcp::endpoint local_endpoint() const { return acceptor_.local_endpoint(); }

private:
    void do_accept();
    void on_accept_error(const boost::beast::error_code& ec);
    void read_request(std::shared_ptr<HttpSession> session);
    void close_session(const std::shared_ptr<HttpSession>& session);

    ServerConfig config_;
    RequestHandler& handler_;
    boost::asio::io_context io_ctx_;
    tcp::acceptor acceptor_;
    boost::asio::steady_timer accept_timer_;
    unsigned accept_failures_ = 0;
};
