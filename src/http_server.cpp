#include "http_server.hpp"
#include "logging.hpp"
#include <thread>
#include <vector>

namespace beast = boost::beast;

std::chrono::milliseconds accept_retry_delay(unsigned failures) {
    if (failures == 0)
        return std::chrono::milliseconds(0);
    if (failures > 7)
        return std::chrono::milliseconds(1000);
    return std::chrono::milliseconds(10 << (failures - 1));
}

UpdateServer::UpdateServer(const ServerConfig& config, RequestHandler& handler)
    : config_(config)
    , handler_(handler)
    , io_ctx_(config.threads)
    , acceptor_(io_ctx_, tcp::endpoint(boost::asio::ip::make_address(config.host), config.port))
    , accept_timer_(io_ctx_)
{
}

void UpdateServer::run() {
    UPDATE_SERVER_LOG_INFO("listening", {string_field("host", config_.host),
                                         int_field("port", local_endpoint().port()),
                                         int_field("threads", config_.threads)});
    do_accept();

    std::vector<std::thread> workers;
    try {
        for (int i = 1; i < config_.threads; ++i)
            workers.emplace_back([this] { io_ctx_.run(); });
    } catch (...) {
        io_ctx_.stop();
        for (auto& t : workers)
            t.join();
        throw;
    }
    io_ctx_.run();
    for (auto& t : workers)
        t.join();
}

void UpdateServer::stop() {
    io_ctx_.stop();
}

void UpdateServer::do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket sock) {
        if (ec) {
            on_accept_error(ec);
            return;
        }
        accept_failures_ = 0;
        read_request(std::make_shared<HttpSession>(std::move(sock)));
        do_accept();
    });
}

// Errors such as EMFILE last until sessions close; retry on a timer.
void UpdateServer::on_accept_error(const beast::error_code& ec) {
    auto delay = accept_retry_delay(++accept_failures_);
    UPDATE_SERVER_LOG_WARN("accept failed", {string_field("error", ec.message()),
                                             int_field("retry_ms", delay.count())});
    accept_timer_.expires_after(delay);
    accept_timer_.async_wait([this](beast::error_code timer_ec) {
        if (!timer_ec)
            do_accept();
    });
}

void UpdateServer::read_request(std::shared_ptr<HttpSession> session) {
    session->request = {};
    http::async_read(session->socket, session->buffer, session->request,
        [this, session](beast::error_code ec, std::size_t) {
            if (ec == http::error::end_of_stream) {
                close_session(session);
                return;
            }
            if (ec) {
                UPDATE_SERVER_LOG_DEBUG("read failed", {string_field("error", ec.message())});
                return;
            }

            session->response = handler_.handle(session->request);
            http::async_write(session->socket, session->response,
                [this, session](beast::error_code ec2, std::size_t) {
                    if (ec2) {
                        UPDATE_SERVER_LOG_DEBUG("write failed", {string_field("error", ec2.message())});
                        return;
                    }
                    if (!session->response.keep_alive()) {
                        close_session(session);
                        return;
                    }
                    read_request(session);
                });
        });
}

void UpdateServer::close_session(const std::shared_ptr<HttpSession>& session) {
    beast::error_code ec;
    session->socket.shutdown(tcp::socket::shutdown_send, ec);
    if (ec && ec != beast::errc::not_connected)
        UPDATE_SERVER_LOG_DEBUG("shutdown failed", {string_field("error", ec.message())});
}
