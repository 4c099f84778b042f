#include "riskpulse/telemetry/HttpServer.hpp"
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

using namespace riskpulse;
namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp = asio::ip::tcp;

namespace {

http::response<http::string_body> to_beast(const ApiResponse& api, unsigned version, bool keep_alive) {
    http::response<http::string_body> res;
    res.version(version);
    res.result(static_cast<http::status>(api.status));
    res.set(http::field::server, "riskpulse");
    res.set(http::field::content_type, api.content_type);
    res.keep_alive(keep_alive);
    res.body() = api.body;
    res.prepare_payload();
    return res;
}

class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket&& socket, const ApiRouter& router, std::chrono::milliseconds timeout)
        : stream_(std::move(socket)), router_(router), timeout_(timeout) {}

    void start() {
        asio::dispatch(stream_.get_executor(),
                       beast::bind_front_handler(&Session::do_read, shared_from_this()));
    }

private:
    void do_read() {
        req_ = {};
        stream_.expires_after(timeout_);
        http::async_read(stream_, buffer_, req_,
                         beast::bind_front_handler(&Session::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            do_close();
            return;
        }
        if (ec) {
            // The stream has already closed the socket on timeout
            if (ec != beast::error::timeout) {
                std::cerr << "[HTTP] read failed: " << ec.message() << "\n";
            }
            return;
        }

        ApiRequest api;
        api.method = std::string(req_.method_string());
        api.target = std::string(req_.target());
        api.body   = req_.body();

        res_ = std::make_shared<http::response<http::string_body>>(
            to_beast(router_.handle(api), req_.version(), req_.keep_alive()));

        stream_.expires_after(timeout_);
        http::async_write(stream_, *res_,
                          beast::bind_front_handler(&Session::on_write, shared_from_this(),
                                                    res_->need_eof()));
    }

    void on_write(bool close, beast::error_code ec, std::size_t) {
        if (ec) {
            std::cerr << "[HTTP] write failed: " << ec.message() << "\n";
            return;
        }
        if (close) {
            do_close();
            return;
        }
        res_.reset();
        do_read();
    }

    void do_close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        if (ec && ec != beast::errc::not_connected) {
            std::cerr << "[HTTP] shutdown failed: " << ec.message() << "\n";
        }
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    std::shared_ptr<http::response<http::string_body>> res_;
    const ApiRouter& router_;
    std::chrono::milliseconds timeout_;
};

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(asio::io_context& ioc, tcp::acceptor&& acceptor, const ApiRouter& router,
             std::chrono::milliseconds timeout)
        : ioc_(ioc), acceptor_(std::move(acceptor)), router_(router), timeout_(timeout) {}

    void start() { do_accept(); }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);
    }

private:
    void do_accept() {
        acceptor_.async_accept(asio::make_strand(ioc_),
                               beast::bind_front_handler(&Listener::on_accept, shared_from_this()));
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted) return;  // acceptor closed
        if (ec) {
            std::cerr << "[HTTP] accept failed: " << ec.message() << "\n";
        } else {
            std::make_shared<Session>(std::move(socket), router_, timeout_)->start();
        }
        do_accept();
    }

    asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    const ApiRouter& router_;
    std::chrono::milliseconds timeout_;
};

}

HttpServer::HttpServer(const ServerSettings& settings, const ApiRouter& router, std::atomic<bool>& running)
    : settings_(settings), router_(router), running_(running) {}

void HttpServer::run() {
    const int thread_count = settings_.threads < 1 ? 1 : settings_.threads;
    asio::io_context ioc(thread_count);
    std::shared_ptr<Listener> listener;

    try {
        const tcp::endpoint endpoint(asio::ip::make_address(settings_.host), settings_.port);

        tcp::acceptor acceptor(ioc);
        acceptor.open(endpoint.protocol());
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        acceptor.bind(endpoint);
        acceptor.listen(asio::socket_base::max_listen_connections);
        local_port_.store(acceptor.local_endpoint().port());

        listener = std::make_shared<Listener>(ioc, std::move(acceptor), router_,
                                              std::chrono::milliseconds(settings_.request_timeout_ms));
        listener->start();
    } catch (const std::exception& e) {
        std::cerr << "[HTTP] " << e.what() << "\n";
        running_.store(false);
        std::cout << "[HTTP] Server stopped\n";
        return;
    }

    std::cout << "[HTTP] Listening on " << settings_.host << ":" << local_port_.load()
              << " (" << thread_count << " threads)\n";

    auto work = asio::make_work_guard(ioc);
    std::vector<std::thread> workers;
    workers.reserve(thread_count);
    for (int i = 0; i < thread_count; ++i) {
        workers.emplace_back([&]() {
            while (running_.load()) {
                try {
                    ioc.run_for(std::chrono::milliseconds(100));
                } catch (const std::exception& e) {
                    std::cerr << "[HTTP] worker error: " << e.what() << "\n";
                }
            }
        });
    }

    for (auto& t : workers) t.join();

    // Workers are gone; open sessions are released when ioc is destroyed
    listener->stop();
    work.reset();
    ioc.stop();
    local_port_.store(0);
    std::cout << "[HTTP] Server stopped\n";
}
