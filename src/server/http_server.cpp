// src/server/http_server.cpp
#include "trade_guard/server/http_server.hpp"
#include <boost/asio/ip/address.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include "trade_guard/core/logger.hpp"

namespace trade_guard {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

nlohmann::json HttpServerConfig::to_json() const {
    nlohmann::json j;
    j["bind_address"] = bind_address;
    j["port"] = port;
    j["accept_poll_ms"] = accept_poll_ms;
    return j;
}

void HttpServerConfig::from_json(const nlohmann::json& j) {
    if (j.contains("bind_address"))
        bind_address = j.at("bind_address").get<std::string>();
    if (j.contains("port"))
        port = j.at("port").get<uint16_t>();
    if (j.contains("accept_poll_ms"))
        accept_poll_ms = j.at("accept_poll_ms").get<int>();
}

std::vector<std::string> HttpServerConfig::validate() const {
    std::vector<std::string> problems;
    beast::error_code ec;
    asio::ip::make_address(bind_address, ec);
    if (ec)
        problems.push_back("bind_address is not a valid IP address");
    if (accept_poll_ms <= 0)
        problems.push_back("accept_poll_ms must be positive");
    return problems;
}

HttpServer::HttpServer(HttpServerConfig config, std::shared_ptr<RequestRouter> router,
                       std::shared_ptr<MessageBus> bus)
    : config_(std::move(config)), router_(std::move(router)), bus_(std::move(bus)) {
    Logger::register_component("HttpServer");
}

HttpServer::~HttpServer() {
    stop();
}

Result<void> HttpServer::start() {
    if (running_.load()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "HTTP server already running",
                                "HttpServer");
    }

    beast::error_code ec;
    auto address = asio::ip::make_address(config_.bind_address, ec);
    if (ec) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Invalid bind address " + config_.bind_address, "HttpServer");
    }

    auto acceptor = std::make_unique<tcp::acceptor>(ioc_);
    tcp::endpoint endpoint(address, config_.port);
    acceptor->open(endpoint.protocol(), ec);
    if (!ec)
        acceptor->set_option(asio::socket_base::reuse_address(true), ec);
    if (!ec)
        acceptor->bind(endpoint, ec);
    if (!ec)
        acceptor->listen(asio::socket_base::max_listen_connections, ec);
    if (!ec)
        acceptor->non_blocking(true, ec);
    if (ec) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                "Cannot listen on " + config_.bind_address + ":" +
                                    std::to_string(config_.port) + ": " + ec.message(),
                                "HttpServer");
    }

    bound_port_ = acceptor->local_endpoint().port();
    acceptor_ = std::move(acceptor);
    running_.store(true);
    accept_thread_ = std::thread(&HttpServer::accept_loop, this);
    INFO("Listening on " << config_.bind_address << ":" << bound_port_);
    return Result<void>();
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto& socket : sockets_) {
            socket->close();
        }
        sockets_.clear();
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }

    beast::error_code ec;
    if (acceptor_) {
        acceptor_->close(ec);
    }
    INFO("HTTP server stopped");
}

void HttpServer::accept_loop() {
    Logger::register_component("HttpServer");
    while (running_.load()) {
        tcp::socket socket(ioc_);
        beast::error_code ec;
        acceptor_->accept(socket, ec);

        if (ec == asio::error::would_block || ec == asio::error::try_again) {
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.accept_poll_ms));
            continue;
        }
        if (ec) {
            WARN("Accept failed: " << ec.message());
            continue;
        }

        std::lock_guard<std::mutex> lock(workers_mutex_);
        reap_finished_locked();
        auto done = std::make_shared<std::atomic<bool>>(false);
        Worker worker;
        worker.done = done;
        worker.thread = std::thread([this, done, s = std::move(socket)]() mutable {
            serve(std::move(s));
            done->store(true);
        });
        workers_.push_back(std::move(worker));
    }
}

void HttpServer::reap_finished_locked() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load()) {
            if (it->thread.joinable())
                it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
    for (auto it = sockets_.begin(); it != sockets_.end();) {
        it = (*it)->is_open() ? std::next(it) : sockets_.erase(it);
    }
}

void HttpServer::serve(tcp::socket socket) {
    Logger::register_component("HttpServer");
    beast::error_code ec;
    socket.non_blocking(false, ec);

    beast::flat_buffer buffer;
    http::request<http::string_body> req;
    http::read(socket, buffer, req, ec);
    if (ec) {
        if (ec != http::error::end_of_stream) {
            DEBUG("Dropping malformed request: " << ec.message());
        }
        return;
    }

    std::string target(req.target());
    if (websocket::is_upgrade(req)) {
        auto session = RequestRouter::websocket_session(target);
        if (session) {
            serve_websocket(std::move(socket), *session, req);
            return;
        }
    }

    HttpRequest request;
    request.method = std::string(req.method_string());
    request.target = target;
    request.body = req.body();
    HttpResponse routed = router_->handle(request);

    http::response<http::string_body> res;
    res.version(req.version());
    res.result(static_cast<http::status>(routed.status));
    res.set(http::field::server, "trade_guard");
    res.set(http::field::content_type, "application/json");
    res.keep_alive(false);
    res.body() = routed.body.dump();
    res.prepare_payload();
    http::write(socket, res, ec);
    if (ec) {
        DEBUG("Response write failed: " << ec.message());
    }

    DEBUG(request.method << " " << target << " -> " << routed.status);
    socket.shutdown(tcp::socket::shutdown_send, ec);
}

void HttpServer::serve_websocket(tcp::socket socket, const std::string& session_id,
                                 const http::request<http::string_body>& request) {
    if (!bus_->has_session(session_id)) {
        http::response<http::string_body> res{http::status::not_found, request.version()};
        res.set(http::field::content_type, "application/json");
        res.body() = R"({"detail":"session_not_found"})";
        res.prepare_payload();
        beast::error_code ec;
        http::write(socket, res, ec);
        return;
    }

    auto connection = std::make_shared<WebSocketConnection>(
        "ws-" + std::to_string(next_connection_id_.fetch_add(1)), session_id, std::move(socket),
        bus_, config_.accept_poll_ms);
    auto accepted = connection->accept(request);
    if (accepted.is_error()) {
        WARN(accepted.error()->what());
        return;
    }
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        if (!running_.load()) {
            connection->close();
            return;
        }
        sockets_.push_back(connection);
    }

    auto registered = bus_->register_connection(session_id, connection);
    if (registered.is_error()) {
        WARN("WebSocket " << connection->id()
                          << " could not join: " << registered.error()->what());
        connection->close();
        return;
    }
    connection->read_loop();
}

}  // namespace trade_guard
