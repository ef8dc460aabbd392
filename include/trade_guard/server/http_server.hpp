// include/trade_guard/server/http_server.hpp
#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "trade_guard/core/config_base.hpp"
#include "trade_guard/server/request_router.hpp"
#include "trade_guard/server/websocket_connection.hpp"

namespace trade_guard {

struct HttpServerConfig : public ConfigBase {
    std::string bind_address{"0.0.0.0"};
    uint16_t port{8000};
    int accept_poll_ms{50};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    std::vector<std::string> validate() const override;
};

/**
 * @brief Blocking HTTP/1.1 and WebSocket front end on Boost.Beast
 *
 * One accept thread polls a non-blocking acceptor so stop() is prompt.
 * Each connection is served on its own thread: a single request, or a
 * WebSocket session that joins the bus until either side closes.
 */
class HttpServer {
public:
    HttpServer(HttpServerConfig config, std::shared_ptr<RequestRouter> router,
               std::shared_ptr<MessageBus> bus);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Bind and start accepting
     * @return CONNECTION_ERROR when the address cannot be bound
     */
    Result<void> start();
    void stop();

    bool is_running() const {
        return running_.load();
    }

    uint16_t bound_port() const {
        return bound_port_;
    }

private:
    void accept_loop();
    void serve(boost::asio::ip::tcp::socket socket);
    void serve_websocket(boost::asio::ip::tcp::socket socket, const std::string& session_id,
                         const boost::beast::http::request<boost::beast::http::string_body>& request);
    void reap_finished_locked();

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    HttpServerConfig config_;
    std::shared_ptr<RequestRouter> router_;
    std::shared_ptr<MessageBus> bus_;

    boost::asio::io_context ioc_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
    uint16_t bound_port_{0};

    std::atomic<bool> running_{false};
    std::thread accept_thread_;
    std::mutex workers_mutex_;
    std::vector<Worker> workers_;
    std::vector<std::shared_ptr<WebSocketConnection>> sockets_;
    std::atomic<uint64_t> next_connection_id_{0};
};

}  // namespace trade_guard
