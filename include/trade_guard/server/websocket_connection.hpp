// include/trade_guard/server/websocket_connection.hpp
#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include "trade_guard/messaging/message_bus.hpp"

namespace trade_guard {

/**
 * @brief One WebSocket participant of an MCP session
 *
 * Frames read from the peer are parsed as MCP messages and broadcast to the
 * session; broadcasts from the bus are written back as text frames.
 *
 * The stream has a private io_context and is only touched by the thread
 * running read_loop(). send() and close() may be called from any thread:
 * they queue work and wake the owner.
 */
class WebSocketConnection : public Connection {
public:
    using Stream = boost::beast::websocket::stream<boost::asio::ip::tcp::socket>;
    using Request = boost::beast::http::request<boost::beast::http::string_body>;

    WebSocketConnection(std::string id, std::string session_id,
                        boost::asio::ip::tcp::socket socket, std::shared_ptr<MessageBus> bus,
                        int poll_ms = 50);

    const std::string& id() const override {
        return id_;
    }

    /**
     * @brief Queue an envelope for the owner thread
     * @return CONNECTION_ERROR once the connection is closed
     */
    Result<void> send(const nlohmann::json& envelope) override;

    /**
     * @brief Complete the server side of the upgrade
     * Must run on the thread that will call read_loop().
     */
    Result<void> accept(const Request& request);

    /**
     * @brief Drive reads and queued writes until the peer closes or close() is called
     * Blocks the calling thread.
     */
    void read_loop();

    void close();

    bool is_open() const {
        return open_.load();
    }

    size_t queued() const;

private:
    void enqueue(std::string text);
    void start_write();
    void handle_frame(const std::string& text);
    void shutdown_stream();

    std::string id_;
    std::string session_id_;
    boost::asio::io_context ioc_;
    Stream stream_;
    std::shared_ptr<MessageBus> bus_;
    int poll_ms_;

    mutable std::mutex outbound_mutex_;
    std::deque<std::string> outbound_;

    // Owner thread only
    std::string writing_;
    bool write_pending_{false};

    std::atomic<bool> open_{true};
};

}  // namespace trade_guard
