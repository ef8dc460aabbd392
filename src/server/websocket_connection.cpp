// src/server/websocket_connection.cpp
#include "trade_guard/server/websocket_connection.hpp"
#include <boost/asio/buffer.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <chrono>
#include "trade_guard/core/logger.hpp"

namespace trade_guard {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

namespace {

// Moves an accepted socket onto the connection's own io_context
tcp::socket rebind(asio::io_context& ioc, tcp::socket socket) {
    beast::error_code ec;
    auto endpoint = socket.local_endpoint(ec);
    if (ec)
        return tcp::socket(ioc);
    auto handle = socket.release(ec);
    if (ec)
        return tcp::socket(ioc);
    return tcp::socket(ioc, endpoint.protocol(), handle);
}

}  // namespace

WebSocketConnection::WebSocketConnection(std::string id, std::string session_id,
                                         tcp::socket socket, std::shared_ptr<MessageBus> bus,
                                         int poll_ms)
    : id_(std::move(id)),
      session_id_(std::move(session_id)),
      stream_(rebind(ioc_, std::move(socket))),
      bus_(std::move(bus)),
      poll_ms_(poll_ms) {
    stream_.text(true);
}

Result<void> WebSocketConnection::accept(const Request& request) {
    beast::error_code ec;
    stream_.accept(request, ec);
    if (ec) {
        open_.store(false);
        return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                "WebSocket handshake failed: " + ec.message(), "WebSocket");
    }
    return Result<void>();
}

Result<void> WebSocketConnection::send(const nlohmann::json& envelope) {
    if (!open_.load()) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR, "WebSocket " + id_ + " is closed",
                                "WebSocket");
    }
    enqueue(envelope.dump());
    return Result<void>();
}

size_t WebSocketConnection::queued() const {
    std::lock_guard<std::mutex> lock(outbound_mutex_);
    return outbound_.size();
}

void WebSocketConnection::enqueue(std::string text) {
    {
        std::lock_guard<std::mutex> lock(outbound_mutex_);
        outbound_.push_back(std::move(text));
    }
    // Wakes the owner out of run_one_for()
    asio::post(ioc_, [] {});
}

void WebSocketConnection::start_write() {
    if (write_pending_)
        return;
    {
        std::lock_guard<std::mutex> lock(outbound_mutex_);
        if (outbound_.empty())
            return;
        writing_ = std::move(outbound_.front());
        outbound_.pop_front();
    }
    write_pending_ = true;
    stream_.async_write(asio::buffer(writing_), [this](beast::error_code ec, std::size_t) {
        write_pending_ = false;
        if (ec) {
            if (open_.exchange(false)) {
                WARN("WebSocket " << id_ << " write failed: " << ec.message());
            }
        }
    });
}

void WebSocketConnection::handle_frame(const std::string& text) {
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        enqueue(R"({"error":"invalid_json"})");
        return;
    }
    auto message = McpMessage::from_json(parsed, session_id_);
    if (message.is_error()) {
        nlohmann::json reply = {{"error", "invalid_message"},
                                {"reason", message.error()->what()}};
        enqueue(reply.dump());
        return;
    }
    McpMessage routed = message.value();
    routed.session_id = session_id_;
    bus_->broadcast(session_id_, routed);
}

void WebSocketConnection::read_loop() {
    Logger::register_component("WebSocket");
    beast::flat_buffer buffer;
    bool reading = false;
    bool received = false;
    beast::error_code read_ec;

    while (open_.load()) {
        start_write();
        if (!reading) {
            received = false;
            stream_.async_read(buffer, [&](beast::error_code ec, std::size_t) {
                read_ec = ec;
                received = true;
            });
            reading = true;
        }

        if (ioc_.stopped())
            ioc_.restart();
        ioc_.run_one_for(std::chrono::milliseconds(poll_ms_));

        if (!received)
            continue;
        reading = false;
        if (read_ec) {
            if (read_ec != websocket::error::closed && open_.load()) {
                WARN("WebSocket " << id_ << " read failed: " << read_ec.message());
            }
            break;
        }
        std::string text = beast::buffers_to_string(buffer.data());
        buffer.consume(buffer.size());
        handle_frame(text);
    }

    open_.store(false);
    shutdown_stream();
    bus_->unregister_connection(session_id_, id_);
    INFO("WebSocket " << id_ << " left session " << session_id_);
}

void WebSocketConnection::shutdown_stream() {
    beast::error_code ec;
    auto& socket = beast::get_lowest_layer(stream_);
    socket.shutdown(tcp::socket::shutdown_both, ec);
    socket.close(ec);
    // Completes the aborted read and write handlers while their buffers are alive
    ioc_.restart();
    ioc_.run();
}

void WebSocketConnection::close() {
    if (!open_.exchange(false)) {
        return;
    }
    // The owner thread notices on wake-up and tears the stream down itself
    asio::post(ioc_, [] {});
}

}  // namespace trade_guard
