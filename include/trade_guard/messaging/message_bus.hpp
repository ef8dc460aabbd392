// include/trade_guard/messaging/message_bus.hpp
#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>
#include "trade_guard/core/clock.hpp"
#include "trade_guard/core/config_base.hpp"
#include "trade_guard/core/error.hpp"
#include "trade_guard/messaging/mcp_message.hpp"

namespace trade_guard {

/**
 * @brief One participant attached to a session
 */
class Connection {
public:
    virtual ~Connection() = default;

    virtual const std::string& id() const = 0;

    /**
     * @brief Deliver an envelope
     * @return Error if the peer is gone; the bus then drops this connection
     */
    virtual Result<void> send(const nlohmann::json& envelope) = 0;
};

struct MessageBusConfig : public ConfigBase {
    size_t history_limit{500};
    size_t replay_limit{50};
    // Sessions from create_session() that nobody joins are swept after this
    int idle_session_ttl_seconds{300};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    std::vector<std::string> validate() const override;
};

/**
 * @brief Session-scoped fan-out with bounded history and replay
 *
 * Sends always happen outside the bus lock, so a slow or failing peer
 * never blocks other sessions.
 */
class MessageBus {
public:
    explicit MessageBus(MessageBusConfig config = MessageBusConfig(),
                        std::shared_ptr<Clock> clock = system_clock());

    MessageBus(const MessageBus&) = delete;
    MessageBus& operator=(const MessageBus&) = delete;

    /**
     * @brief Open a session with a random 32 hex character id
     *
     * Also sweeps earlier sessions that stayed empty past the idle TTL.
     */
    std::string create_session();

    /**
     * @brief Open a session under a caller-chosen id and keep it open
     *
     * Pinned sessions outlive their last connection and are never swept.
     */
    void ensure_session(const std::string& session_id);

    std::vector<std::string> list_sessions() const;
    bool has_session(const std::string& session_id) const;

    /**
     * @brief Attach a connection after replaying recent history to it
     *
     * Messages broadcast during the replay are delivered too, in order.
     * @return SESSION_NOT_FOUND for unknown sessions, or the send error if
     *         the replay failed (the connection is then not attached)
     */
    Result<void> register_connection(const std::string& session_id,
                                      std::shared_ptr<Connection> connection);

    /**
     * @brief Detach a connection; an empty unpinned session is removed with its history
     */
    void unregister_connection(const std::string& session_id, const std::string& connection_id);

    /**
     * @brief Append to history and send to every attached connection
     *
     * Unknown sessions are not created; the message is dropped. A failed
     * send detaches only that connection.
     * @return Number of connections that accepted the message
     */
    size_t broadcast(const std::string& session_id, const McpMessage& message);

    /**
     * @brief Heartbeat from the coordinator carrying payload
     */
    size_t broadcast_system_event(const std::string& session_id, const nlohmann::json& payload);

    std::vector<nlohmann::json> history(const std::string& session_id) const;
    size_t connection_count(const std::string& session_id) const;

private:
    struct Session {
        std::deque<std::pair<uint64_t, nlohmann::json>> history;
        std::vector<std::shared_ptr<Connection>> connections;
        uint64_t next_seq{0};
        Timestamp created_at{};
        bool pinned{false};
    };

    std::string generate_session_id();
    size_t sweep_idle_locked();

    MessageBusConfig config_;
    std::shared_ptr<Clock> clock_;
    std::unordered_map<std::string, Session> sessions_;
    std::mt19937_64 rng_;
    mutable std::mutex mutex_;
};

}  // namespace trade_guard
