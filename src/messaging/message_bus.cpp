// src/messaging/message_bus.cpp
#include "trade_guard/messaging/message_bus.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include "trade_guard/core/logger.hpp"

namespace trade_guard {

nlohmann::json MessageBusConfig::to_json() const {
    nlohmann::json j;
    j["history_limit"] = history_limit;
    j["replay_limit"] = replay_limit;
    j["idle_session_ttl_seconds"] = idle_session_ttl_seconds;
    return j;
}

void MessageBusConfig::from_json(const nlohmann::json& j) {
    if (j.contains("history_limit"))
        history_limit = j.at("history_limit").get<size_t>();
    if (j.contains("replay_limit"))
        replay_limit = j.at("replay_limit").get<size_t>();
    if (j.contains("idle_session_ttl_seconds"))
        idle_session_ttl_seconds = j.at("idle_session_ttl_seconds").get<int>();
}

std::vector<std::string> MessageBusConfig::validate() const {
    std::vector<std::string> problems;
    if (history_limit == 0)
        problems.push_back("history_limit must be positive");
    if (replay_limit > history_limit)
        problems.push_back("replay_limit must not exceed history_limit");
    if (idle_session_ttl_seconds <= 0)
        problems.push_back("idle_session_ttl_seconds must be positive");
    return problems;
}

MessageBus::MessageBus(MessageBusConfig config, std::shared_ptr<Clock> clock)
    : config_(std::move(config)), clock_(std::move(clock)), rng_(std::random_device{}()) {
    Logger::register_component("MessageBus");
}

std::string MessageBus::generate_session_id() {
    std::ostringstream os;
    os << std::hex << std::setfill('0') << std::setw(16) << rng_() << std::setw(16) << rng_();
    return os.str();
}

std::string MessageBus::create_session() {
    std::lock_guard<std::mutex> lock(mutex_);
    sweep_idle_locked();
    std::string id;
    do {
        id = generate_session_id();
    } while (sessions_.count(id));
    Session session;
    session.created_at = clock_->now();
    sessions_.emplace(id, std::move(session));
    INFO("Created session " << id);
    return id;
}

void MessageBus::ensure_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& session = sessions_[session_id];
    if (!session.pinned) {
        session.pinned = true;
        session.created_at = clock_->now();
    }
}

size_t MessageBus::sweep_idle_locked() {
    const auto cutoff = clock_->now() - std::chrono::seconds(config_.idle_session_ttl_seconds);
    size_t removed = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        const Session& session = it->second;
        if (!session.pinned && session.connections.empty() && session.created_at <= cutoff) {
            it = sessions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        DEBUG("Swept " << removed << " sessions nobody joined");
    }
    return removed;
}

std::vector<std::string> MessageBus::list_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, _] : sessions_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

bool MessageBus::has_session(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(session_id) > 0;
}

Result<void> MessageBus::register_connection(const std::string& session_id,
                                             std::shared_ptr<Connection> connection) {
    if (!connection) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Connection is null", "MessageBus");
    }

    // Replay outside the lock, then catch up on anything broadcast meanwhile
    // until the connection can be attached with nothing left to send.
    std::optional<uint64_t> next_seq;
    while (true) {
        std::vector<nlohmann::json> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = sessions_.find(session_id);
            if (it == sessions_.end()) {
                return make_error<void>(ErrorCode::SESSION_NOT_FOUND,
                                        "Unknown session: " + session_id, "MessageBus");
            }
            Session& session = it->second;

            if (!next_seq) {
                size_t skip = session.history.size() > config_.replay_limit
                                  ? session.history.size() - config_.replay_limit
                                  : 0;
                next_seq = session.history.empty() ? session.next_seq
                                                   : session.history[skip].first;
            }

            for (const auto& [seq, envelope] : session.history) {
                if (seq >= *next_seq) {
                    pending.push_back(envelope);
                }
            }
            if (pending.empty()) {
                session.connections.push_back(connection);
                break;
            }
            next_seq = session.next_seq;
        }

        for (const auto& envelope : pending) {
            auto sent = connection->send(envelope);
            if (sent.is_error()) {
                WARN("Replay to " << connection->id() << " failed: " << sent.error()->what());
                return sent;
            }
        }
    }

    INFO("Connection " << connection->id() << " joined session " << session_id);
    return Result<void>();
}

void MessageBus::unregister_connection(const std::string& session_id,
                                       const std::string& connection_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return;
    }
    auto& connections = it->second.connections;
    connections.erase(std::remove_if(connections.begin(), connections.end(),
                                     [&](const std::shared_ptr<Connection>& c) {
                                         return c->id() == connection_id;
                                     }),
                      connections.end());
    if (connections.empty() && !it->second.pinned) {
        sessions_.erase(it);
        DEBUG("Session " << session_id << " closed");
    }
}

size_t MessageBus::broadcast(const std::string& session_id, const McpMessage& message) {
    McpMessage stamped = message;
    stamped.session_id = session_id;
    nlohmann::json envelope = stamped.to_envelope();

    std::vector<std::shared_ptr<Connection>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            DEBUG("Dropping " << message_type_to_string(message.message_type) << " for closed session "
                              << session_id);
            return 0;
        }
        Session& session = it->second;
        session.history.emplace_back(session.next_seq++, envelope);
        while (session.history.size() > config_.history_limit) {
            session.history.pop_front();
        }
        targets = session.connections;
    }

    size_t delivered = 0;
    for (const auto& connection : targets) {
        auto sent = connection->send(envelope);
        if (sent.is_ok()) {
            ++delivered;
            continue;
        }
        WARN("Dropping connection " << connection->id() << " from session " << session_id
                                    << ": " << sent.error()->what());
        unregister_connection(session_id, connection->id());
    }
    return delivered;
}

size_t MessageBus::broadcast_system_event(const std::string& session_id,
                                          const nlohmann::json& payload) {
    McpMessage message;
    message.session_id = session_id;
    message.sender_id = "mcp-coordinator";
    message.sender_role = McpRole::COORDINATOR;
    message.message_type = McpMessageType::HEARTBEAT;
    message.payload = payload;
    message.timestamp = clock_->now();
    return broadcast(session_id, message);
}

std::vector<nlohmann::json> MessageBus::history(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<nlohmann::json> out;
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return out;
    }
    for (const auto& [_, envelope] : it->second.history) {
        out.push_back(envelope);
    }
    return out;
}

size_t MessageBus::connection_count(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? 0 : it->second.connections.size();
}

}  // namespace trade_guard
