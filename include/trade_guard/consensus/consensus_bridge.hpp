// include/trade_guard/consensus/consensus_bridge.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>
#include "trade_guard/consensus/consensus_engine.hpp"
#include "trade_guard/messaging/message_bus.hpp"

namespace trade_guard {

class RiskOrchestrator;

/**
 * @brief Bus participant that feeds proposals and votes into the ConsensusEngine
 *
 * A PROPOSAL registers a proposal (id from the payload, else
 * "{sender}:{symbol}:{unix_ms}"); a VOTE is cast on behalf of its sender.
 * Every resolution is broadcast as a CONSENSUS message, and an approved one
 * is submitted to the orchestrator under the proposer's id.
 * Messages it sent itself are ignored.
 */
class ConsensusBridge : public Connection, public std::enable_shared_from_this<ConsensusBridge> {
public:
    static constexpr const char* kSenderId = "consensus-engine";

    ConsensusBridge(std::string session_id, std::shared_ptr<ConsensusEngine> engine,
                    std::shared_ptr<MessageBus> bus,
                    std::shared_ptr<RiskOrchestrator> orchestrator = nullptr,
                    std::shared_ptr<Clock> clock = system_clock());

    /**
     * @brief Join the session and subscribe to resolutions
     * The replayed history is processed like live traffic.
     */
    Result<void> attach();

    /**
     * @brief Leave the session
     * The bus holds the attached bridge; the bridge only observes the bus.
     */
    void detach();

    const std::string& id() const override {
        return id_;
    }

    Result<void> send(const nlohmann::json& envelope) override;

    /**
     * @brief Broadcast a resolution and act on it
     */
    void handle_resolution(const ConsensusResult& result);

private:
    Result<void> handle_proposal(const McpMessage& message);
    Result<void> handle_vote(const McpMessage& message);
    void submit_approved(const ConsensusResult& result);

    std::string id_;
    std::string session_id_;
    std::shared_ptr<ConsensusEngine> engine_;
    std::weak_ptr<MessageBus> bus_;
    std::shared_ptr<RiskOrchestrator> orchestrator_;
    std::shared_ptr<Clock> clock_;
};

}  // namespace trade_guard
