// src/consensus/consensus_bridge.cpp
#include "trade_guard/consensus/consensus_bridge.hpp"
#include <stdexcept>
#include "trade_guard/core/logger.hpp"
#include "trade_guard/core/time_utils.hpp"
#include "trade_guard/orchestrator/risk_orchestrator.hpp"

namespace trade_guard {

ConsensusBridge::ConsensusBridge(std::string session_id, std::shared_ptr<ConsensusEngine> engine,
                                 std::shared_ptr<MessageBus> bus,
                                 std::shared_ptr<RiskOrchestrator> orchestrator,
                                 std::shared_ptr<Clock> clock)
    : id_(std::string(kSenderId) + "@" + session_id),
      session_id_(std::move(session_id)),
      engine_(std::move(engine)),
      bus_(bus),
      orchestrator_(std::move(orchestrator)),
      clock_(std::move(clock)) {
    Logger::register_component("ConsensusBridge");
    if (!engine_ || !bus) {
        throw std::invalid_argument("ConsensusBridge requires an engine and a bus");
    }
}

Result<void> ConsensusBridge::attach() {
    std::weak_ptr<ConsensusBridge> weak = shared_from_this();
    engine_->on_resolution([weak](const ConsensusResult& result) {
        if (auto self = weak.lock()) {
            self->handle_resolution(result);
        }
    });

    auto bus = bus_.lock();
    if (!bus) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR, "Message bus is gone",
                                "ConsensusBridge");
    }
    bus->ensure_session(session_id_);
    auto registered = bus->register_connection(session_id_, shared_from_this());
    if (registered.is_error()) {
        return registered;
    }
    INFO("Consensus bridge attached to session " << session_id_);
    return Result<void>();
}

void ConsensusBridge::detach() {
    if (auto bus = bus_.lock()) {
        bus->unregister_connection(session_id_, id_);
    }
}

Result<void> ConsensusBridge::send(const nlohmann::json& envelope) {
    // Failing here would drop the bridge from the session, so malformed
    // traffic is logged and skipped.
    auto parsed = McpMessage::from_json(envelope, session_id_);
    if (parsed.is_error()) {
        WARN("Ignoring malformed message: " << parsed.error()->what());
        return Result<void>();
    }
    const McpMessage& message = parsed.value();
    if (message.sender_id == kSenderId) {
        return Result<void>();
    }

    Result<void> handled;
    switch (message.message_type) {
        case McpMessageType::PROPOSAL:
            handled = handle_proposal(message);
            break;
        case McpMessageType::VOTE:
            handled = handle_vote(message);
            break;
        default:
            break;
    }
    if (handled.is_error()) {
        WARN("Ignoring " << message_type_to_string(message.message_type) << " from "
                         << message.sender_id << ": " << handled.error()->what());
    }
    return Result<void>();
}

Result<void> ConsensusBridge::handle_proposal(const McpMessage& message) {
    auto payload = ProposalPayload::from_json(message.payload);
    if (payload.is_error()) {
        return forward_error<void>(payload);
    }
    ProposalPayload proposal = payload.value();
    if (proposal.proposal_id.empty()) {
        proposal.proposal_id = message.sender_id + ":" + proposal.symbol + ":" +
                               std::to_string(core::to_unix_ms(clock_->now()));
    }
    auto registered = engine_->register_proposal(proposal.proposal_id, proposal,
                                                 message.sender_id);
    if (registered.is_error()) {
        return registered;
    }
    INFO("Proposal " << proposal.proposal_id << " opened by " << message.sender_id);
    return Result<void>();
}

Result<void> ConsensusBridge::handle_vote(const McpMessage& message) {
    auto payload = VotePayload::from_json(message.payload);
    if (payload.is_error()) {
        return forward_error<void>(payload);
    }
    const VotePayload& vote = payload.value();
    // A resolving vote reaches handle_resolution() through the listener
    engine_->cast_vote(vote.proposal_id, message.sender_id, vote.approve, vote.confidence);
    return Result<void>();
}

void ConsensusBridge::handle_resolution(const ConsensusResult& result) {
    McpMessage message;
    message.session_id = session_id_;
    message.sender_id = kSenderId;
    message.sender_role = McpRole::COORDINATOR;
    message.message_type = McpMessageType::CONSENSUS;
    message.payload = result.to_json();
    message.timestamp = clock_->now();
    if (auto bus = bus_.lock()) {
        bus->broadcast(session_id_, message);
    } else {
        WARN("Resolution of " << result.proposal_id << " not broadcast: message bus is gone");
    }

    if (result.approved) {
        submit_approved(result);
    }
}

void ConsensusBridge::submit_approved(const ConsensusResult& result) {
    if (!orchestrator_) {
        return;
    }

    OrderIntent intent;
    intent.symbol = result.payload.symbol;
    intent.side = result.payload.side;
    intent.notional = result.payload.notional;
    intent.client_metadata["proposal_id"] = result.proposal_id;
    intent.client_metadata["consensus_score"] = result.consensus_score;
    intent.client_metadata["confidence"] = result.payload.confidence;
    const auto& constraints = result.payload.constraints;
    if (constraints.is_object()) {
        for (const char* key : {"entry_price", "atr_pct"}) {
            if (constraints.contains(key) && constraints.at(key).is_number()) {
                intent.client_metadata[key] = constraints.at(key);
            }
        }
    }

    auto submitted = orchestrator_->submit_order(result.proposer_id, intent);
    if (submitted.is_error()) {
        ERROR("Approved proposal " << result.proposal_id
                                   << " could not be submitted: " << submitted.error()->to_string());
        return;
    }
    const auto& response = submitted.value();
    INFO("Approved proposal " << result.proposal_id << " -> "
                              << submit_status_to_string(response.status)
                              << (response.code.empty() ? "" : " [" + response.code + "]"));
}

}  // namespace trade_guard
