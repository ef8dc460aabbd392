// src/orchestrator/risk_orchestrator.cpp
#include "trade_guard/orchestrator/risk_orchestrator.hpp"
#include <cmath>
#include <cstdio>
#include <set>
#include <stdexcept>
#include "trade_guard/core/logger.hpp"
#include "trade_guard/core/time_utils.hpp"

namespace trade_guard {

namespace {

const char* kSender = "risk-orchestrator";

std::string fixed2(double value) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.2f", value);
    return buffer;
}

double round_to(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

std::optional<double> metadata_number(const nlohmann::json& metadata, const char* key) {
    if (metadata.is_object() && metadata.contains(key) && metadata.at(key).is_number()) {
        return metadata.at(key).get<double>();
    }
    return std::nullopt;
}

}  // namespace

nlohmann::json OrchestratorConfig::to_json() const {
    nlohmann::json j;
    j["symbols"] = symbols;
    j["idempotency_ttl_seconds"] = idempotency_ttl_seconds;
    j["adaptive_exits"] = adaptive_exits;
    j["coordination_session"] = coordination_session;
    return j;
}

void OrchestratorConfig::from_json(const nlohmann::json& j) {
    if (j.contains("symbols"))
        symbols = j.at("symbols").get<std::vector<std::string>>();
    if (j.contains("idempotency_ttl_seconds"))
        idempotency_ttl_seconds = j.at("idempotency_ttl_seconds").get<int>();
    if (j.contains("adaptive_exits"))
        adaptive_exits = j.at("adaptive_exits").get<bool>();
    if (j.contains("coordination_session"))
        coordination_session = j.at("coordination_session").get<std::string>();
}

std::vector<std::string> OrchestratorConfig::validate() const {
    std::vector<std::string> problems;
    if (idempotency_ttl_seconds <= 0)
        problems.push_back("idempotency_ttl_seconds must be positive");
    for (const auto& symbol : symbols) {
        if (symbol.empty()) {
            problems.push_back("symbols must not contain empty names");
            break;
        }
    }
    return problems;
}

std::string submit_status_to_string(SubmitStatus status) {
    switch (status) {
        case SubmitStatus::SUBMITTED:
            return "submitted";
        case SubmitStatus::DUPLICATE:
            return "duplicate";
        case SubmitStatus::REJECTED:
            return "rejected";
    }
    return "rejected";
}

nlohmann::json SubmitResponse::to_json() const {
    nlohmann::json j;
    j["status"] = submit_status_to_string(status);
    if (!order_id.empty())
        j["order_id"] = order_id;
    if (status == SubmitStatus::REJECTED) {
        j["detail"] = code;
        j["reason"] = reason;
    } else if (status == SubmitStatus::SUBMITTED) {
        j["notional"] = notional;
        if (exits)
            j["adaptive_tpsl"] = exits->to_json();
    }
    return j;
}

RiskOrchestrator::RiskOrchestrator(OrchestratorConfig config, RiskEngine engine,
                                   GuardrailChain guardrails, OrchestratorServices services)
    : config_(std::move(config)),
      engine_(std::move(engine)),
      guardrails_(std::move(guardrails)),
      services_(std::move(services)) {
    Logger::register_component("RiskOrchestrator");
    if (!services_.safeguards || !services_.store || !services_.idempotency ||
        !services_.gateway || !services_.events || !services_.risk_guard || !services_.clock) {
        throw std::invalid_argument("RiskOrchestrator is missing a required service");
    }
    if (services_.bus && !config_.coordination_session.empty()) {
        services_.bus->ensure_session(config_.coordination_session);
    }
}

std::string RiskOrchestrator::idempotency_key(const std::string& bot_id,
                                              const std::string& symbol) {
    return bot_id + ":" + symbol;
}

Result<SubmitResponse> RiskOrchestrator::submit_order(const std::string& bot_id,
                                                      const OrderIntent& intent) {
    if (bot_id.empty()) {
        return make_error<SubmitResponse>(ErrorCode::INVALID_ARGUMENT, "bot_id is required",
                                          "RiskOrchestrator");
    }

    auto gate = services_.safeguards->can_trade();
    if (!gate.allowed) {
        if (gate.breaker_open) {
            return make_error<SubmitResponse>(ErrorCode::SERVICE_DEGRADED, gate.reason,
                                              "RiskOrchestrator");
        }
        SubmitResponse response;
        response.status = SubmitStatus::REJECTED;
        response.code = gate.kill_switch ? "kill_switch_active" : "safeguard_blocked";
        response.reason = gate.reason;
        WARN("Order from " << bot_id << " on " << intent.symbol << " blocked: " << gate.reason);
        return response;
    }

    auto snapshot = services_.store->get_fresh();
    if (snapshot.is_error()) {
        return make_error<SubmitResponse>(ErrorCode::NOT_READY,
                                          std::string("Portfolio not ready: ") +
                                              snapshot.error()->what(),
                                          "RiskOrchestrator");
    }

    const std::string key = idempotency_key(bot_id, intent.symbol);
    const std::string order_id =
        key + ":" + std::to_string(core::to_unix_ms(services_.clock->now()));

    if (auto pending = lookup_pending(key)) {
        INFO("Duplicate order from " << bot_id << " on " << intent.symbol << " (pending "
                                     << *pending << ")");
        broadcast_consensus("", false, {bot_id}, "duplicate order");
        SubmitResponse response;
        response.status = SubmitStatus::DUPLICATE;
        response.order_id = *pending;
        return response;
    }

    std::string reference = broadcast_query(intent, bot_id, order_id);

    auto entry = reference_price(snapshot.value(), intent);
    std::optional<AdaptiveTPSL> exits;
    Evaluation evaluation;
    try {
        exits = adaptive_exits(intent, entry, bot_id);
        evaluation = evaluate(snapshot.value(), intent, entry, exits, bot_id, order_id);
    } catch (const std::exception& e) {
        ERROR("Risk evaluation failed for " << order_id << ": " << e.what());
        evaluation = Evaluation{};
        evaluation.code = "risk_check_failed";
        evaluation.reason = std::string("Risk evaluation failed: ") + e.what();
    }

    broadcast_consensus(reference, evaluation.approved, {bot_id, "risk-engine"},
                        evaluation.reason);

    if (!evaluation.approved) {
        INFO("Order " << order_id << " rejected [" << evaluation.code
                      << "]: " << evaluation.reason);
        SubmitResponse response;
        response.status = SubmitStatus::REJECTED;
        response.order_id = order_id;
        response.code = evaluation.code;
        response.reason = evaluation.reason;
        return response;
    }

    auto payload = decorate(intent, evaluation, entry, exits, order_id);
    if (payload.is_error()) {
        return forward_error<SubmitResponse>(payload);
    }

    if (!services_.safeguards->check_circuit_breaker("orders")) {
        return make_error<SubmitResponse>(ErrorCode::SERVICE_DEGRADED,
                                          "Orders circuit breaker is open", "RiskOrchestrator");
    }

    auto reserved = services_.idempotency->reserve(
        key, order_id, std::chrono::seconds(config_.idempotency_ttl_seconds));
    if (reserved.is_error()) {
        WARN("Idempotency reserve failed for " << key << ": " << reserved.error()->what());
    } else if (reserved.value()) {
        SubmitResponse response;
        response.status = SubmitStatus::DUPLICATE;
        response.order_id = *reserved.value();
        return response;
    }

    auto placed = services_.gateway->place_order(payload.value());
    if (placed.is_error()) {
        services_.safeguards->record_failure("orders");
        ERROR("Order placement failed [" << bot_id << "] " << order_id << ": "
                                         << placed.error()->what());
        nlohmann::json failed_event;
        failed_event["bot_id"] = bot_id;
        failed_event["event"] = "order_failed";
        failed_event["order_id"] = order_id;
        failed_event["error"] = placed.error()->what();
        failed_event["timestamp"] = core::to_iso8601(services_.clock->now());
        auto published = services_.events->publish_decision(failed_event);
        if (published.is_error()) {
            WARN("Failed to publish order failure: " << published.error()->what());
        }
        broadcast_execution(order_id, "failed", placed.error()->what());
        return forward_error<SubmitResponse>(placed);
    }

    services_.safeguards->record_success("orders");
    services_.safeguards->record_order();

    nlohmann::json decision;
    decision["bot_id"] = bot_id;
    decision["event"] = "order_placed";
    decision["order_id"] = order_id;
    decision["symbol"] = intent.symbol;
    decision["side"] = side_to_string(intent.side);
    decision["notional"] = evaluation.notional;
    decision["metadata"] = intent.client_metadata;
    decision["timestamp"] = core::to_iso8601(services_.clock->now());
    auto published = services_.events->publish_decision(decision);
    if (published.is_error()) {
        WARN("Failed to publish decision for " << order_id << ": " << published.error()->what());
    }
    broadcast_execution(order_id, "submitted");

    INFO("Order " << order_id << " submitted: " << side_to_string(intent.side) << " "
                  << intent.symbol << " notional " << fixed2(evaluation.notional));

    SubmitResponse response;
    response.status = SubmitStatus::SUBMITTED;
    response.order_id = order_id;
    response.notional = evaluation.notional;
    response.exits = std::move(exits);
    return response;
}

std::optional<Price> RiskOrchestrator::reference_price(const PortfolioSnapshot& snapshot,
                                                      const OrderIntent& intent) {
    if (auto entry = intent.entry_price()) {
        return entry;
    }
    return snapshot.last_price(intent.symbol);
}

std::optional<AdaptiveTPSL> RiskOrchestrator::adaptive_exits(const OrderIntent& intent,
                                                             std::optional<Price> entry,
                                                             const std::string& bot_id) const {
    if (!config_.adaptive_exits || !services_.tpsl || !entry || intent.take_profit ||
        intent.stop_loss) {
        return std::nullopt;
    }
    double confidence = metadata_number(intent.client_metadata, "confidence").value_or(0.7);
    return services_.tpsl->calculate(intent.symbol, intent.side, *entry, bot_id, confidence);
}

RiskOrchestrator::Evaluation RiskOrchestrator::evaluate(const PortfolioSnapshot& snapshot,
                                                        const OrderIntent& intent,
                                                        std::optional<Price> entry,
                                                        const std::optional<AdaptiveTPSL>& exits,
                                                        const std::string& bot_id,
                                                        const std::string& order_id) const {
    Evaluation evaluation;
    evaluation.requested_notional = RiskEngine::evaluated_notional(snapshot, intent);
    evaluation.notional = evaluation.requested_notional;
    evaluation.leverage = intent.leverage;

    auto risk = engine_.evaluate(snapshot, intent, bot_id, order_id);
    if (!risk.approved) {
        evaluation.code = "risk_check_failed";
        evaluation.reason = risk.reason;
        return evaluation;
    }

    if (auto rejection = guardrails_.evaluate(snapshot, intent)) {
        evaluation.code = rejection->code;
        evaluation.reason = rejection->reason;
        return evaluation;
    }

    // No stop at all: the loss cap is inactive, the other RiskGuard limits still apply
    double sl_pct = 0.0;
    if (intent.stop_loss && entry) {
        sl_pct = std::abs(*entry - *intent.stop_loss) / *entry;
    } else if (exits) {
        sl_pct = exits->sl_pct;
    }

    double leverage = intent.leverage.value_or(1.0);
    auto sized = services_.risk_guard->check_trade(
        snapshot.balance, evaluation.requested_notional, leverage, sl_pct, intent.symbol,
        metadata_number(intent.client_metadata, "atr_pct"));
    if (!sized.approved) {
        evaluation.code = "risk_guard_rejected";
        evaluation.reason = sized.reason;
        return evaluation;
    }
    evaluation.notional = sized.adjusted_size;
    if (intent.leverage || sized.adjusted_leverage != leverage) {
        evaluation.leverage = sized.adjusted_leverage;
    }
    if (sized.adjusted_size < evaluation.requested_notional) {
        INFO("Order " << order_id << " resized from " << fixed2(evaluation.requested_notional)
                      << " to " << fixed2(sized.adjusted_size));
    }

    evaluation.approved = true;
    evaluation.reason = risk.reason.empty() ? "Approved" : risk.reason;
    return evaluation;
}

Result<nlohmann::json> RiskOrchestrator::decorate(const OrderIntent& intent,
                                                  const Evaluation& evaluation,
                                                  std::optional<Price> entry,
                                                  const std::optional<AdaptiveTPSL>& exits,
                                                  const std::string& order_id) const {
    nlohmann::json payload;
    payload["symbol"] = intent.symbol;
    payload["side"] = side_to_string(intent.side);
    payload["type"] = order_type_to_string(intent.order_type);
    payload["clientOrderId"] = order_id;

    if (intent.quantity) {
        double scale = evaluation.requested_notional > 0.0
                           ? evaluation.notional / evaluation.requested_notional
                           : 1.0;
        payload["quantity"] = round_to(*intent.quantity * scale, 6);
    } else {
        if (!entry) {
            return make_error<nlohmann::json>(
                ErrorCode::INVALID_ORDER,
                "Cannot derive quantity for " + intent.symbol + ": no price or last price",
                "RiskOrchestrator");
        }
        payload["quantity"] = round_to(evaluation.notional / *entry, 6);
    }

    if (intent.price)
        payload["price"] = *intent.price;
    if (evaluation.leverage)
        payload["leverage"] = *evaluation.leverage;
    if (intent.take_profit)
        payload["stopPrice"] = *intent.take_profit;
    if (intent.stop_loss)
        payload["stopLossPrice"] = *intent.stop_loss;
    if (exits) {
        payload["stopPrice"] = round_to(exits->tp_price, 6);
        payload["stopLossPrice"] = round_to(exits->sl_price, 6);
    }

    // Nested, never merged into the order fields
    if (intent.client_metadata.is_object() && !intent.client_metadata.empty()) {
        payload["client_metadata"] = intent.client_metadata;
    }
    return payload;
}

std::optional<std::string> RiskOrchestrator::lookup_pending(const std::string& key) {
    auto pending = services_.idempotency->lookup(key);
    if (pending.is_error()) {
        WARN("Idempotency lookup failed for " << key << ": " << pending.error()->what());
        return std::nullopt;
    }
    return pending.value();
}

std::vector<std::string> RiskOrchestrator::tracked_symbols() const {
    std::set<std::string> symbols(config_.symbols.begin(), config_.symbols.end());
    auto snapshot = services_.store->get();
    if (snapshot.is_ok()) {
        for (const auto& symbol : snapshot.value().symbols()) {
            symbols.insert(symbol);
        }
    }
    return std::vector<std::string>(symbols.begin(), symbols.end());
}

nlohmann::json RiskOrchestrator::emergency_stop(const std::string& reason) {
    services_.safeguards->activate_kill_switch(reason);

    nlohmann::json cancelled = nlohmann::json::array();
    nlohmann::json failed = nlohmann::json::array();
    for (const auto& symbol : tracked_symbols()) {
        auto result = services_.gateway->cancel_all_orders(symbol);
        if (result.is_error()) {
            ERROR("Failed to cancel orders for " << symbol << ": " << result.error()->what());
            failed.push_back(symbol);
        } else {
            cancelled.push_back(symbol);
        }
    }

    nlohmann::json event;
    event["bot_id"] = "orchestrator";
    event["event"] = "kill_switch";
    event["reason"] = reason;
    event["cancelled"] = cancelled;
    event["failed"] = failed;
    event["timestamp"] = core::to_iso8601(services_.clock->now());
    auto published = services_.events->publish_reasoning(event);
    if (published.is_error()) {
        WARN("Failed to publish kill switch event: " << published.error()->what());
    }

    WARN("Emergency stop complete: " << cancelled.size() << " cancelled, " << failed.size()
                                     << " failed");

    nlohmann::json response;
    response["status"] = "halted";
    response["cancelled"] = cancelled.size();
    response["failed"] = failed.size();
    response["failed_symbols"] = failed;
    return response;
}

void RiskOrchestrator::resume_trading() {
    services_.safeguards->deactivate_kill_switch();
    INFO("Trading resumed by operator");
}

Result<void> RiskOrchestrator::register_decision(const nlohmann::json& payload) {
    if (!payload.is_object()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Decision must be an object",
                                "RiskOrchestrator");
    }
    if (!payload.contains("bot_id") || !payload.at("bot_id").is_string() ||
        payload.at("bot_id").get<std::string>().empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "bot_id is required",
                                "RiskOrchestrator");
    }
    if (!payload.contains("decision") || !payload.at("decision").is_object()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "decision must be an object",
                                "RiskOrchestrator");
    }
    if (payload.contains("context") && !payload.at("context").is_object()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "context must be an object",
                                "RiskOrchestrator");
    }
    if (payload.contains("confidence") && !payload.at("confidence").is_number()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "confidence must be a number",
                                "RiskOrchestrator");
    }

    nlohmann::json record = payload;
    if (!record.contains("context"))
        record["context"] = nlohmann::json::object();
    if (!record.contains("reasoning"))
        record["reasoning"] = nlohmann::json::array();
    if (!record.contains("timestamp"))
        record["timestamp"] = core::to_iso8601(services_.clock->now());

    auto published = services_.events->publish_reasoning(record);
    if (published.is_error()) {
        WARN("Failed to record decision from " << record.at("bot_id").get<std::string>()
                                               << ": " << published.error()->what());
    }
    DEBUG("Recorded decision from " << record.at("bot_id").get<std::string>());
    return Result<void>();
}

Result<void> RiskOrchestrator::record_trade_result(const std::string& bot_id,
                                                  const std::string& symbol, double pnl) {
    if (bot_id.empty() || symbol.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "bot_id and symbol are required",
                                "RiskOrchestrator");
    }
    if (!std::isfinite(pnl)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "pnl must be finite",
                                "RiskOrchestrator");
    }

    if (services_.performance) {
        services_.performance->record_trade(bot_id, symbol, pnl);
    }
    if (!services_.risk_guard->record_trade_result(pnl)) {
        WARN("Daily loss halt active after " << bot_id << " " << symbol << " pnl "
                                            << fixed2(pnl));
    }

    nlohmann::json event;
    event["bot_id"] = bot_id;
    event["event"] = "trade_closed";
    event["symbol"] = symbol;
    event["pnl"] = pnl;
    event["daily_pnl"] = services_.risk_guard->daily_pnl();
    event["timestamp"] = core::to_iso8601(services_.clock->now());
    auto published = services_.events->publish_decision(event);
    if (published.is_error()) {
        WARN("Failed to publish trade result: " << published.error()->what());
    }
    return Result<void>();
}

void RiskOrchestrator::reset_daily() {
    services_.safeguards->reset_daily_metrics();
    services_.risk_guard->reset_daily_pnl();
    INFO("Daily loss counters reset");
}

Result<nlohmann::json> RiskOrchestrator::performance_summary(const std::string& bot_id) const {
    if (!services_.performance) {
        return make_error<nlohmann::json>(ErrorCode::NOT_INITIALIZED,
                                          "Performance tracking is not configured",
                                          "RiskOrchestrator");
    }
    nlohmann::json j = services_.performance->get_agent_summary(bot_id);
    j["agent_id"] = bot_id;
    j["preferred_symbols"] = services_.performance->get_preferred_symbols(bot_id, tracked_symbols());
    return j;
}

void RiskOrchestrator::handle_snapshot(const PortfolioSnapshot& snapshot) {
    services_.safeguards->update_heat_metrics(snapshot);
    if (!services_.safeguards->check_drawdown_limits()) {
        WARN("Drawdown limits breached on latest snapshot");
    }

    nlohmann::json positions = nlohmann::json::array();
    for (const auto& entry : snapshot.positions) {
        nlohmann::json p;
        p["symbol"] = entry.second.symbol;
        p["quantity"] = entry.second.quantity;
        p["entry_price"] = entry.second.entry_price;
        p["mark_price"] = entry.second.mark_price;
        p["notional"] = entry.second.notional;
        p["unrealized_pnl"] = entry.second.unrealized_pnl;
        positions.push_back(p);
    }

    nlohmann::json event;
    event["bot_id"] = "orchestrator";
    event["balance"] = fixed2(snapshot.balance);
    event["total_exposure"] = fixed2(snapshot.total_exposure);
    event["positions"] = positions.dump();
    event["unrealized_pnl"] = fixed2(snapshot.unrealized_pnl);
    event["timestamp"] = core::to_iso8601(snapshot.timestamp);
    auto published = services_.events->publish_position(event);
    if (published.is_error()) {
        WARN("Failed to publish position snapshot: " << published.error()->what());
    }

    if (coordination_enabled()) {
        auto heat = services_.safeguards->heat();
        nlohmann::json market;
        market["balance"] = snapshot.balance;
        market["equity"] = snapshot.equity();
        market["total_exposure"] = snapshot.total_exposure;
        market["positions"] = snapshot.open_position_count();
        market["unrealized_pnl"] = snapshot.unrealized_pnl;

        nlohmann::json payload;
        payload["market"] = market;
        payload["risk_state"] = heat.to_json();
        payload["risk_state"]["kill_switch_active"] =
            services_.safeguards->is_kill_switch_active();
        payload["telemetry"] = {{"source", "portfolio_watcher"}};
        broadcast(McpMessageType::OBSERVATION, payload);
    }
}

Result<PortfolioSnapshot> RiskOrchestrator::portfolio() {
    return services_.store->get_fresh();
}

nlohmann::json RiskOrchestrator::status_json() const {
    nlohmann::json j = services_.safeguards->status_json();
    j["risk_guard"] = {{"trading_halted", services_.risk_guard->is_trading_halted()},
                       {"daily_pnl", services_.risk_guard->daily_pnl()}};
    auto halt = services_.risk_guard->halt_reason();
    if (halt)
        j["risk_guard"]["halt_reason"] = *halt;
    j["idempotency_backend"] = services_.idempotency->backend();
    j["tracked_symbols"] = tracked_symbols();
    return j;
}

bool RiskOrchestrator::is_halted() const {
    return services_.safeguards->is_kill_switch_active();
}

std::string RiskOrchestrator::broadcast_query(const OrderIntent& intent, const std::string& bot_id,
                                              const std::string& order_id) {
    if (!coordination_enabled()) {
        return "";
    }
    nlohmann::json context;
    context["bot_id"] = bot_id;
    context["notional"] = intent.notional;
    context["take_profit"] =
        intent.take_profit ? nlohmann::json(*intent.take_profit) : nlohmann::json();
    context["stop_loss"] = intent.stop_loss ? nlohmann::json(*intent.stop_loss) : nlohmann::json();

    nlohmann::json payload;
    payload["reference_id"] = order_id;
    payload["question"] =
        "Should we execute " + side_to_string(intent.side) + " " + intent.symbol + "?";
    payload["topic"] = "trade_proposal";
    payload["context"] = context;
    broadcast(McpMessageType::QUERY, payload);
    return order_id;
}

void RiskOrchestrator::broadcast_consensus(const std::string& reference, bool approved,
                                           const std::vector<std::string>& participants,
                                           const std::string& notes) {
    if (!coordination_enabled()) {
        return;
    }
    nlohmann::json payload;
    payload["reference_id"] = reference.empty() ? nlohmann::json() : nlohmann::json(reference);
    payload["approved"] = approved;
    payload["consensus_score"] = approved ? 1.0 : 0.0;
    payload["participants"] = participants;
    payload["notes"] = notes;
    broadcast(McpMessageType::CONSENSUS, payload);
}

void RiskOrchestrator::broadcast_execution(const std::string& order_id, const std::string& status,
                                           const std::string& error) {
    if (!coordination_enabled()) {
        return;
    }
    nlohmann::json payload;
    payload["order_id"] = order_id;
    payload["status"] = status;
    payload["error"] = error.empty() ? nlohmann::json() : nlohmann::json(error);
    broadcast(McpMessageType::EXECUTION, payload);
}

void RiskOrchestrator::broadcast(McpMessageType type, const nlohmann::json& payload) {
    McpMessage message;
    message.session_id = config_.coordination_session;
    message.sender_id = kSender;
    message.sender_role = McpRole::COORDINATOR;
    message.message_type = type;
    message.payload = payload;
    message.timestamp = services_.clock->now();
    services_.bus->broadcast(config_.coordination_session, message);
}

}  // namespace trade_guard
