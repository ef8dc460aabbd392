// src/server/request_router.cpp
#include "trade_guard/server/request_router.hpp"
#include <stdexcept>
#include "trade_guard/core/logger.hpp"
#include "trade_guard/performance/market_analysis.hpp"

namespace trade_guard {

namespace {

HttpResponse detail(int status, const std::string& code, const std::string& reason = "") {
    HttpResponse response;
    response.status = status;
    response.body["detail"] = code;
    if (!reason.empty())
        response.body["reason"] = reason;
    return response;
}

HttpResponse ok(nlohmann::json body) {
    HttpResponse response;
    response.body = std::move(body);
    return response;
}

// Empty bodies parse as {}
std::optional<nlohmann::json> parse_body(const std::string& body) {
    if (body.empty()) {
        return nlohmann::json::object();
    }
    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        return std::nullopt;
    }
    return parsed;
}

HttpResponse error_response(const TradeError& error) {
    switch (error.code()) {
        case ErrorCode::NOT_READY:
            return detail(503, "portfolio_not_ready", error.what());
        case ErrorCode::SERVICE_DEGRADED:
            return detail(503, "service_degraded", error.what());
        case ErrorCode::INVALID_ARGUMENT:
        case ErrorCode::INVALID_ORDER:
            return detail(422, "validation_error", error.what());
        case ErrorCode::SESSION_NOT_FOUND:
            return detail(404, "session_not_found", error.what());
        default:
            return detail(502, error_code_name(error.code()), error.what());
    }
}

}  // namespace

RequestRouter::RequestRouter(std::shared_ptr<RiskOrchestrator> orchestrator,
                             std::shared_ptr<MessageBus> bus,
                             std::shared_ptr<AdaptiveTPSLCalculator> tpsl,
                             std::shared_ptr<ComponentRegistry> registry)
    : orchestrator_(std::move(orchestrator)),
      bus_(std::move(bus)),
      tpsl_(std::move(tpsl)),
      registry_(std::move(registry)) {
    Logger::register_component("HttpRouter");
    if (!orchestrator_ || !bus_) {
        throw std::invalid_argument("RequestRouter requires an orchestrator and a bus");
    }
}

std::vector<std::string> RequestRouter::split_path(const std::string& target) {
    std::string path = target.substr(0, target.find('?'));
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos)
            end = path.size();
        if (end > start)
            parts.push_back(path.substr(start, end - start));
        start = end + 1;
    }
    if (!parts.empty() && parts.front() == "orchestrator") {
        parts.erase(parts.begin());
    }
    return parts;
}

std::optional<std::string> RequestRouter::websocket_session(const std::string& target) {
    auto parts = split_path(target);
    if (parts.size() == 3 && parts[0] == "mcp" && parts[2] == "ws") {
        return parts[1];
    }
    return std::nullopt;
}

HttpResponse RequestRouter::handle(const HttpRequest& request) const {
    auto parts = split_path(request.target);
    const std::string& method = request.method;

    try {
        if (parts.empty()) {
            if (method == "GET")
                return ok({{"service", "trade_guard"}, {"status", "ok"}});
            return detail(405, "method_not_allowed");
        }

        const std::string& head = parts[0];
        if (parts.size() == 2 && head == "order") {
            if (method != "POST")
                return detail(405, "method_not_allowed");
            return submit_order(parts[1], request.body);
        }
        if (parts.size() == 1) {
            if (head == "emergency_stop" && method == "POST")
                return emergency_stop(request.body);
            if (head == "resume" && method == "POST") {
                orchestrator_->resume_trading();
                return ok({{"status", "resumed"}});
            }
            if (head == "register_decision" && method == "POST")
                return register_decision(request.body);
            if (head == "portfolio" && method == "GET")
                return portfolio();
            if (head == "healthz" && method == "GET")
                return healthz();
            if (head == "safeguards" && method == "GET")
                return ok(orchestrator_->status_json());
            if (head == "tpsl" && method == "POST")
                return tpsl(request.body);
            if (head == "trade_result" && method == "POST")
                return trade_result(request.body);
            if (head == "reset_daily" && method == "POST") {
                orchestrator_->reset_daily();
                return ok({{"status", "reset"}});
            }
        }
        if (parts.size() == 2 && head == "performance") {
            if (method != "GET")
                return detail(405, "method_not_allowed");
            auto summary = orchestrator_->performance_summary(parts[1]);
            if (summary.is_error())
                return detail(503, "service_degraded", summary.error()->what());
            return ok(summary.value());
        }
        if (head == "mcp") {
            if (parts.size() == 2 && parts[1] == "sessions") {
                if (method == "POST")
                    return ok({{"session_id", bus_->create_session()}});
                if (method == "GET")
                    return ok({{"sessions", bus_->list_sessions()}});
                return detail(405, "method_not_allowed");
            }
            if (parts.size() == 3 && parts[2] == "messages") {
                if (method == "POST")
                    return post_message(parts[1], request.body);
                if (method == "GET") {
                    if (!bus_->has_session(parts[1]))
                        return detail(404, "session_not_found");
                    return ok({{"session_id", parts[1]}, {"messages", bus_->history(parts[1])}});
                }
                return detail(405, "method_not_allowed");
            }
        }
    } catch (const std::exception& e) {
        ERROR("Request " << method << " " << request.target << " failed: " << e.what());
        return detail(500, "internal_error", e.what());
    }

    return detail(404, "not_found");
}

HttpResponse RequestRouter::submit_order(const std::string& bot_id,
                                         const std::string& body) const {
    auto parsed = parse_body(body);
    if (!parsed) {
        return detail(422, "validation_error", "Body is not valid JSON");
    }
    auto intent = OrderIntent::from_json(*parsed);
    if (intent.is_error()) {
        return detail(422, "validation_error", intent.error()->what());
    }

    auto result = orchestrator_->submit_order(bot_id, intent.value());
    if (result.is_error()) {
        return error_response(*result.error());
    }
    const auto& response = result.value();
    HttpResponse http;
    http.status = response.status == SubmitStatus::REJECTED ? 400 : 200;
    http.body = response.to_json();
    return http;
}

HttpResponse RequestRouter::emergency_stop(const std::string& body) const {
    auto parsed = parse_body(body);
    std::string reason = "Emergency stop requested";
    if (parsed && parsed->is_object() && parsed->contains("reason") &&
        parsed->at("reason").is_string()) {
        reason = parsed->at("reason").get<std::string>();
    }
    return ok(orchestrator_->emergency_stop(reason));
}

HttpResponse RequestRouter::register_decision(const std::string& body) const {
    auto parsed = parse_body(body);
    if (!parsed) {
        return detail(422, "validation_error", "Body is not valid JSON");
    }
    auto recorded = orchestrator_->register_decision(*parsed);
    if (recorded.is_error()) {
        return detail(422, "validation_error", recorded.error()->what());
    }
    return ok({{"status", "recorded"}});
}

HttpResponse RequestRouter::trade_result(const std::string& body) const {
    auto parsed = parse_body(body);
    if (!parsed || !parsed->is_object()) {
        return detail(422, "validation_error", "Body must be a JSON object");
    }
    const auto& j = *parsed;
    if (!j.contains("bot_id") || !j.at("bot_id").is_string() || !j.contains("symbol") ||
        !j.at("symbol").is_string() || !j.contains("pnl") || !j.at("pnl").is_number()) {
        return detail(422, "validation_error", "bot_id, symbol and numeric pnl are required");
    }
    auto recorded = orchestrator_->record_trade_result(j.at("bot_id").get<std::string>(),
                                                       j.at("symbol").get<std::string>(),
                                                       j.at("pnl").get<double>());
    if (recorded.is_error()) {
        return detail(422, "validation_error", recorded.error()->what());
    }
    return ok({{"status", "recorded"}});
}

HttpResponse RequestRouter::portfolio() const {
    auto snapshot = orchestrator_->portfolio();
    if (snapshot.is_error()) {
        return detail(503, "portfolio_not_ready", snapshot.error()->what());
    }
    return ok(snapshot.value().to_json());
}

HttpResponse RequestRouter::healthz() const {
    nlohmann::json body;
    bool healthy = registry_ ? registry_->is_healthy() : true;
    body["status"] = healthy ? "ok" : "degraded";
    body["portfolio_ready"] = orchestrator_->portfolio().is_ok();
    body["kill_switch_active"] = orchestrator_->is_halted();
    if (registry_)
        body["components"] = registry_->to_json();
    return ok(body);
}

HttpResponse RequestRouter::tpsl(const std::string& body) const {
    if (!tpsl_) {
        return detail(503, "service_degraded", "Adaptive TP/SL is not configured");
    }
    auto parsed = parse_body(body);
    if (!parsed || !parsed->is_object()) {
        return detail(422, "validation_error", "Body must be a JSON object");
    }
    const auto& j = *parsed;
    if (!j.contains("symbol") || !j.at("symbol").is_string()) {
        return detail(422, "validation_error", "symbol is required");
    }
    Side side = j.contains("side") && j.at("side").is_string()
                    ? side_from_string(j.at("side").get<std::string>())
                    : Side::NONE;
    if (side == Side::NONE) {
        return detail(422, "validation_error", "side must be BUY or SELL");
    }
    if (!j.contains("entry_price") || !j.at("entry_price").is_number() ||
        j.at("entry_price").get<double>() <= 0.0) {
        return detail(422, "validation_error", "entry_price must be positive");
    }

    std::optional<std::string> agent_id;
    if (j.contains("agent_id") && j.at("agent_id").is_string())
        agent_id = j.at("agent_id").get<std::string>();
    double confidence = 0.7;
    if (j.contains("confidence") && j.at("confidence").is_number())
        confidence = j.at("confidence").get<double>();
    std::optional<MarketAnalysis> analysis;
    if (j.contains("market_analysis") && j.at("market_analysis").is_object())
        analysis = MarketAnalysis::from_json(j.at("market_analysis"));

    auto plan = tpsl_->calculate(j.at("symbol").get<std::string>(), side,
                                 j.at("entry_price").get<double>(), agent_id, confidence,
                                 analysis);
    return ok(plan.to_json());
}

HttpResponse RequestRouter::post_message(const std::string& session_id,
                                         const std::string& body) const {
    if (!bus_->has_session(session_id)) {
        return detail(404, "session_not_found");
    }
    auto parsed = parse_body(body);
    if (!parsed) {
        return detail(422, "validation_error", "Body is not valid JSON");
    }
    auto message = McpMessage::from_json(*parsed, session_id);
    if (message.is_error()) {
        return detail(422, "validation_error", message.error()->what());
    }
    McpMessage routed = message.value();
    routed.session_id = session_id;
    size_t delivered = bus_->broadcast(session_id, routed);
    return ok({{"status", "delivered"}, {"recipients", delivered}});
}

}  // namespace trade_guard
