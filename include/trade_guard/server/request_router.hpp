// include/trade_guard/server/request_router.hpp
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "trade_guard/core/component_registry.hpp"
#include "trade_guard/messaging/message_bus.hpp"
#include "trade_guard/orchestrator/risk_orchestrator.hpp"
#include "trade_guard/risk/adaptive_tpsl.hpp"

namespace trade_guard {

struct HttpRequest {
    std::string method;  // upper case
    std::string target;  // path, query string allowed
    std::string body;
};

struct HttpResponse {
    int status{200};
    nlohmann::json body = nlohmann::json::object();
};

/**
 * @brief Maps HTTP requests to orchestrator, TP/SL and bus operations
 *
 * Transport free so it can be driven directly. Every route is also served
 * under the /orchestrator prefix.
 */
class RequestRouter {
public:
    RequestRouter(std::shared_ptr<RiskOrchestrator> orchestrator,
                  std::shared_ptr<MessageBus> bus,
                  std::shared_ptr<AdaptiveTPSLCalculator> tpsl = nullptr,
                  std::shared_ptr<ComponentRegistry> registry = nullptr);

    HttpResponse handle(const HttpRequest& request) const;

    /**
     * @brief Session id when target is /mcp/{session}/ws
     */
    static std::optional<std::string> websocket_session(const std::string& target);

    /**
     * @brief Path without query string or /orchestrator prefix, split on '/'
     */
    static std::vector<std::string> split_path(const std::string& target);

private:
    HttpResponse submit_order(const std::string& bot_id, const std::string& body) const;
    HttpResponse emergency_stop(const std::string& body) const;
    HttpResponse register_decision(const std::string& body) const;
    HttpResponse trade_result(const std::string& body) const;
    HttpResponse portfolio() const;
    HttpResponse healthz() const;
    HttpResponse tpsl(const std::string& body) const;
    HttpResponse post_message(const std::string& session_id, const std::string& body) const;

    std::shared_ptr<RiskOrchestrator> orchestrator_;
    std::shared_ptr<MessageBus> bus_;
    std::shared_ptr<AdaptiveTPSLCalculator> tpsl_;
    std::shared_ptr<ComponentRegistry> registry_;
};

}  // namespace trade_guard
