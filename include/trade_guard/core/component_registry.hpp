// include/trade_guard/core/component_registry.hpp
#pragma once

#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>
#include "trade_guard/core/error.hpp"
#include "trade_guard/core/types.hpp"

namespace trade_guard {

enum class ComponentState { INITIALIZED, RUNNING, DEGRADED, ERR_STATE, STOPPED };

enum class ComponentType {
    PORTFOLIO_STORE,
    RISK_ORCHESTRATOR,
    SAFEGUARDS,
    CONSENSUS_ENGINE,
    MESSAGE_BUS,
    EVENT_SINK,
    EXCHANGE_GATEWAY,
    IDEMPOTENCY_STORE,
    HTTP_SERVER
};

std::string component_state_to_string(ComponentState state);
std::string component_type_to_string(ComponentType type);

struct ComponentInfo {
    ComponentType type;
    ComponentState state;
    std::string id;
    std::string error_message;
    Timestamp last_update;
    std::unordered_map<std::string, double> metrics;
};

/**
 * @brief Lifecycle and health registry for the running components
 *
 * Owned by the application and passed to components that report their own
 * state. Feeds GET /healthz.
 */
class ComponentRegistry {
public:
    ComponentRegistry() = default;
    ComponentRegistry(const ComponentRegistry&) = delete;
    ComponentRegistry& operator=(const ComponentRegistry&) = delete;

    Result<void> register_component(const ComponentInfo& info);
    Result<void> unregister_component(const std::string& component_id);
    Result<ComponentInfo> get_state(const std::string& component_id) const;

    /**
     * @brief Move a component to a new state
     * @return Error if the component is unknown or the transition is not allowed
     */
    Result<void> update_state(const std::string& component_id, ComponentState new_state,
                              const std::string& error_message = "");

    Result<void> update_metrics(const std::string& component_id,
                                const std::unordered_map<std::string, double>& metrics);

    /**
     * @brief True when every component is INITIALIZED or RUNNING
     * DEGRADED components keep the process serving but mark it unhealthy.
     */
    bool is_healthy() const;

    std::vector<std::string> get_all_components() const;
    nlohmann::json to_json() const;

private:
    Result<void> validate_transition(ComponentState current_state,
                                     ComponentState new_state) const;

    std::unordered_map<std::string, ComponentInfo> components_;
    mutable std::mutex mutex_;
};

}  // namespace trade_guard
