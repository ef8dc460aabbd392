// src/core/component_registry.cpp
#include "trade_guard/core/component_registry.hpp"
#include <algorithm>
#include "trade_guard/core/time_utils.hpp"

namespace trade_guard {

std::string component_state_to_string(ComponentState state) {
    switch (state) {
        case ComponentState::INITIALIZED:
            return "initialized";
        case ComponentState::RUNNING:
            return "running";
        case ComponentState::DEGRADED:
            return "degraded";
        case ComponentState::ERR_STATE:
            return "error";
        case ComponentState::STOPPED:
            return "stopped";
    }
    return "unknown";
}

std::string component_type_to_string(ComponentType type) {
    switch (type) {
        case ComponentType::PORTFOLIO_STORE:
            return "portfolio_store";
        case ComponentType::RISK_ORCHESTRATOR:
            return "risk_orchestrator";
        case ComponentType::SAFEGUARDS:
            return "safeguards";
        case ComponentType::CONSENSUS_ENGINE:
            return "consensus_engine";
        case ComponentType::MESSAGE_BUS:
            return "message_bus";
        case ComponentType::EVENT_SINK:
            return "event_sink";
        case ComponentType::EXCHANGE_GATEWAY:
            return "exchange_gateway";
        case ComponentType::IDEMPOTENCY_STORE:
            return "idempotency_store";
        case ComponentType::HTTP_SERVER:
            return "http_server";
    }
    return "unknown";
}

Result<void> ComponentRegistry::register_component(const ComponentInfo& info) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (info.id.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Component ID cannot be empty",
                                "ComponentRegistry");
    }
    if (components_.count(info.id)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Component already registered: " + info.id, "ComponentRegistry");
    }

    components_[info.id] = info;
    return Result<void>();
}

Result<void> ComponentRegistry::unregister_component(const std::string& component_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = components_.find(component_id);
    if (it == components_.end()) {
        return make_error<void>(ErrorCode::DATA_NOT_FOUND, "Component not found: " + component_id,
                                "ComponentRegistry");
    }
    components_.erase(it);
    return Result<void>();
}

Result<ComponentInfo> ComponentRegistry::get_state(const std::string& component_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = components_.find(component_id);
    if (it == components_.end()) {
        return make_error<ComponentInfo>(ErrorCode::DATA_NOT_FOUND,
                                         "Component not found: " + component_id,
                                         "ComponentRegistry");
    }
    return Result<ComponentInfo>(it->second);
}

Result<void> ComponentRegistry::update_state(const std::string& component_id,
                                             ComponentState new_state,
                                             const std::string& error_message) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = components_.find(component_id);
    if (it == components_.end()) {
        return make_error<void>(ErrorCode::DATA_NOT_FOUND, "Component not found: " + component_id,
                                "ComponentRegistry");
    }

    if (it->second.state == new_state) {
        it->second.last_update = std::chrono::system_clock::now();
        return Result<void>();
    }

    auto validation = validate_transition(it->second.state, new_state);
    if (validation.is_error()) {
        return validation;
    }

    it->second.state = new_state;
    it->second.last_update = std::chrono::system_clock::now();

    if (new_state == ComponentState::ERR_STATE || new_state == ComponentState::DEGRADED) {
        it->second.error_message = error_message;
    } else {
        it->second.error_message.clear();
    }
    return Result<void>();
}

Result<void> ComponentRegistry::validate_transition(ComponentState current_state,
                                                   ComponentState new_state) const {
    bool valid = false;
    switch (current_state) {
        case ComponentState::INITIALIZED:
            valid = (new_state == ComponentState::RUNNING ||
                     new_state == ComponentState::ERR_STATE ||
                     new_state == ComponentState::STOPPED);
            break;
        case ComponentState::RUNNING:
            valid = (new_state == ComponentState::DEGRADED ||
                     new_state == ComponentState::STOPPED ||
                     new_state == ComponentState::ERR_STATE);
            break;
        case ComponentState::DEGRADED:
            valid = (new_state == ComponentState::RUNNING ||
                     new_state == ComponentState::STOPPED ||
                     new_state == ComponentState::ERR_STATE);
            break;
        case ComponentState::ERR_STATE:
            valid = (new_state == ComponentState::INITIALIZED ||
                     new_state == ComponentState::RUNNING ||
                     new_state == ComponentState::STOPPED);
            break;
        case ComponentState::STOPPED:
            valid = new_state == ComponentState::INITIALIZED;
            break;
    }

    if (!valid) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Invalid state transition from " +
                                    component_state_to_string(current_state) + " to " +
                                    component_state_to_string(new_state),
                                "ComponentRegistry");
    }
    return Result<void>();
}

Result<void> ComponentRegistry::update_metrics(
    const std::string& component_id, const std::unordered_map<std::string, double>& metrics) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = components_.find(component_id);
    if (it == components_.end()) {
        return make_error<void>(ErrorCode::DATA_NOT_FOUND, "Component not found: " + component_id,
                                "ComponentRegistry");
    }
    for (const auto& [name, value] : metrics) {
        it->second.metrics[name] = value;
    }
    it->second.last_update = std::chrono::system_clock::now();
    return Result<void>();
}

bool ComponentRegistry::is_healthy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (components_.empty())
        return false;

    for (const auto& [_, info] : components_) {
        if (info.state != ComponentState::INITIALIZED && info.state != ComponentState::RUNNING) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> ComponentRegistry::get_all_components() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(components_.size());
    for (const auto& [id, _] : components_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

nlohmann::json ComponentRegistry::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json components = nlohmann::json::object();
    for (const auto& [id, info] : components_) {
        nlohmann::json c;
        c["type"] = component_type_to_string(info.type);
        c["state"] = component_state_to_string(info.state);
        c["last_update"] = core::to_iso8601(info.last_update);
        if (!info.error_message.empty())
            c["error"] = info.error_message;
        if (!info.metrics.empty())
            c["metrics"] = info.metrics;
        components[id] = c;
    }
    return components;
}

}  // namespace trade_guard
