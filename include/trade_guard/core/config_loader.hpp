// include/trade_guard/core/config_loader.hpp

#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "trade_guard/consensus/consensus_engine.hpp"
#include "trade_guard/core/config_base.hpp"
#include "trade_guard/core/error.hpp"
#include "trade_guard/core/logger.hpp"
#include "trade_guard/gateway/rest_exchange_gateway.hpp"
#include "trade_guard/messaging/message_bus.hpp"
#include "trade_guard/orchestrator/risk_orchestrator.hpp"
#include "trade_guard/portfolio/portfolio_state_store.hpp"
#include "trade_guard/risk/adaptive_tpsl.hpp"
#include "trade_guard/risk/guardrails.hpp"
#include "trade_guard/risk/risk_engine.hpp"
#include "trade_guard/risk/risk_guard.hpp"
#include "trade_guard/safeguards/safeguard_manager.hpp"
#include "trade_guard/server/http_server.hpp"

namespace trade_guard {

/**
 * @brief Idempotency storage
 * An empty database_url keeps keys in memory only. The URL carries
 * credentials and is never serialized.
 */
struct StorageConfig {
    std::string database_url;
    std::string idempotency_table{"idempotency_keys"};

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["idempotency_table"] = idempotency_table;
        return j;
    }

    void from_json(const nlohmann::json& j) {
        if (j.contains("database_url"))
            database_url = j.at("database_url").get<std::string>();
        if (j.contains("idempotency_table"))
            idempotency_table = j.at("idempotency_table").get<std::string>();
    }
};

/**
 * @brief Event sink destination
 */
struct TelemetryConfig {
    std::string event_log_path{"logs/events.jsonl"};
    size_t queue_capacity{1024};

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["event_log_path"] = event_log_path;
        j["queue_capacity"] = queue_capacity;
        return j;
    }

    void from_json(const nlohmann::json& j) {
        if (j.contains("event_log_path"))
            event_log_path = j.at("event_log_path").get<std::string>();
        if (j.contains("queue_capacity"))
            queue_capacity = j.at("queue_capacity").get<size_t>();
    }
};

/**
 * @brief Consolidated application configuration
 *
 * One section per component. Sections missing from the file keep their
 * defaults.
 */
struct AppConfig : public ConfigBase {
    LoggerConfig logging;
    HttpServerConfig server;
    RestGatewayConfig gateway;
    StorageConfig storage;
    TelemetryConfig telemetry;
    PortfolioStoreConfig portfolio;
    RiskEngineConfig risk_engine;
    GuardrailConfig guardrails;
    RiskGuardConfig risk_guard;
    SafeguardConfig safeguards;
    AdaptiveTPSLConfig tpsl;
    OrchestratorConfig orchestrator;
    ConsensusConfig consensus;
    MessageBusConfig bus;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    /**
     * @brief Problems from every section, prefixed with the section name
     */
    std::vector<std::string> validate() const override;
};

/**
 * @brief Builds AppConfig from defaults, an optional JSON file and the environment
 *
 * Precedence, lowest first: compiled defaults, config file, environment.
 */
class ConfigLoader {
public:
    /**
     * @brief Load and validate the application configuration
     * @param config_file JSON file; empty to skip
     * @return INVALID_DATA listing every invalid field
     */
    static Result<AppConfig> load(const std::filesystem::path& config_file);

    /**
     * @brief Apply MAX_DRAWDOWN_PCT, SYMBOLS, HTTP_PORT and the other overrides
     * @return INVALID_ARGUMENT when a numeric variable does not parse
     */
    static Result<void> apply_env_overrides(AppConfig& config);

    /**
     * @brief Recursively merge JSON objects; source wins on conflicts
     */
    static void merge_json(nlohmann::json& target, const nlohmann::json& source);

private:
    static Result<nlohmann::json> load_json_file(const std::filesystem::path& file_path);
    static void log_config_summary(const AppConfig& config);
};

}  // namespace trade_guard
