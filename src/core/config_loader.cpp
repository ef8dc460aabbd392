// src/core/config_loader.cpp

#include "trade_guard/core/config_loader.hpp"

#include <algorithm>
#include <fstream>

#include "trade_guard/core/env_loader.hpp"

namespace trade_guard {

nlohmann::json AppConfig::to_json() const {
    nlohmann::json j;
    j["logging"] = logging.to_json();
    j["server"] = server.to_json();
    j["gateway"] = gateway.to_json();
    j["storage"] = storage.to_json();
    j["telemetry"] = telemetry.to_json();
    j["portfolio"] = portfolio.to_json();
    j["risk_engine"] = risk_engine.to_json();
    j["guardrails"] = guardrails.to_json();
    j["risk_guard"] = risk_guard.to_json();
    j["safeguards"] = safeguards.to_json();
    j["tpsl"] = tpsl.to_json();
    j["orchestrator"] = orchestrator.to_json();
    j["consensus"] = consensus.to_json();
    j["bus"] = bus.to_json();
    return j;
}

void AppConfig::from_json(const nlohmann::json& j) {
    if (j.contains("logging"))
        logging.from_json(j.at("logging"));
    if (j.contains("server"))
        server.from_json(j.at("server"));
    if (j.contains("gateway"))
        gateway.from_json(j.at("gateway"));
    if (j.contains("storage"))
        storage.from_json(j.at("storage"));
    if (j.contains("telemetry"))
        telemetry.from_json(j.at("telemetry"));
    if (j.contains("portfolio"))
        portfolio.from_json(j.at("portfolio"));
    if (j.contains("risk_engine"))
        risk_engine.from_json(j.at("risk_engine"));
    if (j.contains("guardrails"))
        guardrails.from_json(j.at("guardrails"));
    if (j.contains("risk_guard"))
        risk_guard.from_json(j.at("risk_guard"));
    if (j.contains("safeguards"))
        safeguards.from_json(j.at("safeguards"));
    if (j.contains("tpsl"))
        tpsl.from_json(j.at("tpsl"));
    if (j.contains("orchestrator"))
        orchestrator.from_json(j.at("orchestrator"));
    if (j.contains("consensus"))
        consensus.from_json(j.at("consensus"));
    if (j.contains("bus"))
        bus.from_json(j.at("bus"));
}

std::vector<std::string> AppConfig::validate() const {
    std::vector<std::string> problems;
    auto collect = [&problems](const char* section, const ConfigBase& config) {
        for (const auto& p : config.validate()) {
            problems.push_back(std::string(section) + ": " + p);
        }
    };
    collect("logging", logging);
    collect("server", server);
    collect("gateway", gateway);
    collect("portfolio", portfolio);
    collect("risk_engine", risk_engine);
    collect("guardrails", guardrails);
    collect("risk_guard", risk_guard);
    collect("safeguards", safeguards);
    collect("tpsl", tpsl);
    collect("orchestrator", orchestrator);
    collect("consensus", consensus);
    collect("bus", bus);
    if (storage.idempotency_table.empty())
        problems.push_back("storage: idempotency_table must not be empty");
    if (telemetry.event_log_path.empty())
        problems.push_back("telemetry: event_log_path must not be empty");
    if (telemetry.queue_capacity == 0)
        problems.push_back("telemetry: queue_capacity must be positive");
    return problems;
}

Result<nlohmann::json> ConfigLoader::load_json_file(const std::filesystem::path& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return make_error<nlohmann::json>(ErrorCode::FILE_NOT_FOUND,
                                          "Failed to open config file: " + file_path.string(),
                                          "ConfigLoader");
    }

    try {
        nlohmann::json j;
        file >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<nlohmann::json>(
            ErrorCode::JSON_PARSE_ERROR,
            "Failed to parse JSON file " + file_path.string() + ": " + e.what(), "ConfigLoader");
    }
}

void ConfigLoader::merge_json(nlohmann::json& target, const nlohmann::json& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        const auto& key = it.key();
        const auto& value = it.value();

        if (target.contains(key) && target[key].is_object() && value.is_object()) {
            merge_json(target[key], value);
        } else {
            target[key] = value;
        }
    }
}

Result<void> ConfigLoader::apply_env_overrides(AppConfig& config) {
    struct DoubleOverride {
        const char* name;
        double* target;
    };
    DoubleOverride doubles[] = {
        {"MAX_DRAWDOWN_PCT", &config.risk_engine.max_drawdown_pct},
        {"MAX_PER_TRADE_PCT", &config.risk_engine.max_per_trade_pct},
        {"MIN_MARGIN_BUFFER_USDT", &config.risk_engine.min_margin_buffer_usdt},
        {"DEFAULT_AGENT_ALLOCATION_USD", &config.risk_engine.allocation.default_allocation_usd},
        {"KELLY_FRACTION_CAP", &config.guardrails.kelly_fraction_cap},
        {"MAX_PORTFOLIO_LEVERAGE", &config.guardrails.max_portfolio_leverage},
        {"MAX_POSITION_RISK", &config.guardrails.max_position_risk},
        {"MAX_DRAWDOWN", &config.guardrails.max_drawdown},
        {"MAX_DAILY_LOSS_PCT", &config.safeguards.max_daily_loss_pct},
        {"MAX_DAILY_LOSS_USD", &config.risk_guard.max_daily_loss_usd},
    };
    for (const auto& entry : doubles) {
        auto value = EnvLoader::get_double(entry.name);
        if (value.is_error())
            return forward_error<void>(value);
        if (value.value())
            *entry.target = *value.value();
    }

    auto refresh = EnvLoader::get_long("PORTFOLIO_REFRESH_SECONDS");
    if (refresh.is_error())
        return forward_error<void>(refresh);
    if (refresh.value()) {
        config.portfolio.refresh_interval_seconds = static_cast<int>(*refresh.value());
        config.portfolio.max_backoff_seconds = std::max(config.portfolio.max_backoff_seconds,
                                                        config.portfolio.refresh_interval_seconds);
    }

    auto ttl = EnvLoader::get_long("IDEMPOTENCY_TTL_SECONDS");
    if (ttl.is_error())
        return forward_error<void>(ttl);
    if (ttl.value())
        config.orchestrator.idempotency_ttl_seconds = static_cast<int>(*ttl.value());

    auto port = EnvLoader::get_long("HTTP_PORT");
    if (port.is_error())
        return forward_error<void>(port);
    if (port.value()) {
        if (*port.value() < 0 || *port.value() > 65535) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "HTTP_PORT out of range: " + std::to_string(*port.value()),
                                    "ConfigLoader");
        }
        config.server.port = static_cast<uint16_t>(*port.value());
    }

    auto symbols = EnvLoader::get_list("SYMBOLS");
    if (!symbols.empty())
        config.orchestrator.symbols = symbols;

    if (auto url = EnvLoader::get("GATEWAY_URL"))
        config.gateway.base_url = *url;
    if (auto key = EnvLoader::get("GATEWAY_API_KEY"))
        config.gateway.api_key = *key;
    if (auto db = EnvLoader::get("DATABASE_URL"))
        config.storage.database_url = *db;
    if (auto path = EnvLoader::get("EVENT_LOG_PATH"))
        config.telemetry.event_log_path = *path;
    if (auto level = EnvLoader::get("LOG_LEVEL"))
        config.logging.min_level = level_from_string(*level);

    return Result<void>();
}

void ConfigLoader::log_config_summary(const AppConfig& config) {
    auto& logger = Logger::instance();
    if (!logger.is_initialized()) {
        return;
    }
    INFO("Config summary: port=" << config.server.port << ", gateway=" << config.gateway.base_url
                                 << ", idempotency="
                                 << (config.storage.database_url.empty() ? "memory" : "postgres")
                                 << ", symbols=" << config.orchestrator.symbols.size());
    INFO("Config summary: max_drawdown_pct=" << config.risk_engine.max_drawdown_pct
                                             << ", max_per_trade_pct="
                                             << config.risk_engine.max_per_trade_pct
                                             << ", kelly_cap=" << config.guardrails.kelly_fraction_cap
                                             << ", max_loss_per_trade="
                                             << config.risk_guard.max_loss_per_trade);
}

Result<AppConfig> ConfigLoader::load(const std::filesystem::path& config_file) {
    AppConfig config;

    if (!config_file.empty()) {
        auto file_result = load_json_file(config_file);
        if (file_result.is_error()) {
            return forward_error<AppConfig>(file_result);
        }
        nlohmann::json merged = config.to_json();
        merge_json(merged, file_result.value());
        try {
            config.from_json(merged);
        } catch (const nlohmann::json::exception& e) {
            return make_error<AppConfig>(ErrorCode::INVALID_DATA,
                                         "Failed to extract config: " + std::string(e.what()),
                                         "ConfigLoader");
        }
    }

    auto overridden = apply_env_overrides(config);
    if (overridden.is_error()) {
        return forward_error<AppConfig>(overridden);
    }

    auto problems = config.validate();
    if (!problems.empty()) {
        std::string message = "Invalid configuration:";
        for (const auto& p : problems) {
            message += " " + p + ";";
        }
        return make_error<AppConfig>(ErrorCode::INVALID_DATA, message, "ConfigLoader");
    }

    log_config_summary(config);
    return config;
}

}  // namespace trade_guard
