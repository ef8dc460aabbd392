#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <iostream>
#include <memory>
#include <thread>
#include "trade_guard/consensus/consensus_bridge.hpp"
#include "trade_guard/consensus/consensus_engine.hpp"
#include "trade_guard/core/component_registry.hpp"
#include "trade_guard/core/config_loader.hpp"
#include "trade_guard/core/env_loader.hpp"
#include "trade_guard/core/logger.hpp"
#include "trade_guard/core/time_utils.hpp"
#include "trade_guard/gateway/rest_exchange_gateway.hpp"
#include "trade_guard/messaging/message_bus.hpp"
#include "trade_guard/orchestrator/risk_orchestrator.hpp"
#include "trade_guard/performance/performance_tracker.hpp"
#include "trade_guard/portfolio/portfolio_state_store.hpp"
#include "trade_guard/server/http_server.hpp"
#include "trade_guard/server/request_router.hpp"
#include "trade_guard/storage/idempotency_store.hpp"
#include "trade_guard/storage/postgres_idempotency_store.hpp"
#include "trade_guard/telemetry/event_sink.hpp"

using namespace trade_guard;

namespace {

std::atomic<bool> running{true};

void signal_handler(int) {
    running = false;
}

void register_running(ComponentRegistry& registry, ComponentType type, const std::string& id) {
    ComponentInfo info{type, ComponentState::INITIALIZED, id, "", std::chrono::system_clock::now(),
                       {}};
    auto registered = registry.register_component(info);
    if (registered.is_error()) {
        WARN("Component registration failed: " << registered.error()->what());
        return;
    }
    auto started = registry.update_state(id, ComponentState::RUNNING);
    if (started.is_error()) {
        WARN("Component state update failed: " << started.error()->what());
    }
}

std::shared_ptr<IdempotencyStore> build_idempotency_store(const StorageConfig& config,
                                                          ComponentRegistry& registry) {
    auto memory = std::make_shared<InMemoryIdempotencyStore>();
    register_running(registry, ComponentType::IDEMPOTENCY_STORE, "idempotency");
    if (config.database_url.empty()) {
        INFO("Idempotency keys kept in memory");
        return memory;
    }

    auto postgres =
        std::make_shared<PostgresIdempotencyStore>(config.database_url, config.idempotency_table);
    auto connected = postgres->connect();
    if (connected.is_error()) {
        WARN("Shared idempotency store unavailable, using memory: " << connected.error()->what());
        auto degraded = registry.update_state("idempotency", ComponentState::DEGRADED,
                                              connected.error()->what());
        if (degraded.is_error()) {
            WARN("Component state update failed: " << degraded.error()->what());
        }
        return memory;
    }
    return std::make_shared<FallbackIdempotencyStore>(postgres, memory);
}

int utc_day_of_year(Timestamp now) {
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    core::safe_gmtime(&t, &tm);
    return tm.tm_yday;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        auto env = EnvLoader::load(".env");
        if (env.is_error() && env.error()->code() != ErrorCode::FILE_NOT_FOUND) {
            std::cerr << "Failed to load .env: " << env.error()->what() << std::endl;
            return 1;
        }

        std::string config_path = argc > 1 ? argv[1] : EnvLoader::get("CONFIG_PATH").value_or("");
        auto config_result = ConfigLoader::load(config_path);
        if (config_result.is_error()) {
            std::cerr << "Failed to load configuration: " << config_result.error()->to_string()
                      << std::endl;
            return 1;
        }
        const AppConfig& config = config_result.value();

        auto& logger = Logger::instance();
        logger.initialize(config.logging);
        if (!logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }
        Logger::register_component("Main");
        INFO("Starting trade_guard");

        auto registry = std::make_shared<ComponentRegistry>();
        auto clock = system_clock();

        auto gateway = std::make_shared<RestExchangeGateway>(config.gateway);
        register_running(*registry, ComponentType::EXCHANGE_GATEWAY, "gateway");

        auto safeguards = std::make_shared<SafeguardManager>(config.safeguards, clock);
        register_running(*registry, ComponentType::SAFEGUARDS, "safeguards");

        auto store = std::make_shared<PortfolioStateStore>(config.portfolio, gateway, clock);
        store->attach_breaker(safeguards->breaker("api"));

        auto idempotency = build_idempotency_store(config.storage, *registry);

        auto event_file = std::make_shared<JsonLinesEventSink>(config.telemetry.event_log_path);
        auto events = std::make_shared<AsyncEventSink>(event_file, config.telemetry.queue_capacity);
        events->start();
        register_running(*registry, ComponentType::EVENT_SINK, "events");

        auto bus = std::make_shared<MessageBus>(config.bus, clock);
        register_running(*registry, ComponentType::MESSAGE_BUS, "bus");

        auto performance = std::make_shared<InMemoryPerformanceTracker>();
        auto tpsl = std::make_shared<AdaptiveTPSLCalculator>(config.tpsl, performance, nullptr, clock);

        OrchestratorServices services;
        services.safeguards = safeguards;
        services.store = store;
        services.idempotency = idempotency;
        services.gateway = gateway;
        services.events = events;
        services.risk_guard = std::make_shared<RiskGuard>(config.risk_guard);
        services.bus = bus;
        services.tpsl = tpsl;
        services.performance = performance;
        services.clock = clock;

        auto orchestrator = std::make_shared<RiskOrchestrator>(
            config.orchestrator, RiskEngine(config.risk_engine),
            GuardrailChain::standard(config.guardrails), services);
        register_running(*registry, ComponentType::RISK_ORCHESTRATOR, "orchestrator");

        std::weak_ptr<RiskOrchestrator> weak_orchestrator = orchestrator;
        store->on_snapshot([weak_orchestrator](const PortfolioSnapshot& snapshot) {
            if (auto orch = weak_orchestrator.lock()) {
                orch->handle_snapshot(snapshot);
            }
        });

        auto consensus = std::make_shared<ConsensusEngine>(config.consensus, clock);
        auto consensus_started = consensus->start();
        if (consensus_started.is_error()) {
            ERROR("Failed to start consensus sweeper: " << consensus_started.error()->what());
            return 1;
        }
        register_running(*registry, ComponentType::CONSENSUS_ENGINE, "consensus");

        std::shared_ptr<ConsensusBridge> bridge;
        if (!config.orchestrator.coordination_session.empty()) {
            bridge = std::make_shared<ConsensusBridge>(config.orchestrator.coordination_session,
                                                       consensus, bus, orchestrator, clock);
            auto attached = bridge->attach();
            if (attached.is_error()) {
                ERROR("Failed to attach consensus bridge: " << attached.error()->what());
                return 1;
            }
        }

        auto refreshed = store->refresh();
        if (refreshed.is_error()) {
            WARN("Initial portfolio refresh failed: " << refreshed.error()->what());
        }
        auto store_started = store->start();
        if (store_started.is_error()) {
            ERROR("Failed to start portfolio refresh: " << store_started.error()->what());
            return 1;
        }
        register_running(*registry, ComponentType::PORTFOLIO_STORE, "portfolio");

        auto router = std::make_shared<RequestRouter>(orchestrator, bus, tpsl, registry);
        HttpServer server(config.server, router, bus);
        auto listening = server.start();
        if (listening.is_error()) {
            ERROR("Failed to start HTTP server: " << listening.error()->to_string());
            return 1;
        }
        register_running(*registry, ComponentType::HTTP_SERVER, "http");

        int trading_day = utc_day_of_year(clock->now());
        auto last_purge = clock->now();
        while (running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));

            auto now = clock->now();
            int today = utc_day_of_year(now);
            if (today != trading_day) {
                trading_day = today;
                orchestrator->reset_daily();
            }
            if (now - last_purge >= std::chrono::seconds(60)) {
                last_purge = now;
                auto purged = idempotency->purge_expired();
                if (purged.is_error()) {
                    WARN("Idempotency purge failed: " << purged.error()->what());
                } else if (purged.value() > 0) {
                    DEBUG("Purged " << purged.value() << " expired idempotency keys");
                }
            }
        }

        INFO("Shutting down");
        server.stop();
        if (bridge) {
            bridge->detach();
        }
        store->stop();
        consensus->stop();
        if (!events->flush(std::chrono::seconds(5))) {
            WARN("Event queue not drained before shutdown");
        }
        events->stop();
        INFO("trade_guard stopped");
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
