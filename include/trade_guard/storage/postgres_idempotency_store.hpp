// include/trade_guard/storage/postgres_idempotency_store.hpp
#pragma once

#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include "trade_guard/core/clock.hpp"
#include "trade_guard/storage/idempotency_store.hpp"

namespace trade_guard {

/**
 * @brief Idempotency keys in PostgreSQL, shared across restarts and replicas
 *
 * Rows live in a single table keyed by the idempotency key; expiry is an
 * epoch-millisecond column compared against the injected clock.
 */
class PostgresIdempotencyStore : public IdempotencyStore {
public:
    PostgresIdempotencyStore(std::string connection_string,
                             std::string table_name = "idempotency_keys",
                             std::shared_ptr<Clock> clock = system_clock());
    ~PostgresIdempotencyStore() override;

    PostgresIdempotencyStore(const PostgresIdempotencyStore&) = delete;
    PostgresIdempotencyStore& operator=(const PostgresIdempotencyStore&) = delete;

    /**
     * @brief Open the connection and create the table if missing
     */
    Result<void> connect();
    void disconnect();
    bool is_connected() const;

    Result<std::optional<std::string>> lookup(const std::string& key) override;
    Result<std::optional<std::string>> reserve(const std::string& key,
                                               const std::string& order_id,
                                               std::chrono::seconds ttl) override;
    Result<size_t> purge_expired() override;

    const char* backend() const override {
        return "postgres";
    }

private:
    Result<void> validate_connection() const;
    Result<void> validate_table_name(const std::string& table_name) const;

    std::string connection_string_;
    std::string table_name_;
    std::shared_ptr<Clock> clock_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;
};

}  // namespace trade_guard
