// src/storage/postgres_idempotency_store.cpp
#include "trade_guard/storage/postgres_idempotency_store.hpp"
#include <cctype>
#include "trade_guard/core/logger.hpp"
#include "trade_guard/core/time_utils.hpp"

namespace trade_guard {

PostgresIdempotencyStore::PostgresIdempotencyStore(std::string connection_string,
                                                   std::string table_name,
                                                   std::shared_ptr<Clock> clock)
    : connection_string_(std::move(connection_string)),
      table_name_(std::move(table_name)),
      clock_(std::move(clock)) {
    Logger::register_component("PostgresIdempotencyStore");
}

PostgresIdempotencyStore::~PostgresIdempotencyStore() {
    disconnect();
}

Result<void> PostgresIdempotencyStore::validate_table_name(const std::string& table_name) const {
    if (table_name.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Table name cannot be empty",
                                "PostgresIdempotencyStore");
    }
    for (char c : table_name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '.') {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Invalid table name: " + table_name,
                                    "PostgresIdempotencyStore");
        }
    }
    return Result<void>();
}

Result<void> PostgresIdempotencyStore::connect() {
    auto table_check = validate_table_name(table_name_);
    if (table_check.is_error()) {
        return table_check;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    try {
        connection_ = std::make_unique<pqxx::connection>(connection_string_);
        if (!connection_->is_open()) {
            return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                    "Failed to open database connection",
                                    "PostgresIdempotencyStore");
        }

        pqxx::work txn(*connection_);
        txn.exec("CREATE TABLE IF NOT EXISTS " + table_name_ +
                 " (key TEXT PRIMARY KEY, order_id TEXT NOT NULL, expires_at_ms BIGINT NOT NULL)");
        txn.commit();

        INFO("Connected idempotency store to table " << table_name_);
        return Result<void>();
    } catch (const std::exception& e) {
        connection_.reset();
        return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                "Database connection error: " + std::string(e.what()),
                                "PostgresIdempotencyStore");
    }
}

void PostgresIdempotencyStore::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connection_ && connection_->is_open()) {
        connection_->close();
        INFO("Disconnected idempotency store");
    }
    connection_.reset();
}

bool PostgresIdempotencyStore::is_connected() const {
    return connection_ && connection_->is_open();
}

Result<void> PostgresIdempotencyStore::validate_connection() const {
    if (!is_connected()) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR, "Not connected to database",
                                "PostgresIdempotencyStore");
    }
    return Result<void>();
}

Result<std::optional<std::string>> PostgresIdempotencyStore::lookup(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<std::optional<std::string>>(validation);
    }

    try {
        pqxx::work txn(*connection_);
        auto rows = txn.exec_params("SELECT order_id FROM " + table_name_ +
                                        " WHERE key = $1 AND expires_at_ms > $2",
                                    key, core::to_unix_ms(clock_->now()));
        txn.commit();
        if (rows.empty()) {
            return std::optional<std::string>();
        }
        return std::optional<std::string>(rows[0][0].as<std::string>());
    } catch (const std::exception& e) {
        return make_error<std::optional<std::string>>(
            ErrorCode::DATABASE_ERROR, "Idempotency lookup failed: " + std::string(e.what()),
            "PostgresIdempotencyStore");
    }
}

Result<std::optional<std::string>> PostgresIdempotencyStore::reserve(
    const std::string& key, const std::string& order_id, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<std::optional<std::string>>(validation);
    }

    auto now_ms = core::to_unix_ms(clock_->now());
    auto expires_ms = now_ms + static_cast<int64_t>(ttl.count()) * 1000;

    try {
        pqxx::work txn(*connection_);
        // Takes over the row only when it has expired
        auto claimed = txn.exec_params(
            "INSERT INTO " + table_name_ +
                " (key, order_id, expires_at_ms) VALUES ($1, $2, $3)"
                " ON CONFLICT (key) DO UPDATE SET order_id = EXCLUDED.order_id,"
                " expires_at_ms = EXCLUDED.expires_at_ms"
                " WHERE " + table_name_ + ".expires_at_ms <= $4"
                " RETURNING order_id",
            key, order_id, expires_ms, now_ms);

        if (!claimed.empty()) {
            txn.commit();
            return std::optional<std::string>();
        }

        auto holder =
            txn.exec_params("SELECT order_id FROM " + table_name_ + " WHERE key = $1", key);
        txn.commit();
        if (holder.empty()) {
            return make_error<std::optional<std::string>>(
                ErrorCode::DATABASE_ERROR, "Idempotency key vanished during reserve: " + key,
                "PostgresIdempotencyStore");
        }
        return std::optional<std::string>(holder[0][0].as<std::string>());
    } catch (const std::exception& e) {
        return make_error<std::optional<std::string>>(
            ErrorCode::DATABASE_ERROR, "Idempotency reserve failed: " + std::string(e.what()),
            "PostgresIdempotencyStore");
    }
}

Result<size_t> PostgresIdempotencyStore::purge_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<size_t>(validation);
    }

    try {
        pqxx::work txn(*connection_);
        auto result = txn.exec_params("DELETE FROM " + table_name_ + " WHERE expires_at_ms <= $1",
                                      core::to_unix_ms(clock_->now()));
        txn.commit();
        return static_cast<size_t>(result.affected_rows());
    } catch (const std::exception& e) {
        return make_error<size_t>(ErrorCode::DATABASE_ERROR,
                                  "Idempotency purge failed: " + std::string(e.what()),
                                  "PostgresIdempotencyStore");
    }
}

}  // namespace trade_guard
