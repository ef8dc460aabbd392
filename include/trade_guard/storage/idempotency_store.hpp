// include/trade_guard/storage/idempotency_store.hpp
#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "trade_guard/core/clock.hpp"
#include "trade_guard/core/error.hpp"

namespace trade_guard {

/**
 * @brief TTL-bounded record of order keys already forwarded
 *
 * A key maps to the order id that claimed it. Expired keys behave as absent.
 */
class IdempotencyStore {
public:
    virtual ~IdempotencyStore() = default;

    /**
     * @brief Order id holding the key, if the key has not expired
     */
    virtual Result<std::optional<std::string>> lookup(const std::string& key) = 0;

    /**
     * @brief Claim the key for order_id unless someone holds it
     * @return nullopt when claimed, otherwise the order id already holding it
     */
    virtual Result<std::optional<std::string>> reserve(const std::string& key,
                                                       const std::string& order_id,
                                                       std::chrono::seconds ttl) = 0;

    /**
     * @brief Drop expired keys
     * @return Number of keys removed
     */
    virtual Result<size_t> purge_expired() = 0;

    virtual const char* backend() const = 0;
};

class InMemoryIdempotencyStore : public IdempotencyStore {
public:
    explicit InMemoryIdempotencyStore(std::shared_ptr<Clock> clock = system_clock());

    Result<std::optional<std::string>> lookup(const std::string& key) override;
    Result<std::optional<std::string>> reserve(const std::string& key,
                                               const std::string& order_id,
                                               std::chrono::seconds ttl) override;
    Result<size_t> purge_expired() override;

    const char* backend() const override {
        return "memory";
    }

    size_t size() const;

private:
    struct Entry {
        std::string order_id;
        Timestamp expires_at;
    };

    std::shared_ptr<Clock> clock_;
    std::unordered_map<std::string, Entry> entries_;
    mutable std::mutex mutex_;
};

/**
 * @brief Shared store with an in-memory fallback
 *
 * Any error from the primary is logged and the call is retried on the
 * fallback, so an outage of the shared store never blocks order flow.
 * Every claim is also recorded in the fallback, and the fallback is
 * consulted first, so a key claimed during an outage still holds after
 * the primary recovers.
 */
class FallbackIdempotencyStore : public IdempotencyStore {
public:
    FallbackIdempotencyStore(std::shared_ptr<IdempotencyStore> primary,
                             std::shared_ptr<IdempotencyStore> fallback);

    Result<std::optional<std::string>> lookup(const std::string& key) override;
    Result<std::optional<std::string>> reserve(const std::string& key,
                                               const std::string& order_id,
                                               std::chrono::seconds ttl) override;
    Result<size_t> purge_expired() override;

    const char* backend() const override {
        return primary_->backend();
    }

private:
    std::optional<std::string> local_holder(const std::string& key);

    std::shared_ptr<IdempotencyStore> primary_;
    std::shared_ptr<IdempotencyStore> fallback_;
};

}  // namespace trade_guard
