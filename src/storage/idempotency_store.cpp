// src/storage/idempotency_store.cpp
#include "trade_guard/storage/idempotency_store.hpp"
#include <stdexcept>
#include "trade_guard/core/logger.hpp"

namespace trade_guard {

InMemoryIdempotencyStore::InMemoryIdempotencyStore(std::shared_ptr<Clock> clock)
    : clock_(std::move(clock)) {}

Result<std::optional<std::string>> InMemoryIdempotencyStore::lookup(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::optional<std::string>();
    }
    if (clock_->now() >= it->second.expires_at) {
        entries_.erase(it);
        return std::optional<std::string>();
    }
    return std::optional<std::string>(it->second.order_id);
}

Result<std::optional<std::string>> InMemoryIdempotencyStore::reserve(const std::string& key,
                                                                    const std::string& order_id,
                                                                    std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_->now();
    auto it = entries_.find(key);
    if (it != entries_.end() && now < it->second.expires_at) {
        return std::optional<std::string>(it->second.order_id);
    }
    entries_[key] = Entry{order_id, now + ttl};
    return std::optional<std::string>();
}

Result<size_t> InMemoryIdempotencyStore::purge_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_->now();
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now >= it->second.expires_at) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t InMemoryIdempotencyStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

FallbackIdempotencyStore::FallbackIdempotencyStore(std::shared_ptr<IdempotencyStore> primary,
                                                   std::shared_ptr<IdempotencyStore> fallback)
    : primary_(std::move(primary)), fallback_(std::move(fallback)) {
    if (!primary_ || !fallback_) {
        throw std::invalid_argument("FallbackIdempotencyStore requires both stores");
    }
}

std::optional<std::string> FallbackIdempotencyStore::local_holder(const std::string& key) {
    auto local = fallback_->lookup(key);
    if (local.is_error()) {
        WARN("In-memory idempotency lookup failed for " << key << ": " << local.error()->what());
        return std::nullopt;
    }
    return local.value();
}

Result<std::optional<std::string>> FallbackIdempotencyStore::lookup(const std::string& key) {
    if (auto held = local_holder(key)) {
        return std::optional<std::string>(*held);
    }
    auto result = primary_->lookup(key);
    if (result.is_ok()) {
        return result;
    }
    WARN("Shared idempotency store unavailable, using in-memory store: "
         << result.error()->what());
    return std::optional<std::string>();
}

Result<std::optional<std::string>> FallbackIdempotencyStore::reserve(
    const std::string& key, const std::string& order_id, std::chrono::seconds ttl) {
    // Keys claimed during an outage live only in memory and must keep blocking after recovery
    if (auto held = local_holder(key)) {
        return std::optional<std::string>(*held);
    }

    auto result = primary_->reserve(key, order_id, ttl);
    if (result.is_error()) {
        WARN("Shared idempotency store unavailable, using in-memory store: "
             << result.error()->what());
        return fallback_->reserve(key, order_id, ttl);
    }
    if (!result.value()) {
        auto mirrored = fallback_->reserve(key, order_id, ttl);
        if (mirrored.is_error()) {
            WARN("Failed to mirror idempotency key " << key << ": " << mirrored.error()->what());
        }
    }
    return result;
}

Result<size_t> FallbackIdempotencyStore::purge_expired() {
    auto fallback_removed = fallback_->purge_expired();
    auto result = primary_->purge_expired();
    if (result.is_error()) {
        WARN("Failed to purge shared idempotency store: " << result.error()->what());
        return fallback_removed;
    }
    return result.value() + (fallback_removed.is_ok() ? fallback_removed.value() : 0);
}

}  // namespace trade_guard
