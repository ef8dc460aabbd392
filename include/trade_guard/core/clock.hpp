// include/trade_guard/core/clock.hpp

#pragma once

#include <memory>
#include "trade_guard/core/types.hpp"

namespace trade_guard {

/**
 * @brief Source of wall-clock time for every time-dependent component
 *
 * Breakers, rate windows, idempotency TTLs and consensus deadlines all compare
 * timestamps taken from a Clock, so tests can drive them with a manual clock.
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock : public Clock {
public:
    Timestamp now() const override {
        return std::chrono::system_clock::now();
    }
};

inline std::shared_ptr<Clock> system_clock() {
    static std::shared_ptr<Clock> clock = std::make_shared<SystemClock>();
    return clock;
}

}  // namespace trade_guard
