// include/trade_guard/telemetry/event_sink.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include "trade_guard/core/error.hpp"

namespace trade_guard {

enum class EventKind { DECISION, POSITION, REASONING };

std::string event_kind_to_string(EventKind kind);

/**
 * @brief Destination for decision, position and reasoning records
 */
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual Result<void> publish_decision(const nlohmann::json& payload) = 0;
    virtual Result<void> publish_position(const nlohmann::json& payload) = 0;
    virtual Result<void> publish_reasoning(const nlohmann::json& payload) = 0;
};

/**
 * @brief Appends one JSON object per line to a file
 * Each line is {"stream": <kind>, "payload": {...}}.
 */
class JsonLinesEventSink : public EventSink {
public:
    explicit JsonLinesEventSink(std::string path);

    Result<void> publish_decision(const nlohmann::json& payload) override;
    Result<void> publish_position(const nlohmann::json& payload) override;
    Result<void> publish_reasoning(const nlohmann::json& payload) override;

    const std::string& path() const {
        return path_;
    }

private:
    Result<void> write(EventKind kind, const nlohmann::json& payload);

    std::string path_;
    std::ofstream out_;
    std::mutex mutex_;
};

/**
 * @brief Counters of an AsyncEventSink
 */
struct EventSinkStats {
    uint64_t enqueued{0};
    uint64_t delivered{0};
    uint64_t dropped{0};  // rejected because the queue was full
    uint64_t failed{0};   // the inner sink returned an error
    size_t backlog{0};

    nlohmann::json to_json() const;
};

/**
 * @brief Bounded queue drained by one worker into an inner sink
 *
 * publish_* never blocks on the inner sink. When the queue is full the
 * event is dropped and counted, and the call returns SERVICE_DEGRADED.
 * stop() drains what is queued before joining.
 */
class AsyncEventSink : public EventSink {
public:
    AsyncEventSink(std::shared_ptr<EventSink> inner, size_t capacity = 1024);
    ~AsyncEventSink() override;

    AsyncEventSink(const AsyncEventSink&) = delete;
    AsyncEventSink& operator=(const AsyncEventSink&) = delete;

    void start();
    void stop();

    Result<void> publish_decision(const nlohmann::json& payload) override;
    Result<void> publish_position(const nlohmann::json& payload) override;
    Result<void> publish_reasoning(const nlohmann::json& payload) override;

    EventSinkStats stats() const;

    /**
     * @brief Block until the queue is empty or the timeout expires
     * @return true if drained
     */
    bool flush(std::chrono::milliseconds timeout);

private:
    struct QueuedEvent {
        EventKind kind;
        nlohmann::json payload;
    };

    Result<void> enqueue(EventKind kind, const nlohmann::json& payload);
    void run();
    void deliver(const QueuedEvent& event);

    std::shared_ptr<EventSink> inner_;
    size_t capacity_;

    std::deque<QueuedEvent> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable drained_cv_;
    bool stopping_{false};
    bool in_flight_{false};
    std::thread worker_;
    std::atomic<bool> running_{false};

    EventSinkStats stats_;
};

}  // namespace trade_guard
