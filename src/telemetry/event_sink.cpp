// src/telemetry/event_sink.cpp
#include "trade_guard/telemetry/event_sink.hpp"
#include <stdexcept>
#include "trade_guard/core/logger.hpp"

namespace trade_guard {

std::string event_kind_to_string(EventKind kind) {
    switch (kind) {
        case EventKind::DECISION:
            return "decision";
        case EventKind::POSITION:
            return "position";
        case EventKind::REASONING:
            return "reasoning";
    }
    return "unknown";
}

JsonLinesEventSink::JsonLinesEventSink(std::string path) : path_(std::move(path)) {}

Result<void> JsonLinesEventSink::write(EventKind kind, const nlohmann::json& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!out_.is_open()) {
        out_.open(path_, std::ios::app);
        if (!out_.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open event log: " + path_, "JsonLinesEventSink");
        }
    }

    nlohmann::json line;
    line["stream"] = event_kind_to_string(kind);
    line["payload"] = payload;
    out_ << line.dump() << '\n';
    out_.flush();

    if (!out_) {
        out_.close();
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed to write event log: " + path_,
                                "JsonLinesEventSink");
    }
    return Result<void>();
}

Result<void> JsonLinesEventSink::publish_decision(const nlohmann::json& payload) {
    return write(EventKind::DECISION, payload);
}

Result<void> JsonLinesEventSink::publish_position(const nlohmann::json& payload) {
    return write(EventKind::POSITION, payload);
}

Result<void> JsonLinesEventSink::publish_reasoning(const nlohmann::json& payload) {
    return write(EventKind::REASONING, payload);
}

nlohmann::json EventSinkStats::to_json() const {
    nlohmann::json j;
    j["enqueued"] = enqueued;
    j["delivered"] = delivered;
    j["dropped"] = dropped;
    j["failed"] = failed;
    j["backlog"] = backlog;
    return j;
}

AsyncEventSink::AsyncEventSink(std::shared_ptr<EventSink> inner, size_t capacity)
    : inner_(std::move(inner)), capacity_(capacity) {
    if (!inner_) {
        throw std::invalid_argument("AsyncEventSink requires an inner sink");
    }
    if (capacity_ == 0) {
        throw std::invalid_argument("AsyncEventSink capacity must be positive");
    }
}

AsyncEventSink::~AsyncEventSink() {
    stop();
}

void AsyncEventSink::start() {
    if (running_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = false;
    }
    worker_ = std::thread(&AsyncEventSink::run, this);
}

void AsyncEventSink::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

Result<void> AsyncEventSink::enqueue(EventKind kind, const nlohmann::json& payload) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() >= capacity_) {
            stats_.dropped++;
            return make_error<void>(ErrorCode::SERVICE_DEGRADED,
                                    "Event queue full, dropped " + event_kind_to_string(kind) +
                                        " event",
                                    "AsyncEventSink");
        }
        queue_.push_back(QueuedEvent{kind, payload});
        stats_.enqueued++;
    }
    cv_.notify_one();
    return Result<void>();
}

Result<void> AsyncEventSink::publish_decision(const nlohmann::json& payload) {
    return enqueue(EventKind::DECISION, payload);
}

Result<void> AsyncEventSink::publish_position(const nlohmann::json& payload) {
    return enqueue(EventKind::POSITION, payload);
}

Result<void> AsyncEventSink::publish_reasoning(const nlohmann::json& payload) {
    return enqueue(EventKind::REASONING, payload);
}

void AsyncEventSink::run() {
    Logger::register_component("EventSink");
    while (true) {
        QueuedEvent event;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                // stopping and drained
                return;
            }
            event = std::move(queue_.front());
            queue_.pop_front();
            in_flight_ = true;
        }

        deliver(event);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_ = false;
        }
        drained_cv_.notify_all();
    }
}

void AsyncEventSink::deliver(const QueuedEvent& event) {
    Result<void> result;
    try {
        switch (event.kind) {
            case EventKind::DECISION:
                result = inner_->publish_decision(event.payload);
                break;
            case EventKind::POSITION:
                result = inner_->publish_position(event.payload);
                break;
            case EventKind::REASONING:
                result = inner_->publish_reasoning(event.payload);
                break;
        }
    } catch (const std::exception& e) {
        result = make_error<void>(ErrorCode::UNKNOWN_ERROR, e.what(), "AsyncEventSink");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (result.is_ok()) {
            stats_.delivered++;
        } else {
            stats_.failed++;
        }
    }
    if (result.is_error()) {
        WARN("Failed to deliver " << event_kind_to_string(event.kind)
                                  << " event: " << result.error()->what());
    }
}

EventSinkStats AsyncEventSink::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    EventSinkStats copy = stats_;
    copy.backlog = queue_.size();
    return copy;
}

bool AsyncEventSink::flush(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return drained_cv_.wait_for(lock, timeout,
                                [this] { return queue_.empty() && !in_flight_; });
}

}  // namespace trade_guard
