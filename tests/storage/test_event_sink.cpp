#include <gtest/gtest.h>
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <streambuf>
#include <thread>
#include "core/test_base.hpp"
#include "core/test_utils.hpp"
#include "trade_guard/telemetry/event_sink.hpp"

using namespace trade_guard;
using namespace trade_guard::testing;

namespace {

/**
 * @brief Inner sink that blocks until released
 */
class GatedSink : public EventSink {
public:
    Result<void> publish_decision(const nlohmann::json&) override {
        return wait();
    }
    Result<void> publish_position(const nlohmann::json&) override {
        return wait();
    }
    Result<void> publish_reasoning(const nlohmann::json&) override {
        return wait();
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

private:
    Result<void> wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return open_; });
        return Result<void>();
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_{false};
};

/**
 * @brief Console capture that runs a callback once a marker has been written
 */
class MarkerBuf : public std::streambuf {
public:
    MarkerBuf(std::string marker, std::function<void()> on_marker)
        : marker_(std::move(marker)), on_marker_(std::move(on_marker)) {}

protected:
    int overflow(int c) override {
        if (c != traits_type::eof()) {
            text_.push_back(static_cast<char>(c));
            check();
        }
        return c;
    }

    std::streamsize xsputn(const char* s, std::streamsize n) override {
        text_.append(s, static_cast<size_t>(n));
        check();
        return n;
    }

private:
    void check() {
        if (on_marker_ && text_.find(marker_) != std::string::npos) {
            auto callback = std::move(on_marker_);
            on_marker_ = nullptr;
            callback();
        }
    }

    std::string marker_;
    std::function<void()> on_marker_;
    std::string text_;
};

}  // namespace

class EventSinkTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        path = (std::filesystem::temp_directory_path() / "trade_guard_events_test.jsonl").string();
        std::filesystem::remove(path);
    }

    void TearDown() override {
        std::filesystem::remove(path);
        TestBase::TearDown();
    }

    std::vector<nlohmann::json> read_lines() const {
        std::vector<nlohmann::json> lines;
        std::ifstream in(path);
        std::string line;
        while (std::getline(in, line)) {
            lines.push_back(nlohmann::json::parse(line));
        }
        return lines;
    }

    std::string path;
};

TEST_F(EventSinkTest, JsonLinesTagsEachStream) {
    JsonLinesEventSink sink(path);
    ASSERT_TRUE(sink.publish_decision({{"bot_id", "bot-1"}}).is_ok());
    ASSERT_TRUE(sink.publish_position({{"symbol", "BTCUSDT"}}).is_ok());
    ASSERT_TRUE(sink.publish_reasoning({{"text", "trend"}}).is_ok());

    auto lines = read_lines();
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0]["stream"], "decision");
    EXPECT_EQ(lines[0]["payload"]["bot_id"], "bot-1");
    EXPECT_EQ(lines[1]["stream"], "position");
    EXPECT_EQ(lines[2]["stream"], "reasoning");
}

TEST_F(EventSinkTest, JsonLinesReportsUnwritablePath) {
    JsonLinesEventSink sink("/nonexistent_dir_for_events/events.jsonl");
    auto result = sink.publish_decision({{"bot_id", "bot-1"}});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_IO_ERROR);
}

TEST_F(EventSinkTest, AsyncDeliversInOrder) {
    auto inner = std::make_shared<RecordingEventSink>();
    AsyncEventSink sink(inner, 16);
    sink.start();
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(sink.publish_decision({{"seq", i}}).is_ok());
    }
    ASSERT_TRUE(sink.flush(std::chrono::seconds(2)));
    sink.stop();

    ASSERT_EQ(inner->decisions.size(), 5u);
    EXPECT_EQ(inner->decisions[4]["seq"], 4);
    auto stats = sink.stats();
    EXPECT_EQ(stats.enqueued, 5u);
    EXPECT_EQ(stats.delivered, 5u);
    EXPECT_EQ(stats.backlog, 0u);
}

TEST_F(EventSinkTest, AsyncDropsWhenFull) {
    auto inner = std::make_shared<GatedSink>();
    AsyncEventSink sink(inner, 2);

    // not started, so nothing drains
    ASSERT_TRUE(sink.publish_position({{"n", 1}}).is_ok());
    ASSERT_TRUE(sink.publish_position({{"n", 2}}).is_ok());
    auto dropped = sink.publish_position({{"n", 3}});
    ASSERT_TRUE(dropped.is_error());
    EXPECT_EQ(dropped.error()->code(), ErrorCode::SERVICE_DEGRADED);
    EXPECT_EQ(sink.stats().dropped, 1u);
    EXPECT_EQ(sink.stats().backlog, 2u);

    inner->release();
    sink.start();
    EXPECT_TRUE(sink.flush(std::chrono::seconds(2)));
    sink.stop();
}

TEST_F(EventSinkTest, AsyncCountsInnerFailures) {
    auto inner = std::make_shared<RecordingEventSink>();
    inner->fail = true;
    AsyncEventSink sink(inner, 4);
    sink.start();
    ASSERT_TRUE(sink.publish_reasoning({{"text", "x"}}).is_ok());
    ASSERT_TRUE(sink.flush(std::chrono::seconds(2)));

    EXPECT_EQ(sink.stats().failed, 1u);
    EXPECT_EQ(sink.stats().delivered, 0u);
}

TEST_F(EventSinkTest, FailureWarningDoesNotHoldStatsLock) {
    Logger::reset_for_tests();
    LoggerConfig config;
    config.destination = LogDestination::CONSOLE;
    config.min_level = LogLevel::WARNING;
    Logger::instance().initialize(config);

    auto inner = std::make_shared<RecordingEventSink>();
    inner->fail = true;
    AsyncEventSink sink(inner, 4);
    std::atomic<bool> read_stats{false};
    MarkerBuf capture("Failed to deliver", [&] {
        // Runs on the worker thread while it is logging
        EXPECT_EQ(sink.stats().failed, 1u);
        read_stats = true;
    });
    auto* original = std::cout.rdbuf(&capture);

    sink.start();
    EXPECT_TRUE(sink.publish_decision({{"seq", 1}}).is_ok());
    sink.stop();
    std::cout.rdbuf(original);

    EXPECT_TRUE(read_stats.load());
}

TEST_F(EventSinkTest, StopDrainsQueue) {
    auto inner = std::make_shared<RecordingEventSink>();
    auto sink = std::make_unique<AsyncEventSink>(inner, 64);
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(sink->publish_decision({{"seq", i}}).is_ok());
    }
    sink->start();
    sink->stop();
    EXPECT_EQ(inner->decisions.size(), 10u);
}

TEST_F(EventSinkTest, RejectsInvalidConstruction) {
    EXPECT_THROW(AsyncEventSink(nullptr, 4), std::invalid_argument);
    EXPECT_THROW(AsyncEventSink(std::make_shared<RecordingEventSink>(), 0),
                 std::invalid_argument);
}
