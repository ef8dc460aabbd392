#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>
#include "trade_guard/core/logger.hpp"

using namespace trade_guard;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::reset_for_tests();
        Logger::register_component("");

        original_cout = std::cout.rdbuf();
        std::cout.rdbuf(cout_buffer.rdbuf());

        std::error_code ec;
        std::filesystem::remove_all(test_log_dir, ec);
        std::filesystem::create_directories(test_log_dir);
    }

    void TearDown() override {
        std::cout.rdbuf(original_cout);
        Logger::reset_for_tests();
        Logger::register_component("");

        std::error_code ec;
        std::filesystem::remove_all(test_log_dir, ec);
    }

    std::vector<std::filesystem::path> get_log_files(const std::string& dir) {
        std::vector<std::filesystem::path> files;
        if (!std::filesystem::exists(dir))
            return files;
        for (const auto& entry : std::filesystem::directory_iterator(dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end());
        return files;
    }

    std::string read_file(const std::filesystem::path& path) {
        std::ifstream file(path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    LoggerConfig plain_config(LogDestination destination) {
        LoggerConfig config;
        config.destination = destination;
        config.log_directory = test_log_dir;
        config.include_timestamp = false;
        config.include_level = false;
        return config;
    }

    std::streambuf* original_cout;
    std::stringstream cout_buffer;
    const std::string test_log_dir = "test_guard_logs";
};

TEST_F(LoggerTest, InitializationCreatesLogDirectory) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.log_directory = test_log_dir + "/nested";
    ASSERT_NO_THROW(Logger::instance().initialize(config));
    EXPECT_TRUE(std::filesystem::exists(config.log_directory));
    EXPECT_TRUE(Logger::instance().is_initialized());
}

TEST_F(LoggerTest, LogsToConsoleWhenConfigured) {
    Logger::instance().initialize(plain_config(LogDestination::CONSOLE));

    Logger::instance().log(LogLevel::INFO, "kill switch engaged");
    EXPECT_EQ(cout_buffer.str(), "kill switch engaged\n");
    EXPECT_TRUE(get_log_files(test_log_dir).empty());
}

TEST_F(LoggerTest, LogsToBothDestinations) {
    Logger::instance().initialize(plain_config(LogDestination::BOTH));

    Logger::instance().log(LogLevel::INFO, "Both message");

    EXPECT_EQ(cout_buffer.str(), "Both message\n");
    auto files = get_log_files(test_log_dir);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(read_file(files[0]), "Both message\n");
}

TEST_F(LoggerTest, LogLevelFiltering) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.min_level = LogLevel::WARNING;
    Logger::instance().initialize(config);

    DEBUG("Debug");
    INFO("Info");
    WARN("Warning");
    ERROR("Error");

    auto content = read_file(get_log_files(test_log_dir)[0]);
    EXPECT_EQ(content.find("Debug"), std::string::npos);
    EXPECT_EQ(content.find("Info"), std::string::npos);
    EXPECT_NE(content.find("Warning\nError\n"), std::string::npos);
}

TEST_F(LoggerTest, MessageCarriesLevelAndComponent) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.include_level = true;
    Logger::instance().initialize(config);

    Logger::register_component("RiskOrchestrator");
    INFO("order accepted for " << "BTCUSDT");

    auto content = read_file(get_log_files(test_log_dir)[0]);
    EXPECT_NE(content.find("[INFO] [RiskOrchestrator] order accepted for BTCUSDT"),
              std::string::npos);
}

TEST_F(LoggerTest, ComponentTagIsPerThread) {
    Logger::instance().initialize(plain_config(LogDestination::FILE));
    Logger::register_component("Main");

    std::thread worker([]() { INFO("from worker"); });
    worker.join();
    INFO("from main");

    auto content = read_file(get_log_files(test_log_dir)[0]);
    EXPECT_NE(content.find("from worker\n"), std::string::npos);
    EXPECT_EQ(content.find("[Main] from worker"), std::string::npos);
    EXPECT_NE(content.find("[Main] from main"), std::string::npos);
}

TEST_F(LoggerTest, FileRotation) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.max_file_size = 10;
    config.max_files = 2;
    Logger::instance().initialize(config);

    Logger::instance().log(LogLevel::INFO, "12345678");
    Logger::instance().log(LogLevel::INFO, "12345678");

    EXPECT_EQ(get_log_files(test_log_dir).size(), 2u);
}

TEST_F(LoggerTest, MaxFilesEnforced) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.max_file_size = 1;
    config.max_files = 2;
    Logger::instance().initialize(config);

    for (int i = 0; i < 3; ++i) {
        Logger::instance().log(LogLevel::INFO, std::to_string(i));
    }

    EXPECT_EQ(get_log_files(test_log_dir).size(), 2u);
}

TEST_F(LoggerTest, LogBeforeInitializationSilent) {
    Logger::instance().log(LogLevel::INFO, "Test");

    EXPECT_TRUE(cout_buffer.str().empty());
    EXPECT_TRUE(get_log_files(test_log_dir).empty());
}

TEST(LoggerConfigTest, LevelNamesParse) {
    EXPECT_EQ(level_from_string("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(level_from_string("WARN"), LogLevel::WARNING);
    EXPECT_EQ(level_from_string("ERROR"), LogLevel::ERR);
    EXPECT_EQ(level_from_string("verbose"), LogLevel::INFO);
}

TEST(LoggerConfigTest, JsonRoundTripAndValidation) {
    LoggerConfig config;
    config.min_level = LogLevel::DEBUG;
    config.destination = LogDestination::BOTH;
    config.filename_prefix = "guard";

    LoggerConfig restored;
    restored.from_json(config.to_json());
    EXPECT_EQ(restored.min_level, LogLevel::DEBUG);
    EXPECT_EQ(restored.destination, LogDestination::BOTH);
    EXPECT_EQ(restored.filename_prefix, "guard");
    EXPECT_TRUE(restored.validate().empty());

    restored.max_files = 0;
    restored.max_file_size = 10;
    EXPECT_EQ(restored.validate().size(), 2u);
}
