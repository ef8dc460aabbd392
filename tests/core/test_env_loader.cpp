#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "trade_guard/core/env_loader.hpp"

using namespace trade_guard;

class EnvLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        env_file = std::filesystem::temp_directory_path() / "trade_guard_test.env";
        for (const char* key : kKeys) {
            unsetenv(key);
        }
    }

    void TearDown() override {
        std::filesystem::remove(env_file);
        for (const char* key : kKeys) {
            unsetenv(key);
        }
    }

    void write_env(const std::string& content) {
        std::ofstream file(env_file);
        file << content;
    }

    static constexpr const char* kKeys[] = {"TG_TEST_URL", "TG_TEST_KEY", "TG_TEST_PCT",
                                            "TG_TEST_SYMBOLS", "TG_TEST_EXPORTED"};
    std::filesystem::path env_file;
};

TEST_F(EnvLoaderTest, MissingFileIsReported) {
    auto result = EnvLoader::load("/nonexistent/trade_guard.env");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(EnvLoaderTest, ParsesCommentsQuotesAndExport) {
    write_env(
        "# venue settings\n"
        "TG_TEST_URL = \"http://localhost:9000\"\n"
        "\n"
        "export TG_TEST_EXPORTED='yes'\n"
        "not a pair\n"
        "TG_TEST_PCT=7.5\n");

    ASSERT_TRUE(EnvLoader::load(env_file.string()).is_ok());
    EXPECT_EQ(EnvLoader::get("TG_TEST_URL"), "http://localhost:9000");
    EXPECT_EQ(EnvLoader::get("TG_TEST_EXPORTED"), "yes");
    EXPECT_EQ(EnvLoader::get("TG_TEST_PCT"), "7.5");
}

TEST_F(EnvLoaderTest, ExistingVariablesWinUnlessOverwriting) {
    setenv("TG_TEST_KEY", "from-shell", 1);
    write_env("TG_TEST_KEY=from-file\n");

    ASSERT_TRUE(EnvLoader::load(env_file.string()).is_ok());
    EXPECT_EQ(EnvLoader::get("TG_TEST_KEY"), "from-shell");

    ASSERT_TRUE(EnvLoader::load(env_file.string(), true).is_ok());
    EXPECT_EQ(EnvLoader::get("TG_TEST_KEY"), "from-file");
}

TEST_F(EnvLoaderTest, NumericLookups) {
    auto unset = EnvLoader::get_double("TG_TEST_PCT");
    ASSERT_TRUE(unset.is_ok());
    EXPECT_FALSE(unset.value().has_value());

    setenv("TG_TEST_PCT", "12.5", 1);
    auto parsed = EnvLoader::get_double("TG_TEST_PCT");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_DOUBLE_EQ(*parsed.value(), 12.5);

    setenv("TG_TEST_PCT", "12.5%", 1);
    auto bad = EnvLoader::get_double("TG_TEST_PCT");
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error()->code(), ErrorCode::INVALID_ARGUMENT);

    setenv("TG_TEST_PCT", "30", 1);
    EXPECT_EQ(*EnvLoader::get_long("TG_TEST_PCT").value(), 30);
    setenv("TG_TEST_PCT", "30.5", 1);
    EXPECT_TRUE(EnvLoader::get_long("TG_TEST_PCT").is_error());
}

TEST_F(EnvLoaderTest, ListLookupTrimsAndDropsEmpty) {
    setenv("TG_TEST_SYMBOLS", " BTCUSDT, ETHUSDT ,,SOLUSDT ", 1);
    auto symbols = EnvLoader::get_list("TG_TEST_SYMBOLS");
    ASSERT_EQ(symbols.size(), 3u);
    EXPECT_EQ(symbols[0], "BTCUSDT");
    EXPECT_EQ(symbols[1], "ETHUSDT");
    EXPECT_EQ(symbols[2], "SOLUSDT");

    EXPECT_TRUE(EnvLoader::get_list("TG_TEST_URL").empty());
}
