#include <gtest/gtest.h>
#include "utils/config.h"
#include "utils/logger.h"
#include "modules/api_key_module.h"

#include <chrono>
#include <filesystem>
#include <fstream>

using namespace avatarcli::utils;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto stamp = std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
        testDir = std::filesystem::temp_directory_path() / ("avatarcli_config_" + stamp);
        std::filesystem::create_directories(testDir);
        Config::instance().reset();
    }

    void TearDown() override {
        Config::instance().reset();
        std::error_code ec;
        std::filesystem::remove_all(testDir, ec);
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        auto path = testDir / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }

    std::filesystem::path testDir;
};

TEST_F(ConfigTest, Defaults) {
    auto& config = Config::instance();
    ApiConfig api = config.getApiConfig();
    EXPECT_EQ(api.baseUrl, "https://tavusapi.com/v2");
    EXPECT_EQ(api.keyFile, ".tavus_api_key");
    EXPECT_EQ(api.timeoutSeconds, 30u);

    UiConfig ui = config.getUiConfig();
    EXPECT_EQ(ui.itemsPerPage, 10u);
    EXPECT_FALSE(ui.plain);

    LogConfig log = config.getLogConfig();
    EXPECT_EQ(log.level, "info");
    EXPECT_EQ(log.file, config.getDataDir() + "/avatarcli.log");
    EXPECT_EQ(config.getDefaultConfigPath(), config.getDataDir() + "/avatarcli.conf");
}

TEST_F(ConfigTest, LoadOverridesAndIgnoresComments) {
    auto path = writeFile("avatarcli.conf",
                          "# comment\n"
                          "api.base_url = https://staging.example.invalid/v2/\r\n"
                          "ui.items_per_page=25\n"
                          "ui.plain=yes\n"
                          "not a pair\n"
                          "=orphan\n");
    auto& config = Config::instance();
    ASSERT_TRUE(config.load(path));
    EXPECT_EQ(config.getConfigPath(), path);

    EXPECT_EQ(config.getApiConfig().baseUrl, "https://staging.example.invalid/v2");
    EXPECT_EQ(config.getUiConfig().itemsPerPage, 25u);
    EXPECT_TRUE(config.getUiConfig().plain);
    EXPECT_EQ(config.getApiConfig().keyFile, ".tavus_api_key");
    EXPECT_FALSE(config.has(""));
}

TEST_F(ConfigTest, InvalidNumbersFallBack) {
    auto& config = Config::instance();
    config.set("ui.items_per_page", "lots");
    config.set("api.timeout", -5);
    EXPECT_EQ(config.getUiConfig().itemsPerPage, 10u);
    EXPECT_EQ(config.getApiConfig().timeoutSeconds, 30u);
    EXPECT_EQ(config.getInt("ui.items_per_page", 7), 7);
}

TEST_F(ConfigTest, SaveRoundTrip) {
    auto& config = Config::instance();
    UiConfig ui;
    ui.itemsPerPage = 5;
    ui.plain = true;
    config.setUiConfig(ui);
    auto path = (testDir / "saved.conf").string();
    ASSERT_TRUE(config.save(path));

    config.reset();
    EXPECT_EQ(config.getUiConfig().itemsPerPage, 10u);
    ASSERT_TRUE(config.load(path));
    EXPECT_EQ(config.getUiConfig().itemsPerPage, 5u);
    EXPECT_TRUE(config.getUiConfig().plain);

    auto uiKeys = config.keys("ui.");
    ASSERT_EQ(uiKeys.size(), 2u);
    EXPECT_EQ(uiKeys[0], "ui.items_per_page");
}

TEST_F(ConfigTest, MissingFileFailsLoad) {
    EXPECT_FALSE(Config::instance().load((testDir / "absent.conf").string()));
}

TEST_F(ConfigTest, KeyFileFirstNonEmptyLine) {
    auto path = writeFile("key", "\n   \n  sk-abc123  \nsecond\n");
    auto key = avatarcli::modules::ApiKeyModule::loadKeyFile(path);
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(*key, "sk-abc123");
    EXPECT_FALSE(avatarcli::modules::ApiKeyModule::loadKeyFile((testDir / "none").string()).has_value());
}

TEST(LoggerTest, ParseLevel) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(Logger::parseLevel("DEBUG", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(Logger::parseLevel("warning", level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_TRUE(Logger::parseLevel("off", level));
    EXPECT_EQ(level, LogLevel::OFF);
    EXPECT_FALSE(Logger::parseLevel("verbose", level));
    EXPECT_EQ(level, LogLevel::OFF);
}

TEST(LoggerTest, RedactsCredentials) {
    Logger::enableConsole(false);
    Logger::setAllowSensitiveLogging(false);
    Logger::setLevel(LogLevel::INFO);
    Logger::clearLogs();

    Logger::log(LogLevel::WARN, "http", "sending x-api-key: sk-live-123 to host");
    auto logs = Logger::getRecentLogs(1);
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs[0].category, "http");
    EXPECT_EQ(logs[0].message.find("sk-live-123"), std::string::npos);
    EXPECT_NE(logs[0].message.find("[REDACTED]"), std::string::npos);

    EXPECT_EQ(Logger::redactKey("0123456789abcdef"), "0123...cdef");
    EXPECT_EQ(Logger::redactKey("short"), "[REDACTED_KEY]");
}

TEST(LoggerTest, LevelFilter) {
    Logger::enableConsole(false);
    Logger::setLevel(LogLevel::ERROR);
    Logger::clearLogs();
    Logger::log(LogLevel::INFO, "api", "quiet");
    Logger::log(LogLevel::ERROR, "api", "loud");
    EXPECT_EQ(Logger::getLogCount(), 1u);
    EXPECT_EQ(Logger::getErrorCount(), 1u);
    Logger::setLevel(LogLevel::INFO);
}
