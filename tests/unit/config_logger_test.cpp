#include "common/config_loader.hpp"
#include "common/logger.hpp"

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {
std::filesystem::path TempPath(const std::string& suffix) {
    auto base = std::filesystem::temp_directory_path();
    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return base / ("voice_token_test_" + suffix + "_" + std::to_string(now));
}

const char* const kOverrideVars[] = {
    "MEDIA_SERVER_URL", "MEDIA_SERVER_API_KEY", "MEDIA_SERVER_API_SECRET", "SECRET_KEYS",
    "DEFAULT_AGENT", "REDIS_HOST", "REDIS_PORT", "REDIS_PASSWORD", "PORT"};

void ClearOverrideEnv() {
    for (const char* name : kOverrideVars) {
        ::unsetenv(name);
    }
}
} // namespace

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        ClearOverrideEnv();
    }

    void TearDown() override {
        ClearOverrideEnv();
        if (!temp_file_.empty()) {
            std::error_code ec;
            std::filesystem::remove(temp_file_, ec);
        }
    }

    std::filesystem::path WriteTempConfig(const std::string& content) {
        temp_file_ = TempPath("config.json");
        std::ofstream ofs(temp_file_);
        ofs << content;
        ofs.flush();
        return temp_file_;
    }

private:
    std::filesystem::path temp_file_;
};

TEST_F(ConfigLoaderTest, LoadsSectionsAndKeepsDefaults) {
    const std::string config_json = R"({
        // 注释允许
        "logging": {
            "level": "debug",
            "pattern": "[%H:%M:%S] %v",
            "console": false,
            "file": "temp/logs/server.log"
        },
        "media": {
            "url": "wss://media.example.com",
            "api_key": "APIkey",
            "api_secret": "secret",
            "request_timeout_ms": 2500
        },
        "agents": {
            "allowed": "ivy, rex ,,nova"
        },
        "key_store": {
            "backend": "static",
            "static_keys": ["abc123", "", "def456"],
            "cache": { "ttl_ms": 30000 }
        }
    })";
    auto config_path = WriteTempConfig(config_json);

    auto cfg = voicetoken::common::ConfigLoader::Load(config_path.string());
    EXPECT_EQ(cfg.logging.level, "debug");
    EXPECT_EQ(cfg.logging.pattern, "[%H:%M:%S] %v");
    EXPECT_FALSE(cfg.logging.console);
    EXPECT_EQ(cfg.logging.file, "temp/logs/server.log");

    EXPECT_EQ(cfg.media.url, "wss://media.example.com");
    EXPECT_EQ(cfg.media.request_timeout_ms, 2500);
    EXPECT_EQ(cfg.media.token_ttl_seconds, 86400);
    EXPECT_TRUE(cfg.media.create_room);

    EXPECT_EQ(cfg.agents.default_agent, "ivy");
    EXPECT_EQ(cfg.agents.allowed, (std::vector<std::string>{"ivy", "rex", "nova"}));

    EXPECT_EQ(cfg.key_store.backend, "static");
    EXPECT_EQ(cfg.key_store.static_keys, (std::vector<std::string>{"abc123", "def456"}));
    EXPECT_EQ(cfg.key_store.cache.ttl_ms, 30000);
    EXPECT_FALSE(cfg.key_store.cache.serve_stale_on_error);

    EXPECT_EQ(cfg.server.port, 8000);
    EXPECT_EQ(cfg.session.room_prefix, "web-call-");
}

TEST_F(ConfigLoaderTest, MissingFileThrows) {
    EXPECT_THROW(voicetoken::common::ConfigLoader::Load("/nonexistent/voice_token.json"), std::runtime_error);
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesFileValues) {
    auto cfg = voicetoken::common::ConfigLoader::FromJson(nlohmann::json{
        {"media", {{"url", "ws://file"}, {"api_key", "file-key"}}},
        {"server", {{"port", 9000}}},
    });

    ::setenv("MEDIA_SERVER_URL", "wss://env", 1);
    ::setenv("SECRET_KEYS", "k1,k2", 1);
    ::setenv("DEFAULT_AGENT", "nova", 1);
    ::setenv("REDIS_PORT", "6380", 1);
    ::setenv("PORT", "8080", 1);
    voicetoken::common::ConfigLoader::ApplyEnvOverrides(cfg);

    EXPECT_EQ(cfg.media.url, "wss://env");
    EXPECT_EQ(cfg.media.api_key, "file-key");
    EXPECT_EQ(cfg.key_store.static_keys, (std::vector<std::string>{"k1", "k2"}));
    EXPECT_EQ(cfg.agents.default_agent, "nova");
    EXPECT_EQ(cfg.key_store.redis.port, 6380);
    EXPECT_EQ(cfg.server.port, 8080);
}

TEST_F(ConfigLoaderTest, NonNumericPortOverrideThrows) {
    voicetoken::common::AppConfig cfg;
    ::setenv("PORT", "eighty", 1);
    EXPECT_THROW(voicetoken::common::ConfigLoader::ApplyEnvOverrides(cfg), std::runtime_error);
}

TEST(ConfigValidationTest, ReportsMissingMediaCredentials) {
    voicetoken::common::AppConfig cfg;
    auto problems = voicetoken::common::ValidateConfig(cfg);
    ASSERT_FALSE(problems.empty());
    EXPECT_NE(problems.front().find("media"), std::string::npos);

    cfg.media.url = "ws://localhost:7880";
    cfg.media.api_key = "key";
    cfg.media.api_secret = "secret";
    EXPECT_TRUE(voicetoken::common::ValidateConfig(cfg).empty());

    cfg.key_store.backend = "memcached";
    EXPECT_EQ(voicetoken::common::ValidateConfig(cfg).size(), 1u);
}

TEST(ConfigValidationTest, SplitListTrimsAndDropsEmpty) {
    EXPECT_EQ(voicetoken::common::SplitList(" a , b,,c "), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(voicetoken::common::SplitList(" , ").empty());
}

class LoggerInitTest : public ::testing::Test {
protected:
    void TearDown() override {
        voicetoken::common::ShutdownLogger();
        if (!temp_dir_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(temp_dir_, ec);
        }
    }

    std::filesystem::path PrepareLogPath(const std::string& filename) {
        temp_dir_ = TempPath("logs");
        return temp_dir_ / "logs" / filename;
    }

    std::filesystem::path temp_dir_;
};

TEST_F(LoggerInitTest, CreatesDirectories) {
    auto log_file = PrepareLogPath("voice_token.log");

    voicetoken::common::LoggingConfig config;
    config.console = false;
    config.level = "warn";
    config.pattern = "[test] %v";
    config.file = log_file.string();

    voicetoken::common::InitLogger(config);

    auto logger = voicetoken::common::GetLogger();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->level(), spdlog::level::warn);
    EXPECT_TRUE(std::filesystem::exists(log_file.parent_path()));

    // 触发一次日志写入，确保文件被创建
    VOICETOKEN_LOG_WARN("logger integration test");

    EXPECT_TRUE(std::filesystem::exists(log_file));
}

TEST_F(LoggerInitTest, InvalidLevelFallsBackToInfo) {
    voicetoken::common::LoggingConfig config;
    config.console = false;
    config.level = "not-a-level";

    voicetoken::common::InitLogger(config);

    auto logger = voicetoken::common::GetLogger();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->level(), spdlog::level::info);
}

TEST_F(LoggerInitTest, AcceptsLevelAliases) {
    voicetoken::common::LoggingConfig config;
    config.console = false;
    config.level = "WARNING";
    voicetoken::common::InitLogger(config);
    EXPECT_EQ(voicetoken::common::GetLogger()->level(), spdlog::level::warn);

    config.level = "error";
    voicetoken::common::InitLogger(config);
    EXPECT_EQ(voicetoken::common::GetLogger()->level(), spdlog::level::err);
}

TEST_F(LoggerInitTest, UsableAfterShutdown) {
    voicetoken::common::ShutdownLogger();
    auto logger = voicetoken::common::GetLogger();
    ASSERT_NE(logger, nullptr);
    VOICETOKEN_LOG_INFO("still logging after shutdown");
}

TEST(RedactSecretTest, KeepsOnlyPrefixAndLength) {
    EXPECT_EQ(voicetoken::common::RedactSecret(""), "<empty>");
    EXPECT_EQ(voicetoken::common::RedactSecret("abc123"), "***(6)");
    EXPECT_EQ(voicetoken::common::RedactSecret("sk-live-0123456789"), "sk-***(18)");
}
