#include "common/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <unordered_map>
#include <system_error>
#include <vector>

namespace voicetoken {
namespace common {

namespace {

std::mutex g_logger_mutex;
std::shared_ptr<spdlog::logger> g_logger;

// 配置中允许的级别名称, 含常见别名
spdlog::level::level_enum ParseLevel(const std::string& level, spdlog::level::level_enum fallback) {
    static const std::unordered_map<std::string, spdlog::level::level_enum> kLevels{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"err", spdlog::level::err},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"fatal", spdlog::level::critical},
        {"off", spdlog::level::off},
    };

    std::string normalized = level;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    auto it = kLevels.find(normalized);
    if (it == kLevels.end()) {
        std::fprintf(stderr, "voice_token_server: unknown log level \"%s\", using %s\n",
                     level.c_str(), spdlog::level::to_string_view(fallback).data());
        return fallback;
    }
    return it->second;
}

void EnsureParentDirectory(const std::filesystem::path& path) {
    auto parent = path.parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        throw std::runtime_error("Failed to create log directory " + parent.string() + ": " + ec.message());
    }
}

} // namespace

void InitLogger(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (!config.file.empty()) {
        std::filesystem::path log_path{config.file};
        EnsureParentDirectory(log_path);
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path.string(), true));
    }
    auto logger = std::make_shared<spdlog::logger>("voice_token_server", sinks.begin(), sinks.end());
    logger->set_level(ParseLevel(config.level, spdlog::level::info));
    logger->set_pattern(config.pattern);
    // 警告及以上立即落盘, 便于排查失败请求
    logger->flush_on(spdlog::level::warn);

    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_logger = logger;
    spdlog::set_default_logger(g_logger);
}

void ShutdownLogger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (g_logger) {
        g_logger->flush();
    }
    g_logger.reset();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger> GetLogger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (!g_logger) {
        g_logger = spdlog::default_logger();
    }
    // spdlog::shutdown() 之后默认日志器为空
    if (!g_logger) {
        g_logger = std::make_shared<spdlog::logger>(
            "voice_token_server", std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    return g_logger;
}

std::string RedactSecret(const std::string& secret) {
    if (secret.empty()) {
        return "<empty>";
    }
    constexpr std::size_t kVisible = 3;
    if (secret.size() <= kVisible * 2) {
        return "***(" + std::to_string(secret.size()) + ")";
    }
    return secret.substr(0, kVisible) + "***(" + std::to_string(secret.size()) + ")";
}

} // namespace common
} // namespace voicetoken
