#pragma once

#include "common/config.hpp"

#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace voicetoken {
namespace common {

void InitLogger(const LoggingConfig& config);
void ShutdownLogger();

// 获取全局日志器
std::shared_ptr<spdlog::logger> GetLogger();

// 凭据脱敏: 仅保留前缀与长度, 用于日志
std::string RedactSecret(const std::string& secret);

// 日志宏定义
#define VOICETOKEN_LOG_INFO(...)  ::voicetoken::common::GetLogger()->info(__VA_ARGS__)
#define VOICETOKEN_LOG_WARN(...)  ::voicetoken::common::GetLogger()->warn(__VA_ARGS__)
#define VOICETOKEN_LOG_ERROR(...) ::voicetoken::common::GetLogger()->error(__VA_ARGS__)

} // namespace common
} // namespace voicetoken
