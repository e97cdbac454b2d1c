#pragma once

#include "common/config.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace voicetoken {
namespace common {

// 密钥文档内容, 四个字段均为必填
struct MediaSecrets {
    std::string media_url;
    std::string media_api_key;
    std::string media_api_secret;
    std::vector<std::string> api_keys;  // SECRET_KEYS, 逗号分隔
};

class SecretLoader {
public:
    // 读取 JSON 密钥文档
    static StatusOr<MediaSecrets> LoadFile(const std::string& path);
    static StatusOr<MediaSecrets> FromJson(const nlohmann::json& doc);

    // 将密钥写入配置; 已由环境变量提供的字段不覆盖
    static void Apply(const MediaSecrets& secrets, AppConfig& config);
};

} // namespace common
} // namespace voicetoken
