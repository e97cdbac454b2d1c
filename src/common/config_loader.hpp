#pragma once

#include "common/config.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace voicetoken {
namespace common {

class ConfigLoader {
public:
    // 读取并解析配置文件, 失败时抛出 std::runtime_error
    static AppConfig Load(const std::string& path);
    // 用环境变量覆盖部署相关字段
    static void ApplyEnvOverrides(AppConfig& config);

    static AppConfig FromJson(const nlohmann::json& j);

private:
    static nlohmann::json ReadFile(const std::string& path);
};

// 检查配置中会导致请求失败的问题, 每条问题一条描述
std::vector<std::string> ValidateConfig(const AppConfig& config);

// 将逗号分隔的列表拆分为去除空白后的非空项
std::vector<std::string> SplitList(const std::string& value);

} // namespace common
} // namespace voicetoken
