#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "common/config.hpp"

// Redis++库头文件
#include <sw/redis++/redis++.h>

#include <memory>
#include <mutex>
#include <string>

namespace voicetoken {
namespace cache {

// Redis 访问封装, 所有异常在此转换为 Status
class RedisClient {
public:
    explicit RedisClient(const voicetoken::common::RedisConfig& config);
    ~RedisClient();

    // 创建连接池 (连接按需建立)
    voicetoken::common::Status Connect();

    // 探测服务器可用性
    voicetoken::common::Status Ping();

    // 获取键对应的值, 键不存在时返回 kNotFound
    voicetoken::common::StatusOr<std::string> Get(const std::string& key);

private:
    std::shared_ptr<sw::redis::Redis> Handle();

    voicetoken::common::RedisConfig config_; // Redis配置
    std::mutex mutex_;
    std::shared_ptr<sw::redis::Redis> redis_; // Redis连接对象
};

} // namespace cache
} // namespace voicetoken
