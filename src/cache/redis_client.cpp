#include "cache/redis_client.hpp"

#include <chrono>

namespace voicetoken {
namespace cache {

namespace {

using voicetoken::common::Status;

// 超时单独映射, 其余 redis++ 错误视为服务不可用
Status FromRedisError(const std::string& op, const sw::redis::Error& err) {
    if (dynamic_cast<const sw::redis::TimeoutError*>(&err) != nullptr) {
        return Status::DeadlineExceeded("Redis " + op + " timed out: " + err.what());
    }
    return Status::Unavailable("Redis " + op + " failed: " + err.what());
}

} // namespace

// 构造函数
RedisClient::RedisClient(const voicetoken::common::RedisConfig& config)
    : config_(config) {}

// 析构函数
RedisClient::~RedisClient() = default;

// 连接到Redis服务器
Status RedisClient::Connect() {
    if (!config_.enabled) {
        return Status::Unavailable("Redis is disabled in the configuration.");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (redis_) {
        return Status::OK(); // 已经连接
    }

    try {
        sw::redis::ConnectionOptions opts; // Redis连接选项
        opts.host = config_.host;
        opts.port = config_.port;
        if (!config_.password.empty()) {
            opts.password = config_.password;
        }
        opts.db = config_.db;
        opts.connect_timeout = std::chrono::milliseconds(config_.connection_timeout_ms);
        opts.socket_timeout = std::chrono::milliseconds(config_.socket_timeout_ms);

        // 创建连接池选项, 取连接的等待同样受超时约束
        sw::redis::ConnectionPoolOptions pool_opts;
        pool_opts.size = static_cast<std::size_t>(config_.pool_size);
        pool_opts.wait_timeout = std::chrono::milliseconds(config_.connection_timeout_ms);

        redis_ = std::make_shared<sw::redis::Redis>(opts, pool_opts);
        return Status::OK();
    } catch (const sw::redis::Error& err) {
        return Status::Unavailable("Failed to connect to Redis: " + std::string(err.what()));
    }
}

std::shared_ptr<sw::redis::Redis> RedisClient::Handle() {
    std::lock_guard<std::mutex> lock(mutex_);
    return redis_;
}

Status RedisClient::Ping() {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        Handle()->ping();
        return Status::OK();
    } catch (const sw::redis::Error& err) {
        return FromRedisError("PING", err);
    }
}

// 获取键对应的值
voicetoken::common::StatusOr<std::string> RedisClient::Get(const std::string& key) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        auto val = Handle()->get(key);
        if (!val) {
            return Status::NotFound("Key not found in Redis");
        }
        return voicetoken::common::StatusOr<std::string>(*val);
    } catch (const sw::redis::Error& err) {
        return FromRedisError("GET", err);
    }
}

} // namespace cache
} // namespace voicetoken
