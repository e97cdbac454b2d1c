#pragma once

#include <string>
#include <vector>

namespace voicetoken {
namespace common {

// HTTP 服务器配置结构体
struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8000;
    int io_threads = 2;             // 负责 accept 与解析的 IO 线程数
    int workers = 8;                // 执行阻塞请求处理的工作线程数
    int read_timeout_ms = 10000;    // 单个请求的读超时
    int body_limit = 16 * 1024;     // 请求体上限 (字节)
};

// 日志配置结构体
struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e][%^%l%$][%t] %v";
    bool console = true;
    std::string file = "";
};

// 媒体服务 (房间创建 + 令牌签名) 配置结构体
struct MediaConfig {
    std::string url = "";           // ws(s):// 或 http(s):// 地址
    std::string api_key = "";
    std::string api_secret = "";
    std::string room_service_path = "/twirp/livekit.RoomService/CreateRoom";
    int token_ttl_seconds = 24 * 3600;
    int service_token_ttl_seconds = 600;
    int request_timeout_ms = 5000;
    int room_empty_timeout_seconds = 300;
    bool create_room = true;
    bool verify_tls = true;
};

// Agent 调度配置结构体
struct AgentConfig {
    std::string default_agent = "ivy";
    std::string dispatch_name = "";         // 为空时直接使用 persona 名称调度
    std::vector<std::string> allowed;       // 除默认 agent 外允许请求方指定的 agent
};

// 房间名与参与者标识的生成规则
struct SessionNamingConfig {
    std::string room_prefix = "web-call-";
    std::string identity_prefix = "identity-";
    int room_suffix_hex = 32;
    int identity_suffix_hex = 12;
};

// Redis配置结构体
struct RedisConfig {
    std::string host = "127.0.0.1";
    int port = 6379;
    std::string password = "";
    int db = 0;
    int pool_size = 4;
    int connection_timeout_ms = 500;
    int socket_timeout_ms = 1000;
    bool enabled = true;
};

// 校验结果缓存配置结构体, ttl_ms 为 0 时不启用
struct KeyCacheConfig {
    int ttl_ms = 0;
    int negative_ttl_ms = 0;
    int max_entries = 1024;
    bool serve_stale_on_error = false;
};

// API Key 存储配置结构体
struct KeyStoreConfig {
    std::string backend = "redis";          // "redis" 或 "static"
    std::string prefix = "voicetoken:apikey:";
    bool hash_keys = false;                 // 以 SHA-256 摘要作为存储键
    std::vector<std::string> static_keys;
    RedisConfig redis;
    KeyCacheConfig cache;
};

// 密钥文档配置结构体
struct SecretsConfig {
    std::string file = "";
};

// 应用配置结构体
struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
    MediaConfig media;
    AgentConfig agents;
    SessionNamingConfig session;
    KeyStoreConfig key_store;
    SecretsConfig secrets;
};

} // namespace common
} // namespace voicetoken
