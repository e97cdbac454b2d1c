#include "common/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace voicetoken {
namespace common {

namespace {

std::string Trim(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

// 读取非空环境变量
bool ReadEnv(const char* name, std::string& out) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return false;
    }
    out = value;
    return true;
}

bool ReadEnvInt(const char* name, int& out) {
    std::string value;
    if (!ReadEnv(name, value)) {
        return false;
    }
    try {
        out = std::stoi(value);
        return true;
    } catch (const std::exception&) {
        throw std::runtime_error(std::string("Environment variable ") + name + " is not an integer: " + value);
    }
}

std::vector<std::string> ReadStringList(const nlohmann::json& node, const std::vector<std::string>& fallback) {
    if (node.is_string()) {
        return SplitList(node.get<std::string>());
    }
    if (!node.is_array()) {
        return fallback;
    }
    std::vector<std::string> out;
    for (const auto& item : node) {
        if (item.is_string() && !item.get<std::string>().empty()) {
            out.push_back(item.get<std::string>());
        }
    }
    return out;
}

} // namespace

AppConfig ConfigLoader::Load(const std::string& path) {
    auto json = ReadFile(path);
    return FromJson(json);
}

nlohmann::json ConfigLoader::ReadFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }
    return nlohmann::json::parse(ifs, nullptr, true, true);
}

// 部署环境通过环境变量注入凭据, 优先级高于配置文件
void ConfigLoader::ApplyEnvOverrides(AppConfig& config) {
    ReadEnv("MEDIA_SERVER_URL", config.media.url);
    ReadEnv("MEDIA_SERVER_API_KEY", config.media.api_key);
    ReadEnv("MEDIA_SERVER_API_SECRET", config.media.api_secret);
    ReadEnv("DEFAULT_AGENT", config.agents.default_agent);
    ReadEnv("REDIS_HOST", config.key_store.redis.host);
    ReadEnvInt("REDIS_PORT", config.key_store.redis.port);
    ReadEnv("REDIS_PASSWORD", config.key_store.redis.password);
    ReadEnvInt("PORT", config.server.port);

    std::string keys;
    if (ReadEnv("SECRET_KEYS", keys)) {
        config.key_store.static_keys = SplitList(keys);
    }
}

// 从JSON对象构建配置结构体
AppConfig ConfigLoader::FromJson(const nlohmann::json& j) {
    AppConfig cfg;
    // Server配置
    if (j.contains("server")) {
        const auto& server = j["server"];
        cfg.server.host = server.value("host", cfg.server.host);
        cfg.server.port = server.value("port", cfg.server.port);
        cfg.server.io_threads = server.value("io_threads", cfg.server.io_threads);
        cfg.server.workers = server.value("workers", cfg.server.workers);
        cfg.server.read_timeout_ms = server.value("read_timeout_ms", cfg.server.read_timeout_ms);
        cfg.server.body_limit = server.value("body_limit", cfg.server.body_limit);
    }
    // Logging配置
    if (j.contains("logging")) {
        const auto& logging = j["logging"];
        cfg.logging.level = logging.value("level", cfg.logging.level);
        cfg.logging.pattern = logging.value("pattern", cfg.logging.pattern);
        cfg.logging.console = logging.value("console", cfg.logging.console);
        cfg.logging.file = logging.value("file", cfg.logging.file);
    }
    // Media配置
    if (j.contains("media")) {
        const auto& media = j["media"];
        cfg.media.url = media.value("url", cfg.media.url);
        cfg.media.api_key = media.value("api_key", cfg.media.api_key);
        cfg.media.api_secret = media.value("api_secret", cfg.media.api_secret);
        cfg.media.room_service_path = media.value("room_service_path", cfg.media.room_service_path);
        cfg.media.token_ttl_seconds = media.value("token_ttl_seconds", cfg.media.token_ttl_seconds);
        cfg.media.service_token_ttl_seconds =
            media.value("service_token_ttl_seconds", cfg.media.service_token_ttl_seconds);
        cfg.media.request_timeout_ms = media.value("request_timeout_ms", cfg.media.request_timeout_ms);
        cfg.media.room_empty_timeout_seconds =
            media.value("room_empty_timeout_seconds", cfg.media.room_empty_timeout_seconds);
        cfg.media.create_room = media.value("create_room", cfg.media.create_room);
        cfg.media.verify_tls = media.value("verify_tls", cfg.media.verify_tls);
    }
    // Agent配置
    if (j.contains("agents")) {
        const auto& agents = j["agents"];
        cfg.agents.default_agent = agents.value("default_agent", cfg.agents.default_agent);
        cfg.agents.dispatch_name = agents.value("dispatch_name", cfg.agents.dispatch_name);
        if (agents.contains("allowed")) {
            cfg.agents.allowed = ReadStringList(agents["allowed"], cfg.agents.allowed);
        }
    }
    // Session命名配置
    if (j.contains("session")) {
        const auto& session = j["session"];
        cfg.session.room_prefix = session.value("room_prefix", cfg.session.room_prefix);
        cfg.session.identity_prefix = session.value("identity_prefix", cfg.session.identity_prefix);
        cfg.session.room_suffix_hex = session.value("room_suffix_hex", cfg.session.room_suffix_hex);
        cfg.session.identity_suffix_hex = session.value("identity_suffix_hex", cfg.session.identity_suffix_hex);
    }
    // KeyStore配置
    if (j.contains("key_store")) {
        const auto& store = j["key_store"];
        cfg.key_store.backend = store.value("backend", cfg.key_store.backend);
        cfg.key_store.prefix = store.value("prefix", cfg.key_store.prefix);
        cfg.key_store.hash_keys = store.value("hash_keys", cfg.key_store.hash_keys);
        if (store.contains("static_keys")) {
            cfg.key_store.static_keys = ReadStringList(store["static_keys"], cfg.key_store.static_keys);
        }
        if (store.contains("redis")) {
            const auto& redis = store["redis"];
            auto& out = cfg.key_store.redis;
            out.host = redis.value("host", out.host);
            out.port = redis.value("port", out.port);
            out.password = redis.value("password", out.password);
            out.db = redis.value("db", out.db);
            out.pool_size = redis.value("pool_size", out.pool_size);
            out.connection_timeout_ms = redis.value("connection_timeout_ms", out.connection_timeout_ms);
            out.socket_timeout_ms = redis.value("socket_timeout_ms", out.socket_timeout_ms);
            out.enabled = redis.value("enabled", out.enabled);
        }
        if (store.contains("cache")) {
            const auto& cache = store["cache"];
            auto& out = cfg.key_store.cache;
            out.ttl_ms = cache.value("ttl_ms", out.ttl_ms);
            out.negative_ttl_ms = cache.value("negative_ttl_ms", out.negative_ttl_ms);
            out.max_entries = cache.value("max_entries", out.max_entries);
            out.serve_stale_on_error = cache.value("serve_stale_on_error", out.serve_stale_on_error);
        }
    }
    // Secrets配置
    if (j.contains("secrets")) {
        cfg.secrets.file = j["secrets"].value("file", cfg.secrets.file);
    }
    return cfg;
}

std::vector<std::string> ValidateConfig(const AppConfig& config) {
    std::vector<std::string> problems;
    if (config.media.url.empty() || config.media.api_key.empty() || config.media.api_secret.empty()) {
        problems.emplace_back("media url/api_key/api_secret not fully configured; token requests will fail");
    }
    if (config.agents.default_agent.empty()) {
        problems.emplace_back("agents.default_agent is empty; token requests without agent_name will fail");
    }
    if (config.media.request_timeout_ms <= 0) {
        problems.emplace_back("media.request_timeout_ms must be positive");
    }
    if (config.media.token_ttl_seconds <= 0) {
        problems.emplace_back("media.token_ttl_seconds must be positive");
    }
    if (config.key_store.backend == "redis") {
        if (config.key_store.redis.connection_timeout_ms <= 0 || config.key_store.redis.socket_timeout_ms <= 0) {
            problems.emplace_back("key_store.redis timeouts must be positive");
        }
    } else if (config.key_store.backend == "static") {
        if (config.key_store.static_keys.empty()) {
            problems.emplace_back("key_store.backend is static but no keys are configured; every request will be rejected");
        }
    } else {
        problems.emplace_back("unknown key_store.backend \"" + config.key_store.backend + "\"");
    }
    if (config.session.room_suffix_hex < 8 || config.session.identity_suffix_hex < 8) {
        problems.emplace_back("session suffix lengths below 8 hex chars make identifier collisions likely");
    }
    return problems;
}

std::vector<std::string> SplitList(const std::string& value) {
    std::vector<std::string> out;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = Trim(item);
        if (!item.empty()) {
            out.push_back(item);
        }
    }
    return out;
}

} // namespace common
} // namespace voicetoken
