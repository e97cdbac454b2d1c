#include "server/service_builder.hpp"

#include "cache/redis_client.hpp"
#include "common/logger.hpp"
#include "core/auth/cached_key_store.hpp"
#include "core/auth/key_validator.hpp"
#include "core/auth/redis_key_store.hpp"
#include "core/session/session_issuer.hpp"
#include "media/http_transport.hpp"
#include "media/media_server_client.hpp"

#include <chrono>

namespace voicetoken {
namespace server {

std::shared_ptr<voicetoken::core::KeyStore> CreateKeyStore(const voicetoken::common::KeyStoreConfig& config) {
    std::shared_ptr<voicetoken::core::KeyStore> store;
    if (config.backend == "static" || !config.redis.enabled) {
        VOICETOKEN_LOG_WARN("[KeyStore] Redis disabled; using static allow-list with {} keys",
                            config.static_keys.size());
        store = std::make_shared<voicetoken::core::StaticKeyStore>(config.static_keys);
    } else {
        auto redis = std::make_shared<voicetoken::cache::RedisClient>(config.redis);
        // 启动时不可达只记录告警; 请求期间的查询失败按校验器故障处理, 不回退到静态白名单
        auto status = redis->Ping();
        if (!status.IsOk()) {
            VOICETOKEN_LOG_WARN("[KeyStore] Redis {}:{} not reachable at start-up: {}",
                                config.redis.host, config.redis.port, status.Message());
        } else {
            VOICETOKEN_LOG_INFO("[KeyStore] Redis {}:{} connected", config.redis.host, config.redis.port);
        }
        store = std::make_shared<voicetoken::core::RedisKeyStore>(redis, config.prefix, config.hash_keys);
    }

    if (config.cache.ttl_ms > 0) {
        VOICETOKEN_LOG_INFO("[KeyStore] validation cache enabled (ttl={}ms, negative_ttl={}ms, stale_on_error={})",
                            config.cache.ttl_ms, config.cache.negative_ttl_ms, config.cache.serve_stale_on_error);
        store = std::make_shared<voicetoken::core::CachedKeyStore>(store, config.cache);
    }
    return store;
}

std::shared_ptr<voicetoken::media::MediaSessionService> CreateMediaService(
    const voicetoken::common::MediaConfig& config) {
    auto transport = std::make_shared<voicetoken::media::BeastHttpTransport>(
        std::chrono::milliseconds(config.request_timeout_ms), config.verify_tls);
    return std::make_shared<voicetoken::media::MediaServerClient>(config, std::move(transport));
}

std::shared_ptr<voicetoken::core::TokenService> BuildTokenService(
    const voicetoken::common::AppConfig& config,
    std::shared_ptr<voicetoken::core::KeyStore> key_store,
    std::shared_ptr<voicetoken::media::MediaSessionService> media) {
    auto validator = std::make_shared<voicetoken::core::KeyValidator>(std::move(key_store));
    auto issuer = std::make_shared<voicetoken::core::SessionIssuer>(
        config.agents, config.session, config.media.create_room, std::move(media));
    return std::make_shared<voicetoken::core::TokenService>(std::move(validator), std::move(issuer));
}

} // namespace server
} // namespace voicetoken
