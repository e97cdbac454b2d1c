#pragma once

#include "common/config.hpp"
#include "core/auth/key_store.hpp"
#include "core/session/token_service.hpp"
#include "media/media_service.hpp"

#include <memory>

namespace voicetoken {
namespace server {

// 按配置构建 API Key 存储链: Redis 或静态白名单, 可选外包一层校验缓存
std::shared_ptr<voicetoken::core::KeyStore> CreateKeyStore(const voicetoken::common::KeyStoreConfig& config);

// 按配置构建媒体服务客户端
std::shared_ptr<voicetoken::media::MediaSessionService> CreateMediaService(
    const voicetoken::common::MediaConfig& config);

// 组装完整的令牌流水线; 测试可传入替身
std::shared_ptr<voicetoken::core::TokenService> BuildTokenService(
    const voicetoken::common::AppConfig& config,
    std::shared_ptr<voicetoken::core::KeyStore> key_store,
    std::shared_ptr<voicetoken::media::MediaSessionService> media);

} // namespace server
} // namespace voicetoken
