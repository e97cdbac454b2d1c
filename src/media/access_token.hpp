#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace voicetoken {
namespace media {

// 媒体服务的 video 授权
struct VideoGrant {
    bool room_join = false;
    bool room_create = false;
    std::string room;
};

struct AgentDispatchClaim {
    std::string agent_name;
    std::string metadata;
};

// 访问令牌的声明集合
struct TokenClaims {
    std::string identity;       // sub / jti
    std::string name;
    std::string metadata;
    VideoGrant video;
    std::vector<AgentDispatchClaim> agents;     // roomConfig.agents
    std::chrono::seconds ttl{3600};
};

// HS256 签名, iss 为媒体服务 API key
voicetoken::common::StatusOr<std::string> SignAccessToken(const std::string& api_key,
                                                          const std::string& api_secret,
                                                          const TokenClaims& claims);

// 校验签名、签发方与有效期, 返回 payload
voicetoken::common::StatusOr<nlohmann::json> VerifyAccessToken(const std::string& token,
                                                               const std::string& api_key,
                                                               const std::string& api_secret);

} // namespace media
} // namespace voicetoken
