#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/auth/key_validator.hpp"
#include "core/session/session_issuer.hpp"

#include <memory>
#include <string>

namespace voicetoken {
namespace core {

// 令牌请求流水线: 先校验 API Key, 通过后才解析请求体并签发
// 错误状态码:
//   kUnauthenticated  - key 缺失或无效
//   kInvalidArgument  - 请求体格式错误或 agent 不被允许
//   其他              - 校验器或签发器故障
class TokenService {
public:
    TokenService(std::shared_ptr<KeyValidator> validator,
                 std::shared_ptr<SessionIssuer> issuer);

    voicetoken::common::StatusOr<IssuedSession> RequestToken(const std::string& credential,
                                                             const std::string& body) const;

private:
    std::shared_ptr<KeyValidator> validator_;
    std::shared_ptr<SessionIssuer> issuer_;
};

// 解析可选的 JSON 请求体 {agent_name?, customer?: {name, email}}; 空请求体合法
voicetoken::common::StatusOr<IssueCommand> ParseIssueBody(const std::string& body);

} // namespace core
} // namespace voicetoken
