#pragma once

#include "common/config.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"
#include "media/media_service.hpp"

#include <memory>
#include <optional>
#include <string>

namespace voicetoken {
namespace core {

struct CustomerInfo {
    std::string name;
    std::string email;
};

// 一次签发请求, 仅在 API Key 校验通过后构造
struct IssueCommand {
    std::string agent_name;     // 为空时使用默认 agent
    std::string user_id;        // 来自授权记录, 可为空
    std::optional<CustomerInfo> customer;
};

struct IssuedSession {
    std::string token;
    std::string room_name;
    std::string participant;
    std::string agent;
};

// 会话签发器: 生成房间名与参与者标识, 创建房间并签发令牌
class SessionIssuer {
public:
    using Status = voicetoken::common::Status;
    using StatusOrSession = voicetoken::common::StatusOr<IssuedSession>;

    SessionIssuer(const voicetoken::common::AgentConfig& agents,
                  const voicetoken::common::SessionNamingConfig& naming,
                  bool create_room,
                  std::shared_ptr<voicetoken::media::MediaSessionService> media);

    // 错误: kInvalidArgument 表示请求的 agent 不被允许; 媒体层失败统一为 kInternal, 细节只写日志
    StatusOrSession Issue(const IssueCommand& command) const;

    // 解析最终使用的 agent 名称
    voicetoken::common::StatusOr<std::string> ResolveAgent(const std::string& requested) const;

private:
    voicetoken::common::StatusOr<std::string> GenerateRoomName() const;
    voicetoken::common::StatusOr<std::string> GenerateIdentity() const;
    std::string BuildMetadata(const IssueCommand& command,
                              const std::string& agent,
                              const std::string& identity) const;

    voicetoken::common::AgentConfig agents_;
    voicetoken::common::SessionNamingConfig naming_;
    bool create_room_;
    std::shared_ptr<voicetoken::media::MediaSessionService> media_;
};

// 由安全随机源生成的小写十六进制串, 随机源不可用时返回 kInternal
voicetoken::common::StatusOr<std::string> RandomHex(std::size_t length);

} // namespace core
} // namespace voicetoken
