#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"

#include <string>

namespace voicetoken {
namespace media {

// agent 调度指令: 由媒体服务决定哪个自动化 agent 加入房间
struct DispatchDirective {
    std::string agent_name;
    std::string metadata;   // JSON 字符串, 原样交给 agent
};

// 一次会话的房间/参与者/调度三元组
struct SessionGrant {
    std::string room_name;
    std::string participant_identity;
    DispatchDirective dispatch;
};

// 媒体会话服务能力: 创建房间 + 签发访问令牌
class MediaSessionService {
public:
    virtual ~MediaSessionService() = default;

    // 创建房间, 失败即返回非 OK; 调用方不重试
    virtual voicetoken::common::Status CreateRoom(const SessionGrant& grant) = 0;

    // 签发绑定该房间与参与者的访问令牌
    virtual voicetoken::common::StatusOr<std::string> IssueToken(const SessionGrant& grant) = 0;
};

} // namespace media
} // namespace voicetoken
