#include "core/session/session_issuer.hpp"

#include "common/logger.hpp"

#include <nlohmann/json.hpp>
#include <openssl/rand.h>

#include <algorithm>
#include <vector>

namespace voicetoken {
namespace core {

namespace {

constexpr char kHexChars[] = "0123456789abcdef";

// 媒体层失败统一为内部错误, 原始状态只写日志
voicetoken::common::Status IssuerFailure(const char* stage) {
    return voicetoken::common::Status::Internal(std::string(stage) + " failed");
}

} // namespace

voicetoken::common::StatusOr<std::string> RandomHex(std::size_t length) {
    std::vector<unsigned char> bytes((length + 1) / 2);
    if (bytes.empty()) {
        return voicetoken::common::StatusOr<std::string>(std::string());
    }
    // 使用 OpenSSL 的加密安全随机数生成器, 不回退到可预测的随机源
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        VOICETOKEN_LOG_ERROR("[SessionIssuer] RAND_bytes failed");
        return voicetoken::common::Status::Internal("secure random source unavailable");
    }
    std::string result;
    result.reserve(bytes.size() * 2);
    for (unsigned char b : bytes) {
        result.push_back(kHexChars[b >> 4]);
        result.push_back(kHexChars[b & 0x0f]);
    }
    result.resize(length);
    return voicetoken::common::StatusOr<std::string>(std::move(result));
}

SessionIssuer::SessionIssuer(const voicetoken::common::AgentConfig& agents,
                             const voicetoken::common::SessionNamingConfig& naming,
                             bool create_room,
                             std::shared_ptr<voicetoken::media::MediaSessionService> media)
    : agents_(agents), naming_(naming), create_room_(create_room), media_(std::move(media)) {}

voicetoken::common::StatusOr<std::string> SessionIssuer::ResolveAgent(const std::string& requested) const {
    if (requested.empty() || requested == agents_.default_agent) {
        if (agents_.default_agent.empty()) {
            return Status::FailedPrecondition("no default agent configured");
        }
        return voicetoken::common::StatusOr<std::string>(agents_.default_agent);
    }
    if (std::find(agents_.allowed.begin(), agents_.allowed.end(), requested) == agents_.allowed.end()) {
        return Status::InvalidArgument("unknown agent: " + requested);
    }
    return voicetoken::common::StatusOr<std::string>(requested);
}

SessionIssuer::StatusOrSession SessionIssuer::Issue(const IssueCommand& command) const {
    auto agent = ResolveAgent(command.agent_name);
    if (!agent.IsOk()) {
        return agent.GetStatus();
    }

    auto room_name = GenerateRoomName();
    if (!room_name.IsOk()) {
        return room_name.GetStatus();
    }
    auto identity = GenerateIdentity();
    if (!identity.IsOk()) {
        return identity.GetStatus();
    }

    voicetoken::media::SessionGrant grant;
    grant.room_name = std::move(room_name).Value();
    grant.participant_identity = std::move(identity).Value();
    grant.dispatch.agent_name = agents_.dispatch_name.empty() ? agent.Value() : agents_.dispatch_name;
    grant.dispatch.metadata = BuildMetadata(command, agent.Value(), grant.participant_identity);

    // 房间创建失败则不再签发令牌
    if (create_room_) {
        auto status = media_->CreateRoom(grant);
        if (!status.IsOk()) {
            VOICETOKEN_LOG_ERROR("[SessionIssuer] create room {} failed: {}",
                                 grant.room_name, voicetoken::common::ToString(status));
            return IssuerFailure("create room");
        }
    }

    auto token = media_->IssueToken(grant);
    if (!token.IsOk()) {
        VOICETOKEN_LOG_ERROR("[SessionIssuer] sign token for room {} failed: {}",
                             grant.room_name, voicetoken::common::ToString(token.GetStatus()));
        return IssuerFailure("token signing");
    }

    IssuedSession session;
    session.token = std::move(token).Value();
    session.room_name = std::move(grant.room_name);
    session.participant = std::move(grant.participant_identity);
    session.agent = agent.Value();
    VOICETOKEN_LOG_INFO("[SessionIssuer] issued token room={} participant={} agent={}",
                        session.room_name, session.participant, session.agent);
    return StatusOrSession(std::move(session));
}

voicetoken::common::StatusOr<std::string> SessionIssuer::GenerateRoomName() const {
    auto suffix = RandomHex(static_cast<std::size_t>(std::max(naming_.room_suffix_hex, 1)));
    if (!suffix.IsOk()) {
        return suffix.GetStatus();
    }
    return voicetoken::common::StatusOr<std::string>(naming_.room_prefix + suffix.Value());
}

voicetoken::common::StatusOr<std::string> SessionIssuer::GenerateIdentity() const {
    auto suffix = RandomHex(static_cast<std::size_t>(std::max(naming_.identity_suffix_hex, 1)));
    if (!suffix.IsOk()) {
        return suffix.GetStatus();
    }
    return voicetoken::common::StatusOr<std::string>(naming_.identity_prefix + suffix.Value());
}

std::string SessionIssuer::BuildMetadata(const IssueCommand& command,
                                         const std::string& agent,
                                         const std::string& identity) const {
    nlohmann::json metadata{
        {"agent", agent},
        {"participant", identity},
    };
    if (!command.user_id.empty()) {
        metadata["user_id"] = command.user_id;
    }
    if (command.customer) {
        metadata["customer"] = {
            {"name", command.customer->name},
            {"email", command.customer->email},
        };
    }
    return metadata.dump();
}

} // namespace core
} // namespace voicetoken
