#include "media/media_server_client.hpp"

#include "common/logger.hpp"
#include "media/access_token.hpp"

#include <nlohmann/json.hpp>

namespace voicetoken {
namespace media {

using voicetoken::common::Status;
using voicetoken::common::StatusOr;

MediaServerClient::MediaServerClient(const voicetoken::common::MediaConfig& config,
                                     std::shared_ptr<HttpTransport> transport)
    : config_(config), transport_(std::move(transport)) {}

Status MediaServerClient::CheckCredentials() const {
    if (config_.url.empty() || config_.api_key.empty() || config_.api_secret.empty()) {
        return Status::FailedPrecondition("media server credentials are not configured");
    }
    return Status::OK();
}

Status MediaServerClient::CreateRoom(const SessionGrant& grant) {
    auto status = CheckCredentials();
    if (!status.IsOk()) {
        return status;
    }
    auto endpoint = ParseEndpoint(config_.url);
    if (!endpoint.IsOk()) {
        return endpoint.GetStatus();
    }

    // 服务端调用令牌, 只授予 roomCreate
    TokenClaims service_claims;
    service_claims.video.room_create = true;
    service_claims.ttl = std::chrono::seconds(config_.service_token_ttl_seconds);
    auto service_token = SignAccessToken(config_.api_key, config_.api_secret, service_claims);
    if (!service_token.IsOk()) {
        return service_token.GetStatus();
    }

    nlohmann::json dispatch{
        {"agent_name", grant.dispatch.agent_name},
        {"metadata", grant.dispatch.metadata},
    };
    nlohmann::json body{
        {"name", grant.room_name},
        {"empty_timeout", config_.room_empty_timeout_seconds},
    };
    body["agents"] = nlohmann::json::array();
    body["agents"].push_back(std::move(dispatch));

    HttpCall call;
    call.method = "POST";
    call.target = config_.room_service_path;
    call.headers.emplace_back("Authorization", "Bearer " + service_token.Value());
    call.body = body.dump();

    auto reply = transport_->Send(endpoint.Value(), call);
    if (!reply.IsOk()) {
        return reply.GetStatus().WithContext("create room");
    }
    if (reply.Value().status < 200 || reply.Value().status >= 300) {
        return Status::Unavailable("create room rejected with HTTP " + std::to_string(reply.Value().status) +
                                   ": " + reply.Value().body.substr(0, 256));
    }
    VOICETOKEN_LOG_INFO("[MediaServer] room {} created", grant.room_name);
    return Status::OK();
}

StatusOr<std::string> MediaServerClient::IssueToken(const SessionGrant& grant) {
    auto status = CheckCredentials();
    if (!status.IsOk()) {
        return status;
    }

    TokenClaims claims;
    claims.identity = grant.participant_identity;
    claims.video.room_join = true;
    claims.video.room = grant.room_name;
    claims.agents.push_back({grant.dispatch.agent_name, grant.dispatch.metadata});
    claims.ttl = std::chrono::seconds(config_.token_ttl_seconds);
    return SignAccessToken(config_.api_key, config_.api_secret, claims);
}

} // namespace media
} // namespace voicetoken
