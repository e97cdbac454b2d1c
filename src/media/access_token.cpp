#include "media/access_token.hpp"

#include <jwt-cpp/traits/nlohmann-json/traits.h>

#include <exception>

namespace voicetoken {
namespace media {

namespace {

using traits = jwt::traits::nlohmann_json;
using voicetoken::common::Status;
using voicetoken::common::StatusOr;

nlohmann::json VideoGrantToJson(const VideoGrant& video) {
    nlohmann::json j = nlohmann::json::object();
    if (video.room_join) {
        j["roomJoin"] = true;
    }
    if (video.room_create) {
        j["roomCreate"] = true;
    }
    if (!video.room.empty()) {
        j["room"] = video.room;
    }
    return j;
}

} // namespace

StatusOr<std::string> SignAccessToken(const std::string& api_key,
                                      const std::string& api_secret,
                                      const TokenClaims& claims) {
    if (api_key.empty() || api_secret.empty()) {
        return Status::FailedPrecondition("media api key/secret not configured");
    }
    if (claims.ttl.count() <= 0) {
        return Status::InvalidArgument("token ttl must be positive");
    }

    try {
        const auto now = std::chrono::system_clock::now();
        auto builder = jwt::create<traits>();
        builder.set_type("JWT")
            .set_issuer(api_key)
            .set_not_before(now)
            .set_expires_at(now + claims.ttl)
            .set_payload_claim("video", jwt::basic_claim<traits>(VideoGrantToJson(claims.video)));

        if (!claims.identity.empty()) {
            builder.set_subject(claims.identity).set_id(claims.identity);
        }
        if (!claims.name.empty()) {
            builder.set_payload_claim("name", jwt::basic_claim<traits>(nlohmann::json(claims.name)));
        }
        if (!claims.metadata.empty()) {
            builder.set_payload_claim("metadata", jwt::basic_claim<traits>(nlohmann::json(claims.metadata)));
        }
        if (!claims.agents.empty()) {
            nlohmann::json agents = nlohmann::json::array();
            for (const auto& agent : claims.agents) {
                agents.push_back({{"agentName", agent.agent_name}, {"metadata", agent.metadata}});
            }
            builder.set_payload_claim("roomConfig",
                                      jwt::basic_claim<traits>(nlohmann::json{{"agents", agents}}));
        }

        return StatusOr<std::string>(builder.sign(jwt::algorithm::hs256{api_secret}));
    } catch (const std::exception& ex) {
        return Status::Internal(std::string("token signing failed: ") + ex.what());
    }
}

StatusOr<nlohmann::json> VerifyAccessToken(const std::string& token,
                                           const std::string& api_key,
                                           const std::string& api_secret) {
    try {
        auto decoded = jwt::decode<traits>(token);
        jwt::verify<traits>()
            .allow_algorithm(jwt::algorithm::hs256{api_secret})
            .with_issuer(api_key)
            .leeway(5)
            .verify(decoded);
        return StatusOr<nlohmann::json>(nlohmann::json::parse(decoded.get_payload()));
    } catch (const std::exception& ex) {
        return Status::Unauthenticated(std::string("token verification failed: ") + ex.what());
    }
}

} // namespace media
} // namespace voicetoken
