#include "server/token_http_handler.hpp"

#include "common/logger.hpp"

#include <nlohmann/json.hpp>

namespace voicetoken {
namespace server {

namespace http = boost::beast::http;

using voicetoken::common::Status;
using voicetoken::common::StatusCode;

namespace {

constexpr const char* kApiKeyHeader = "X-API-Key";
constexpr const char* kWelcomeMessage =
    "Welcome to Media Server Token Server. Use /token endpoint to generate a token.";

HttpResponse JsonResponse(const HttpRequest& req, http::status status, const nlohmann::json& body) {
    HttpResponse res{status, req.version()};
    res.set(http::field::server, "voice-token-server");
    res.set(http::field::content_type, "application/json");
    res.set(http::field::cache_control, "no-store");
    res.keep_alive(req.keep_alive());
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

HttpResponse ErrorResponse(const HttpRequest& req, http::status status, const std::string& detail) {
    return JsonResponse(req, status, nlohmann::json{{"detail", detail}});
}

} // namespace

TokenHttpHandler::TokenHttpHandler(std::shared_ptr<voicetoken::core::TokenService> service)
    : service_(std::move(service)) {}

HttpResponse TokenHttpHandler::Handle(const HttpRequest& req) const {
    std::string path(req.target());
    auto query = path.find('?');
    if (query != std::string::npos) {
        path.resize(query);
    }

    if (path == "/") {
        return HandleRoot(req);
    }
    if (path == "/healthz") {
        return HandleHealth(req);
    }
    if (path == "/token") {
        return HandleToken(req);
    }
    return ErrorResponse(req, http::status::not_found, "Not Found");
}

HttpResponse TokenHttpHandler::HandleRoot(const HttpRequest& req) const {
    if (req.method() != http::verb::get) {
        return ErrorResponse(req, http::status::method_not_allowed, "Method Not Allowed");
    }
    return JsonResponse(req, http::status::ok, nlohmann::json{{"message", kWelcomeMessage}});
}

HttpResponse TokenHttpHandler::HandleHealth(const HttpRequest& req) const {
    if (req.method() != http::verb::get) {
        return ErrorResponse(req, http::status::method_not_allowed, "Method Not Allowed");
    }
    return JsonResponse(req, http::status::ok, nlohmann::json{{"status", "SERVING"}});
}

HttpResponse TokenHttpHandler::HandleToken(const HttpRequest& req) const {
    if (req.method() != http::verb::post) {
        return ErrorResponse(req, http::status::method_not_allowed, "Method Not Allowed");
    }

    std::string credential;
    auto it = req.find(kApiKeyHeader);
    if (it != req.end()) {
        credential = std::string(it->value());
    }

    auto result = service_->RequestToken(credential, req.body());
    if (!result.IsOk()) {
        const auto& status = result.GetStatus();
        const auto http_status = ToHttpStatus(status);
        switch (status.Code()) {
            case StatusCode::kUnauthenticated:
                return ErrorResponse(req, http_status, "Unauthorized");
            case StatusCode::kInvalidArgument:
                return ErrorResponse(req, http_status, status.Message());
            default:
                VOICETOKEN_LOG_ERROR("[TokenHandler] token request failed: {}",
                                     voicetoken::common::ToString(status));
                return ErrorResponse(req, http_status, "Internal server error");
        }
    }

    const auto& session = result.Value();
    return JsonResponse(req, http::status::ok, nlohmann::json{
        {"token", session.token},
        {"room_name", session.room_name},
        {"participant", session.participant},
        {"agent", session.agent},
    });
}

http::status TokenHttpHandler::ToHttpStatus(const Status& status) {
    switch (status.Code()) {
        case StatusCode::kOk:
            return http::status::ok;
        case StatusCode::kUnauthenticated:
            return http::status::unauthorized;
        case StatusCode::kInvalidArgument:
            return http::status::bad_request;
        default:
            return http::status::internal_server_error;
    }
}

} // namespace server
} // namespace voicetoken
