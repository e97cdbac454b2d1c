#pragma once

#include "common/status.hpp"
#include "core/session/token_service.hpp"

#include <boost/beast/http.hpp>

#include <memory>
#include <string>

namespace voicetoken {
namespace server {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

// HTTP 路由:
//   GET  /         欢迎信息, 不检查鉴权头
//   GET  /healthz  存活检查
//   POST /token    X-API-Key 鉴权后签发令牌
class TokenHttpHandler {
public:
    explicit TokenHttpHandler(std::shared_ptr<voicetoken::core::TokenService> service);

    HttpResponse Handle(const HttpRequest& req) const;

    // 内部错误只返回通用描述, 细节仅写入日志
    static boost::beast::http::status ToHttpStatus(const voicetoken::common::Status& status);

private:
    HttpResponse HandleRoot(const HttpRequest& req) const;
    HttpResponse HandleHealth(const HttpRequest& req) const;
    HttpResponse HandleToken(const HttpRequest& req) const;

    std::shared_ptr<voicetoken::core::TokenService> service_;
};

} // namespace server
} // namespace voicetoken
