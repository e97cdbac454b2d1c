#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace voicetoken {
namespace media {

// 解析后的服务地址
struct HttpEndpoint {
    std::string scheme;     // "http" 或 "https"
    std::string host;
    std::string port;
    std::string base_path;  // 不含结尾的 '/'

    bool Tls() const { return scheme == "https"; }
};

// ws:// 与 wss:// 分别映射为 http:// 与 https://
voicetoken::common::StatusOr<HttpEndpoint> ParseEndpoint(const std::string& url);

struct HttpCall {
    std::string method = "POST";
    std::string target;     // 以 '/' 开头, 拼接在 base_path 之后
    std::vector<std::pair<std::string, std::string>> headers;
    std::string content_type = "application/json";
    std::string body;
};

struct HttpReply {
    int status = 0;
    std::string body;
};

// 出站 HTTP 能力, 便于测试替换
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // 传输失败返回 kUnavailable, 超时返回 kDeadlineExceeded; 任何 HTTP 状态码都视为传输成功
    virtual voicetoken::common::StatusOr<HttpReply> Send(const HttpEndpoint& endpoint, const HttpCall& call) = 0;
};

// 基于 Boost.Beast 的实现, 每次调用使用独立的 io_context, 整个交换过程受 timeout 约束
class BeastHttpTransport : public HttpTransport {
public:
    explicit BeastHttpTransport(std::chrono::milliseconds timeout, bool verify_tls = true);

    voicetoken::common::StatusOr<HttpReply> Send(const HttpEndpoint& endpoint, const HttpCall& call) override;

private:
    std::chrono::milliseconds timeout_;
    bool verify_tls_;
};

} // namespace media
} // namespace voicetoken
