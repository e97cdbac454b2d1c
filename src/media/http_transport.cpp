#include "media/http_transport.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <algorithm>
#include <cctype>
#include <memory>
#include <type_traits>

namespace voicetoken {
namespace media {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

using voicetoken::common::Status;
using voicetoken::common::StatusOr;

namespace {

constexpr const char* kUserAgent = "voice-token-server";

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

// 一次完整的请求/响应交换, 总耗时受 deadline_ 约束
template <class Stream>
class Exchange : public std::enable_shared_from_this<Exchange<Stream>> {
public:
    static constexpr bool kTls = !std::is_same_v<Stream, beast::tcp_stream>;

    template <class... StreamArgs>
    Exchange(net::io_context& ioc,
             http::request<http::string_body> req,
             std::string host,
             std::string port,
             StreamArgs&&... stream_args)
        : resolver_(ioc)
        , stream_(std::forward<StreamArgs>(stream_args)...)
        , deadline_(ioc)
        , req_(std::move(req))
        , host_(std::move(host))
        , port_(std::move(port)) {}

    void Run(std::chrono::milliseconds timeout) {
        deadline_.expires_after(timeout);
        deadline_.async_wait([self = this->shared_from_this()](beast::error_code ec) {
            if (ec == net::error::operation_aborted || self->done_) {
                return;
            }
            self->timed_out_ = true;
            self->resolver_.cancel();
            beast::get_lowest_layer(self->stream_).cancel();
        });
        resolver_.async_resolve(host_, port_,
                                beast::bind_front_handler(&Exchange::OnResolve, this->shared_from_this()));
    }

    bool TimedOut() const { return timed_out_; }
    const beast::error_code& Error() const { return ec_; }
    http::response<http::string_body>& Response() { return res_; }

    // TLS 校验需要在握手前配置
    Stream& GetStream() { return stream_; }

private:
    void OnResolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
            return Finish(ec);
        }
        beast::get_lowest_layer(stream_).async_connect(
            results, beast::bind_front_handler(&Exchange::OnConnect, this->shared_from_this()));
    }

    void OnConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec) {
            return Finish(ec);
        }
        if constexpr (kTls) {
            // SNI
            if (!SSL_set_tlsext_host_name(stream_.native_handle(), host_.c_str())) {
                return Finish(beast::error_code(static_cast<int>(::ERR_get_error()),
                                                net::error::get_ssl_category()));
            }
            stream_.async_handshake(ssl::stream_base::client,
                                    beast::bind_front_handler(&Exchange::OnHandshake, this->shared_from_this()));
        } else {
            DoWrite();
        }
    }

    void OnHandshake(beast::error_code ec) {
        if (ec) {
            return Finish(ec);
        }
        DoWrite();
    }

    void DoWrite() {
        http::async_write(stream_, req_,
                          beast::bind_front_handler(&Exchange::OnWrite, this->shared_from_this()));
    }

    void OnWrite(beast::error_code ec, std::size_t) {
        if (ec) {
            return Finish(ec);
        }
        http::async_read(stream_, buffer_, res_,
                         beast::bind_front_handler(&Exchange::OnRead, this->shared_from_this()));
    }

    void OnRead(beast::error_code ec, std::size_t) {
        Finish(ec);
    }

    void Finish(beast::error_code ec) {
        if (done_) {
            return;
        }
        done_ = true;
        ec_ = ec;
        deadline_.cancel();
        beast::error_code ignored;
        beast::get_lowest_layer(stream_).socket().shutdown(tcp::socket::shutdown_both, ignored);
        beast::get_lowest_layer(stream_).close();
    }

    tcp::resolver resolver_;
    Stream stream_;
    net::steady_timer deadline_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    http::response<http::string_body> res_;
    std::string host_;
    std::string port_;
    beast::error_code ec_;
    bool done_ = false;
    bool timed_out_ = false;
};

template <class Stream>
StatusOr<HttpReply> Collect(const std::shared_ptr<Exchange<Stream>>& exchange,
                            const HttpEndpoint& endpoint) {
    if (exchange->TimedOut()) {
        return Status::DeadlineExceeded("request to " + endpoint.host + " timed out");
    }
    if (exchange->Error()) {
        return Status::Unavailable("request to " + endpoint.host + " failed: " + exchange->Error().message());
    }
    HttpReply reply;
    reply.status = static_cast<int>(exchange->Response().result_int());
    reply.body = std::move(exchange->Response().body());
    return StatusOr<HttpReply>(std::move(reply));
}

} // namespace

StatusOr<HttpEndpoint> ParseEndpoint(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return Status::InvalidArgument("endpoint url has no scheme: " + url);
    }

    HttpEndpoint endpoint;
    const std::string scheme = ToLower(url.substr(0, scheme_end));
    if (scheme == "http" || scheme == "ws") {
        endpoint.scheme = "http";
        endpoint.port = "80";
    } else if (scheme == "https" || scheme == "wss") {
        endpoint.scheme = "https";
        endpoint.port = "443";
    } else {
        return Status::InvalidArgument("unsupported endpoint scheme: " + scheme);
    }

    const std::string rest = url.substr(scheme_end + 3);
    const auto path_begin = rest.find('/');
    std::string authority = rest.substr(0, path_begin);
    if (path_begin != std::string::npos) {
        endpoint.base_path = rest.substr(path_begin);
        while (!endpoint.base_path.empty() && endpoint.base_path.back() == '/') {
            endpoint.base_path.pop_back();
        }
    }

    if (!authority.empty() && authority.front() == '[') {
        // IPv6 字面量
        auto close = authority.find(']');
        if (close == std::string::npos) {
            return Status::InvalidArgument("malformed IPv6 host in endpoint url: " + url);
        }
        endpoint.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return Status::InvalidArgument("malformed endpoint authority: " + url);
            }
            endpoint.port = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            endpoint.port = authority.substr(colon + 1);
            authority.resize(colon);
        }
        endpoint.host = authority;
    }

    if (endpoint.host.empty()) {
        return Status::InvalidArgument("endpoint url has no host: " + url);
    }
    if (endpoint.port.empty() ||
        !std::all_of(endpoint.port.begin(), endpoint.port.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return Status::InvalidArgument("endpoint url has an invalid port: " + url);
    }
    return StatusOr<HttpEndpoint>(std::move(endpoint));
}

BeastHttpTransport::BeastHttpTransport(std::chrono::milliseconds timeout, bool verify_tls)
    : timeout_(timeout), verify_tls_(verify_tls) {}

StatusOr<HttpReply> BeastHttpTransport::Send(const HttpEndpoint& endpoint, const HttpCall& call) {
    const auto verb = http::string_to_verb(call.method);
    if (verb == http::verb::unknown) {
        return Status::InvalidArgument("unsupported HTTP method: " + call.method);
    }

    http::request<http::string_body> req{verb, endpoint.base_path + call.target, 11};
    req.set(http::field::host, endpoint.host);
    req.set(http::field::user_agent, kUserAgent);
    for (const auto& [name, value] : call.headers) {
        req.set(name, value);
    }
    if (!call.body.empty()) {
        req.set(http::field::content_type, call.content_type);
        req.body() = call.body;
    }
    req.prepare_payload();

    try {
        if (endpoint.Tls()) {
            ssl::context ctx{ssl::context::tlsv12_client};
            if (verify_tls_) {
                ctx.set_default_verify_paths();
                ctx.set_verify_mode(ssl::verify_peer);
            } else {
                ctx.set_verify_mode(ssl::verify_none);
            }

            net::io_context ioc;
            using TlsStream = beast::ssl_stream<beast::tcp_stream>;
            auto exchange = std::make_shared<Exchange<TlsStream>>(
                ioc, std::move(req), endpoint.host, endpoint.port, ioc, ctx);
            if (verify_tls_) {
                exchange->GetStream().set_verify_callback(ssl::host_name_verification(endpoint.host));
            }
            exchange->Run(timeout_);
            ioc.run();
            return Collect(exchange, endpoint);
        }

        net::io_context ioc;
        auto exchange = std::make_shared<Exchange<beast::tcp_stream>>(
            ioc, std::move(req), endpoint.host, endpoint.port, ioc);
        exchange->Run(timeout_);
        ioc.run();
        return Collect(exchange, endpoint);
    } catch (const std::exception& ex) {
        return Status::Unavailable("request to " + endpoint.host + " failed: " + ex.what());
    }
}

} // namespace media
} // namespace voicetoken
