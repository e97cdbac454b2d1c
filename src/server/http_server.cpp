#include "server/http_server.hpp"

#include "common/logger.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <chrono>
#include <optional>

namespace voicetoken {
namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

using voicetoken::common::Status;

namespace {

HttpResponse PlainError(unsigned version, bool keep_alive, http::status status, const std::string& detail) {
    HttpResponse res{status, version};
    res.set(http::field::server, "voice-token-server");
    res.set(http::field::content_type, "application/json");
    res.keep_alive(keep_alive);
    res.body() = "{\"detail\":\"" + detail + "\"}";
    res.prepare_payload();
    return res;
}

// 单个连接, 所有 IO 操作都在该连接的 strand 上执行
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket&& socket,
                const HttpServer::Handler& handler,
                net::thread_pool& workers,
                const voicetoken::common::ServerConfig& config)
        : stream_(std::move(socket))
        , handler_(handler)
        , workers_(workers)
        , read_timeout_(std::chrono::milliseconds(std::max(config.read_timeout_ms, 1)))
        , body_limit_(static_cast<std::uint64_t>(std::max(config.body_limit, 0))) {}

    void Run() {
        net::dispatch(stream_.get_executor(),
                      beast::bind_front_handler(&HttpSession::DoRead, shared_from_this()));
    }

private:
    void DoRead() {
        parser_.emplace();
        parser_->body_limit(body_limit_);
        stream_.expires_after(read_timeout_);
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&HttpSession::OnRead, shared_from_this()));
    }

    void OnRead(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            return DoClose();
        }
        if (ec == http::error::body_limit) {
            return SendResponse(PlainError(11, false, http::status::payload_too_large, "Payload Too Large"));
        }
        if (ec) {
            // 超时或对端断开: 直接放弃该连接
            return;
        }

        // 处理逻辑可能阻塞于 Redis/媒体服务, 投递到工作线程池
        auto req = std::make_shared<HttpRequest>(parser_->release());
        net::post(workers_, [self = shared_from_this(), req]() {
            HttpResponse res;
            try {
                res = self->handler_(*req);
            } catch (const std::exception& ex) {
                VOICETOKEN_LOG_ERROR("[HttpServer] handler threw: {}", ex.what());
                res = PlainError(req->version(), false, http::status::internal_server_error,
                                 "Internal server error");
            }
            auto response = std::make_shared<HttpResponse>(std::move(res));
            net::post(self->stream_.get_executor(), [self, response]() {
                self->SendResponse(std::move(*response));
            });
        });
    }

    void SendResponse(HttpResponse&& res) {
        res_ = std::make_shared<HttpResponse>(std::move(res));
        stream_.expires_after(read_timeout_);
        http::async_write(stream_, *res_,
                          beast::bind_front_handler(&HttpSession::OnWrite, shared_from_this()));
    }

    void OnWrite(beast::error_code ec, std::size_t) {
        if (ec) {
            return;
        }
        const bool close = res_->need_eof();
        res_.reset();
        if (close) {
            return DoClose();
        }
        DoRead();
    }

    void DoClose() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    std::shared_ptr<HttpResponse> res_;
    const HttpServer::Handler& handler_;
    net::thread_pool& workers_;
    std::chrono::milliseconds read_timeout_;
    std::uint64_t body_limit_;
};

} // namespace

HttpServer::HttpServer(const voicetoken::common::ServerConfig& config, Handler handler)
    : config_(config)
    , handler_(std::move(handler))
    , ioc_(std::max(config.io_threads, 1))
    , acceptor_(net::make_strand(ioc_)) {}

HttpServer::~HttpServer() {
    Stop();
}

Status HttpServer::Start() {
    if (running_) {
        return Status::FailedPrecondition("server already started");
    }

    boost::system::error_code ec;
    auto address = net::ip::make_address(config_.host, ec);
    if (ec) {
        return Status::InvalidArgument("invalid listen address " + config_.host + ": " + ec.message());
    }
    tcp::endpoint endpoint{address, static_cast<unsigned short>(config_.port)};

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        return Status::Unavailable("open acceptor: " + ec.message());
    }
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
        return Status::Unavailable("set reuse_address: " + ec.message());
    }
    acceptor_.bind(endpoint, ec);
    if (ec) {
        return Status::Unavailable("bind " + config_.host + ":" + std::to_string(config_.port) + ": " + ec.message());
    }
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        return Status::Unavailable("listen: " + ec.message());
    }

    workers_ = std::make_unique<net::thread_pool>(static_cast<std::size_t>(std::max(config_.workers, 1)));
    running_ = true;
    DoAccept();

    const int io_threads = std::max(config_.io_threads, 1);
    io_threads_.reserve(static_cast<std::size_t>(io_threads));
    for (int i = 0; i < io_threads; ++i) {
        io_threads_.emplace_back([this] { ioc_.run(); });
    }
    VOICETOKEN_LOG_INFO("[HttpServer] listening on {}:{} (io_threads={}, workers={})",
                        config_.host, Port(), io_threads, std::max(config_.workers, 1));
    return Status::OK();
}

void HttpServer::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    // 先停止 IO 侧, 不再读入新请求; 之后投递到 IO 的响应直接丢弃
    net::post(acceptor_.get_executor(), [this] {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
    });
    ioc_.stop();
    for (auto& thread : io_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    io_threads_.clear();
    boost::system::error_code ignored;
    acceptor_.close(ignored);
    workers_->join();
    VOICETOKEN_LOG_INFO("[HttpServer] stopped");
}

unsigned short HttpServer::Port() const {
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void HttpServer::DoAccept() {
    acceptor_.async_accept(net::make_strand(ioc_),
                           beast::bind_front_handler(&HttpServer::OnAccept, this));
}

void HttpServer::OnAccept(boost::system::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec == net::error::operation_aborted || !running_) {
            return;
        }
        VOICETOKEN_LOG_WARN("[HttpServer] accept failed: {}", ec.message());
    } else {
        std::make_shared<HttpSession>(std::move(socket), handler_, *workers_, config_)->Run();
    }
    if (running_) {
        DoAccept();
    }
}

} // namespace server
} // namespace voicetoken
