#pragma once

#include "common/config.hpp"
#include "common/status.hpp"
#include "server/token_http_handler.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

namespace voicetoken {
namespace server {

// 基于 Boost.Beast 的 HTTP/1.1 服务器
// IO 线程负责 accept/读写, 请求处理 (可能阻塞于远端调用) 投递到独立的工作线程池
class HttpServer {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    HttpServer(const voicetoken::common::ServerConfig& config, Handler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // 绑定端口并启动 IO 线程; port 为 0 时由系统分配
    voicetoken::common::Status Start();
    void Stop();

    // 实际监听的端口, Start() 成功后有效
    unsigned short Port() const;

private:
    void DoAccept();
    void OnAccept(boost::system::error_code ec, boost::asio::ip::tcp::socket socket);

    voicetoken::common::ServerConfig config_;
    Handler handler_;
    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::unique_ptr<boost::asio::thread_pool> workers_;
    std::vector<std::thread> io_threads_;
    std::atomic<bool> running_{false};
};

} // namespace server
} // namespace voicetoken
