//
// Created by Aiziboy on 2025/12/9.
//

#ifndef ROUTIX_HTTP_SESSION_HPP
#define ROUTIX_HTTP_SESSION_HPP

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include <boost/asio/awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include <routix/http/http_common_types.hpp>
#include <routix/http/router.hpp>

namespace routix {

    /**
     * @brief 一个 HTTP/1.1 连接。
     *
     * 循环读取请求 -> Router::dispatch -> 写回响应，直到对端关闭、超时、
     * 或请求不要求 keep-alive。第一个请求和之后的空闲等待使用不同的超时。
     * handler 执行期间对端断开 (或 stop())，handler 在下一个 co_await 处被取消，不再写回响应。
     */
    class HttpSession : public std::enable_shared_from_this<HttpSession> {
    public:
        HttpSession(tcp::socket socket, const Router& router, std::size_t body_limit,
                    std::chrono::milliseconds timeout, std::chrono::milliseconds keep_alive);
        ~HttpSession();

        // 启动会话，连接结束时返回
        boost::asio::awaitable<void> run();

        // 关闭 socket，正在等待的读写会以 operation_aborted 结束
        void stop();

        const std::string& remote_ip() const { return remote_ip_; }

    private:
        boost::asio::awaitable<void> write_error(http::status status, unsigned version);

        // 等待对端断开，期间读到的数据追加到 buf；对端断开、出错或被取消时返回
        boost::asio::awaitable<void> watch_peer(boost::beast::flat_buffer& buf);
        void close_socket();

        boost::beast::tcp_stream stream_;
        const Router& router_;
        std::size_t body_limit_;
        std::chrono::milliseconds initial_timeout_;
        std::chrono::milliseconds keep_alive_timeout_;
        std::string remote_ip_;
        bool stopped_ = false;

        static constexpr std::size_t read_chunk_size = 4096;
    };

} // namespace routix

#endif //ROUTIX_HTTP_SESSION_HPP
