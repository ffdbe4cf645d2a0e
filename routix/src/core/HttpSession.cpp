//
// Created by Aiziboy on 2025/12/9.
//

#include <routix/core/HttpSession.hpp>
#include <routix/version.hpp>

#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <spdlog/spdlog.h>

using namespace boost::asio::experimental::awaitable_operators;

namespace routix {

    HttpSession::HttpSession(tcp::socket socket, const Router& router, const std::size_t body_limit,
                             const std::chrono::milliseconds timeout, const std::chrono::milliseconds keep_alive)
        : stream_(std::move(socket)),
          router_(router),
          body_limit_(body_limit),
          initial_timeout_(timeout),
          keep_alive_timeout_(keep_alive) {
        boost::system::error_code ec;
        const auto endpoint = stream_.socket().remote_endpoint(ec);
        if (!ec) {
            remote_ip_ = endpoint.address().to_string();
        }
        SPDLOG_DEBUG("Create a connection [{}]", remote_ip_);
    }

    HttpSession::~HttpSession() {
        SPDLOG_DEBUG("Close a connection [{}]", remote_ip_);
    }

    boost::asio::awaitable<void> HttpSession::run() {
        auto self = shared_from_this(); // 保活
        try {
            // 使用 Beast 推荐的 flat_buffer 来提高性能
            boost::beast::flat_buffer buf;

            // 标志位，用于判断是否是第一个请求
            bool is_first_request = true;

            for (;;) {
                if (stopped_) break;

                http::request_parser<http::string_body> parser;
                parser.body_limit(body_limit_);

                // 新连接的第一个请求使用较短的超时，keep-alive 的空闲连接使用较长的超时
                stream_.expires_after(is_first_request ? initial_timeout_ : keep_alive_timeout_);

                boost::system::error_code ec;
                co_await http::async_read(stream_, buf, parser, boost::asio::redirect_error(boost::asio::use_awaitable, ec));

                if (ec) {
                    if (ec == http::error::body_limit) {
                        // 请求体过大：发送 413 后必须关闭连接
                        SPDLOG_WARN("HTTP/1.1 request body too large from {}", remote_ip_);
                        co_await write_error(http::status::payload_too_large, parser.get().version());
                        break;
                    }
                    if (ec == boost::beast::error::timeout) {
                        if (!stopped_) SPDLOG_DEBUG("HTTP/1.1 request timeout [{}]", remote_ip_);
                        break;
                    }
                    if (ec.category() == http::make_error_code(http::error::bad_method).category() &&
                        ec != http::error::end_of_stream && ec != http::error::partial_message) {
                        // 请求行或请求头格式错误
                        SPDLOG_DEBUG("HTTP/1.1 malformed request from {}: {}", remote_ip_, ec.message());
                        co_await write_error(http::status::bad_request, 11);
                        break;
                    }
                    throw boost::system::system_error{ec};
                }

                // 读完之后停止计时，handler 的执行时间不受读超时约束
                stream_.expires_never();

                HttpRequest req = parser.release();
                const bool keep_alive = req.keep_alive();

                // handler 执行期间同时监视连接：对端断开或 stop() 关闭 socket 时，
                // dispatch 收到取消信号，在下一个挂起点被放弃
                auto result = co_await (router_.dispatch(std::move(req), remote_ip_) || watch_peer(buf));
                if (result.index() == 1) {
                    SPDLOG_DEBUG("HTTP/1.1 peer gone while handling request [{}]", remote_ip_);
                    break;
                }

                HttpResponse resp = std::move(std::get<0>(result));
                resp.keep_alive(keep_alive);

                stream_.expires_after(keep_alive_timeout_);
                co_await http::async_write(stream_, resp, boost::asio::use_awaitable);

                if (!keep_alive) {
                    // 客户端不希望保持连接
                    break;
                }

                is_first_request = false;
            }
        } catch (const boost::system::system_error& e) {
            if (const auto& code = e.code();
                code == http::error::end_of_stream ||
                code == boost::asio::error::connection_reset ||
                code == boost::asio::error::operation_aborted ||
                code == boost::beast::error::timeout) {
                // 客户端关闭、连接被重置、或我们自己 stop()
                SPDLOG_DEBUG("HTTP session ended: {}", code.message());
            } else {
                SPDLOG_ERROR("Error in HTTP session [{}] ({}): {}", remote_ip_, code.message(), e.what());
            }
        } catch (const std::exception& e) {
            SPDLOG_ERROR("Unexpected exception in HTTP session [{}]: {}", remote_ip_, e.what());
        } catch (...) {
            SPDLOG_ERROR("Unknown exception in HTTP session [{}]", remote_ip_);
        }

        close_socket();
    }

    boost::asio::awaitable<void> HttpSession::watch_peer(boost::beast::flat_buffer& buf) {
        auto& socket = stream_.socket();
        boost::system::error_code ec;
        // 流水线请求的数据留在 buf 里，交给下一轮解析
        while (buf.size() < body_limit_) {
            const std::size_t n = co_await socket.async_read_some(
                buf.prepare(read_chunk_size), boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec) {
                // EOF、连接重置，或者 dispatch 先完成后取消了这次读取
                co_return;
            }
            buf.commit(n);
        }

        // 缓冲已满，不再读取，只等待连接出错
        co_await socket.async_wait(tcp::socket::wait_error, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    void HttpSession::stop() {
        stopped_ = true;
        close_socket();
    }

    boost::asio::awaitable<void> HttpSession::write_error(const http::status status, const unsigned version) {
        HttpResponse resp{status, version == 10 ? 10u : 11u};
        resp.set(http::field::server, framework::server_header);
        resp.keep_alive(false);
        resp.prepare_payload();

        stream_.expires_after(initial_timeout_);
        boost::system::error_code ec;
        co_await http::async_write(stream_, resp, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            SPDLOG_DEBUG("写入 {} 响应失败: {}", static_cast<unsigned>(status), ec.message());
        }
    }

    void HttpSession::close_socket() {
        auto& socket = stream_.socket();
        if (!socket.is_open()) return;

        boost::system::error_code ec;
        socket.shutdown(tcp::socket::shutdown_both, ec);
        if (ec && ec != boost::asio::error::not_connected) {
            SPDLOG_DEBUG("HTTP tcp socket shutdown: {}", ec.message());
        }
        socket.close(ec);
    }

} // namespace routix
