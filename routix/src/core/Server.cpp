//
// Created by Aiziboy on 2025/12/9.
//

#include <routix/core/Server.hpp>
#include <routix/core/HttpSession.hpp>
#include <routix/utils/finally.hpp>

#include <stdexcept>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>

using namespace std::literals::chrono_literals;

namespace routix {

    Server::Server(const std::vector<std::shared_ptr<boost::asio::io_context>>& io_contexts, const ServerConfig& config,
                   std::shared_ptr<const Router> router)
        : io_contexts_(io_contexts),
          router_(std::move(router)),
          max_request_body_size_bytes_(config.max_request_size_bytes),
          initial_timeout_(config.initial_timeout_ms),
          keep_alive_timeout_(config.keep_alive_ms) {
        if (!router_) {
            throw std::invalid_argument("Server requires a router");
        }
        setup_acceptor(config.port, config.ip_v4);
    }

    Server::~Server() = default;

    /**
     * @brief 启动服务器的监听循环。
     * 为每个 Acceptor 在它所属的 IO 线程上启动一个监听协程
     */
    void Server::run() {
        for (std::size_t i = 0; i < acceptors_.size(); ++i) {
            auto& acceptor = acceptors_[i];
            boost::asio::co_spawn(acceptor.get_executor(), listener(acceptor, thread_contexts_[i]), boost::asio::detached);
        }
        SPDLOG_INFO("服务器在 {} 个 IO 线程上运行，并启用了 SO_REUSEPORT。", acceptors_.size());
    }

    uint16_t Server::port() const {
        if (acceptors_.empty()) return 0;
        boost::system::error_code ec;
        const auto endpoint = acceptors_.front().local_endpoint(ec);
        return ec ? 0 : endpoint.port();
    }

    boost::asio::awaitable<void> Server::stop() {
        // 1. 通知 listener、handle_connection 不要再处理新连接了
        is_stopping_ = true;

        // 2. 关闭所有 Acceptor
        SPDLOG_INFO("停止 {} acceptors...", acceptors_.size());
        for (auto& acceptor : acceptors_) {
            if (acceptor.is_open()) {
                boost::system::error_code ec;
                acceptor.close(ec);
                if (ec) SPDLOG_DEBUG("关闭 acceptor 失败: {}", ec.message());
            }
        }
        SPDLOG_INFO("Server 已停止接受新连接");

        // 3. 为每个 IO 线程派发清理任务，在目标线程上执行
        std::vector<boost::asio::awaitable<void>> stop_tasks;
        stop_tasks.reserve(io_contexts_.size());

        for (std::size_t i = 0; i < io_contexts_.size(); ++i) {
            const std::shared_ptr<ThreadContext> ctx = thread_contexts_[i];
            auto task = boost::asio::co_spawn(*io_contexts_[i], [ctx, i]() -> boost::asio::awaitable<void> {
                // 关闭 socket，session 的读写协程会以 operation_aborted 退出
                for (const auto& s : ctx->sessions) s->stop();

                // 等待所有连接协程的栈帧销毁
                if (ctx->active_coroutine_count > 0) {
                    SPDLOG_DEBUG("IO 线程 {} 正在等待 {} 个协程终止……", i, ctx->active_coroutine_count);
                    boost::asio::steady_timer flush_timer(co_await boost::asio::this_coro::executor);
                    while (ctx->active_coroutine_count > 0) {
                        flush_timer.expires_after(10ms);
                        co_await flush_timer.async_wait(boost::asio::use_awaitable);
                    }
                }
                ctx->sessions.clear();
                SPDLOG_DEBUG("IO 线程 {} 退场...", i);
            }, boost::asio::use_awaitable);

            stop_tasks.push_back(std::move(task));
        }

        for (auto& task : stop_tasks) {
            co_await std::move(task);
        }

        SPDLOG_INFO("所有 IO 线程中的所有连接均正常停止。");
    }

    /**
     * @brief 监听协程
     * 只负责 Accept，然后立即分派连接
     */
    boost::asio::awaitable<void> Server::listener(boost::asio::ip::tcp::acceptor& acceptor, const std::shared_ptr<ThreadContext> ctx) {
        const auto exec = co_await boost::asio::this_coro::executor;

        // accept 失败时的休眠
        boost::asio::steady_timer timer(exec);

        for (;;) {
            try {
                if (is_stopping_) co_return;
                boost::system::error_code ec;

                // socket 绑定到当前线程的 executor，SO_REUSEPORT 下内核会把连接分发到这里
                tcp::socket socket(exec);
                co_await acceptor.async_accept(socket, boost::asio::redirect_error(boost::asio::use_awaitable, ec));

                if (ec) {
                    if (ec == boost::asio::error::operation_aborted) {
                        SPDLOG_INFO("Listener 函数停止 (acceptor closed)");
                        co_return;
                    }

                    SPDLOG_WARN("与客户端建立新的连接失败: {}", ec.message());

                    // 文件描述符耗尽之类的错误，稍等再继续
                    if (ec == boost::asio::error::no_descriptors ||
                        ec == boost::asio::error::no_buffer_space ||
                        ec == boost::system::errc::too_many_files_open) {
                        timer.expires_after(100ms);
                        co_await timer.async_wait(boost::asio::use_awaitable);
                    }
                    continue;
                }

                boost::asio::co_spawn(
                    exec,
                    [this, s = std::move(socket), ctx]() mutable -> boost::asio::awaitable<void> {
                        return handle_connection(std::move(s), ctx);
                    },
                    boost::asio::detached
                );
            } catch (const std::exception& e) {
                // 只打印日志，确保服务器继续监听
                SPDLOG_ERROR("Server 监听循环迭代中发生异常: {}", e.what());
            }
        }
    }

    boost::asio::awaitable<void> Server::handle_connection(boost::asio::ip::tcp::socket socket, const std::shared_ptr<ThreadContext> ctx) {
        // 协程存在期间计数不为 0，阻止 Server::stop() 提前返回
        ++ctx->active_coroutine_count;
        [[maybe_unused]] auto guard = Finally([ctx]() noexcept { --ctx->active_coroutine_count; });

        if (is_stopping_) co_return;

        boost::system::error_code ec;
        socket.set_option(tcp::no_delay(true), ec);
        if (ec) {
            SPDLOG_WARN("设置 TCP_NODELAY 失败: {}", ec.message());
        }

        const auto session = std::make_shared<HttpSession>(
            std::move(socket), *router_, max_request_body_size_bytes_, initial_timeout_, keep_alive_timeout_);

        ctx->sessions.insert(session);
        try {
            co_await session->run();
        } catch (const std::exception& e) {
            SPDLOG_ERROR("HttpSession run error: {}", e.what());
        } catch (...) {
            SPDLOG_ERROR("HttpSession run error: unknown exception");
        }
        ctx->sessions.erase(session);
    }

    /**
     * @brief 为 **每个 IO 线程** 创建一个独立的 acceptor，全部监听同一个端口 (SO_REUSEPORT)。
     */
    void Server::setup_acceptor(const uint16_t port, const std::string& ip) {
        boost::system::error_code ec;

        const auto address = boost::asio::ip::make_address(ip, ec);
        if (ec) {
            throw std::runtime_error("Invalid IP address provided: " + ip);
        }
        const tcp::endpoint endpoint(address, port);

        acceptors_.reserve(io_contexts_.size());
        thread_contexts_.reserve(io_contexts_.size());

        for (const auto& ioc : io_contexts_) {
            acceptors_.emplace_back(*ioc);
            auto& acceptor = acceptors_.back();
            thread_contexts_.push_back(std::make_shared<ThreadContext>());

            acceptor.open(endpoint.protocol(), ec);
            if (ec) throw std::runtime_error("Acceptor open failed: " + ec.message());

            acceptor.set_option(boost::asio::socket_base::reuse_address(true), ec);
            if (ec) {
                // 不是致命错误
                SPDLOG_WARN("Failed to set reuse_address option: {}", ec.message());
                ec.clear();
            }

            // 允许不同线程的 socket 绑定到完全相同的 IP:PORT，由内核做负载均衡
            #if defined(SO_REUSEPORT)
            using reuse_port = boost::asio::detail::socket_option::boolean<SOL_SOCKET, SO_REUSEPORT>;
            acceptor.set_option(reuse_port(true), ec);
            if (ec) {
                SPDLOG_CRITICAL("SO_REUSEPORT set failed! Kernel too old? Error: {}", ec.message());
                throw std::runtime_error("SO_REUSEPORT required.");
            }
            #else
            #error "SO_REUSEPORT not supported on this platform."
            #endif

            acceptor.bind(endpoint, ec);
            if (ec) throw std::runtime_error("Failed to bind to endpoint " + ip + ":" + std::to_string(port) + ". Error: " + ec.message());

            acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
            if (ec) throw std::runtime_error("Listen failed: " + ec.message());
        }

        SPDLOG_INFO("Server listening on {}:{} with {} acceptors (SO_REUSEPORT).", ip, port, acceptors_.size());
    }

} // namespace routix
