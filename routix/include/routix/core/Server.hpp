//
// Created by Aiziboy on 2025/12/9.
//

#ifndef ROUTIX_SERVER_HPP
#define ROUTIX_SERVER_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <routix/http/router.hpp>
#include <routix/utils/config/RoutixConfig.hpp>

namespace routix {

    class HttpSession;

    /// @class Server
    /// @brief HTTP/1.1 服务器核心类。
    ///
    /// <h2>架构：</h2>
    /// 1. <b>One Loop Per Thread:</b> 每个 IO 线程拥有独立的 `io_context` 和事件循环。
    /// 2. <b>SO_REUSEPORT:</b> 每个线程拥有独立的 `acceptor` 监听同一端口，由内核分发连接。
    /// 3. <b>Thread-Local Context:</b> Session 管理在线程本地进行（ThreadContext），不需要锁。
    /// 4. <b>Router:</b> 启动前编译好的只读路由表，所有 IO 线程共享，不加锁。
    class Server {
    public:
        /**
         * @brief 为每个 IO 线程创建并绑定 Acceptor。
         * @param io_contexts IO 线程的 io_context 列表
         * @param config server 配置
         * @param router 编译好的路由
         * @throws std::runtime_error 地址非法或绑定端口失败
         */
        Server(const std::vector<std::shared_ptr<boost::asio::io_context>>& io_contexts, const ServerConfig& config,
               std::shared_ptr<const Router> router);

        ~Server();

        Server(const Server&) = delete;
        Server& operator=(const Server&) = delete;

        /// 为每个 Acceptor 启动监听协程，不阻塞
        void run();

        /**
         * @brief 优雅停机。
         *
         * 1. 关闭所有 Acceptor
         * 2. 向所有 IO 线程广播停机任务，关闭各自的 Session
         * 3. 等待每个线程上的连接协程彻底结束
         */
        boost::asio::awaitable<void> stop();

        const Router& router() const { return *router_; }

        /// 实际监听的端口
        uint16_t port() const;

    private:
        // 每个 IO 线程拥有一个独立的 ThreadContext 实例。
        // listener 和 handle_connection 都绑定在特定的 IO 线程上，访问它不需要互斥锁。
        struct ThreadContext {
            std::unordered_set<std::shared_ptr<HttpSession>> sessions;

            // 活跃协程计数器：stop() 返回前必须等待它归零，
            // 否则 io_context 析构时残留的协程栈帧会访问已释放的内存
            std::size_t active_coroutine_count = 0;
        };

        boost::asio::awaitable<void> listener(boost::asio::ip::tcp::acceptor& acceptor, std::shared_ptr<ThreadContext> ctx);

        boost::asio::awaitable<void> handle_connection(boost::asio::ip::tcp::socket socket, std::shared_ptr<ThreadContext> ctx);

        void setup_acceptor(uint16_t port, const std::string& ip);

        std::vector<std::shared_ptr<boost::asio::io_context>> io_contexts_;

        /// Acceptor 列表，长度等于 IO 线程数
        std::vector<boost::asio::ip::tcp::acceptor> acceptors_;

        /// 索引与 acceptors_ 及 IO 线程一一对应。
        /// 连接协程持有 shared_ptr：io_context 析构时销毁残留的协程帧也不会访问已释放的 ThreadContext
        std::vector<std::shared_ptr<ThreadContext>> thread_contexts_;

        std::shared_ptr<const Router> router_;

        /// 为 true 则不再处理新连接
        std::atomic<bool> is_stopping_{false};

        std::size_t max_request_body_size_bytes_;
        std::chrono::milliseconds initial_timeout_;
        std::chrono::milliseconds keep_alive_timeout_;
    };

} // namespace routix

#endif //ROUTIX_SERVER_HPP
