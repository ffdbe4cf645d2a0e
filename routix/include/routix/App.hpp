//
// Created by Aiziboy on 2025/12/9.
//

#ifndef ROUTIX_APP_HPP
#define ROUTIX_APP_HPP

#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <routix/controller/HttpController.hpp>
#include <routix/core/Server.hpp>
#include <routix/http/route_compiler.hpp>
#include <routix/utils/config/RoutixConfig.hpp>

namespace routix {

    /**
     * @brief 应用程序核心类
     *
     * 负责整个服务的生命周期：
     * 1. 加载配置、初始化日志
     * 2. IO 线程池 (One Loop Per Thread)，io-0 是调用 run() 的主线程
     * 3. 收集路由定义，在 run() 中一次性编译并冻结
     * 4. 信号处理与优雅退出
     *
     * @code
     * routix::App app("config.toml");
     * app.addRoutes({ route::get("/hello", hello) });
     * app.addController(std::make_shared<UserController>());
     * return app.run();
     * @endcode
     */
    class App {
    public:
        /// @brief 从配置文件构造
        explicit App(const std::string& config_path = "config.toml");

        /// @brief 使用已经加载好的配置
        explicit App(RoutixConfig config);

        /// @brief 等待所有线程退出
        ~App();

        App(const App&) = delete;
        App& operator=(const App&) = delete;

        // --- 路由注册接口，只在 run() 之前有效 ---

        void addRoutes(std::vector<RouteDef> routes);
        void addRoute(RouteDef route);

        /// @brief 注册 HTTP 控制器，App 持有控制器直到退出
        void addController(const std::vector<std::shared_ptr<HttpController>>& controllers);
        void addController(const std::shared_ptr<HttpController>& controller);

        const RoutixConfig& config() const { return config_; }

        /// @brief 主 IO Context (io-0)，绑定信号集
        boost::asio::io_context& get_main_ioc() const { return *io_context_pool_[0]; }

        const std::vector<std::shared_ptr<boost::asio::io_context>>& get_io_contexts() const { return io_context_pool_; }

        /**
         * @brief 启动应用程序主循环，阻塞到收到 SIGINT / SIGTERM。
         *
         * 1. 编译路由 (任何冲突都在这里失败，服务器不会开始监听)
         * 2. 创建 Server 并绑定端口
         * 3. 启动 IO 线程、设置信号处理
         * 4. 在当前线程运行 io-0
         * @return 退出码 (0 for success, 1 for error)。
         */
        int run();

    private:
        using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

        void init_io_pool();
        void setup_threading();
        void setup_signal_handling();
        void shutdown_io_pool();

        // 声明顺序决定了初始化和析构顺序，请勿随意调整

        RoutixConfig config_;

        /// 包含 N 个独立的 io_context，每个代表一个 IO 线程。
        std::vector<std::shared_ptr<boost::asio::io_context>> io_context_pool_;
        /// 防止每个 io_context 在无任务时立即退出。
        std::vector<WorkGuard> io_work_guards_;

        std::unique_ptr<boost::asio::signal_set> signals_;

        std::vector<RouteDef> route_defs_;
        std::vector<std::shared_ptr<HttpController>> controllers_;

        std::unique_ptr<Server> server_;

        /// 运行 io_context_pool_[1...N]，App 析构时自动 join
        std::vector<std::jthread> io_threads_;
    };

} // namespace routix

#endif //ROUTIX_APP_HPP
