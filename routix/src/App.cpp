//
// Created by Aiziboy on 2025/12/9.
//

#include <routix/App.hpp>
#include <routix/error/routix_error.hpp>
#include <routix/utils/config/ConfigLoader.hpp>
#include <routix/utils/logger_manager.hpp>
#include <routix/utils/thread_utils.hpp>
#include <routix/version.hpp>

#include <csignal>
#include <filesystem>
#include <stdexcept>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <spdlog/spdlog.h>

namespace routix {

    App::App(const std::string& config_path)
        : App(ConfigLoader::load(config_path)) {}

    App::App(RoutixConfig config)
        : config_(std::move(config)) {
        LoggerManager::init(config_.logging);
        init_io_pool();

        SPDLOG_INFO("{} {} ({})", framework::name, framework::version, config_.app.name);
        SPDLOG_INFO("📁 Workdir: {}", std::filesystem::current_path().string());
    }

    App::~App() {
        // run() 没有正常结束时 (例如绑定端口失败)，IO 线程仍持有 WorkGuard，先让它们退出再 join
        shutdown_io_pool();
    }

    void App::init_io_pool() {
        const std::size_t io_threads_count = config_.server.io_threads;
        if (io_threads_count == 0) {
            throw std::runtime_error("IO threads count must be > 0");
        }

        io_context_pool_.reserve(io_threads_count);
        io_work_guards_.reserve(io_threads_count);
        for (std::size_t i = 0; i < io_threads_count; ++i) {
            // 并发提示为 1：每个 io_context 只由一个线程运行
            auto ioc = std::make_shared<boost::asio::io_context>(1);
            io_context_pool_.push_back(ioc);
            io_work_guards_.emplace_back(boost::asio::make_work_guard(*ioc));
        }

        signals_ = std::make_unique<boost::asio::signal_set>(*io_context_pool_[0], SIGINT, SIGTERM);
    }

    void App::addRoutes(std::vector<RouteDef> routes) {
        for (auto& route : routes) {
            route_defs_.push_back(std::move(route));
        }
    }

    void App::addRoute(RouteDef route) {
        route_defs_.push_back(std::move(route));
    }

    void App::addController(const std::vector<std::shared_ptr<HttpController>>& controllers) {
        for (const auto& controller : controllers) {
            addController(controller);
        }
    }

    void App::addController(const std::shared_ptr<HttpController>& controller) {
        if (!controller) {
            throw std::invalid_argument("addController: controller is null");
        }
        route_defs_.push_back(controller->routes());
        controllers_.push_back(controller);
    }

    /**
     * @brief 创建 io-1..N 线程，io-0 由 run() 的调用线程运行
     */
    void App::setup_threading() {
        const std::size_t extra = io_context_pool_.size() - 1;
        io_threads_.reserve(extra);
        for (std::size_t i = 0; i < extra; ++i) {
            const std::size_t thread_index = i + 1;
            io_threads_.emplace_back([this, thread_index]() {
                const std::string thread_name = "io-" + std::to_string(thread_index);
                ThreadUtils::set_current_thread_name(thread_name);
                SPDLOG_DEBUG("IO thread '{}' started.", thread_name);
                io_context_pool_[thread_index]->run();
            });
        }
    }

    /**
     * @brief 监听 SIGINT (Ctrl+C) 和 SIGTERM 信号，触发关闭流程。
     */
    void App::setup_signal_handling() {
        signals_->async_wait([this](const boost::system::error_code& error, const int signal_number) {
            if (error) return;

            SPDLOG_INFO("Received signal {}, starting graceful shutdown...", signal_number);
            co_spawn(get_main_ioc(), [this]() -> boost::asio::awaitable<void> {
                SPDLOG_INFO("Shutting down server sessions...");
                co_await server_->stop();
                SPDLOG_INFO("Stopping all IO contexts...");
                shutdown_io_pool();
            }, boost::asio::detached);
        });
    }

    void App::shutdown_io_pool() {
        io_work_guards_.clear(); // 释放所有 WorkGuard，允许 io_context 退出
        for (const auto& ioc : io_context_pool_) {
            ioc->stop();
        }
    }

    int App::run() {
        try {
            // 1. 编译路由，冲突在监听端口之前暴露
            CompiledRoutes compiled = RouteCompiler::compile(route_defs_);
            for (const auto& info : compiled.table.routes()) {
                SPDLOG_INFO("  {:<7} {} (guards: {})", to_string(info.method), info.pattern, info.guard_count);
            }
            const auto router = std::make_shared<const Router>(std::move(compiled));

            // 2. 绑定端口
            server_ = std::make_unique<Server>(io_context_pool_, config_.server, router);

            // 3. 线程与信号
            setup_threading();
            setup_signal_handling();
            server_->run();

            SPDLOG_INFO("服务器已在端口 {} 上启动. IO 线程数: {}. 按 Ctrl+C 关闭", config_.server.port, config_.server.io_threads);

            // 4. 主线程作为 io-0
            ThreadUtils::set_current_thread_name("io-0");
            io_context_pool_[0]->run();

            SPDLOG_INFO("Server shut down gracefully. Exiting application.");
            return 0;
        } catch (const ConflictError& e) {
            SPDLOG_CRITICAL("路由定义错误 [{}]: {}", e.code().message(), e.what());
        } catch (const std::exception& e) {
            SPDLOG_CRITICAL("Fatal error during server execution: {}", e.what());
        }
        shutdown_io_pool();
        return 1;
    }

} // namespace routix
