//
// Created by Aiziboy on 2025/12/8.
//

#ifndef ROUTIX_LOGGER_MANAGER_HPP
#define ROUTIX_LOGGER_MANAGER_HPP

#include <chrono>
#include <cstdio>
#include <memory>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <routix/utils/config/RoutixConfig.hpp>

namespace routix {

    class LoggerManager {
    public:
        static void init(const LoggingConfig& config) {
            try {
                // 1. 初始化线程池 (队列大小 8192，线程数 1)
                spdlog::init_thread_pool(8192, 1);

                std::vector<spdlog::sink_ptr> sinks;

                // 2. 按 output_type 选择 Sinks
                if (config.output_type == "console" || config.output_type == "all") {
                    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
                }

                if (config.output_type == "file" || config.output_type == "all") {
                    // 轮转文件，防止日志无限增大
                    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                        config.file_path, static_cast<std::size_t>(config.max_size_mb) * 1024 * 1024, config.max_files));
                }

                // "off" 或其他无效值：关闭日志
                if (sinks.empty()) {
                    sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
                }

                // 3. 创建异步 Logger
                const auto async_logger_ptr = std::make_shared<spdlog::async_logger>(
                    "routix",
                    sinks.begin(), sinks.end(),
                    spdlog::thread_pool(),
                    spdlog::async_overflow_policy::overrun_oldest
                );

                // 4. 设置级别
                const spdlog::level::level_enum log_level = spdlog::level::from_str(config.level);
                async_logger_ptr->set_level(log_level);

                // 5. 全局注册
                spdlog::set_default_logger(async_logger_ptr);
                spdlog::set_level(log_level);

                // 6. 自动刷盘：异步日志崩溃时会丢失最近几秒的日志
                using namespace std::chrono_literals;
                spdlog::flush_every(10s);
                spdlog::flush_on(spdlog::level::err);

                // 7. 设置日志格式
                spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e %z] [thread %t] [%s:%#] [%^%l%$] %v");

                SPDLOG_INFO("Logger level : {}", spdlog::level::to_string_view(spdlog::default_logger()->level()));
            } catch (const spdlog::spdlog_ex& ex) {
                // 日志初始化失败，只能打印到 stderr
                std::fprintf(stderr, "Log init failed: %s\n", ex.what());
            }
        }

        // 在 main 退出前调用
        static void shutdown() {
            spdlog::shutdown();
        }

        LoggerManager() = delete;
    };

} // namespace routix

#endif //ROUTIX_LOGGER_MANAGER_HPP
