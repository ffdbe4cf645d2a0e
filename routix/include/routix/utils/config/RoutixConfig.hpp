//
// Created by Aiziboy on 2025/12/8.
//

#ifndef ROUTIX_CONFIG_HPP
#define ROUTIX_CONFIG_HPP

#include <cstdint>
#include <string>

namespace routix {

    // ------------------------------------------------
    // [logging]
    // ------------------------------------------------
    struct LoggingConfig {
        ///  日志级别，如 "trace", "debug", "info", "warn", "error", "off"
        std::string level = "info";
        /// 日志输出位置，如 "console", "file", "all", "off"
        std::string output_type = "console";
        /// 指定日志文件文件路径
        std::string file_path = "logs/routix.log";
        /// 日志轮转配置 : 单个日志文件的最大大小（MB）
        uint16_t max_size_mb = 5;
        /// 日志轮转配置 : 日志文件轮转数量
        uint16_t max_files = 10;
    };

    // ------------------------------------------------
    // [app]
    // ------------------------------------------------
    struct AppConfig {
        /// 应用名称
        std::string name = "Routix";
    };

    // ------------------------------------------------
    // [server]
    // ------------------------------------------------
    struct ServerConfig {
        /// server监听端口. 默认值：8080
        uint16_t port = 8080;
        /// IP. 默认值：0.0.0.0
        std::string ip_v4 = "0.0.0.0";
        /// 专门用于I/O的线程数. 默认值 0：按核心数自动计算
        uint16_t io_threads = 0;
        /// keep alive超时时间. 默认值：180000ms(3分钟)
        uint32_t keep_alive_ms = 180000;
        /// 新连接读取第一个请求的超时时间. 默认值：10000ms
        uint32_t initial_timeout_ms = 10000;
        /// 请求体最大大小. 默认值：1048576 bytes(1MB)
        uint32_t max_request_size_bytes = 1024 * 1024;
    };

    struct RoutixConfig {
        AppConfig app;
        ServerConfig server;
        LoggingConfig logging;
    };

} // namespace routix

#endif //ROUTIX_CONFIG_HPP
