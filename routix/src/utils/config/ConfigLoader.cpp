//
// Created by Aiziboy on 2025/12/8.
//

#include <routix/utils/config/ConfigLoader.hpp>

#include <filesystem>
#include <stdexcept>
#include <thread>
#include <spdlog/spdlog.h>

namespace routix {

    void ConfigLoader::finalize(RoutixConfig& config) {
        // 如果用户在 toml 文件中没有设置，或者显式设置为 0，则进行自动计算
        if (config.server.io_threads == 0) {
            const unsigned hc = std::thread::hardware_concurrency();
            const uint16_t total_cores = hc > 0 ? static_cast<uint16_t>(hc) : 1; // 避免为0
            // 为系统保留一个核心
            config.server.io_threads = total_cores > 1 ? total_cores - 1 : 1;
        }

        if (config.server.port == 0) {
            throw std::runtime_error("server.port must be greater than 0");
        }
        if (config.server.max_request_size_bytes == 0) {
            throw std::runtime_error("server.max_request_size_bytes must be greater than 0");
        }
        if (config.server.initial_timeout_ms == 0 || config.server.keep_alive_ms == 0) {
            throw std::runtime_error("server.initial_timeout_ms and server.keep_alive_ms must be greater than 0");
        }
    }

    // --- 主加载函数 ---
    RoutixConfig ConfigLoader::load(const std::string& filepath) {
        try {
            toml::table root_tbl = toml::parse_file(filepath);

            // 检查是否指定了环境
            if (const auto value_op = root_tbl["active_profile"].value<std::string>()) {
                if (*value_op != "dev" && *value_op != "prod" && *value_op != "test") {
                    throw std::runtime_error("无法识别的配置文件类型[ " + *value_op + " ]");
                }
                // config.toml -> config-dev.toml
                const std::filesystem::path path = filepath;
                const std::filesystem::path new_path =
                        path.parent_path() / (path.stem().string() + "-" + *value_op + path.extension().string());
                root_tbl = toml::parse_file(new_path.string());
            }

            return from_table(root_tbl);
        } catch (const toml::parse_error& err) {
            throw std::runtime_error("Error parsing config file '" + filepath + "': " + std::string(err.description()));
        }
    }

    RoutixConfig ConfigLoader::parse(const std::string_view content) {
        try {
            const toml::table root_tbl = toml::parse(content);
            return from_table(root_tbl);
        } catch (const toml::parse_error& err) {
            throw std::runtime_error("Error parsing config: " + std::string(err.description()));
        }
    }

    RoutixConfig ConfigLoader::from_table(const toml::table& root_tbl) {
        RoutixConfig config;
        config.app = parse_app(root_tbl);
        config.server = parse_server(root_tbl);
        config.logging = parse_logging(root_tbl);
        finalize(config);
        return config;
    }

    // --- 私有帮助函数实现 ---

    AppConfig ConfigLoader::parse_app(const toml::table& app_tb) {
        AppConfig appConfig;
        if (const auto table = app_tb["app"].as_table()) {
            appConfig.name = (*table)["name"].value_or(appConfig.name);
        }
        return appConfig;
    }

    LoggingConfig ConfigLoader::parse_logging(const toml::table& log_tb) {
        LoggingConfig logConfig;
        if (const auto table = log_tb["logging"].as_table()) {
            logConfig.level = (*table)["level"].value_or(logConfig.level);
            logConfig.output_type = (*table)["output_type"].value_or(logConfig.output_type);
            logConfig.file_path = (*table)["file_path"].value_or(logConfig.file_path);
            logConfig.max_size_mb = (*table)["max_size_mb"].value_or(logConfig.max_size_mb);
            logConfig.max_files = (*table)["max_files"].value_or(logConfig.max_files);
        }
        return logConfig;
    }

    ServerConfig ConfigLoader::parse_server(const toml::table& server_tb) {
        ServerConfig serverConfig;
        if (const auto server_tbl = server_tb["server"].as_table()) {
            serverConfig.port = (*server_tbl)["port"].value_or(serverConfig.port);
            serverConfig.ip_v4 = (*server_tbl)["ip_v4"].value_or(serverConfig.ip_v4);
            serverConfig.io_threads = (*server_tbl)["io_threads"].value_or(serverConfig.io_threads);
            serverConfig.keep_alive_ms = (*server_tbl)["keep_alive_ms"].value_or(serverConfig.keep_alive_ms);
            serverConfig.initial_timeout_ms = (*server_tbl)["initial_timeout_ms"].value_or(serverConfig.initial_timeout_ms);
            serverConfig.max_request_size_bytes = (*server_tbl)["max_request_size_bytes"].value_or(serverConfig.max_request_size_bytes);
        }
        SPDLOG_DEBUG("server 配置: {}:{}", serverConfig.ip_v4, serverConfig.port);
        return serverConfig;
    }

} // namespace routix
