//
// Created by Aiziboy on 2025/12/8.
//

#ifndef ROUTIX_CONFIG_LOADER_HPP
#define ROUTIX_CONFIG_LOADER_HPP

#include <string>
#include <string_view>

#include <toml++/toml.hpp>

#include <routix/utils/config/RoutixConfig.hpp>

namespace routix {

    class ConfigLoader {
    public:
        /**
         * @brief 从指定的 TOML 文件路径加载配置。
         *
         * 如果文件中设置了 active_profile，则改为加载同目录下的 config-<profile>.toml。
         *
         * @param filepath 配置文件的路径。
         * @return RoutixConfig 填充了配置数据的结构体。
         * @throws std::runtime_error 如果文件不存在、解析失败或配置值不合法。
         */
        static RoutixConfig load(const std::string& filepath);

        /// 从内存中的 TOML 文本解析 (不处理 active_profile)
        static RoutixConfig parse(std::string_view content);

    private:
        static RoutixConfig from_table(const toml::table& root_tbl);

        static AppConfig parse_app(const toml::table& app_tb);
        static ServerConfig parse_server(const toml::table& server_tb);
        static LoggingConfig parse_logging(const toml::table& log_tb);

        /// 自动计算线程数并校验
        static void finalize(RoutixConfig& config);
    };

} // namespace routix

#endif //ROUTIX_CONFIG_LOADER_HPP
