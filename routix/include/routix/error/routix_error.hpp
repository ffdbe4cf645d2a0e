//
// Created by Aiziboy on 2025/12/2.
//

#ifndef ROUTIX_ROUTIX_ERROR_HPP
#define ROUTIX_ROUTIX_ERROR_HPP

#include <system_error>
#include <stdexcept>
#include <string>
#include <boost/beast/http/status.hpp>

// =======================================================================
// 🔹 命名空间： routix_error::routing (路由表构建期错误)
// =======================================================================
namespace routix_error::routing {
    // 定义错误枚举
    enum class code {
        route_conflict = 1,         // 同一路径 + 方法重复注册
        parameter_conflict,         // 同一位置的动态段/通配段参数名不一致
        invalid_pattern,            // 路由模式语法错误
    };

    // 自定义路由错误类别 (继承 std::error_category)
    class category_impl final : public std::error_category {
    public:
        const char* name() const noexcept override {
            return "routing_error";
        }

        std::string message(int ev) const override {
            switch (static_cast<code>(ev)) {
                case code::route_conflict: return "Route already registered for this method";
                case code::parameter_conflict: return "Conflicting parameter name at the same path position";
                case code::invalid_pattern: return "Invalid route pattern";
                default: return "Unknown routing error";
            }
        }
    };

    // 全局访问接口
    inline const std::error_category& category() {
        static category_impl instance;
        return instance;
    }

    // 为了让 error_code 能从枚举隐式构造，必须在同命名空间提供此函数 (ADL)
    inline std::error_code make_error_code(code e) {
        return {static_cast<int>(e), category()};
    }

    // 预定义的 error_code 常量
    inline const std::error_code route_conflict     = make_error_code(code::route_conflict);
    inline const std::error_code parameter_conflict = make_error_code(code::parameter_conflict);
    inline const std::error_code invalid_pattern    = make_error_code(code::invalid_pattern);

} // namespace routix_error::routing


// =======================================================================
// 🔹 命名空间： routix_error::extract (请求数据提取错误)
// =======================================================================
namespace routix_error::extract {

    enum class code {
        missing_parameter = 1,      // 参数不存在
        invalid_parameter,          // 参数无法转换为目标类型
        invalid_utf8,               // 参数不是合法的 UTF-8
        wrong_number_of_parameters, // 元组提取时参数个数与路由不符
        missing_header,             // 必需的请求头不存在
        malformed_body,             // 请求体格式或 Content-Type 不符
        missing_extension,          // 扩展槽中没有所需类型的数据
    };

    class category_impl final : public std::error_category {
    public:
        const char* name() const noexcept override {
            return "extract_error";
        }

        std::string message(int ev) const override {
            switch (static_cast<code>(ev)) {
                case code::missing_parameter: return "Missing required parameter";
                case code::invalid_parameter: return "Invalid parameter value";
                case code::invalid_utf8: return "Parameter is not valid UTF-8";
                case code::wrong_number_of_parameters: return "Wrong number of path parameters";
                case code::missing_header: return "Missing required header";
                case code::malformed_body: return "Malformed request body";
                case code::missing_extension: return "Missing request extension";
                default: return "Unknown extract error";
            }
        }
    };

    inline const std::error_category& category() {
        static category_impl instance;
        return instance;
    }

    //  ADL 支持函数
    inline std::error_code make_error_code(code e) {
        return {static_cast<int>(e), category()};
    }

    inline const std::error_code missing_parameter          = make_error_code(code::missing_parameter);
    inline const std::error_code invalid_parameter          = make_error_code(code::invalid_parameter);
    inline const std::error_code invalid_utf8               = make_error_code(code::invalid_utf8);
    inline const std::error_code wrong_number_of_parameters = make_error_code(code::wrong_number_of_parameters);
    inline const std::error_code missing_header             = make_error_code(code::missing_header);
    inline const std::error_code malformed_body             = make_error_code(code::malformed_body);
    inline const std::error_code missing_extension          = make_error_code(code::missing_extension);

} // namespace routix_error::extract


// =======================================================================
//  让枚举支持自动转换为 std::error_code (标准库集成)
// =======================================================================
namespace std {

    template <>
    struct is_error_code_enum<routix_error::routing::code> : true_type {};

    template <>
    struct is_error_code_enum<routix_error::extract::code> : true_type {};

} // namespace std


namespace routix {

    /**
     * @brief 路由表构建期错误。
     *
     * 在服务器开始接受连接之前抛出，必须阻止启动。
     * code() 属于 routix_error::routing 类别。
     */
    class ConflictError final : public std::system_error {
    public:
        ConflictError(routix_error::routing::code c, const std::string& what)
            : std::system_error(make_error_code(c), what) {}
    };

    /**
     * @brief 请求数据提取错误。
     *
     * 由 RequestContext 的提取接口抛出，携带建议的 HTTP 状态码。
     * 如果 handler 没有自行处理，Router 会把它转换成对应状态码的响应。
     */
    class ExtractError final : public std::system_error {
    public:
        ExtractError(routix_error::extract::code c, boost::beast::http::status status, const std::string& what)
            : std::system_error(make_error_code(c), what), status_(status) {}

        boost::beast::http::status status() const noexcept { return status_; }

    private:
        boost::beast::http::status status_;
    };

} // namespace routix

#endif //ROUTIX_ROUTIX_ERROR_HPP
