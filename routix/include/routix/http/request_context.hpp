//
// Created by Aiziboy on 2025/12/5.
//

#ifndef ROUTIX_REQUEST_CONTEXT_HPP
#define ROUTIX_REQUEST_CONTEXT_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

#include <routix/error/routix_error.hpp>
#include <routix/http/extensions.hpp>
#include <routix/http/http_common_types.hpp>
#include <routix/http/parameter_set.hpp>
#include <routix/http/path_params.hpp>
#include <routix/utils/param_parser.hpp>
#include <routix/utils/url_codec.hpp>

namespace routix {

    namespace detail {
        template<typename T>
        struct is_tuple : std::false_type {};

        template<typename... Ts>
        struct is_tuple<std::tuple<Ts...>> : std::true_type {};
    }

    /**
     * @class RequestContext
     * @brief 单个请求在 Guard 链和 Handler 之间传递的上下文。
     *
     * 持有解析好的请求、路由捕获的路径参数 (按路径顺序)、扩展槽和待发送的响应。
     * 每次 dispatch 创建一个，请求结束即销毁，不在请求之间共享。
     *
     * 提取接口分两类：
     * - pathParam / path_param_as / queryParam / header(name) 返回 std::optional，不抛异常；
     * - path<T> / query<T> / header<T> / form() / extension<T> 在缺失或格式错误时抛出 ExtractError，
     *   未被 handler 捕获时由 Router 转换为 400 / 500 响应。
     */
    class RequestContext {
    public:

        RequestContext(HttpRequest req, PathParams params, std::string ip = {});

        // --- 请求数据访问 ---

        const HttpRequest& request() const;
        http::verb method() const;

        /// 不含查询串的路径
        std::string_view request_path() const;

        const std::string& ip() const;

        // --- 路径参数 ---

        std::optional<std::string_view> pathParam(std::string_view key) const;
        const PathParams& pathParams() const;

        template<param_parser::Parsable T>
        std::optional<T> path_param_as(const std::string_view key) const {
            const auto sv_opt = pathParam(key);
            if (!sv_opt) {
                return std::nullopt;
            }
            if constexpr (param_parser::is_text_v<T>) {
                if (!url_codec::is_valid_utf8(*sv_opt)) return std::nullopt;
            }
            return param_parser::tryParse<T>(*sv_opt);
        }

        /**
         * @brief 提取必需的路径参数。
         * @throws ExtractError missing_parameter (500)：路由模式中没有这个参数，属于 handler 与路由不匹配
         * @throws ExtractError invalid_utf8 / invalid_parameter (400)
         */
        template<param_parser::Parsable T>
        T path(const std::string_view key) const {
            const auto sv_opt = pathParam(key);
            if (!sv_opt) {
                throw ExtractError(routix_error::extract::code::missing_parameter, http::status::internal_server_error,
                                   "Route has no path parameter named '" + std::string(key) + "'");
            }
            return convert_path<T>(key, *sv_opt);
        }

        /**
         * @brief 按位置把所有路径参数提取成一个元组。
         * @code
         * auto [id, name] = ctx.path<std::tuple<int, std::string>>();
         * @endcode
         * @throws ExtractError wrong_number_of_parameters (500)：元组大小与捕获的参数个数不同
         */
        template<typename Tuple> requires detail::is_tuple<Tuple>::value
        Tuple path() const {
            constexpr std::size_t expected = std::tuple_size_v<Tuple>;
            if (path_params_.size() != expected) {
                throw ExtractError(routix_error::extract::code::wrong_number_of_parameters, http::status::internal_server_error,
                                   "Expected " + std::to_string(expected) + " path parameters but route captured " +
                                   std::to_string(path_params_.size()));
            }
            return path_tuple<Tuple>(std::make_index_sequence<expected>{});
        }

        // --- 查询参数 ---

        std::optional<std::string_view> queryParam(std::string_view key) const;
        std::vector<std::string_view> queryParamList(std::string_view key) const;
        const QueryParams& queryParamAll() const;

        template<param_parser::Parsable T>
        std::optional<T> query_param_as(const std::string_view key) const {
            return queries().get_optional<T>(key);
        }

        /// 必需的查询参数，缺失或格式错误时抛出 ExtractError (400)
        template<param_parser::Parsable T>
        T query(const std::string_view key) const {
            return queries().get<T>(key);
        }

        ParameterSet<QueryParams> queries() const;

        // --- 请求头 ---

        std::optional<std::string_view> header(std::string_view name) const;

        /// 必需的请求头，缺失时抛出 missing_header (400)
        template<param_parser::Parsable T>
        T header(const std::string_view name) const {
            const auto sv_opt = header(name);
            if (!sv_opt) {
                throw ExtractError(routix_error::extract::code::missing_header, http::status::bad_request,
                                   "Missing required header: " + std::string(name));
            }
            auto value = param_parser::tryParse<T>(*sv_opt);
            if (!value) {
                throw ExtractError(routix_error::extract::code::invalid_parameter, http::status::bad_request,
                                   "Header '" + std::string(name) + "' has an invalid value");
            }
            return *std::move(value);
        }

        // --- 请求体 ---

        /// 原始请求体字节
        std::string_view body() const;

        /// 取走请求体 (之后 body() 为空)
        std::string take_body();

        /**
         * @brief 按 application/x-www-form-urlencoded 解析请求体 (只解析一次)。
         * @throws ExtractError malformed_body (400)：Content-Type 不是 urlencoded 表单
         */
        ParameterSet<QueryParams> form() const;

        // --- 扩展槽 ---

        Extensions& extensions();
        const Extensions& extensions() const;

        /// 取出必需的扩展数据，不存在时抛出 missing_extension (500)
        template<typename T>
        T& extension() {
            if (T* value = extensions_.get<T>()) {
                return *value;
            }
            throw ExtractError(routix_error::extract::code::missing_extension, http::status::internal_server_error,
                               std::string("Missing request extension: ") + typeid(T).name());
        }

        // --- 响应构建 ---
        HttpResponse& response();

        void string(http::status status, std::string_view body, std::string_view content_type);
        void string(http::status status, std::string_view body);
        void string(std::string_view body);
        void json(http::status status, std::string_view json);
        void json(std::string_view json);

    private:

        template<typename T>
        T convert_path(const std::string_view key, const std::string_view raw) const {
            if constexpr (param_parser::is_text_v<T>) {
                if (!url_codec::is_valid_utf8(raw)) {
                    throw ExtractError(routix_error::extract::code::invalid_utf8, http::status::bad_request,
                                       "Path parameter '" + std::string(key) + "' is not valid UTF-8");
                }
            }
            auto value = param_parser::tryParse<T>(raw);
            if (!value) {
                throw ExtractError(routix_error::extract::code::invalid_parameter, http::status::bad_request,
                                   "Path parameter '" + std::string(key) + "' with value '" + std::string(raw) + "' is not valid");
            }
            return *std::move(value);
        }

        template<typename Tuple, std::size_t... I>
        Tuple path_tuple(std::index_sequence<I...>) const {
            // 花括号初始化保证从左到右求值
            return Tuple{convert_path<std::tuple_element_t<I, Tuple>>(path_params_.at(I).first, path_params_.at(I).second)...};
        }

        void parseQueryIfNeeded() const;


        // --- 成员变量 ---

        HttpRequest request_;    // 持有请求对象的值
        HttpResponse response_;  // 持有响应对象的值
        PathParams path_params_; // 持有路径参数的值
        std::string ip_;         // 持有远程主机的ip
        Extensions extensions_;

        mutable QueryParams queryParams_;
        mutable bool queryParamsParsed_ = false;

        mutable QueryParams formParams_;
        mutable bool formParsed_ = false;
    };

} // namespace routix

#endif // ROUTIX_REQUEST_CONTEXT_HPP
