//
// Created by Aiziboy on 2025/12/6.
//

#ifndef ROUTIX_ROUTER_HPP
#define ROUTIX_ROUTER_HPP

#include <memory>
#include <string>
#include <vector>
#include <boost/asio/awaitable.hpp>

#include <routix/http/handler.hpp>
#include <routix/http/http_common_types.hpp>
#include <routix/http/route_compiler.hpp>
#include <routix/http/route_table.hpp>

namespace routix {

    /**
     * @class Router
     * @brief 请求分发器。
     *
     * 持有冻结的路由表，对每个请求：
     * 1. 在路由表中匹配方法和路径；
     * 2. NotFound -> fallback 或 404，MethodNotAllowed -> 405 + Allow；
     * 3. 匹配成功 -> 创建 RequestContext，按顺序执行 Guard 链，任一 Guard 拒绝则立即返回它的响应，
     *    全部放行后执行 Handler。
     *
     * dispatch 是 const 的，可以被所有 IO 线程上的连接并发调用。
     * 任何异常都不会越过 dispatch：ExtractError 转为其状态码，其他任何异常 (包括非 std::exception 类型) 转为 500。
     */
    class Router {
    public:
        explicit Router(RouteTable table);
        explicit Router(CompiledRoutes routes);

        /**
         * @brief 路由分发的主入口，总是返回一个完整的响应。
         * @param req 解析好的请求 (所有权转移给本次请求的 RequestContext)
         * @param ip 远端地址，供 handler 读取
         */
        boost::asio::awaitable<HttpResponse> dispatch(HttpRequest req, std::string ip = {}) const;

        const RouteTable& table() const { return table_; }
        bool has_fallback() const { return fallback_ != nullptr; }

    private:
        /// 执行 Guard 链 + Handler，结果写入 ctx.response()
        static boost::asio::awaitable<void> run_chain(const HandlerBinding& binding, RequestContext& ctx);

        /// Guard 自己构造的拒绝响应补齐版本、keep-alive 和 Server 头
        static void prepare_rejection(RequestContext& ctx);

        /// 计算 Content-Length 等字段，取出最终响应
        static HttpResponse finalize(RequestContext& ctx);

        static HttpResponse make_error(const HttpRequest& req, http::status status, std::string_view body);
        static std::string join_methods(const std::vector<http::verb>& methods);

        RouteTable table_;
        std::shared_ptr<const HandlerBinding> fallback_;
    };

} // namespace routix

#endif //ROUTIX_ROUTER_HPP
