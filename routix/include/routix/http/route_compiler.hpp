//
// Created by Aiziboy on 2025/12/6.
//

#ifndef ROUTIX_ROUTE_COMPILER_HPP
#define ROUTIX_ROUTE_COMPILER_HPP

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

#include <routix/http/handler.hpp>
#include <routix/http/http_common_types.hpp>
#include <routix/http/route_table.hpp>

namespace routix {

    /**
     * @struct RouteDef
     * @brief 声明式的路由定义，一棵普通的嵌套数据结构。
     *
     * 由 route::get / route::group / route::fallback 等工厂函数创建，
     * 交给 RouteCompiler 一次性编译成只读的 RouteTable。
     */
    struct RouteDef {
        enum class Kind : std::uint8_t {
            endpoint, // 叶子：path + 方法 + handler
            group,    // 分组：path 前缀 + 子路由
            fallback, // 兜底：没有任何路由匹配路径时使用，只能出现在顶层
        };

        Kind kind = Kind::endpoint;
        std::string path;
        std::vector<http::verb> methods;
        HandlerFunc handler;
        std::vector<GuardPtr> guards;
        std::vector<RouteDef> children;
    };

    /**
     * @brief 路由定义的工厂函数。
     * @code
     * std::vector<RouteDef> routes = {
     *     route::get("/hello", hello),
     *     route::group("/api", {
     *         route::get("/users/:id", get_user),
     *         route::post("/users/:id", update_user, {audit_guard}),
     *     }, {auth_guard}),
     *     route::fallback(not_found_page),
     * };
     * @endcode
     */
    namespace route {
        RouteDef get(std::string path, HandlerFunc handler, std::vector<GuardPtr> guards = {});
        RouteDef post(std::string path, HandlerFunc handler, std::vector<GuardPtr> guards = {});
        RouteDef put(std::string path, HandlerFunc handler, std::vector<GuardPtr> guards = {});
        RouteDef patch(std::string path, HandlerFunc handler, std::vector<GuardPtr> guards = {});
        RouteDef del(std::string path, HandlerFunc handler, std::vector<GuardPtr> guards = {});
        RouteDef head(std::string path, HandlerFunc handler, std::vector<GuardPtr> guards = {});
        RouteDef options(std::string path, HandlerFunc handler, std::vector<GuardPtr> guards = {});

        /// 同一个 handler 绑定到多个方法
        RouteDef any_of(std::initializer_list<http::verb> methods, std::string path, HandlerFunc handler,
                        std::vector<GuardPtr> guards = {});

        /// 路径前缀分组，guards 作用于所有子路由，排在子路由自身的 guards 之前
        RouteDef group(std::string prefix, std::vector<RouteDef> children, std::vector<GuardPtr> guards = {});

        /// 替换默认的 404 响应
        RouteDef fallback(HandlerFunc handler, std::vector<GuardPtr> guards = {});
    } // namespace route

    /// RouteCompiler 的输出：冻结的路由表 + 可选的兜底绑定
    struct CompiledRoutes {
        RouteTable table;
        std::shared_ptr<const HandlerBinding> fallback;
    };

    /**
     * @class RouteCompiler
     * @brief 把 RouteDef 树展开成路由表。
     *
     * - 路径：分组前缀与子路径按 '/' 拼接；
     * - Guard：外层分组 -> 内层分组 -> 叶子自身，按顺序拼接；
     * - 任何冲突 (重复的路径 + 方法、参数名不一致、语法错误、嵌套或重复的 fallback)
     *   都在这里抛出 ConflictError，服务器不会带着错误的路由表启动。
     */
    class RouteCompiler {
    public:
        static CompiledRoutes compile(const std::vector<RouteDef>& defs);

    private:
        static void flatten(const RouteDef& def, const std::string& prefix, const std::vector<GuardPtr>& inherited,
                            RouteTableBuilder& builder);

        static std::string join_path(const std::string& prefix, const std::string& path);
    };

} // namespace routix

#endif // ROUTIX_ROUTE_COMPILER_HPP
