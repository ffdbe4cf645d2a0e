//
// Created by Aiziboy on 2025/12/4.
//

#ifndef ROUTIX_ROUTE_TABLE_HPP
#define ROUTIX_ROUTE_TABLE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <routix/http/handler.hpp>
#include <routix/http/http_common_types.hpp>
#include <routix/http/path_params.hpp>

// 向前声明 RouteNode 以隐藏实现细节
namespace routix::routing {
    struct RouteNode;
}

namespace routix {

    enum class MatchStatus : std::uint8_t {
        matched,
        not_found,
        method_not_allowed,
    };

    /**
     * @struct MatchResult
     * @brief RouteTable::match 的结果。
     *
     * - matched：binding 指向表内的 HandlerBinding，params 为按路径顺序捕获的参数。
     * - method_not_allowed：allowed 为该路径上注册过的方法 (按 http::verb 排序)。
     * - not_found：其他字段为空。
     *
     * NotFound / MethodNotAllowed 是普通的返回值，不是异常。
     */
    struct MatchResult {
        MatchStatus status = MatchStatus::not_found;
        const HandlerBinding* binding = nullptr;
        PathParams params;
        std::vector<http::verb> allowed;
        /// 命中的路由模式，如 "/users/:id"
        std::string pattern;

        bool operator==(const MatchResult&) const = default;
    };

    /// 路由表中一条已注册路由的描述，用于启动日志和测试
    struct RouteInfo {
        http::verb method;
        std::string pattern;
        std::size_t guard_count;
    };

    class RouteTableBuilder;

    /**
     * @class RouteTable
     * @brief 冻结后的只读路由表 (按路径段组织的前缀树)。
     *
     * 只能由 RouteTableBuilder::freeze() 生成，没有任何修改接口，
     * 因此可以在所有 IO 线程间无锁共享。
     */
    class RouteTable {
    public:
        RouteTable(RouteTable&&) noexcept;
        RouteTable& operator=(RouteTable&&) noexcept;
        ~RouteTable();

        RouteTable(const RouteTable&) = delete;
        RouteTable& operator=(const RouteTable&) = delete;

        /**
         * @brief 按方法和路径匹配路由。
         *
         * 每一层按 字面量 -> 动态段 -> 通配段 的优先级深度优先搜索；
         * 第一个同时匹配路径和方法的分支胜出。
         * 字面量节点匹配了路径但没有注册该方法时，搜索会继续到动态段兄弟节点：
         * 注册 GET /users/me 和 POST /users/:id 后，POST /users/me 命中 :id (id = "me")。
         * 如果没有分支匹配方法，但有节点完整匹配了路径，返回第一个这样的节点上的方法集合 (405)。
         *
         * @param method 请求方法
         * @param path 请求路径，可以带查询串 (会被忽略)
         */
        MatchResult match(http::verb method, std::string_view path) const;

        /// 已注册的 (路径, 方法) 数量
        std::size_t size() const noexcept { return route_count_; }

        /// 按前缀树遍历顺序列出所有路由
        std::vector<RouteInfo> routes() const;

    private:
        friend class RouteTableBuilder;

        RouteTable(std::unique_ptr<routing::RouteNode> root, std::size_t route_count);

        std::unique_ptr<routing::RouteNode> root_;
        std::size_t route_count_ = 0;
    };

    /**
     * @class RouteTableBuilder
     * @brief 构建期使用的可变路由表。
     *
     * insert 失败时抛出 ConflictError，并且不会修改已有的树 (先校验，后插入)。
     * freeze() 只能在右值上调用，调用后 builder 不再可用。
     */
    class RouteTableBuilder {
    public:
        RouteTableBuilder();
        ~RouteTableBuilder();

        RouteTableBuilder(RouteTableBuilder&&) noexcept;
        RouteTableBuilder& operator=(RouteTableBuilder&&) noexcept;

        /**
         * @brief 在 pattern 对应的节点上为 method 绑定 Guard 链和处理函数。
         * @throws ConflictError invalid_pattern: 模式语法错误
         * @throws ConflictError parameter_conflict: 同一位置已有不同名字的动态段/通配段
         * @throws ConflictError route_conflict: 该节点上已经注册过相同方法
         */
        RouteTableBuilder& insert(std::string_view pattern, http::verb method,
                                  std::vector<GuardPtr> guards, HandlerFunc handler);

        /// 已插入的路由数量
        std::size_t size() const noexcept { return route_count_; }

        /// 冻结为只读路由表
        RouteTable freeze() &&;

    private:
        std::unique_ptr<routing::RouteNode> root_;
        std::size_t route_count_ = 0;
    };

} // namespace routix

#endif //ROUTIX_ROUTE_TABLE_HPP
