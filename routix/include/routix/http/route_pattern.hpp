//
// Created by Aiziboy on 2025/12/3.
//

#ifndef ROUTIX_ROUTE_PATTERN_HPP
#define ROUTIX_ROUTE_PATTERN_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace routix {

    /// 路由模式中单个路径段的种类
    enum class SegmentKind : std::uint8_t {
        literal,  // 普通文本，如 "users"
        dynamic,  // 命名参数，如 ":id"
        wildcard, // 通配，如 "*rest"，匹配剩余全部路径，必须是最后一段
    };

    struct SegmentSpec {
        SegmentKind kind = SegmentKind::literal;
        // literal 为文本本身，dynamic / wildcard 为参数名 (不含前缀)
        std::string text;

        bool operator==(const SegmentSpec&) const = default;
    };

    /**
     * @struct RoutePattern
     * @brief 代表一个被“编译”过的路由模式。
     *
     * 将 "/users/:id/files/*path" 这样的字符串预处理成段序列，
     * 只在构建路由表时执行一次，请求到来时不再解析模式字符串。
     *
     * 语法：
     * - 空段被忽略，"/users/" 与 "/users" 等价，"/" 与 "" 表示根。
     * - ":name" 为动态段，"*name" 为通配段，name 只能由字母、数字、下划线组成。
     * - 通配段必须是最后一段；同一模式内参数名不能重复。
     */
    struct RoutePattern {
        std::vector<SegmentSpec> segments;

        /**
         * @brief 静态工厂方法，编译一个路由模式字符串。
         * @throws routix::ConflictError (invalid_pattern) 语法错误时抛出
         */
        static RoutePattern compile(std::string_view pattern);

        /// 规范化后的字符串形式，如 "/users/:id"，根为 "/"
        std::string to_string() const;

        bool operator==(const RoutePattern&) const = default;
    };

} // namespace routix

#endif //ROUTIX_ROUTE_PATTERN_HPP
