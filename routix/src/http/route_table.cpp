//
// Created by Aiziboy on 2025/12/4.
//

#include <routix/http/route_table.hpp>
#include <routix/http/route_pattern.hpp>
#include <routix/error/routix_error.hpp>
#include <routix/utils/url_codec.hpp>

#include <algorithm>
#include <map>
#include <ranges>
#include <stdexcept>
#include <unordered_map>
#include <spdlog/spdlog.h>

namespace routix::routing {
    // 前缀树节点的定义
    struct RouteNode {
        // 字面量子节点。key 是解码后的路径段 (e.g., "users")
        std::unordered_map<std::string, std::unique_ptr<RouteNode>, StringHash, StringEqual> children;

        // 动态段子节点 (e.g., for ":id")，参数名存在父节点上
        std::unique_ptr<RouteNode> param_child = nullptr;
        std::string param_name;

        // 通配段子节点 (e.g., for "*rest")，总是叶子
        std::unique_ptr<RouteNode> wildcard_child = nullptr;
        std::string wildcard_name;

        // 该节点作为路由终点时，每个方法对应的绑定。std::map 保证 Allow 列表有序
        std::map<http::verb, HandlerBinding> handlers;

        // 规范化的路由模式，仅用于结果和日志
        std::string pattern;
    };
} // namespace routix::routing

namespace {
    using routix::routing::RouteNode;

    // 单次匹配的遍历状态 (不在节点上保存父指针)
    struct MatchState {
        http::verb method;
        std::string_view path;
        const std::vector<url_codec::PathSegment>& raw;
        const std::vector<std::string>& decoded;

        routix::PathParams params;
        const RouteNode* found = nullptr;
        // 第一个完整匹配路径但没有该方法的节点
        const RouteNode* path_only = nullptr;
    };

    bool accept_terminal(const RouteNode& node, MatchState& st) {
        if (node.handlers.contains(st.method)) {
            st.found = &node;
            return true;
        }
        if (!node.handlers.empty() && st.path_only == nullptr) {
            st.path_only = &node;
        }
        return false;
    }

    bool descend(const RouteNode& node, const std::size_t index, MatchState& st) {
        if (index == st.decoded.size()) {
            return accept_terminal(node, st);
        }

        // 1. 字面量精确匹配
        if (const auto it = node.children.find(st.decoded[index]); it != node.children.end()) {
            if (descend(*it->second, index + 1, st)) return true;
        }

        // 2. 动态段捕获
        if (node.param_child) {
            st.params.emplace_back(node.param_name, st.decoded[index]);
            if (descend(*node.param_child, index + 1, st)) return true;
            st.params.pop_back();
        }

        // 3. 通配段：吞掉剩余全部路径 (含分隔符)，至少一段
        if (node.wildcard_child) {
            std::string_view rest = st.path.substr(st.raw[index].offset);
            while (!rest.empty() && rest.back() == '/') rest.remove_suffix(1);

            st.params.emplace_back(node.wildcard_name, url_codec::url_decode(rest));
            if (accept_terminal(*node.wildcard_child, st)) return true;
            st.params.pop_back();
        }

        return false;
    }

    void collect(const RouteNode& node, std::vector<routix::RouteInfo>& out) {
        for (const auto& [method, binding] : node.handlers) {
            out.push_back({method, node.pattern, binding.guards.size()});
        }

        // 字面量子节点按字典序输出，保证结果稳定
        std::vector<const std::string*> keys;
        keys.reserve(node.children.size());
        for (const auto& [key, child] : node.children) keys.push_back(&key);
        std::ranges::sort(keys, [](const std::string* a, const std::string* b) { return *a < *b; });

        for (const auto* key : keys) collect(*node.children.at(*key), out);
        if (node.param_child) collect(*node.param_child, out);
        if (node.wildcard_child) collect(*node.wildcard_child, out);
    }
} // namespace

namespace routix {

    // --- RouteTable ---

    RouteTable::RouteTable(std::unique_ptr<routing::RouteNode> root, const std::size_t route_count)
        : root_(std::move(root)), route_count_(route_count) {}

    RouteTable::RouteTable(RouteTable&&) noexcept = default;
    RouteTable& RouteTable::operator=(RouteTable&&) noexcept = default;
    RouteTable::~RouteTable() = default; // unique_ptr 需要 RouteNode 的完整定义才能销毁

    MatchResult RouteTable::match(const http::verb method, const std::string_view path) const {
        MatchResult result;
        if (!root_) return result;

        const std::string_view clean = url_codec::strip_query(path);
        const auto raw = url_codec::split_path(clean);

        // 每段只解码一次，字面量比较和参数捕获都使用解码后的值
        std::vector<std::string> decoded;
        decoded.reserve(raw.size());
        for (const auto& seg : raw) decoded.push_back(url_codec::url_decode(seg.raw));

        MatchState st{method, clean, raw, decoded, {}, nullptr, nullptr};

        if (descend(*root_, 0, st)) {
            result.status = MatchStatus::matched;
            result.binding = &st.found->handlers.at(method);
            result.params = std::move(st.params);
            result.pattern = st.found->pattern;
        } else if (st.path_only) {
            result.status = MatchStatus::method_not_allowed;
            result.allowed.reserve(st.path_only->handlers.size());
            for (const auto& m : st.path_only->handlers | std::views::keys) result.allowed.push_back(m);
            result.pattern = st.path_only->pattern;
        }
        return result;
    }

    std::vector<RouteInfo> RouteTable::routes() const {
        std::vector<RouteInfo> out;
        out.reserve(route_count_);
        if (root_) collect(*root_, out);
        return out;
    }

    // --- RouteTableBuilder ---

    RouteTableBuilder::RouteTableBuilder() : root_(std::make_unique<routing::RouteNode>()) {}
    RouteTableBuilder::~RouteTableBuilder() = default;
    RouteTableBuilder::RouteTableBuilder(RouteTableBuilder&&) noexcept = default;
    RouteTableBuilder& RouteTableBuilder::operator=(RouteTableBuilder&&) noexcept = default;

    RouteTableBuilder& RouteTableBuilder::insert(const std::string_view pattern, const http::verb method,
                                                 std::vector<GuardPtr> guards, HandlerFunc handler) {
        if (!handler) {
            throw std::invalid_argument("route '" + std::string(pattern) + "' has an empty handler");
        }

        const RoutePattern compiled = RoutePattern::compile(pattern);
        const std::string normalized = compiled.to_string();

        // --- 第一步：只读校验，任何冲突都在修改树之前抛出 ---
        const routing::RouteNode* cursor = root_.get();
        for (const auto& seg : compiled.segments) {
            if (cursor == nullptr) break; // 后面的节点都是新建的，不会冲突

            switch (seg.kind) {
                case SegmentKind::literal: {
                    const auto it = cursor->children.find(seg.text);
                    cursor = it == cursor->children.end() ? nullptr : it->second.get();
                    break;
                }
                case SegmentKind::dynamic:
                    if (cursor->param_child && cursor->param_name != seg.text) {
                        throw ConflictError(routix_error::routing::code::parameter_conflict,
                                            "route '" + normalized + "' names parameter ':" + seg.text +
                                            "' but ':" + cursor->param_name + "' is already registered at the same position");
                    }
                    cursor = cursor->param_child.get();
                    break;
                case SegmentKind::wildcard:
                    if (cursor->wildcard_child && cursor->wildcard_name != seg.text) {
                        throw ConflictError(routix_error::routing::code::parameter_conflict,
                                            "route '" + normalized + "' names wildcard '*" + seg.text +
                                            "' but '*" + cursor->wildcard_name + "' is already registered at the same position");
                    }
                    cursor = cursor->wildcard_child.get();
                    break;
            }
        }
        if (cursor != nullptr && cursor->handlers.contains(method)) {
            throw ConflictError(routix_error::routing::code::route_conflict,
                                "route " + std::string(to_string(method)) + " " + normalized + " is already registered");
        }

        // --- 第二步：沿路径创建节点并绑定 ---
        routing::RouteNode* current = root_.get();
        for (const auto& seg : compiled.segments) {
            switch (seg.kind) {
                case SegmentKind::literal: {
                    auto& child = current->children[seg.text];
                    if (!child) child = std::make_unique<routing::RouteNode>();
                    current = child.get();
                    break;
                }
                case SegmentKind::dynamic:
                    if (!current->param_child) {
                        current->param_child = std::make_unique<routing::RouteNode>();
                        current->param_name = seg.text;
                    }
                    current = current->param_child.get();
                    break;
                case SegmentKind::wildcard:
                    if (!current->wildcard_child) {
                        current->wildcard_child = std::make_unique<routing::RouteNode>();
                        current->wildcard_name = seg.text;
                    }
                    current = current->wildcard_child.get();
                    break;
            }
        }

        SPDLOG_DEBUG("注册路由：{} {} (guards: {})", to_string(method), normalized, guards.size());

        current->handlers.emplace(method, HandlerBinding{std::move(guards), std::move(handler)});
        current->pattern = normalized;
        ++route_count_;
        return *this;
    }

    RouteTable RouteTableBuilder::freeze() && {
        return RouteTable(std::move(root_), route_count_);
    }

} // namespace routix
