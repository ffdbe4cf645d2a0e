//
// Created by Aiziboy on 2025/12/6.
//

#include <routix/http/route_compiler.hpp>
#include <routix/error/routix_error.hpp>

#include <stdexcept>
#include <spdlog/spdlog.h>

namespace routix {

    namespace route {
        namespace {
            RouteDef endpoint(std::vector<http::verb> methods, std::string path, HandlerFunc handler, std::vector<GuardPtr> guards) {
                RouteDef def;
                def.kind = RouteDef::Kind::endpoint;
                def.path = std::move(path);
                def.methods = std::move(methods);
                def.handler = std::move(handler);
                def.guards = std::move(guards);
                return def;
            }
        } // namespace

        RouteDef get(std::string path, HandlerFunc handler, std::vector<GuardPtr> guards) {
            return endpoint({http::verb::get}, std::move(path), std::move(handler), std::move(guards));
        }

        RouteDef post(std::string path, HandlerFunc handler, std::vector<GuardPtr> guards) {
            return endpoint({http::verb::post}, std::move(path), std::move(handler), std::move(guards));
        }

        RouteDef put(std::string path, HandlerFunc handler, std::vector<GuardPtr> guards) {
            return endpoint({http::verb::put}, std::move(path), std::move(handler), std::move(guards));
        }

        RouteDef patch(std::string path, HandlerFunc handler, std::vector<GuardPtr> guards) {
            return endpoint({http::verb::patch}, std::move(path), std::move(handler), std::move(guards));
        }

        RouteDef del(std::string path, HandlerFunc handler, std::vector<GuardPtr> guards) {
            return endpoint({http::verb::delete_}, std::move(path), std::move(handler), std::move(guards));
        }

        RouteDef head(std::string path, HandlerFunc handler, std::vector<GuardPtr> guards) {
            return endpoint({http::verb::head}, std::move(path), std::move(handler), std::move(guards));
        }

        RouteDef options(std::string path, HandlerFunc handler, std::vector<GuardPtr> guards) {
            return endpoint({http::verb::options}, std::move(path), std::move(handler), std::move(guards));
        }

        RouteDef any_of(std::initializer_list<http::verb> methods, std::string path, HandlerFunc handler, std::vector<GuardPtr> guards) {
            return endpoint(std::vector<http::verb>(methods), std::move(path), std::move(handler), std::move(guards));
        }

        RouteDef group(std::string prefix, std::vector<RouteDef> children, std::vector<GuardPtr> guards) {
            RouteDef def;
            def.kind = RouteDef::Kind::group;
            def.path = std::move(prefix);
            def.children = std::move(children);
            def.guards = std::move(guards);
            return def;
        }

        RouteDef fallback(HandlerFunc handler, std::vector<GuardPtr> guards) {
            RouteDef def;
            def.kind = RouteDef::Kind::fallback;
            def.handler = std::move(handler);
            def.guards = std::move(guards);
            return def;
        }
    } // namespace route


    CompiledRoutes RouteCompiler::compile(const std::vector<RouteDef>& defs) {
        RouteTableBuilder builder;
        std::shared_ptr<const HandlerBinding> fallback;

        for (const auto& def : defs) {
            if (def.kind == RouteDef::Kind::fallback) {
                if (fallback) {
                    throw ConflictError(routix_error::routing::code::invalid_pattern, "more than one fallback route defined");
                }
                if (!def.handler) {
                    throw std::invalid_argument("fallback route has an empty handler");
                }
                fallback = std::make_shared<const HandlerBinding>(HandlerBinding{def.guards, def.handler});
                continue;
            }
            flatten(def, "", {}, builder);
        }

        SPDLOG_INFO("路由编译完成: {} 条路由{}", builder.size(), fallback ? "，已设置 fallback" : "");
        return CompiledRoutes{std::move(builder).freeze(), std::move(fallback)};
    }

    void RouteCompiler::flatten(const RouteDef& def, const std::string& prefix, const std::vector<GuardPtr>& inherited,
                                RouteTableBuilder& builder) {
        const std::string full_path = join_path(prefix, def.path);

        // 外层在前，当前层在后
        std::vector<GuardPtr> chain = inherited;
        chain.insert(chain.end(), def.guards.begin(), def.guards.end());

        switch (def.kind) {
            case RouteDef::Kind::fallback:
                throw ConflictError(routix_error::routing::code::invalid_pattern,
                                    "fallback route is only allowed at the top level (found under '" + prefix + "')");

            case RouteDef::Kind::group:
                for (const auto& child : def.children) {
                    flatten(child, full_path, chain, builder);
                }
                break;

            case RouteDef::Kind::endpoint:
                if (def.methods.empty()) {
                    throw ConflictError(routix_error::routing::code::invalid_pattern,
                                        "route '" + full_path + "' has no HTTP method");
                }
                for (const auto method : def.methods) {
                    builder.insert(full_path, method, chain, def.handler);
                }
                break;
        }
    }

    std::string RouteCompiler::join_path(const std::string& prefix, const std::string& path) {
        if (prefix.empty()) return path;
        if (path.empty()) return prefix;

        const bool prefix_slash = prefix.back() == '/';
        const bool path_slash = path.front() == '/';
        if (prefix_slash && path_slash) return prefix + path.substr(1);
        if (prefix_slash || path_slash) return prefix + path;
        return prefix + "/" + path;
    }

} // namespace routix
