//
// Created by Aiziboy on 2025/12/6.
//

#include <routix/http/router.hpp>
#include <routix/http/request_context.hpp>
#include <routix/error/routix_error.hpp>
#include <routix/utils/url_codec.hpp>
#include <routix/version.hpp>

#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>
#include <spdlog/spdlog.h>

namespace routix {

    Router::Router(RouteTable table)
        : table_(std::move(table)) {}

    Router::Router(CompiledRoutes routes)
        : table_(std::move(routes.table)),
          fallback_(std::move(routes.fallback)) {}

    boost::asio::awaitable<HttpResponse> Router::dispatch(HttpRequest req, std::string ip) const {
        MatchResult match = table_.match(req.method(), url_codec::strip_query(req.target()));

        switch (match.status) {
            case MatchStatus::not_found: {
                if (!fallback_) {
                    SPDLOG_DEBUG("404 {} {}", to_string(req.method()), req.target());
                    co_return make_error(req, http::status::not_found, "404 Not Found");
                }
                RequestContext ctx(std::move(req), {}, std::move(ip));
                co_await run_chain(*fallback_, ctx);
                co_return finalize(ctx);
            }

            case MatchStatus::method_not_allowed: {
                SPDLOG_DEBUG("405 {} {} (allow: {})", to_string(req.method()), req.target(), join_methods(match.allowed));
                HttpResponse resp = make_error(req, http::status::method_not_allowed, "405 Method Not Allowed");
                resp.set(http::field::allow, join_methods(match.allowed));
                co_return resp;
            }

            case MatchStatus::matched:
                break;
        }

        // 每个请求独占自己的上下文，按路径顺序植入捕获的参数
        RequestContext ctx(std::move(req), std::move(match.params), std::move(ip));
        co_await run_chain(*match.binding, ctx);
        co_return finalize(ctx);
    }

    boost::asio::awaitable<void> Router::run_chain(const HandlerBinding& binding, RequestContext& ctx) {
        try {
            for (const auto& guard : binding.guards) {
                ControlFlow flow = co_await guard->invoke(ctx);
                if (flow.is_rejected()) {
                    // 中断：后面的 Guard 和 Handler 都不会执行
                    ctx.response() = std::move(*flow.response());
                    prepare_rejection(ctx);
                    SPDLOG_DEBUG("Guard 拒绝请求 {} {}: {}", to_string(ctx.method()), ctx.request_path(),
                                 ctx.response().result_int());
                    co_return;
                }
            }

            co_await binding.handler(ctx);
        } catch (const ExtractError& e) {
            // 提取错误：按错误自带的状态码响应 (400 参数错误 / 500 路由与 handler 不匹配)
            if (e.status() == http::status::internal_server_error) {
                SPDLOG_ERROR("请求参数提取失败 {} {}: {}", to_string(ctx.method()), ctx.request_path(), e.what());
            } else {
                SPDLOG_DEBUG("请求参数提取失败 {} {}: {}", to_string(ctx.method()), ctx.request_path(), e.what());
            }
            ctx.response() = make_error(ctx.request(), e.status(), e.what());
        } catch (const boost::system::system_error& e) {
            if (e.code() == boost::asio::error::operation_aborted) {
                // 连接已断开或服务器正在停止，链条在挂起点被放弃
                SPDLOG_DEBUG("请求 {} {} 被取消", to_string(ctx.method()), ctx.request_path());
            } else {
                SPDLOG_ERROR("处理请求 {} {} 时发生异常: {}", to_string(ctx.method()), ctx.request_path(), e.what());
            }
            ctx.response() = make_error(ctx.request(), http::status::internal_server_error, "500 Internal Server Error");
        } catch (const std::exception& e) {
            SPDLOG_ERROR("处理请求 {} {} 时发生异常: {}", to_string(ctx.method()), ctx.request_path(), e.what());
            ctx.response() = make_error(ctx.request(), http::status::internal_server_error, "500 Internal Server Error");
        } catch (...) {
            SPDLOG_ERROR("处理请求 {} {} 时抛出了非 std::exception 类型的异常", to_string(ctx.method()), ctx.request_path());
            ctx.response() = make_error(ctx.request(), http::status::internal_server_error, "500 Internal Server Error");
        }
    }

    void Router::prepare_rejection(RequestContext& ctx) {
        auto& resp = ctx.response();
        resp.version(ctx.request().version());
        resp.keep_alive(ctx.request().keep_alive());
        if (resp.find(http::field::server) == resp.end()) {
            resp.set(http::field::server, framework::server_header);
        }
    }

    HttpResponse Router::finalize(RequestContext& ctx) {
        try {
            ctx.response().prepare_payload();
        } catch (const std::exception& e) {
            // 例如 204 / 304 响应带了 body
            SPDLOG_ERROR("响应不合法 {} {}: {}", to_string(ctx.method()), ctx.request_path(), e.what());
            return make_error(ctx.request(), http::status::internal_server_error, "500 Internal Server Error");
        }
        return std::move(ctx.response());
    }

    HttpResponse Router::make_error(const HttpRequest& req, const http::status status, const std::string_view body) {
        HttpResponse resp{status, req.version()};
        resp.set(http::field::server, framework::server_header);
        resp.set(http::field::content_type, "text/plain;charset=UTF-8");
        resp.keep_alive(req.keep_alive());
        resp.body() = body;
        resp.prepare_payload();
        return resp;
    }

    std::string Router::join_methods(const std::vector<http::verb>& methods) {
        std::string allow_str;
        for (size_t i = 0; i < methods.size(); ++i) {
            allow_str += to_string(methods[i]);
            if (i < methods.size() - 1) allow_str += ", ";
        }
        return allow_str;
    }

} // namespace routix
