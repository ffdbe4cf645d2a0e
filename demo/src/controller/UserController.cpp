//
// Created by Aiziboy on 2025/12/10.
//

#include "UserController.hpp"

#include <boost/json.hpp>
#include <spdlog/spdlog.h>

#include "model/User.hpp"

namespace demo {

    using routix::RequestContext;
    namespace route = routix::route;

    UserController::UserController(std::shared_ptr<UserService> user_service, routix::GuardPtr auth_guard)
        : user_service_(std::move(user_service)),
          auth_guard_(std::move(auth_guard)) {}

    routix::RouteDef UserController::routes() {
        // 请求日志，挂在认证之前
        auto access_log = routix::make_guard([](RequestContext& ctx) -> boost::asio::awaitable<routix::ControlFlow> {
            SPDLOG_DEBUG("{} {} from {}", to_string(ctx.method()), ctx.request().target(), ctx.ip());
            co_return routix::ControlFlow::next();
        });

        return route::group("/api", {
            route::get("/users", [this](RequestContext& ctx) { return list_users(ctx); }),
            route::get("/users/me", [this](RequestContext& ctx) { return me(ctx); }),
            route::get("/users/:id", [this](RequestContext& ctx) { return get_user(ctx); }),
            route::put("/users/:id", [this](RequestContext& ctx) { return save_user(ctx); }),
            route::del("/users/:id", [this](RequestContext& ctx) { return remove_user(ctx); }),
            route::get("/files/*path", [this](RequestContext& ctx) { return get_file(ctx); }),
        }, {access_log, auth_guard_});
    }

    boost::asio::awaitable<void> UserController::list_users(RequestContext& ctx) const {
        const auto limit = ctx.queries().get_or_default<std::size_t>("limit", 20);
        const auto users = co_await user_service_->list_users(limit);
        ctx.json(boost::json::serialize(boost::json::value_from(users)));
    }

    boost::asio::awaitable<void> UserController::me(RequestContext& ctx) const {
        const auto& principal = ctx.extension<Principal>();
        boost::json::object body;
        body["name"] = principal.name;
        ctx.json(boost::json::serialize(body));
        co_return;
    }

    boost::asio::awaitable<void> UserController::get_user(RequestContext& ctx) const {
        // 非数字的 id 由框架转成 400
        const auto id = ctx.path<int64_t>("id");

        const auto user = co_await user_service_->get_user(id);
        if (!user) {
            co_return ctx.json(http::status::not_found, R"({"code":404,"message":"user not found"})");
        }
        ctx.json(boost::json::serialize(boost::json::value_from(*user)));
    }

    boost::asio::awaitable<void> UserController::save_user(RequestContext& ctx) const {
        const auto id = ctx.path<int64_t>("id");

        User user;
        try {
            const std::string_view body = ctx.body();
            user = boost::json::value_to<User>(boost::json::parse(boost::json::string_view(body.data(), body.size())));
        } catch (const std::exception& e) {
            SPDLOG_DEBUG("请求体解析失败: {}", e.what());
            throw routix::ExtractError(routix_error::extract::code::malformed_body, http::status::bad_request,
                                       "Body must be a JSON object with a string 'name'");
        }
        user.id = id;

        const bool created = co_await user_service_->save_user(user);
        ctx.json(created ? http::status::created : http::status::ok, boost::json::serialize(boost::json::value_from(user)));
    }

    boost::asio::awaitable<void> UserController::remove_user(RequestContext& ctx) const {
        const auto id = ctx.path<int64_t>("id");
        if (!co_await user_service_->remove_user(id)) {
            co_return ctx.json(http::status::not_found, R"({"code":404,"message":"user not found"})");
        }
        ctx.response().result(http::status::no_content);
    }

    boost::asio::awaitable<void> UserController::get_file(RequestContext& ctx) const {
        const auto path = ctx.path<std::string>("path");
        boost::json::object body;
        body["path"] = path;
        ctx.json(boost::json::serialize(body));
        co_return;
    }

} // namespace demo
