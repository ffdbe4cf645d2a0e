//
// Created by Aiziboy on 2025/12/11.
//

#include <gtest/gtest.h>

#include <routix/error/routix_error.hpp>
#include <routix/http/route_compiler.hpp>
#include <routix/http/router.hpp>

#include "test_helpers.hpp"

using namespace routix;
using routix::test::invoke_handler;
using routix::test::make_request;
using routix::test::recording_guard;
using routix::test::run_awaitable;
using routix::test::tagged;

class RouteCompilerTest : public ::testing::Test {
protected:
    std::shared_ptr<std::vector<std::string>> log = std::make_shared<std::vector<std::string>>();

    static std::error_code compile_error(const std::vector<RouteDef>& defs) {
        try {
            (void)RouteCompiler::compile(defs);
        } catch (const ConflictError& e) {
            return e.code();
        }
        return {};
    }
};

TEST_F(RouteCompilerTest, FactoriesBindTheirMethod) {
    const auto compiled = RouteCompiler::compile({
        route::get("/r", tagged("get")),
        route::post("/r", tagged("post")),
        route::put("/r", tagged("put")),
        route::patch("/r", tagged("patch")),
        route::del("/r", tagged("delete")),
        route::head("/r", tagged("head")),
        route::options("/r", tagged("options")),
    });

    EXPECT_EQ(compiled.table.size(), 7u);
    const std::vector<std::pair<http::verb, std::string>> expected{
        {http::verb::get, "get"}, {http::verb::post, "post"}, {http::verb::put, "put"},
        {http::verb::patch, "patch"}, {http::verb::delete_, "delete"}, {http::verb::head, "head"},
        {http::verb::options, "options"},
    };
    for (const auto& [method, tag] : expected) {
        const auto m = compiled.table.match(method, "/r");
        ASSERT_EQ(m.status, MatchStatus::matched) << to_string(method);
        EXPECT_EQ(invoke_handler(*m.binding), tag);
    }
}

TEST_F(RouteCompilerTest, AnyOfSharesOneHandler) {
    const auto compiled = RouteCompiler::compile({
        route::any_of({http::verb::get, http::verb::post}, "/both", tagged("both")),
    });

    EXPECT_EQ(compiled.table.size(), 2u);
    EXPECT_EQ(invoke_handler(*compiled.table.match(http::verb::get, "/both").binding), "both");
    EXPECT_EQ(invoke_handler(*compiled.table.match(http::verb::post, "/both").binding), "both");
    EXPECT_EQ(compiled.table.match(http::verb::put, "/both").status, MatchStatus::method_not_allowed);
}

TEST_F(RouteCompilerTest, GroupsJoinPrefixes) {
    const auto compiled = RouteCompiler::compile({
        route::group("/api", {
            route::group("v1/", {
                route::get("/users/:id", tagged("user")),
                route::get("", tagged("v1-root")),
            }),
            route::get("health", tagged("health")),
        }),
    });

    const auto user = compiled.table.match(http::verb::get, "/api/v1/users/5");
    ASSERT_EQ(user.status, MatchStatus::matched);
    EXPECT_EQ(user.pattern, "/api/v1/users/:id");
    EXPECT_EQ(user.params.find("id"), "5");

    EXPECT_EQ(invoke_handler(*compiled.table.match(http::verb::get, "/api/v1").binding), "v1-root");
    EXPECT_EQ(invoke_handler(*compiled.table.match(http::verb::get, "/api/health").binding), "health");
}

TEST_F(RouteCompilerTest, GroupGuardsRunBeforeRouteGuards) {
    const Router router{RouteCompiler::compile({
        route::group("/outer", {
            route::group("/inner", {
                route::get("/leaf", tagged("leaf"), {recording_guard(log, "leaf")}),
            }, {recording_guard(log, "inner")}),
        }, {recording_guard(log, "outer-1"), recording_guard(log, "outer-2")}),
    })};

    const auto table_routes = router.table().routes();
    ASSERT_EQ(table_routes.size(), 1u);
    EXPECT_EQ(table_routes[0].pattern, "/outer/inner/leaf");
    EXPECT_EQ(table_routes[0].guard_count, 4u);

    const auto resp = run_awaitable(router.dispatch(make_request(http::verb::get, "/outer/inner/leaf")));
    EXPECT_EQ(resp.body(), "leaf");
    EXPECT_EQ(*log, (std::vector<std::string>{"outer-1", "outer-2", "inner", "leaf"}));
}

TEST_F(RouteCompilerTest, SiblingGroupsDoNotShareGuards) {
    const Router router{RouteCompiler::compile({
        route::group("/a", {route::get("/x", tagged("a"))}, {recording_guard(log, "a-guard")}),
        route::group("/b", {route::get("/x", tagged("b"))}, {recording_guard(log, "b-guard")}),
        route::get("/c", tagged("c")),
    })};

    (void)run_awaitable(router.dispatch(make_request(http::verb::get, "/b/x")));
    (void)run_awaitable(router.dispatch(make_request(http::verb::get, "/c")));
    EXPECT_EQ(*log, (std::vector<std::string>{"b-guard"}));
}

TEST_F(RouteCompilerTest, DuplicateRouteAcrossGroupsIsConflict) {
    EXPECT_EQ(compile_error({
                  route::get("/api/users", tagged("one")),
                  route::group("/api", {route::get("/users", tagged("two"))}),
              }),
              routix_error::routing::route_conflict);
}

TEST_F(RouteCompilerTest, ParameterNameMismatchIsConflict) {
    EXPECT_EQ(compile_error({
                  route::get("/users/:id", tagged("one")),
                  route::del("/users/:user", tagged("two")),
              }),
              routix_error::routing::parameter_conflict);
}

TEST_F(RouteCompilerTest, EndpointWithoutMethodIsInvalid) {
    EXPECT_EQ(compile_error({route::any_of({}, "/nothing", tagged("x"))}), routix_error::routing::invalid_pattern);
}

TEST_F(RouteCompilerTest, FallbackIsCompiledSeparately) {
    const auto compiled = RouteCompiler::compile({
        route::get("/", tagged("root")),
        route::fallback(tagged("fallback")),
    });

    EXPECT_EQ(compiled.table.size(), 1u);
    ASSERT_NE(compiled.fallback, nullptr);
    EXPECT_EQ(invoke_handler(*compiled.fallback), "fallback");
}

TEST_F(RouteCompilerTest, SecondFallbackIsRejected) {
    EXPECT_EQ(compile_error({route::fallback(tagged("a")), route::fallback(tagged("b"))}),
              routix_error::routing::invalid_pattern);
}

TEST_F(RouteCompilerTest, NestedFallbackIsRejected) {
    EXPECT_EQ(compile_error({route::group("/api", {route::fallback(tagged("a"))})}),
              routix_error::routing::invalid_pattern);
}

TEST_F(RouteCompilerTest, EmptyHandlerIsRejected) {
    EXPECT_THROW((void)RouteCompiler::compile({route::get("/x", HandlerFunc{})}), std::invalid_argument);
    EXPECT_THROW((void)RouteCompiler::compile({route::fallback(HandlerFunc{})}), std::invalid_argument);
}
