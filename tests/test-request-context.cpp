//
// Created by Aiziboy on 2025/12/12.
//

#include <gtest/gtest.h>

#include <routix/error/routix_error.hpp>
#include <routix/http/request_context.hpp>

#include "test_helpers.hpp"

using namespace routix;
using routix::test::make_request;

class RequestContextTest : public ::testing::Test {
protected:
    static RequestContext context(const std::string& target, PathParams params = {}) {
        return RequestContext(make_request(http::verb::get, target), std::move(params));
    }

    template<typename Fn>
    static std::error_code extract_error(Fn&& fn, http::status expected_status) {
        try {
            fn();
        } catch (const ExtractError& e) {
            EXPECT_EQ(e.status(), expected_status) << e.what();
            return e.code();
        }
        return {};
    }
};

TEST_F(RequestContextTest, ExposesRequestBasics) {
    auto ctx = context("/users/7?x=1");
    EXPECT_EQ(ctx.method(), http::verb::get);
    EXPECT_EQ(ctx.request_path(), "/users/7");
    EXPECT_EQ(ctx.request().target(), "/users/7?x=1");
    EXPECT_TRUE(ctx.ip().empty());
    EXPECT_EQ(ctx.response().version(), 11u);
}

TEST_F(RequestContextTest, TypedPathParameter) {
    const auto ctx = context("/users/42", {{"id", "42"}});
    EXPECT_EQ(ctx.path<int>("id"), 42);
    EXPECT_EQ(ctx.path<std::string>("id"), "42");
    EXPECT_EQ(ctx.path_param_as<long>("id"), 42L);
    EXPECT_FALSE(ctx.path_param_as<int>("missing"));
}

TEST_F(RequestContextTest, PathParameterConversionFailureIs400) {
    const auto ctx = context("/users/abc", {{"id", "abc"}});
    EXPECT_EQ(extract_error([&] { (void)ctx.path<int>("id"); }, http::status::bad_request),
              routix_error::extract::invalid_parameter);
    EXPECT_FALSE(ctx.path_param_as<int>("id"));
}

TEST_F(RequestContextTest, UnknownPathParameterIs500) {
    const auto ctx = context("/users/1", {{"id", "1"}});
    EXPECT_EQ(extract_error([&] { (void)ctx.path<int>("user_id"); }, http::status::internal_server_error),
              routix_error::extract::missing_parameter);
}

TEST_F(RequestContextTest, InvalidUtf8TextParameterIs400) {
    const auto ctx = context("/files/x", {{"name", "\xFF\xFE"}});
    EXPECT_EQ(extract_error([&] { (void)ctx.path<std::string>("name"); }, http::status::bad_request),
              routix_error::extract::invalid_utf8);
    EXPECT_FALSE(ctx.path_param_as<std::string_view>("name"));
}

TEST_F(RequestContextTest, TupleExtractionFollowsPathOrder) {
    const auto ctx = context("/orgs/acme/repos/7", {{"org", "acme"}, {"repo", "7"}});
    const auto [org, repo] = ctx.path<std::tuple<std::string, int>>();
    EXPECT_EQ(org, "acme");
    EXPECT_EQ(repo, 7);
}

TEST_F(RequestContextTest, TupleSizeMismatchIs500) {
    const auto ctx = context("/orgs/acme", {{"org", "acme"}});
    EXPECT_EQ(extract_error([&] { (void)ctx.path<std::tuple<std::string, int>>(); }, http::status::internal_server_error),
              routix_error::extract::wrong_number_of_parameters);
}

TEST_F(RequestContextTest, TupleElementConversionFailureIs400) {
    const auto ctx = context("/orgs/acme/repos/x", {{"org", "acme"}, {"repo", "x"}});
    EXPECT_EQ(extract_error([&] { (void)ctx.path<std::tuple<std::string, int>>(); }, http::status::bad_request),
              routix_error::extract::invalid_parameter);
}

TEST_F(RequestContextTest, QueryParameters) {
    const auto ctx = context("/search?q=hello+world&page=2&tag=a&tag=b&debug=true#frag");
    EXPECT_EQ(ctx.queryParam("q"), "hello world");
    EXPECT_EQ(ctx.query<int>("page"), 2);
    EXPECT_EQ(ctx.query<bool>("debug"), true);
    EXPECT_EQ(ctx.queryParamList("tag"), (std::vector<std::string_view>{"a", "b"}));
    EXPECT_TRUE(ctx.queryParamList("none").empty());
    EXPECT_EQ(ctx.queryParamAll().size(), 4u);
    EXPECT_FALSE(ctx.query_param_as<int>("q"));
    EXPECT_EQ(ctx.queries().get_or_default<int>("limit", 20), 20);
}

TEST_F(RequestContextTest, MissingQueryParameterIs400) {
    const auto ctx = context("/search");
    EXPECT_FALSE(ctx.queryParam("q"));
    EXPECT_EQ(extract_error([&] { (void)ctx.query<std::string>("q"); }, http::status::bad_request),
              routix_error::extract::missing_parameter);
}

TEST_F(RequestContextTest, Headers) {
    auto req = make_request(http::verb::get, "/");
    req.set("X-Request-Id", "123");
    const RequestContext ctx(std::move(req), {});

    EXPECT_EQ(ctx.header("x-request-id"), "123");
    EXPECT_EQ(ctx.header<int>("X-Request-Id"), 123);
    EXPECT_FALSE(ctx.header("X-Missing"));
    EXPECT_EQ(extract_error([&] { (void)ctx.header<std::string>("X-Missing"); }, http::status::bad_request),
              routix_error::extract::missing_header);
}

TEST_F(RequestContextTest, UrlEncodedForm) {
    RequestContext ctx(make_request(http::verb::post, "/login", "user=alice&pass=p%40ss+word",
                                    "application/x-www-form-urlencoded; charset=UTF-8"), {});
    EXPECT_EQ(ctx.form().get<std::string>("user"), "alice");
    EXPECT_EQ(ctx.form().get<std::string>("pass"), "p@ss word");
    EXPECT_EQ(ctx.body(), "user=alice&pass=p%40ss+word");
}

TEST_F(RequestContextTest, FormWithWrongContentTypeIs400) {
    const RequestContext ctx(make_request(http::verb::post, "/login", "{}", "application/json"), {});
    EXPECT_EQ(extract_error([&] { (void)ctx.form(); }, http::status::bad_request),
              routix_error::extract::malformed_body);
}

TEST_F(RequestContextTest, MalformedFormBodyIs400) {
    const RequestContext ctx(make_request(http::verb::post, "/login", "user=alice&pass=%zz",
                                          "application/x-www-form-urlencoded"), {});
    EXPECT_EQ(extract_error([&] { (void)ctx.form(); }, http::status::bad_request),
              routix_error::extract::malformed_body);
}

TEST_F(RequestContextTest, MalformedQueryHasNoParameters) {
    const auto ctx = context("/search?q=%zz&page=2");
    EXPECT_FALSE(ctx.queryParam("q"));
    EXPECT_FALSE(ctx.queryParam("page"));
}

TEST_F(RequestContextTest, TakeBodyMovesPayloadOut) {
    RequestContext ctx(make_request(http::verb::post, "/upload", "payload", "text/plain"), {});
    EXPECT_EQ(ctx.take_body(), "payload");
    EXPECT_TRUE(ctx.body().empty());
}

TEST_F(RequestContextTest, Extensions) {
    struct Session {
        std::string user;
    };

    auto ctx = context("/");
    EXPECT_EQ(ctx.extensions().get<Session>(), nullptr);
    EXPECT_EQ(extract_error([&] { (void)ctx.extension<Session>(); }, http::status::internal_server_error),
              routix_error::extract::missing_extension);

    ctx.extensions().insert(Session{"alice"});
    ctx.extensions().insert(7);
    EXPECT_EQ(ctx.extension<Session>().user, "alice");
    EXPECT_EQ(*ctx.extensions().get<int>(), 7);
    EXPECT_EQ(ctx.extensions().size(), 2u);

    ctx.extensions().insert(Session{"bob"});
    EXPECT_EQ(ctx.extension<Session>().user, "bob");
    EXPECT_EQ(ctx.extensions().size(), 2u);

    EXPECT_TRUE(ctx.extensions().remove<int>());
    EXPECT_FALSE(ctx.extensions().contains<int>());
}

TEST_F(RequestContextTest, ResponseHelpers) {
    auto ctx = context("/");
    ctx.json(http::status::created, R"({"id":1})");
    EXPECT_EQ(ctx.response().result(), http::status::created);
    EXPECT_EQ(ctx.response()[http::field::content_type], "application/json;charset=UTF-8");
    EXPECT_EQ(ctx.response().body(), R"({"id":1})");

    ctx.string("plain");
    EXPECT_EQ(ctx.response().result(), http::status::ok);
    EXPECT_EQ(ctx.response()[http::field::content_type], "text/plain;charset=UTF-8");
}
