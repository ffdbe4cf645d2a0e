//
// Created by Aiziboy on 2025/12/11.
//

#include <gtest/gtest.h>

#include <routix/utils/param_parser.hpp>
#include <routix/utils/url_codec.hpp>

TEST(UrlCodecTest, StripQueryRemovesQueryAndFragment) {
    EXPECT_EQ(url_codec::strip_query("/users/7?x=1#top"), "/users/7");
    EXPECT_EQ(url_codec::strip_query("/users/7#top"), "/users/7");
    EXPECT_EQ(url_codec::strip_query("/users/7"), "/users/7");
    EXPECT_EQ(url_codec::strip_query("?only=query"), "");
}

TEST(UrlCodecTest, QueryStringStopsAtFragment) {
    EXPECT_EQ(url_codec::query_string("/a?x=1&y=2#frag"), "x=1&y=2");
    EXPECT_EQ(url_codec::query_string("/a?"), "");
    EXPECT_EQ(url_codec::query_string("/a"), "");
}

TEST(UrlCodecTest, SplitPathSkipsEmptySegments) {
    const auto segments = url_codec::split_path("//a//b/c/");
    ASSERT_EQ(segments.size(), 3u);
    EXPECT_EQ(segments[0].raw, "a");
    EXPECT_EQ(segments[1].raw, "b");
    EXPECT_EQ(segments[2].raw, "c");
    EXPECT_EQ(segments[1].offset, 5u);
    EXPECT_TRUE(url_codec::split_path("/").empty());
    EXPECT_TRUE(url_codec::split_path("").empty());
}

TEST(UrlCodecTest, DecodesPercentEscapes) {
    EXPECT_EQ(url_codec::url_decode("hello%20world"), "hello world");
    EXPECT_EQ(url_codec::url_decode("%E4%BD%A0%e5%a5%bd"), "\xE4\xBD\xA0\xE5\xA5\xBD");
    EXPECT_EQ(url_codec::url_decode("a%2Fb"), "a/b");
}

TEST(UrlCodecTest, PlusIsSpaceOnlyWhenRequested) {
    EXPECT_EQ(url_codec::url_decode("a+b"), "a+b");
    EXPECT_EQ(url_codec::url_decode("a+b", true), "a b");
}

TEST(UrlCodecTest, MalformedEscapesAreKept) {
    EXPECT_EQ(url_codec::url_decode("100%"), "100%");
    EXPECT_EQ(url_codec::url_decode("%zz"), "%zz");
    EXPECT_EQ(url_codec::url_decode("%4"), "%4");
}

TEST(UrlCodecTest, ParseParamsKeepsRepeatedKeysInOrder) {
    routix::QueryParams params;
    ASSERT_TRUE(url_codec::parse_params("tag=a&name=John+Doe&tag=b&flag&&empty=", params));

    ASSERT_TRUE(params.contains("tag"));
    EXPECT_EQ(params.at("tag"), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(params.at("name").front(), "John Doe");
    EXPECT_EQ(params.at("flag").front(), "");
    EXPECT_EQ(params.at("empty").front(), "");
    EXPECT_EQ(params.size(), 4u);
}

TEST(UrlCodecTest, ParseParamsDecodesEscapes) {
    routix::QueryParams params;
    ASSERT_TRUE(url_codec::parse_params("q=%E4%BD%A0%E5%A5%BD&path=%2Fa%2Fb&sum=1%2B1", params));
    EXPECT_EQ(params.at("q").front(), "\xE4\xBD\xA0\xE5\xA5\xBD");
    EXPECT_EQ(params.at("path").front(), "/a/b");
    EXPECT_EQ(params.at("sum").front(), "1+1");
}

TEST(UrlCodecTest, ParseParamsRejectsMalformedEscapes) {
    routix::QueryParams params;
    EXPECT_FALSE(url_codec::parse_params("a=1&b=%zz", params));
    EXPECT_FALSE(url_codec::parse_params("a=100%", params));
    EXPECT_TRUE(params.empty());
}

TEST(UrlCodecTest, ValidatesUtf8) {
    EXPECT_TRUE(url_codec::is_valid_utf8("plain ascii"));
    EXPECT_TRUE(url_codec::is_valid_utf8("\xE4\xBD\xA0\xE5\xA5\xBD"));
    EXPECT_TRUE(url_codec::is_valid_utf8("\xF0\x9F\x98\x80"));
    EXPECT_FALSE(url_codec::is_valid_utf8("\xFF"));
    EXPECT_FALSE(url_codec::is_valid_utf8("\xC0\xAF"));         // 超长编码
    EXPECT_FALSE(url_codec::is_valid_utf8("\xED\xA0\x80"));     // 代理区
    EXPECT_FALSE(url_codec::is_valid_utf8("\xE4\xBD"));         // 截断
}

TEST(ParamParserTest, ParsesNumbersStrictly) {
    EXPECT_EQ(param_parser::tryParse<int>("42"), 42);
    EXPECT_EQ(param_parser::tryParse<int>("-7"), -7);
    EXPECT_FALSE(param_parser::tryParse<int>("42abc"));
    EXPECT_FALSE(param_parser::tryParse<int>(""));
    EXPECT_FALSE(param_parser::tryParse<std::uint8_t>("300"));
    EXPECT_DOUBLE_EQ(*param_parser::tryParse<double>("2.5"), 2.5);
}

TEST(ParamParserTest, ParsesBooleans) {
    EXPECT_EQ(param_parser::tryParse<bool>("TRUE"), true);
    EXPECT_EQ(param_parser::tryParse<bool>("0"), false);
    EXPECT_FALSE(param_parser::tryParse<bool>("yes"));
}
