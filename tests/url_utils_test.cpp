#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <routix/utils/param_parser.hpp>
#include <routix/utils/url_utils.hpp>

using namespace routix;
using ::testing::ElementsAre;
using ::testing::Pair;

// --- 编码 / 解码 ---

TEST(UrlUtilsTest, Quote) {
    EXPECT_EQ(url_utils::quote("a b/c"), "a%20b/c");
    EXPECT_EQ(url_utils::quote("a b/c", url_utils::kSegmentSafe), "a%20b%2Fc");
    EXPECT_EQ(url_utils::quote("\xC3\x9C"), "%C3%9C");
    EXPECT_EQ(url_utils::quote("-._~!$&'()*+,;=:@"), "-._~!$&'()*+,;=:@");
    EXPECT_EQ(url_utils::quote("?#%"), "%3F%23%25");
}

TEST(UrlUtilsTest, QuotePlus) {
    EXPECT_EQ(url_utils::quote_plus("a b&c"), "a+b%26c");
    EXPECT_EQ(url_utils::quote_plus("x=1+2"), "x%3D1%2B2");
    EXPECT_EQ(url_utils::quote_plus("/path?q"), "/path?q");
}

TEST(UrlUtilsTest, Unquote) {
    EXPECT_EQ(url_utils::unquote("a%20b+c"), "a b+c");
    EXPECT_EQ(url_utils::unquote("a%20b+c", true), "a b c");
    EXPECT_EQ(url_utils::unquote("%C3%9C"), "\xC3\x9C");
    EXPECT_EQ(url_utils::unquote("100%"), "100%");
    EXPECT_EQ(url_utils::unquote("%zz"), "%zz");
}

// --- 查询串 ---

TEST(UrlUtilsTest, EncodeQuery) {
    const QueryArgs args{{"b", "x y"}, {"a", "1"}, {"b", "2"}};
    EXPECT_EQ(url_utils::encode_query(args), "b=x+y&a=1&b=2");
    EXPECT_EQ(url_utils::encode_query(args, true), "a=1&b=x+y&b=2");
    EXPECT_EQ(url_utils::encode_query({}), "");
}

TEST(UrlUtilsTest, ParseQuery) {
    EXPECT_THAT(url_utils::parse_query("?a=1&b=x+y&&c&d=%26"),
                ElementsAre(Pair("a", "1"), Pair("b", "x y"), Pair("c", ""), Pair("d", "&")));
    EXPECT_TRUE(url_utils::parse_query("").empty());
    EXPECT_TRUE(url_utils::parse_query("a=%zz").empty());
}

TEST(UrlUtilsTest, ToQueryArgs) {
    const RouteValues values{
        {"a", RouteValue(std::int64_t{1})},
        {"b", RouteValue(std::vector<std::string>{"x", "y"})},
        {"c", RouteValue()},
        {"d", RouteValue(true)},
    };
    EXPECT_THAT(url_utils::to_query_args(values),
                ElementsAre(Pair("a", "1"), Pair("b", "x"), Pair("b", "y"), Pair("d", "True")));
}

// --- 主机与 URL ---

TEST(UrlUtilsTest, NormalizeHost) {
    EXPECT_EQ(url_utils::normalize_host("Example.ORG"), "example.org");
    EXPECT_EQ(url_utils::normalize_host("B\xC3\xBC" "cher.DE"), "xn--bcher-kva.de");
    EXPECT_EQ(url_utils::normalize_host(""), "");
    EXPECT_FALSE(url_utils::normalize_host("bad host").has_value());
}

TEST(UrlUtilsTest, Join) {
    EXPECT_EQ(url_utils::join("http://example.org/app/", "other"), "http://example.org/app/other");
    EXPECT_EQ(url_utils::join("http://example.org/app/", "/new"), "http://example.org/new");
    EXPECT_EQ(url_utils::join("http://example.org/app/sub/", "../x"), "http://example.org/app/x");
    EXPECT_EQ(url_utils::join("http://example.org/", "https://other.org/y"), "https://other.org/y");
    EXPECT_FALSE(url_utils::join("not a url", "x").has_value());
}

// --- 路径 ---

TEST(UrlUtilsTest, PathHelpers) {
    EXPECT_EQ(url_utils::merge_slashes("//a///b/"), "/a/b/");
    EXPECT_EQ(url_utils::merge_slashes("/a/b"), "/a/b");
    EXPECT_EQ(url_utils::lstrip("//a/", '/'), "a/");
    EXPECT_EQ(url_utils::rstrip("/a//", '/'), "/a");
    EXPECT_EQ(url_utils::rstrip("///", '/'), "");
}

TEST(ParamParserTest, TryParse) {
    EXPECT_EQ(param_parser::tryParse<int>("42"), 42);
    EXPECT_FALSE(param_parser::tryParse<int>("42x").has_value());
    EXPECT_FALSE(param_parser::tryParse<int>("").has_value());
    EXPECT_EQ(param_parser::tryParse<bool>("TRUE"), true);
    EXPECT_EQ(param_parser::tryParse<bool>("0"), false);
    EXPECT_FALSE(param_parser::tryParse<bool>("yes").has_value());
    EXPECT_TRUE(param_parser::isEquals("Keep-Alive", "keep-alive"));
    EXPECT_TRUE(param_parser::isDigits("0123"));
    EXPECT_FALSE(param_parser::isDigits(""));
}

TEST(ParamParserTest, ParseLiteral) {
    EXPECT_TRUE(is_none(param_parser::parseLiteral("None")));
    EXPECT_EQ(std::get<bool>(param_parser::parseLiteral("True")), true);
    EXPECT_EQ(std::get<std::int64_t>(param_parser::parseLiteral("-12")), -12);
    EXPECT_DOUBLE_EQ(std::get<double>(param_parser::parseLiteral("2.5")), 2.5);
    EXPECT_EQ(std::get<std::string>(param_parser::parseLiteral("'a,b'")), "a,b");
    EXPECT_EQ(std::get<std::string>(param_parser::parseLiteral("bare")), "bare");
    EXPECT_EQ(std::get<std::string>(param_parser::parseLiteral("true")), "true");
}
