#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <stdexcept>

#include <boost/uuid/uuid_io.hpp>

#include <routix/error/routix_error.hpp>
#include <routix/routing/map.hpp>
#include <routix/routing/map_adapter.hpp>

#include "test_support.hpp"

using namespace routix;
using routix::test::endpoint_of;
using routix::test::int_value;
using routix::test::redirect_of;
using ::testing::ElementsAre;

namespace {

    // 只接受 yes / no 的自定义转换器
    class YesNoConverter final : public Converter {
    public:
        YesNoConverter() : Converter("(?:yes|no)") {}

        RouteValue to_value(std::string_view text) const override {
            return text == "yes";
        }

        std::string to_url(const RouteValue& value) const override {
            return std::get<bool>(value) ? "yes" : "no";
        }
    };

    // 转换时抛出非 ValidationError 的转换器
    class FailingConverter final : public Converter {
    public:
        FailingConverter() : Converter("[^/]+") {}

        RouteValue to_value(std::string_view) const override {
            throw std::logic_error("to_value failed");
        }

        std::string to_url(const RouteValue&) const override {
            throw std::logic_error("to_url failed");
        }
    };

} // namespace

// --- 1. 基本匹配 ---

TEST(MatchingTest, BasicRouting) {
    Map map({
        Rule("/", {.endpoint = "index"}),
        Rule("/foo", {.endpoint = "foo"}),
        Rule("/bar/", {.endpoint = "bar"}),
    });
    const MapAdapter adapter = map.bind("example.org");

    EXPECT_EQ(endpoint_of(adapter.match("/")), "index");
    EXPECT_EQ(endpoint_of(adapter.match("/foo")), "foo");
    EXPECT_EQ(endpoint_of(adapter.match("/bar/")), "bar");

    const MatchResult redirect = adapter.match("/bar");
    EXPECT_EQ(redirect_of(redirect), "http://example.org/bar/");
    EXPECT_EQ(redirect.status_code(), 308);
    EXPECT_EQ(redirect.error_code(), routix_error::routing::request_redirect);

    const MatchResult missing = adapter.match("/blub");
    EXPECT_TRUE(missing.is<NotFound>());
    EXPECT_EQ(missing.status_code(), 404);
    EXPECT_EQ(missing.error_code(), routix_error::routing::not_found);
}

TEST(MatchingTest, EmptyPathRedirectsToRoot) {
    Map map({Rule("/", {.endpoint = "index"}), Rule("/foo", {.endpoint = "foo"})});
    const MapAdapter adapter = map.bind("example.org");
    EXPECT_EQ(redirect_of(adapter.match("")), "http://example.org/");
}

TEST(MatchingTest, MatchUsesBoundPathInfo) {
    Map map({Rule("/foo", {.endpoint = "foo"})});
    const MapAdapter adapter = map.bind("example.org", {.path_info = "/foo"});
    EXPECT_EQ(endpoint_of(adapter.match()), "foo");
}

TEST(MatchingTest, MatchedCarriesRuleAndStatus) {
    Map map({Rule("/user/<int:id>", {.endpoint = "user"})});
    const MapAdapter adapter = map.bind("example.org");

    const MatchResult result = adapter.match("/user/42");
    ASSERT_TRUE(result.is_match());
    EXPECT_EQ(result.status_code(), 200);
    EXPECT_FALSE(result.error_code());
    EXPECT_EQ(result.matched().rule->rule(), "/user/<int:id>");
    EXPECT_EQ(std::get<std::int64_t>(result.matched().values.at("id")), 42);
}

// --- 2. 优先级 ---

TEST(MatchingTest, StaticBeatsDynamic) {
    Map map({
        Rule("/a/<x>", {.endpoint = "dynamic"}),
        Rule("/a/fixed", {.endpoint = "fixed"}),
    });
    const MapAdapter adapter = map.bind("example.org");

    EXPECT_EQ(endpoint_of(adapter.match("/a/fixed")), "fixed");
    const MatchResult other = adapter.match("/a/other");
    ASSERT_TRUE(other.is_match());
    EXPECT_EQ(other.matched().endpoint, "dynamic");
    EXPECT_EQ(std::get<std::string>(other.matched().values.at("x")), "other");
}

TEST(MatchingTest, IntegerConverterTriedBeforeString) {
    Map map({
        Rule("/<name>", {.endpoint = "by_name"}),
        Rule("/<int:id>", {.endpoint = "by_id"}),
    });
    const MapAdapter adapter = map.bind("example.org");

    const MatchResult numeric = adapter.match("/42");
    ASSERT_TRUE(numeric.is_match());
    EXPECT_EQ(numeric.matched().endpoint, "by_id");
    EXPECT_EQ(std::get<std::int64_t>(numeric.matched().values.at("id")), 42);

    EXPECT_EQ(endpoint_of(adapter.match("/abc")), "by_name");
}

TEST(MatchingTest, PathConverterIsTriedLast) {
    Map map({
        Rule("/files/<path:name>", {.endpoint = "files"}),
        Rule("/files/<name>/edit", {.endpoint = "edit"}),
    });
    const MapAdapter adapter = map.bind("example.org");

    const MatchResult nested = adapter.match("/files/a/b/c");
    ASSERT_TRUE(nested.is_match());
    EXPECT_EQ(nested.matched().endpoint, "files");
    EXPECT_EQ(std::get<std::string>(nested.matched().values.at("name")), "a/b/c");

    const MatchResult edit = adapter.match("/files/x/edit");
    ASSERT_TRUE(edit.is_match());
    EXPECT_EQ(edit.matched().endpoint, "edit");
    EXPECT_EQ(std::get<std::string>(edit.matched().values.at("name")), "x");
}

TEST(MatchingTest, RejectedValueFallsBackToNextCandidate) {
    Map map({
        Rule("/<int(max=10):n>", {.endpoint = "small"}),
        Rule("/<int:n>", {.endpoint = "big"}),
    });
    const MapAdapter adapter = map.bind("example.org");

    EXPECT_EQ(endpoint_of(adapter.match("/5")), "small");
    EXPECT_EQ(endpoint_of(adapter.match("/50")), "big");
}

// --- 3. 方法 ---

TEST(MatchingTest, MethodNotAllowedListsAllowedMethods) {
    Map map({
        Rule("/a", {.endpoint = "a_get", .methods = MethodSet{"get"}}),
        Rule("/a", {.endpoint = "a_post", .methods = MethodSet{"POST"}}),
    });
    const MapAdapter adapter = map.bind("example.org");

    EXPECT_EQ(endpoint_of(adapter.match("/a", "GET")), "a_get");
    EXPECT_EQ(endpoint_of(adapter.match("/a", "post")), "a_post");
    // GET 隐含 HEAD
    EXPECT_EQ(endpoint_of(adapter.match("/a", "HEAD")), "a_get");

    const MatchResult result = adapter.match("/a", "PUT");
    ASSERT_TRUE(result.is<MethodNotAllowed>());
    EXPECT_THAT(result.as<MethodNotAllowed>()->allowed, ElementsAre("GET", "HEAD", "POST"));
    EXPECT_EQ(result.status_code(), 405);

    EXPECT_THAT(adapter.allowed_methods("/a"), ElementsAre("GET", "HEAD", "POST"));
    EXPECT_TRUE(adapter.allowed_methods("/nope").empty());
}

TEST(MatchingTest, DefaultMethodFromBind) {
    Map map({
        Rule("/form", {.endpoint = "show", .methods = MethodSet{"GET"}}),
        Rule("/form", {.endpoint = "submit", .methods = MethodSet{"POST"}}),
    });
    EXPECT_EQ(endpoint_of(map.bind("example.org").match("/form")), "show");
    EXPECT_EQ(endpoint_of(map.bind("example.org", {.default_method = "post"}).match("/form")), "submit");
}

TEST(MatchingTest, TestReportsMatchesAndRedirects) {
    Map map({Rule("/a", {.endpoint = "a"}), Rule("/b/", {.endpoint = "b"})});
    const MapAdapter adapter = map.bind("example.org");

    EXPECT_TRUE(adapter.test("/a"));
    EXPECT_TRUE(adapter.test("/b"));
    EXPECT_FALSE(adapter.test("/c"));
}

// --- 4. 转换器 ---

TEST(MatchingTest, BuiltinConverters) {
    Map map({
        Rule("/f/<float:x>", {.endpoint = "float"}),
        Rule("/u/<uuid:id>", {.endpoint = "uuid"}),
        Rule("/<any(about, help):page>", {.endpoint = "any"}),
        Rule("/lang/<string(length=2):code>", {.endpoint = "lang"}),
        Rule("/year/<int(fixed_digits=4):y>", {.endpoint = "year"}),
    });
    const MapAdapter adapter = map.bind("example.org");

    const MatchResult f = adapter.match("/f/1.5");
    ASSERT_TRUE(f.is_match());
    EXPECT_DOUBLE_EQ(std::get<double>(f.matched().values.at("x")), 1.5);
    EXPECT_TRUE(adapter.match("/f/1").is<NotFound>());

    const MatchResult u = adapter.match("/u/a8098c1a-f86e-11da-bd1a-00112444be1e");
    ASSERT_TRUE(u.is_match());
    EXPECT_EQ(boost::uuids::to_string(std::get<boost::uuids::uuid>(u.matched().values.at("id"))),
              "a8098c1a-f86e-11da-bd1a-00112444be1e");

    EXPECT_EQ(endpoint_of(adapter.match("/about")), "any");
    EXPECT_EQ(endpoint_of(adapter.match("/help")), "any");
    EXPECT_TRUE(adapter.match("/other").is<NotFound>());

    EXPECT_EQ(endpoint_of(adapter.match("/lang/de")), "lang");
    EXPECT_TRUE(adapter.match("/lang/deu").is<NotFound>());

    EXPECT_EQ(endpoint_of(adapter.match("/year/2024")), "year");
    EXPECT_TRUE(adapter.match("/year/24").is<NotFound>());
}

TEST(MatchingTest, CustomConverter) {
    Map map;
    map.add_converter("yesno", [](const ConverterArgs&) -> ConverterPtr {
        return std::make_shared<YesNoConverter>();
    });
    map.add(Rule("/flag/<yesno:on>", {.endpoint = "flag"}));
    const MapAdapter adapter = map.bind("example.org");

    const MatchResult result = adapter.match("/flag/yes");
    ASSERT_TRUE(result.is_match());
    EXPECT_TRUE(std::get<bool>(result.matched().values.at("on")));
    EXPECT_TRUE(adapter.match("/flag/maybe").is<NotFound>());

    EXPECT_EQ(adapter.build("flag", {{"on", false}}), "/flag/no");
}

TEST(MatchingTest, ConverterErrorsOtherThanValidationPropagate) {
    Map map;
    map.add_converter("failing", [](const ConverterArgs&) -> ConverterPtr {
        return std::make_shared<FailingConverter>();
    });
    map.add(Rule("/b/<failing:x>", {.endpoint = "b"}));
    const MapAdapter adapter = map.bind("example.org");

    EXPECT_THROW((void) adapter.match("/b/1"), std::logic_error);
    EXPECT_THROW((void) adapter.build("b", {{"x", RouteValue(std::string("1"))}}), std::logic_error);
}

TEST(MatchingTest, DefaultsAreMergedIntoValues) {
    Map map({Rule("/list", {.endpoint = "list", .defaults = {{"page", int_value(1)}}})});
    const MatchResult result = map.bind("example.org").match("/list");
    ASSERT_TRUE(result.is_match());
    EXPECT_EQ(std::get<std::int64_t>(result.matched().values.at("page")), 1);
}

// --- 5. 绑定期错误 ---

TEST(MatchingTest, InvalidRulesAreRejected) {
    Map map;
    EXPECT_THROW(map.add(Rule("no-slash", {.endpoint = "x"})), RoutingSyntaxError);
    EXPECT_THROW(map.add(Rule("//double", {.endpoint = "x"})), RoutingSyntaxError);
    EXPECT_THROW(map.add(Rule("/<nope:x>", {.endpoint = "x"})), RuleSyntaxError);
    EXPECT_THROW(map.add(Rule("/<int(digits=3):x>", {.endpoint = "x"})), RuleSyntaxError);
    EXPECT_THROW(map.add(Rule("/<a>/<a>", {.endpoint = "x"})), RuleSyntaxError);
    EXPECT_EQ(map.size(), 0u);
}

TEST(MatchingTest, DuplicateRules) {
    Map map({Rule("/x/<int:n>", {.endpoint = "x"})});
    EXPECT_THROW(map.add(Rule("/x/<int:n>", {.endpoint = "other"})), DuplicateRuleError);
    EXPECT_EQ(map.size(), 1u);

    // 方法不重叠时不算重复
    Map by_method({Rule("/y", {.endpoint = "get", .methods = MethodSet{"GET"}})});
    EXPECT_NO_THROW(by_method.add(Rule("/y", {.endpoint = "post", .methods = MethodSet{"POST"}})));
    EXPECT_THROW(by_method.add(Rule("/y", {.endpoint = "any"})), DuplicateRuleError);

    // 只用于构建的规则不参与检测
    EXPECT_NO_THROW(map.add(Rule("/x/<int:n>", {.endpoint = "legacy", .build_only = true})));
}

TEST(MatchingTest, BuildOnlyRulesNeverMatch) {
    Map map({Rule("/static/<path:file>", {.endpoint = "static", .build_only = true})});
    const MapAdapter adapter = map.bind("example.org");
    EXPECT_TRUE(adapter.match("/static/app.js").is<NotFound>());
    EXPECT_EQ(adapter.build("static", {{"file", "app.js"}}), "/static/app.js");
}

TEST(MatchingTest, IterRules) {
    Map map({
        Rule("/a", {.endpoint = "a"}),
        Rule("/b", {.endpoint = "b"}),
        Rule("/b/<int:n>", {.endpoint = "b"}),
    });
    const auto all = map.iter_rules();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0]->rule(), "/a");
    EXPECT_EQ(all[2]->id(), 2u);

    // 同一 endpoint 内变量多的规则排在前面
    const auto b = map.iter_rules("b");
    ASSERT_EQ(b.size(), 2u);
    EXPECT_EQ(b[0]->rule(), "/b/<int:n>");
    EXPECT_TRUE(map.iter_rules("missing").empty());
}
