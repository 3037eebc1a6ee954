#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <boost/uuid/string_generator.hpp>

#include <routix/routing/map.hpp>
#include <routix/routing/map_adapter.hpp>
#include <routix/routing/parameter_set.hpp>

using namespace routix;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

TEST(ParameterSetTest, TypedAccess) {
    const boost::uuids::uuid id = boost::uuids::string_generator()("a8098c1a-f86e-11da-bd1a-00112444be1e");
    const RouteValues values{
        {"year", RouteValue(std::int64_t{2024})},
        {"ratio", RouteValue(1.5)},
        {"slug", RouteValue(std::string("hello"))},
        {"flag", RouteValue(std::string("true"))},
        {"count", RouteValue(std::string("12"))},
        {"id", RouteValue(id)},
        {"tags", RouteValue(std::vector<std::string>{"a", "b"})},
    };
    const ParameterSet params(values);

    EXPECT_EQ(params.get<int>("year"), 2024);
    EXPECT_EQ(params.get<std::int64_t>("year"), 2024);
    EXPECT_DOUBLE_EQ(params.get<double>("year"), 2024.0);
    EXPECT_DOUBLE_EQ(params.get<double>("ratio"), 1.5);
    EXPECT_EQ(params.get<std::string>("slug"), "hello");
    EXPECT_EQ(params.get<std::string>("year"), "2024");
    EXPECT_TRUE(params.get<bool>("flag"));
    EXPECT_EQ(params.get<int>("count"), 12);
    EXPECT_EQ(params.get<boost::uuids::uuid>("id"), id);
    EXPECT_THAT(params.get<std::vector<std::string>>("tags"), ElementsAre("a", "b"));
    EXPECT_THAT(params.get<std::vector<std::string>>("slug"), ElementsAre("hello"));
}

TEST(ParameterSetTest, MissingAndInvalidValues) {
    const RouteValues values{
        {"slug", RouteValue(std::string("hello"))},
        {"none", RouteValue()},
    };
    const ParameterSet params(values);

    EXPECT_TRUE(params.contains("none"));
    EXPECT_EQ(params.find("none"), nullptr);

    try {
        (void) params.get<int>("missing");
        FAIL() << "expected BadRequestError";
    } catch (const BadRequestError& e) {
        EXPECT_STREQ(e.what(), "Missing required parameter: missing");
    }

    try {
        (void) params.get<int>("slug");
        FAIL() << "expected BadRequestError";
    } catch (const BadRequestError& e) {
        EXPECT_THAT(e.what(), HasSubstr("Parameter 'slug' with value 'hello' is not a valid integer."));
    }

    EXPECT_THROW((void) params.get<bool>("slug"), BadRequestError);
    EXPECT_THROW((void) params.get<boost::uuids::uuid>("slug"), BadRequestError);
}

TEST(ParameterSetTest, OptionalAndDefault) {
    const RouteValues values{{"page", RouteValue(std::int64_t{3})}};
    const ParameterSet params(values);

    EXPECT_EQ(params.get_optional<int>("page"), 3);
    EXPECT_EQ(params.get_optional<int>("missing"), std::nullopt);
    EXPECT_EQ(params.get_or_default<std::int64_t>("page", 1), 3);
    EXPECT_EQ(params.get_or_default<std::int64_t>("missing", 1), 1);
    EXPECT_EQ(params.get_or_default<std::string>("missing", "none"), "none");
}

TEST(ParameterSetTest, ReadsMatchedValues) {
    Map map({Rule("/blog/<int:year>/<slug>", {.endpoint = "post"})});
    const MatchResult result = map.bind("example.org").match("/blog/2024/hello-world");
    ASSERT_TRUE(result.is_match());

    const ParameterSet params = result.matched().params();
    EXPECT_EQ(params.get<int>("year"), 2024);
    EXPECT_EQ(params.get<std::string>("slug"), "hello-world");
    EXPECT_THROW((void) params.get<int>("slug"), BadRequestError);
}

TEST(ParameterSetTest, DefaultsAreReadable) {
    Map map({Rule("/page", {.endpoint = "page", .defaults = {{"number", RouteValue(std::int64_t{1})}}})});
    const MatchResult result = map.bind("example.org").match("/page");
    ASSERT_TRUE(result.is_match());
    EXPECT_EQ(result.matched().params().get<int>("number"), 1);
    EXPECT_EQ(result.matched().params().get_or_default<int>("missing", 9), 9);
}
