#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <routix/error/routix_error.hpp>
#include <routix/routing/route_compiler.hpp>

using namespace routix;

namespace {

    CompiledTemplate compile(std::string_view rule) {
        static const ConverterRegistry registry = default_converters();
        const ConverterResolver resolve = [](std::string_view name, const ConverterArgs& args) -> ConverterPtr {
            const auto it = registry.find(name);
            if (it == registry.end()) {
                throw RuleSyntaxError("unknown converter " + std::string(name));
            }
            return it->second(args);
        };
        return compile_template(rule, resolve);
    }

} // namespace

// --- 1. 词法分析 ---

TEST(TokenizeRuleTest, SplitsSlashesStaticsAndVariables) {
    const auto tokens = tokenize_rule("/blog/<int(fixed_digits=4):year>/<slug>");
    ASSERT_EQ(tokens.size(), 6u);

    EXPECT_EQ(tokens[0].kind, RuleToken::Kind::slash);
    EXPECT_EQ(tokens[1].kind, RuleToken::Kind::static_text);
    EXPECT_EQ(tokens[1].text, "blog");
    EXPECT_EQ(tokens[2].kind, RuleToken::Kind::slash);

    EXPECT_EQ(tokens[3].kind, RuleToken::Kind::variable);
    EXPECT_EQ(tokens[3].converter, "int");
    EXPECT_EQ(tokens[3].arguments, "fixed_digits=4");
    EXPECT_EQ(tokens[3].name, "year");

    EXPECT_EQ(tokens[5].kind, RuleToken::Kind::variable);
    EXPECT_TRUE(tokens[5].converter.empty());
    EXPECT_EQ(tokens[5].name, "slug");
}

TEST(TokenizeRuleTest, StaticTextAroundVariableInOneSegment) {
    const auto tokens = tokenize_rule("/v<int:n>.json");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[1].text, "v");
    EXPECT_EQ(tokens[2].name, "n");
    EXPECT_EQ(tokens[3].text, ".json");
}

TEST(TokenizeRuleTest, RejectsMalformedPlaceholders) {
    EXPECT_THROW(tokenize_rule("/<int:>"), RuleSyntaxError);
    EXPECT_THROW(tokenize_rule("/<foo"), RuleSyntaxError);
    EXPECT_THROW(tokenize_rule("/<int(4:x>"), RuleSyntaxError);
    EXPECT_THROW(tokenize_rule("/<1abc>"), RuleSyntaxError);
    EXPECT_THROW(tokenize_rule("/<int:x"), RuleSyntaxError);
}

// --- 2. 转换器参数 ---

TEST(ParseConverterArgsTest, LiteralsAndKeywords) {
    const auto parsed = parse_converter_args(R"(1, 'foo', bar=True, baz=None, x="y", 2.5, -3,)");

    ASSERT_EQ(parsed.args.size(), 4u);
    EXPECT_EQ(std::get<std::int64_t>(parsed.args[0]), 1);
    EXPECT_EQ(std::get<std::string>(parsed.args[1]), "foo");
    EXPECT_DOUBLE_EQ(std::get<double>(parsed.args[2]), 2.5);
    EXPECT_EQ(std::get<std::int64_t>(parsed.args[3]), -3);

    ASSERT_EQ(parsed.kwargs.size(), 3u);
    EXPECT_TRUE(std::get<bool>(parsed.kwargs.at("bar")));
    EXPECT_TRUE(is_none(parsed.kwargs.at("baz")));
    EXPECT_EQ(std::get<std::string>(parsed.kwargs.at("x")), "y");
}

TEST(ParseConverterArgsTest, BareWords) {
    const auto parsed = parse_converter_args("about, help");
    ASSERT_EQ(parsed.args.size(), 2u);
    EXPECT_EQ(std::get<std::string>(parsed.args[0]), "about");
    EXPECT_EQ(std::get<std::string>(parsed.args[1]), "help");
}

TEST(ParseConverterArgsTest, EmptyAndInvalid) {
    EXPECT_TRUE(parse_converter_args("   ").empty());
    EXPECT_THROW(parse_converter_args("foo bar"), RuleSyntaxError);
    EXPECT_THROW(parse_converter_args("x=("), RuleSyntaxError);
}

TEST(RegexEscapeTest, EscapesMetacharacters) {
    EXPECT_EQ(regex_escape("a.b"), "a\\.b");
    EXPECT_EQ(regex_escape("(x)+"), "\\(x\\)\\+");
    EXPECT_EQ(regex_escape("plain"), "plain");
}

// --- 3. 编译 ---

TEST(CompileTemplateTest, StaticAndDynamicParts) {
    const auto compiled = compile("/foo/<int:id>");
    ASSERT_EQ(compiled.parts.size(), 3u);

    EXPECT_TRUE(compiled.parts[0].is_static);
    EXPECT_EQ(compiled.parts[0].content, "");
    EXPECT_TRUE(compiled.parts[1].is_static);
    EXPECT_EQ(compiled.parts[1].content, "foo");

    const RulePart& dynamic = compiled.parts[2];
    EXPECT_FALSE(dynamic.is_static);
    EXPECT_FALSE(dynamic.final);
    EXPECT_EQ(dynamic.content, "(?<rv0>\\d+)");
    EXPECT_THAT(dynamic.weight.argument_weights, ::testing::ElementsAre(50));
    ASSERT_EQ(compiled.converters.size(), 1u);
    EXPECT_EQ(compiled.converters[0].first, "id");
}

TEST(CompileTemplateTest, TrailingSlashAddsEmptyStaticPart) {
    const auto compiled = compile("/bar/");
    ASSERT_EQ(compiled.parts.size(), 3u);
    EXPECT_EQ(compiled.parts[2].content, "");
    EXPECT_TRUE(compiled.parts[2].is_static);
}

TEST(CompileTemplateTest, PathConverterMakesFinalSuffixedPart) {
    const auto compiled = compile("/files/<path:p>/");
    ASSERT_EQ(compiled.parts.size(), 4u);

    const RulePart& final_part = compiled.parts[2];
    EXPECT_TRUE(final_part.final);
    EXPECT_TRUE(final_part.suffixed);
    EXPECT_EQ(final_part.content, "(?<rv0>[^/].*?)(?<!/)(?<rsfx>/?)");
    EXPECT_EQ(final_part.weight.final_rank, 1);

    EXPECT_TRUE(compiled.parts[3].is_static);
    EXPECT_EQ(compiled.parts[3].content, "");
}

TEST(CompileTemplateTest, PathConverterAbsorbsRemainingSegments) {
    const auto compiled = compile("/<path:p>/edit");
    ASSERT_EQ(compiled.parts.size(), 2u);
    EXPECT_TRUE(compiled.parts[1].final);
    EXPECT_FALSE(compiled.parts[1].suffixed);
    EXPECT_EQ(compiled.parts[1].content, "(?<rv0>[^/].*?)/edit");
}

TEST(CompileTemplateTest, StaticTextInDynamicSegmentIsEscaped) {
    const auto compiled = compile("/v<int:n>.json");
    ASSERT_EQ(compiled.parts.size(), 2u);
    EXPECT_EQ(compiled.parts[1].content, "v(?<rv0>\\d+)\\.json");
    EXPECT_EQ(compiled.parts[1].weight.static_count, -2);
}

TEST(CompileTemplateTest, TraceKeepsTemplateOrder) {
    const auto compiled = compile("/a/<x>");
    ASSERT_EQ(compiled.trace.size(), 4u);
    EXPECT_FALSE(compiled.trace[1].is_variable);
    EXPECT_EQ(compiled.trace[1].text, "a");
    EXPECT_TRUE(compiled.trace[3].is_variable);
    EXPECT_EQ(compiled.trace[3].text, "x");
}

TEST(CompileTemplateTest, UnknownConverterPropagates) {
    EXPECT_THROW(compile("/<nope:x>"), RuleSyntaxError);
}

TEST(WeightingTest, MoreSpecificSegmentsSortFirst) {
    // 静态文本更多的段优先
    EXPECT_LT(compile("/x<a>").parts[1].weight, compile("/<a>").parts[1].weight);
    // int 比 string 优先
    EXPECT_LT(compile("/<int:a>").parts[1].weight, compile("/<a>").parts[1].weight);
    // final 段永远排在最后
    EXPECT_LT(compile("/<a>").parts[1].weight, compile("/<path:a>").parts[1].weight);
}
