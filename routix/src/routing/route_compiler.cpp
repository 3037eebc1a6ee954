#include <routix/routing/route_compiler.hpp>

#include <cctype>

#include <boost/regex.hpp>

#include <routix/error/routix_error.hpp>
#include <routix/utils/param_parser.hpp>

namespace routix {

namespace {

    bool is_ident_start(char c) noexcept {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
    }

    bool is_ident_char(char c) noexcept {
        return is_ident_start(c) || (c >= '0' && c <= '9');
    }

    /// 从 pos 开始读取一个标识符，读不到时返回空
    std::string_view read_ident(std::string_view rule, std::size_t& pos) {
        const std::size_t start = pos;
        if (pos < rule.size() && is_ident_start(rule[pos])) {
            ++pos;
            while (pos < rule.size() && is_ident_char(rule[pos])) ++pos;
        }
        return rule.substr(start, pos - start);
    }

    [[noreturn]] void malformed(std::string_view rule) {
        throw RuleSyntaxError("malformed url rule: '" + std::string(rule) + "'");
    }

    std::string_view trim(std::string_view s) noexcept {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
        return s;
    }

} // namespace

// --- 1. 词法分析 ---

std::vector<RuleToken> tokenize_rule(std::string_view rule) {
    std::vector<RuleToken> tokens;
    std::size_t pos = 0;

    while (pos < rule.size()) {
        const char c = rule[pos];

        if (c == '/') {
            tokens.push_back({RuleToken::Kind::slash, "/", {}, {}, {}});
            ++pos;
            continue;
        }

        if (c != '<') {
            const std::size_t end = rule.find_first_of("</", pos);
            const std::size_t stop = end == std::string_view::npos ? rule.size() : end;
            tokens.push_back({RuleToken::Kind::static_text, std::string(rule.substr(pos, stop - pos)), {}, {}, {}});
            pos = stop;
            continue;
        }

        // <converter(args):name> 或 <name>
        ++pos;
        RuleToken token;
        token.kind = RuleToken::Kind::variable;
        const std::string_view first = read_ident(rule, pos);
        if (first.empty() || pos >= rule.size()) malformed(rule);

        if (rule[pos] == '>') {
            token.name = std::string(first);
            ++pos;
            tokens.push_back(std::move(token));
            continue;
        }

        token.converter = std::string(first);
        if (rule[pos] == '(') {
            const std::size_t close = rule.find(')', pos + 1);
            if (close == std::string_view::npos) malformed(rule);
            token.arguments = std::string(rule.substr(pos + 1, close - pos - 1));
            pos = close + 1;
        }
        if (pos >= rule.size() || rule[pos] != ':') malformed(rule);
        ++pos;

        const std::string_view name = read_ident(rule, pos);
        if (name.empty() || pos >= rule.size() || rule[pos] != '>') malformed(rule);
        token.name = std::string(name);
        ++pos;
        tokens.push_back(std::move(token));
    }
    return tokens;
}

// --- 2. 转换器参数 ---

ConverterArgs parse_converter_args(std::string_view text) {
    ConverterArgs out;
    if (trim(text).empty()) {
        return out;
    }

    static const boost::regex item_re(
        R"(\s*(?:(\w+)\s*=\s*)?)"
        R"((True|False|-?\d+\.\d+|\d+\.|-?\d+|[\w.]+|[urUR]?("[^"]*?"|'[^']*'))\s*,)");

    const std::string input = std::string(text) + ",";
    auto it = input.cbegin();
    boost::smatch m;
    while (it != input.cend()) {
        if (!boost::regex_search(it, input.cend(), m, item_re, boost::match_continuous)) {
            throw RuleSyntaxError("cannot parse converter argument '" + std::string(it, input.cend() - 1) + "'");
        }
        // 带引号的字符串使用去掉前缀的部分
        const std::string raw = m[3].matched ? m[3].str() : m[2].str();
        RouteValue value = param_parser::parseLiteral(raw);
        if (m[1].matched) {
            out.kwargs[m[1].str()] = std::move(value);
        } else {
            out.args.push_back(std::move(value));
        }
        it = m[0].second;
        // 允许末尾逗号：剩下的只有补上的 ','
        const std::string_view rest(input.data() + (it - input.cbegin()), static_cast<std::size_t>(input.cend() - it));
        if (rest.find_first_not_of(" \t,") == std::string_view::npos) {
            break;
        }
    }
    return out;
}

std::string regex_escape(std::string_view text) {
    static constexpr std::string_view kSpecial = R"(.^$|()[]{}*+?\#-)";
    std::string out;
    out.reserve(text.size() * 2);
    for (const char c : text) {
        if (kSpecial.find(c) != std::string_view::npos) {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

// --- 3. 编译 ---

CompiledTemplate compile_template(std::string_view rule, const ConverterResolver& resolve) {
    CompiledTemplate compiled;

    // 当前段的状态
    std::string content;
    bool is_static = true;
    bool final = false;
    int group_number = 0;
    std::vector<std::pair<int, int>> static_weights;
    std::vector<int> argument_weights;
    std::vector<ConverterPtr> converters;
    std::string signature;

    auto make_weight = [&]() {
        Weighting w;
        w.final_rank = final ? 1 : 0;
        w.static_count = -static_cast<int>(static_weights.size());
        w.static_weights = static_weights;
        w.argument_count = -static_cast<int>(argument_weights.size());
        w.argument_weights = argument_weights;
        return w;
    };

    auto reset = [&]() {
        content.clear();
        is_static = true;
        final = false;
        group_number = 0;
        static_weights.clear();
        argument_weights.clear();
        converters.clear();
        signature.clear();
    };

    for (const auto& token : tokenize_rule(rule)) {
        switch (token.kind) {
            case RuleToken::Kind::static_text: {
                static_weights.emplace_back(static_cast<int>(static_weights.size()), -static_cast<int>(token.text.size()));
                compiled.trace.push_back({false, token.text});
                content += is_static ? token.text : regex_escape(token.text);
                break;
            }
            case RuleToken::Kind::variable: {
                if (is_static) {
                    // 从这里开始 content 是正则，之前的静态文本需要转义
                    content = regex_escape(content);
                }
                is_static = false;

                const std::string converter_name = token.converter.empty() ? "default" : token.converter;
                ConverterPtr converter = resolve(converter_name, parse_converter_args(token.arguments));
                if (!converter->part_isolating()) {
                    final = true;
                }

                content += "(?<rv" + std::to_string(group_number++) + ">" + converter->regex() + ")";
                argument_weights.push_back(converter->weight());
                signature += converter_name + "(" + token.arguments + ");";
                converters.push_back(converter);
                compiled.converters.emplace_back(token.name, std::move(converter));
                compiled.trace.push_back({true, token.name});
                break;
            }
            case RuleToken::Kind::slash: {
                compiled.trace.push_back({false, "/"});
                if (final) {
                    content += "/";
                    break;
                }
                RulePart part;
                part.content = std::move(content);
                part.final = false;
                part.is_static = is_static;
                part.weight = make_weight();
                part.converters = converters;
                part.converter_signature = signature;
                compiled.parts.push_back(std::move(part));
                reset();
                break;
            }
        }
    }

    bool suffixed = false;
    if (final && !content.empty() && content.back() == '/') {
        // 能匹配 '/' 的转换器后面跟着 '/'：末尾斜杠可有可无，单独捕获以便后续做斜杠重定向
        suffixed = true;
        content.pop_back();
        content += "(?<!/)(?<rsfx>/?)";
    }

    RulePart last;
    last.content = std::move(content);
    last.final = final;
    last.is_static = is_static;
    last.suffixed = suffixed;
    last.weight = make_weight();
    last.converters = converters;
    last.converter_signature = signature;
    compiled.parts.push_back(last);

    if (suffixed) {
        RulePart tail;
        tail.weight = last.weight;
        compiled.parts.push_back(std::move(tail));
    }
    return compiled;
}

} // namespace routix
