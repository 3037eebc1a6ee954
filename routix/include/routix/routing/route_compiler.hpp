#ifndef ROUTIX_ROUTE_COMPILER_HPP
#define ROUTIX_ROUTE_COMPILER_HPP

#include <compare>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <routix/routing/converters.hpp>

/**
 * 规则模板的 “编译器”。
 *
 * 一条规则模板（例如 "/blog/<int:year>/<slug>"）在绑定到 Map 时被编译一次：
 * 按 '/' 切分成若干 RulePart，每个 RulePart 对应状态机中的一条边。
 * 静态段保存原文，动态段保存一个完整的正则（命名分组 rv0, rv1 ... 依次对应段内的变量）。
 * 之后每次请求都直接使用编译结果，不再解析模板字符串。
 */
namespace routix {

    /**
     * @struct RuleToken
     * @brief 模板词法单元：'/'、一段静态文本、或一个 <converter(args):name> 占位符。
     */
    struct RuleToken {
        enum class Kind { slash, static_text, variable };

        Kind kind = Kind::static_text;
        std::string text;        ///< 静态文本
        std::string converter;   ///< 转换器名，未写时为空
        std::string arguments;   ///< 括号内的原始参数文本
        std::string name;        ///< 变量名
    };

    /**
     * @brief 把模板切分成词法单元。
     * @throws RuleSyntaxError 占位符不合法（例如 "<int:>"、缺少 '>'、名字不是标识符）
     */
    std::vector<RuleToken> tokenize_rule(std::string_view rule);

    /**
     * @brief 解析转换器参数，例如 `4, signed=True, name="x"`。
     *
     * 支持整数、小数、True/False/None、单双引号字符串（可带 u 前缀）以及裸单词，允许末尾逗号。
     * @throws RuleSyntaxError 无法解析的参数
     */
    ConverterArgs parse_converter_args(std::string_view text);

    /// @brief 转义正则元字符（Boost.Regex perl 语法）
    std::string regex_escape(std::string_view text);

    /**
     * @struct Weighting
     * @brief 同一状态下多条动态边的排序键，按字段字典序比较，越小越先尝试。
     *
     * - final_rank       : 含有能跨越 '/' 的转换器的段永远排在最后
     * - static_count     : 静态片段数量取负，静态文本越多越具体
     * - static_weights   : (位置, -长度)，更长的静态文本更具体
     * - argument_count   : 变量数量取负
     * - argument_weights : 各转换器的 weight
     */
    struct Weighting {
        int final_rank = 0;
        int static_count = 0;
        std::vector<std::pair<int, int>> static_weights;
        int argument_count = 0;
        std::vector<int> argument_weights;

        auto operator<=>(const Weighting&) const = default;
    };

    /**
     * @struct RulePart
     * @brief 规则编译后的一段，对应状态机中的一条边。
     */
    struct RulePart {
        std::string content;                  ///< 静态段的原文，或动态段的正则
        bool final = false;                   ///< 是否一次性吞掉剩余的所有段
        bool is_static = true;
        bool suffixed = false;                ///< final 段以 '/' 结尾时，末尾斜杠单独捕获到 rsfx 分组
        Weighting weight;
        std::vector<ConverterPtr> converters; ///< 段内变量的转换器，顺序与 rv0, rv1 ... 一致
        std::string converter_signature;      ///< 转换器名 + 原始参数，用于判断两条边是否等价

        /// 两个 RulePart 等价时共享同一条状态机边
        bool same_edge(const RulePart& other) const {
            return content == other.content && final == other.final && is_static == other.is_static &&
                   suffixed == other.suffixed && weight == other.weight &&
                   converter_signature == other.converter_signature;
        }
    };

    /// 反向构建使用的模板片段：静态文本或变量名
    struct TraceItem {
        bool is_variable = false;
        std::string text;
    };

    /// 根据名称和参数创建转换器，名称未知或参数不合法时抛出 RuleSyntaxError
    using ConverterResolver = std::function<ConverterPtr(std::string_view name, const ConverterArgs& args)>;

    /**
     * @struct CompiledTemplate
     * @brief 一个模板（主机/子域或路径）的编译结果。
     */
    struct CompiledTemplate {
        std::vector<RulePart> parts;
        std::vector<TraceItem> trace;
        std::vector<std::pair<std::string, ConverterPtr>> converters; ///< 按出现顺序
    };

    /**
     * @brief 编译一个模板。
     *
     * "/a/<b>" 产生三段：""、"a" 和 动态段 "<b>"；以 '/' 结尾的模板最后多一个空的静态段。
     * 使用了 part_isolating == false 的转换器之后，该段成为 final 段并吸收模板剩余部分。
     */
    CompiledTemplate compile_template(std::string_view rule, const ConverterResolver& resolve);

} // namespace routix

#endif //ROUTIX_ROUTE_COMPILER_HPP
