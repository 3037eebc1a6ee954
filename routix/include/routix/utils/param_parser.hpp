#ifndef ROUTIX_PARAM_PARSER_HPP
#define ROUTIX_PARAM_PARSER_HPP

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include <routix/routing/common_types.hpp>

/**
 * 文本 -> 值 的解析工具。
 *
 * 转换器把路径片段转成数字、ParameterSet 按类型读取变量、规则模板里的转换器参数，
 * 三处都走这里，保证同一段文本在各处得到同样的结果。
 */
namespace routix::param_parser {

    // 不区分大小写的string_view比较
    inline bool isEquals(std::string_view a, std::string_view b) {
        return std::equal(a.begin(), a.end(),
                          b.begin(), b.end(),
                          [](char x, char y) {
                              return std::tolower(static_cast<unsigned char>(x)) ==
                                     std::tolower(static_cast<unsigned char>(y));
                          });
    }

    /// 字符串是否全部由十进制数字组成（非空）
    inline bool isDigits(std::string_view sv) {
        return !sv.empty() && std::all_of(sv.begin(), sv.end(), [](char c) {
            return c >= '0' && c <= '9';
        });
    }

    /**
     * @brief 把完整的字符串解析为 T，任何多余字符都视为失败。
     *
     * - 整数、浮点数使用 std::from_chars，不接受前导 '+'、空白，整数溢出视为失败
     * - bool 接受 true/false（不区分大小写）与 1/0
     * - std::string / std::string_view 原样返回
     */
    template<typename T>
    std::optional<T> tryParse(std::string_view sv) {
        if constexpr (std::is_arithmetic_v<T> && !std::is_same_v<T, bool> && !std::is_same_v<T, char>) {
            T value{};
            const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
            if (ec == std::errc() && ptr == sv.data() + sv.size()) {
                return value;
            }
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, bool>) {
            if (isEquals(sv, "true") || sv == "1") return true;
            if (isEquals(sv, "false") || sv == "0") return false;
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return std::string{sv};
        } else if constexpr (std::is_same_v<T, std::string_view>) {
            return sv;
        } else {
            return std::nullopt;
        }
    }

    /**
     * @brief 解析转换器参数里的一个字面量。
     *
     * None -> 空值，True/False -> bool，整数 -> int64，小数（含 "3." 这种写法）-> double，
     * 单双引号包住的去掉引号，其余按裸字符串处理。
     */
    inline RouteValue parseLiteral(std::string_view text) {
        if (text == "None") return std::monostate{};
        if (text == "True") return true;
        if (text == "False") return false;
        if (auto i = tryParse<std::int64_t>(text)) return *i;
        if (auto d = tryParse<double>(text)) return *d;
        if (text.size() >= 2 && text.front() == text.back() && (text.front() == '"' || text.front() == '\'')) {
            return std::string(text.substr(1, text.size() - 2));
        }
        return std::string(text);
    }

} // namespace routix::param_parser

#endif //ROUTIX_PARAM_PARSER_HPP
