#ifndef ROUTIX_URL_UTILS_HPP
#define ROUTIX_URL_UTILS_HPP

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <boost/url/grammar/lut_chars.hpp>
#include <boost/url/rfc/unreserved_chars.hpp>

#include <routix/routing/common_types.hpp>

namespace routix::url_utils {

    namespace grammar = boost::urls::grammar;

    /// 路径中保留原样的字符：RFC 3986 unreserved、pchar 里的子分隔符，再加上 '/'
    inline constexpr grammar::lut_chars kPathSafe =
        boost::urls::unreserved_chars + grammar::lut_chars("!$&'()*+,/:;=@");

    /// 普通路径变量保留原样的字符：与 kPathSafe 相同但不包含 '/'
    inline constexpr grammar::lut_chars kSegmentSafe =
        boost::urls::unreserved_chars + grammar::lut_chars("!$&'()*+,:;=@");

    /// 查询串的 key / value 中保留原样的字符（不含 '&'、'='、'+'）
    inline constexpr grammar::lut_chars kQuerySafe =
        boost::urls::unreserved_chars + grammar::lut_chars("!$'()*,/:;?@");

    /**
     * @brief 百分号编码（boost::urls::encode）。
     *
     * 按 UTF-8 字节处理，safe 之外的字节编码为 %XX（大写）。
     */
    std::string quote(std::string_view input, const grammar::lut_chars& safe = kPathSafe);

    /// @brief 查询串编码：空格编码为 '+'，其余同 quote(input, safe)
    std::string quote_plus(std::string_view input, const grammar::lut_chars& safe = kQuerySafe);

    /**
     * @brief 解码 %XX，plus_as_space 时 '+' 解码为空格。
     *
     * 含有不合法转义（例如 "%zz"、结尾的 "%"）的输入不做百分号解码，原样返回。
     */
    std::string unquote(std::string_view input, bool plus_as_space = false);

    /// 查询参数排序用的键函数
    using SortKey = std::function<std::string(const std::pair<std::string, std::string>&)>;

    /**
     * @brief 把多值参数编码为 "a=1&b=2"。
     * @param sort 为 true 时按 key（或 sort_key 的返回值）稳定排序
     */
    std::string encode_query(const QueryArgs& args, bool sort = false, const SortKey& sort_key = nullptr);

    /// @brief 把 RouteValues 展开成 QueryArgs，空值丢弃、列表展开为重复参数
    QueryArgs to_query_args(const RouteValues& values);

    /// @brief 解析 "a=1&b=2" 形式的查询串（boost::urls::parse_query），无法解析时返回空
    QueryArgs parse_query(std::string_view query);

    /**
     * @brief 使用 ada 规范化主机名：小写、IDNA(punycode)、去掉该 scheme 的默认端口。
     * @return 主机无效时返回 std::nullopt
     */
    std::optional<std::string> normalize_host(std::string_view host, std::string_view scheme = "http");

    /**
     * @brief 以 base 为基准解析相对 URL（等价于浏览器的 URL 拼接规则）。
     * @return 解析失败返回 std::nullopt
     */
    std::optional<std::string> join(std::string_view base, std::string_view relative);

    /// @brief 把连续的 '/' 合并为一个
    std::string merge_slashes(std::string_view path);

    /// @brief 去掉开头所有的 c
    std::string_view lstrip(std::string_view s, char c) noexcept;

    /// @brief 去掉结尾所有的 c
    std::string_view rstrip(std::string_view s, char c) noexcept;

} // namespace routix::url_utils

#endif //ROUTIX_URL_UTILS_HPP
