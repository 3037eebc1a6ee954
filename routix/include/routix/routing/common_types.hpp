#ifndef ROUTIX_COMMON_TYPES_HPP
#define ROUTIX_COMMON_TYPES_HPP

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <boost/uuid/uuid.hpp>

namespace routix {

    // 1. 透明的 Hasher，允许 unordered_map 直接用 string_view 查找
    struct StringHash {
        using is_transparent = void; // 关键：启用透明性

        size_t operator()(std::string_view sv) const {
            return std::hash<std::string_view>{}(sv);
        }
    };

    // 2. 透明的 KeyEqual
    struct StringEqual {
        using is_transparent = void;

        bool operator()(std::string_view a, std::string_view b) const {
            return a == b;
        }
    };

    /**
     * @brief 路由变量的取值。
     *
     * 转换器把路径片段转换成其中一种类型，构建 URL 时再反向转换。
     * - std::monostate 表示“空值”(None)，构建时会被忽略
     * - std::vector<std::string> 用于多值查询参数
     */
    using RouteValue = std::variant<std::monostate,
                                    bool,
                                    std::int64_t,
                                    double,
                                    std::string,
                                    boost::uuids::uuid,
                                    std::vector<std::string>>;

    /// 变量名 -> 值。使用有序 map，保证查询串输出稳定
    using RouteValues = std::map<std::string, RouteValue, std::less<>>;

    /// 多值查询参数容器，保持插入顺序
    using QueryArgs = std::vector<std::pair<std::string, std::string>>;

    /// HTTP 方法集合（大写，有序）
    using MethodSet = std::set<std::string, std::less<>>;

    /**
     * @brief 把值转换成文本形式（查询串、日志使用）
     *
     * bool 写作 True / False，与转换器参数里的字面量一致，
     * 这样 build() 追加到查询串里的值能原样写回规则参数。None 输出空串。
     */
    std::string to_string(const RouteValue& value);

    /// @brief 是否为空值
    inline bool is_none(const RouteValue& value) noexcept {
        return std::holds_alternative<std::monostate>(value);
    }

    /**
     * @brief 宽松比较两个值。
     *
     * 同类型直接比较；整数与浮点数按数值比较；其余跨类型一律不相等。
     */
    bool values_equal(const RouteValue& a, const RouteValue& b);

    /// @brief 把方法名转为大写
    std::string to_upper(std::string_view method);

} // namespace routix

#endif //ROUTIX_COMMON_TYPES_HPP
