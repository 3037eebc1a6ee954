#ifndef ROUTIX_CONVERTERS_HPP
#define ROUTIX_CONVERTERS_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <routix/routing/common_types.hpp>

namespace routix {

    /**
     * @struct ConverterArgs
     * @brief 规则模板中转换器的构造参数，例如 `<int(fixed_digits=4, signed=True):year>`。
     *
     * 由 parse_converter_args() 从括号内的文本解析得到。
     */
    struct ConverterArgs {
        std::vector<RouteValue> args;                              ///< 位置参数
        std::map<std::string, RouteValue, std::less<>> kwargs;     ///< 关键字参数

        bool empty() const noexcept { return args.empty() && kwargs.empty(); }
    };

    /**
     * @class Converter
     * @brief 路由变量转换器的统一能力接口。
     *
     * 一个转换器由四部分组成：
     * - regex()          : 匹配一个变量的正则片段（只能使用非捕获分组以外的命名无关写法，
     *                      捕获分组不会影响取值，因为匹配器使用命名分组取值）
     * - part_isolating() : 是否只在单个 '/' 分隔的段内匹配。为 false 时可以吞掉多个段
     * - to_value()       : 文本 -> 值，拒绝时抛出 ValidationError
     * - to_url()         : 值 -> URL 文本，拒绝时抛出 ValidationError
     *
     * 内置转换器见下方；调用方可以继承本类并通过 Map::add_converter() 注册自定义转换器。
     * 转换器实例创建后不可变，被所有使用它的规则共享。
     */
    class Converter {
    public:
        /**
         * @param regex          正则片段
         * @param weight         候选排序权重，越小越先尝试
         * @param part_isolating 未指定时按 regex 中是否含有 '/' 推断
         */
        explicit Converter(std::string regex, int weight = 100, std::optional<bool> part_isolating = std::nullopt);
        virtual ~Converter() = default;

        const std::string& regex() const noexcept { return regex_; }
        int weight() const noexcept { return weight_; }
        bool part_isolating() const noexcept { return part_isolating_; }

        /// @brief 文本 -> 值，默认原样返回字符串
        virtual RouteValue to_value(std::string_view text) const;

        /// @brief 值 -> URL 片段，默认做百分号编码（不保留 '/'）
        virtual std::string to_url(const RouteValue& value) const;

    protected:
        std::string regex_;
        int weight_;
        bool part_isolating_;
    };

    using ConverterPtr = std::shared_ptr<const Converter>;

    /// 转换器工厂：根据模板里的参数创建实例，参数非法时抛出 std::invalid_argument
    using ConverterFactory = std::function<ConverterPtr(const ConverterArgs&)>;

    /// 转换器名称 -> 工厂
    using ConverterRegistry = std::unordered_map<std::string, ConverterFactory, StringHash, StringEqual>;

    /// 默认字符串转换器，`string` / `default`
    class StringConverter final : public Converter {
    public:
        explicit StringConverter(std::size_t minlength = 1,
                                 std::optional<std::size_t> maxlength = std::nullopt,
                                 std::optional<std::size_t> length = std::nullopt);
    };

    /// `any(a, b, c)`：只匹配给定的几个值之一
    class AnyConverter final : public Converter {
    public:
        explicit AnyConverter(std::vector<std::string> items);

        std::string to_url(const RouteValue& value) const override;

        const std::vector<std::string>& items() const noexcept { return items_; }

    private:
        std::vector<std::string> items_;
    };

    /// `path`：匹配剩余路径（可以包含 '/'），优先级最低
    class PathConverter final : public Converter {
    public:
        PathConverter();

        std::string to_url(const RouteValue& value) const override;
    };

    /// `int`：非负整数，signed=True 时允许负号。to_url 对匹配不回来的值（负数、越界、超出 fixed_digits）抛 ValidationError
    class IntegerConverter final : public Converter {
    public:
        explicit IntegerConverter(std::size_t fixed_digits = 0,
                                  std::optional<std::int64_t> min = std::nullopt,
                                  std::optional<std::int64_t> max = std::nullopt,
                                  bool is_signed = false);

        RouteValue to_value(std::string_view text) const override;
        std::string to_url(const RouteValue& value) const override;

    private:
        std::size_t fixed_digits_;
        std::optional<std::int64_t> min_;
        std::optional<std::int64_t> max_;
        bool is_signed_;
    };

    /// `float`：形如 1.5 的小数，signed=True 时允许负号
    class FloatConverter final : public Converter {
    public:
        explicit FloatConverter(std::optional<double> min = std::nullopt,
                                std::optional<double> max = std::nullopt,
                                bool is_signed = false);

        RouteValue to_value(std::string_view text) const override;
        std::string to_url(const RouteValue& value) const override;

    private:
        std::optional<double> min_;
        std::optional<double> max_;
        bool is_signed_;
    };

    /// `uuid`：标准 8-4-4-4-12 格式，转换为 boost::uuids::uuid
    class UuidConverter final : public Converter {
    public:
        UuidConverter();

        RouteValue to_value(std::string_view text) const override;
        std::string to_url(const RouteValue& value) const override;
    };

    /// @brief 内置转换器注册表：default, string, any, path, int, float, uuid
    ConverterRegistry default_converters();

} // namespace routix

#endif //ROUTIX_CONVERTERS_HPP
