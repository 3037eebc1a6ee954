#ifndef ROUTIX_RULE_HPP
#define ROUTIX_RULE_HPP

#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

#include <routix/routing/common_types.hpp>
#include <routix/routing/converters.hpp>
#include <routix/routing/route_compiler.hpp>
#include <routix/utils/url_utils.hpp>

namespace routix {

    class MapAdapter;
    class Rule;
    struct MapConfig;

    /// redirect_to 的回调形式：根据匹配到的值计算新的 URL（可以是相对地址）
    using RedirectCallback = std::function<std::string(const MapAdapter&, const RouteValues&)>;

    /**
     * @struct RuleOptions
     * @brief 规则的全部可选项，配合 C++20 指定初始化器使用：
     *
     * @code
     * Rule("/blog/<int:year>", {.endpoint = "blog_archive", .methods = MethodSet{"GET"}})
     * @endcode
     */
    struct RuleOptions {
        std::string endpoint;
        std::optional<MethodSet> methods;       ///< 不设置或为空表示允许所有方法
        RouteValues defaults;
        std::optional<std::string> subdomain;   ///< 子域模板，子域匹配模式下使用
        std::optional<std::string> host;        ///< 主机模板，主机匹配模式下使用
        std::optional<bool> strict_slashes;     ///< 不设置时继承 Map
        std::optional<bool> merge_slashes;      ///< 不设置时继承 Map
        bool websocket = false;
        bool build_only = false;
        bool alias = false;
        std::variant<std::monostate, std::string, RedirectCallback> redirect_to;
    };

    /**
     * @class RuleFactory
     * @brief 能产出一组规则的对象。Rule 本身也是 RuleFactory（产出自己）。
     */
    class RuleFactory {
    public:
        virtual ~RuleFactory() = default;
        virtual std::vector<Rule> get_rules() const = 0;
    };

    /**
     * @class RuleItem
     * @brief 规则列表中的一项，可以是 Rule，也可以是任意 RuleFactory（Submount 等），用于嵌套书写。
     */
    class RuleItem {
    public:
        template<typename F> requires std::derived_from<F, RuleFactory>
        RuleItem(F factory) // NOLINT(google-explicit-constructor)
            : factory_(std::make_shared<const F>(std::move(factory))) {}

        std::vector<Rule> get_rules() const;

    private:
        std::shared_ptr<const RuleFactory> factory_;
    };

    /**
     * @class Rule
     * @brief 一条路由规则。
     *
     * 生命周期：调用方构造一个未绑定的 Rule，交给 Map::add()；Map 复制一份并调用 bind()，
     * 绑定后的规则不可变，只通过 std::shared_ptr<const Rule> 共享。
     */
    class Rule final : public RuleFactory {
    public:
        explicit Rule(std::string rule, RuleOptions options = {});

        std::vector<Rule> get_rules() const override { return {*this}; }

        // --- 定义 ---
        const std::string& rule() const noexcept { return rule_; }
        const RuleOptions& options() const noexcept { return options_; }
        const std::string& endpoint() const noexcept { return options_.endpoint; }
        /// 大写的方法集合，包含 GET 时一定包含 HEAD；std::nullopt 表示所有方法
        const std::optional<MethodSet>& methods() const noexcept { return options_.methods; }
        const RouteValues& defaults() const noexcept { return options_.defaults; }
        bool websocket() const noexcept { return options_.websocket; }
        bool build_only() const noexcept { return options_.build_only; }
        bool alias() const noexcept { return options_.alias; }
        bool has_redirect() const noexcept { return !std::holds_alternative<std::monostate>(options_.redirect_to); }

        // --- 绑定后才有意义 ---
        bool is_bound() const noexcept { return bound_; }
        std::size_t id() const noexcept { return id_; }
        bool strict_slashes() const noexcept { return strict_slashes_; }
        bool merge_slashes() const noexcept { return merge_slashes_; }
        /// 主机匹配时为 host 模板，子域匹配时为 subdomain 模板
        const std::string& domain_rule() const noexcept { return domain_rule_; }
        /// 所有变量名，包括 defaults 中的键
        const std::set<std::string, std::less<>>& arguments() const noexcept { return arguments_; }
        /// 变量名 -> 转换器，按在模板中出现的顺序（先主机/子域，后路径）
        const std::vector<std::pair<std::string, ConverterPtr>>& converters() const noexcept { return converters_; }
        const std::vector<RulePart>& parts() const noexcept { return parts_; }

        /// 模板以 '/' 结尾
        bool is_branch() const noexcept { return !rule_.empty() && rule_.back() == '/'; }
        bool is_leaf() const noexcept { return !is_branch(); }

        /**
         * @brief 编译规则。由 Map 在持有写锁时调用。
         * @throws RoutingSyntaxError 路径不以单个 '/' 开头、websocket 规则使用了不允许的方法
         * @throws RuleSyntaxError    占位符、转换器名称或参数不合法
         */
        void bind(const MapConfig& config, const ConverterRegistry& converters, std::size_t id);

        /// @brief 用于重复检测的签名：各段的内容与转换器 + websocket
        std::string signature() const;

        /// @brief 两条规则的方法集合是否有交集
        bool methods_overlap(const Rule& other) const;

        /// @brief 方法是否被本规则接受
        bool accepts_method(std::string_view method) const;

        /**
         * @brief 用给定的值构建 (domain, path?query)。
         * @return 转换器拒绝某个值时返回 std::nullopt
         */
        std::optional<std::pair<std::string, std::string>> build(const RouteValues& values, bool append_unknown = true) const;

        /// @brief 本规则能否用 values 构建（方法、必需变量、默认值一致性）
        bool suitable_for(const RouteValues& values, const std::optional<std::string>& method = std::nullopt) const;

        /// @brief 本规则是否为 rule 提供默认值（同 endpoint、同变量集、本规则有 defaults）
        bool provides_defaults_for(const Rule& rule) const;

        /// @brief 构建时的优先顺序：非别名优先，变量越多越优先，默认值越多越优先
        std::tuple<int, int, int> build_compare_key() const;

        /// @brief 用匹配到的值替换 redirect_to 模板中的 <name>
        std::string redirect_template_url(const RouteValues& values) const;

    private:
        std::string rule_;
        RuleOptions options_;

        bool bound_ = false;
        std::size_t id_ = 0;
        bool strict_slashes_ = true;
        bool merge_slashes_ = true;
        bool sort_parameters_ = false;
        url_utils::SortKey sort_key_;
        std::string domain_rule_;
        std::set<std::string, std::less<>> arguments_;
        std::vector<std::pair<std::string, ConverterPtr>> converters_;
        std::vector<RulePart> parts_;
        std::vector<TraceItem> domain_trace_;
        std::vector<TraceItem> path_trace_;

        ConverterPtr converter_for(std::string_view name) const;
    };

    using RulePtr = std::shared_ptr<const Rule>;

} // namespace routix

#endif //ROUTIX_RULE_HPP
