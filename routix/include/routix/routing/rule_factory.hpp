#ifndef ROUTIX_RULE_FACTORY_HPP
#define ROUTIX_RULE_FACTORY_HPP

#include <map>
#include <string>
#include <vector>

#include <routix/routing/rule.hpp>

/**
 * 规则工厂：把一组规则按同样的方式改写后再交给 Map。可以任意嵌套：
 *
 * @code
 * Map map({
 *     Subdomain("kb", {
 *         Submount("/browse", {
 *             Rule("/", {.endpoint = "kb/browse"}),
 *             Rule("/<int:id>/", {.endpoint = "kb/browse"}),
 *         }),
 *     }),
 * });
 * @endcode
 */
namespace routix {

    /// 给所有规则的路径加上前缀，前缀末尾的 '/' 会被去掉
    class Submount final : public RuleFactory {
    public:
        Submount(std::string path, std::vector<RuleItem> rules);
        std::vector<Rule> get_rules() const override;

    private:
        std::string path_;
        std::vector<RuleItem> rules_;
    };

    /// 给所有规则的 endpoint 加上前缀
    class EndpointPrefix final : public RuleFactory {
    public:
        EndpointPrefix(std::string prefix, std::vector<RuleItem> rules);
        std::vector<Rule> get_rules() const override;

    private:
        std::string prefix_;
        std::vector<RuleItem> rules_;
    };

    /// 把所有规则放到同一个子域模板下
    class Subdomain final : public RuleFactory {
    public:
        Subdomain(std::string subdomain, std::vector<RuleItem> rules);
        std::vector<Rule> get_rules() const override;

    private:
        std::string subdomain_;
        std::vector<RuleItem> rules_;
    };

    using TemplateContext = std::map<std::string, std::string, std::less<>>;

    /// RuleTemplate 代入变量后的结果
    class RuleTemplateFactory final : public RuleFactory {
    public:
        RuleTemplateFactory(std::vector<RuleItem> rules, TemplateContext context);

        /**
         * @brief 在路径、endpoint、子域和字符串类型的 defaults 中替换 $name / ${name}，$$ 表示 '$'。
         * @throws RoutingSyntaxError 引用了 context 中没有的变量，或 '$' 后不是合法的名字
         */
        std::vector<Rule> get_rules() const override;

    private:
        std::vector<RuleItem> rules_;
        TemplateContext context_;
    };

    /**
     * @class RuleTemplate
     * @brief 可重复使用的一组规则模板。
     *
     * @code
     * RuleTemplate resource({Rule("/$name/", {.endpoint = "$name.list"})});
     * map.add(resource({{"name", "user"}}));
     * @endcode
     */
    class RuleTemplate {
    public:
        explicit RuleTemplate(std::vector<RuleItem> rules) : rules_(std::move(rules)) {}

        RuleTemplateFactory operator()(TemplateContext context) const {
            return {rules_, std::move(context)};
        }

    private:
        std::vector<RuleItem> rules_;
    };

    /// @brief 替换 text 中的 $name / ${name} / $$
    std::string substitute_template(const std::string& text, const TemplateContext& context);

} // namespace routix

#endif //ROUTIX_RULE_FACTORY_HPP
