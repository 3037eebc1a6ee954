#include <routix/routing/rule_factory.hpp>

#include <boost/regex.hpp>

#include <routix/error/routix_error.hpp>
#include <routix/utils/url_utils.hpp>

namespace routix {

namespace {

    template<typename Fn>
    std::vector<Rule> rewrite_all(const std::vector<RuleItem>& items, Fn&& rewrite) {
        std::vector<Rule> out;
        for (const auto& item : items) {
            for (const auto& rule : item.get_rules()) {
                out.push_back(rewrite(rule));
            }
        }
        return out;
    }

} // namespace

Submount::Submount(std::string path, std::vector<RuleItem> rules)
    : path_(url_utils::rstrip(path, '/')), rules_(std::move(rules)) {}

std::vector<Rule> Submount::get_rules() const {
    return rewrite_all(rules_, [this](const Rule& rule) {
        return Rule(path_ + rule.rule(), rule.options());
    });
}

EndpointPrefix::EndpointPrefix(std::string prefix, std::vector<RuleItem> rules)
    : prefix_(std::move(prefix)), rules_(std::move(rules)) {}

std::vector<Rule> EndpointPrefix::get_rules() const {
    return rewrite_all(rules_, [this](const Rule& rule) {
        RuleOptions options = rule.options();
        options.endpoint = prefix_ + options.endpoint;
        return Rule(rule.rule(), std::move(options));
    });
}

Subdomain::Subdomain(std::string subdomain, std::vector<RuleItem> rules)
    : subdomain_(std::move(subdomain)), rules_(std::move(rules)) {}

std::vector<Rule> Subdomain::get_rules() const {
    return rewrite_all(rules_, [this](const Rule& rule) {
        RuleOptions options = rule.options();
        options.subdomain = subdomain_;
        return Rule(rule.rule(), std::move(options));
    });
}

RuleTemplateFactory::RuleTemplateFactory(std::vector<RuleItem> rules, TemplateContext context)
    : rules_(std::move(rules)), context_(std::move(context)) {}

std::vector<Rule> RuleTemplateFactory::get_rules() const {
    return rewrite_all(rules_, [this](const Rule& rule) {
        RuleOptions options = rule.options();
        options.endpoint = substitute_template(options.endpoint, context_);
        if (options.subdomain) {
            options.subdomain = substitute_template(*options.subdomain, context_);
        }
        for (auto& [_, value] : options.defaults) {
            if (auto* text = std::get_if<std::string>(&value)) {
                *text = substitute_template(*text, context_);
            }
        }
        return Rule(substitute_template(rule.rule(), context_), std::move(options));
    });
}

std::string substitute_template(const std::string& text, const TemplateContext& context) {
    // $$ | $name | ${name} | 其余非法的 '$'
    static const boost::regex placeholder_re(R"(\$(?:(\$)|([_a-zA-Z][_a-zA-Z0-9]*)|\{([_a-zA-Z][_a-zA-Z0-9]*)\}|()))");

    std::string out;
    auto last = text.cbegin();
    for (boost::sregex_iterator it(text.cbegin(), text.cend(), placeholder_re), end; it != end; ++it) {
        const auto& m = *it;
        out.append(last, m[0].first);
        last = m[0].second;

        if (m[1].matched) {
            out.push_back('$');
            continue;
        }
        if (!m[2].matched && !m[3].matched) {
            throw RoutingSyntaxError("invalid placeholder in rule template '" + text + "' at position " +
                                     std::to_string(m.position()));
        }
        const std::string name = m[2].matched ? m[2].str() : m[3].str();
        const auto value = context.find(name);
        if (value == context.end()) {
            throw RoutingSyntaxError("rule template '" + text + "' references unknown variable '" + name + "'");
        }
        out += value->second;
    }
    out.append(last, text.cend());
    return out;
}

} // namespace routix
