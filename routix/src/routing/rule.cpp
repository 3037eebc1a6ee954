#include <routix/routing/rule.hpp>

#include <algorithm>
#include <stdexcept>

#include <boost/regex.hpp>
#include <spdlog/spdlog.h>

#include <routix/error/routix_error.hpp>
#include <routix/routing/map_config.hpp>

namespace routix {

namespace {

    /// 方法名转大写，GET 隐含 HEAD，空集合等同于不限制
    std::optional<MethodSet> normalize_methods(const std::optional<MethodSet>& methods) {
        if (!methods || methods->empty()) {
            return std::nullopt;
        }
        MethodSet out;
        for (const auto& m : *methods) {
            out.insert(to_upper(m));
        }
        if (out.contains("GET")) {
            out.insert("HEAD");
        }
        return out;
    }

    std::string part_key(const RulePart& part) {
        std::string key = part.is_static ? "S:" : "D:";
        key += part.content;
        key += part.final ? "|f" : "|-";
        key += part.suffixed ? "s" : "-";
        key += "|" + part.converter_signature;
        return key;
    }

} // namespace

// --- RuleItem ---

std::vector<Rule> RuleItem::get_rules() const {
    return factory_->get_rules();
}

// --- Rule ---

Rule::Rule(std::string rule, RuleOptions options)
    : rule_(std::move(rule)), options_(std::move(options)) {
    options_.methods = normalize_methods(options_.methods);

    if (options_.websocket && options_.methods) {
        for (const auto& m : *options_.methods) {
            if (m != "GET" && m != "HEAD" && m != "OPTIONS") {
                throw RoutingSyntaxError("websocket rules can only use 'GET', 'HEAD', and 'OPTIONS' methods: '" + rule_ + "'");
            }
        }
    }
}

void Rule::bind(const MapConfig& config, const ConverterRegistry& converters, std::size_t id) {
    if (bound_) {
        throw std::logic_error("rule '" + rule_ + "' is already bound");
    }
    if (rule_.empty() || rule_.front() != '/' || (rule_.size() > 1 && rule_[1] == '/')) {
        throw RoutingSyntaxError("urls must start with a single leading slash: '" + rule_ + "'");
    }

    id_ = id;
    strict_slashes_ = options_.strict_slashes.value_or(config.strict_slashes);
    merge_slashes_ = options_.merge_slashes.value_or(config.merge_slashes);
    sort_parameters_ = config.sort_parameters;
    sort_key_ = config.sort_key;
    if (!options_.subdomain) {
        options_.subdomain = config.default_subdomain;
    }

    if (config.host_matching) {
        domain_rule_ = options_.host.value_or("");
    } else if (config.subdomain_matching) {
        domain_rule_ = *options_.subdomain;
    } else {
        domain_rule_.clear();
    }

    const ConverterResolver resolve = [&converters](std::string_view name, const ConverterArgs& args) -> ConverterPtr {
        const auto it = converters.find(name);
        if (it == converters.end()) {
            throw RuleSyntaxError("the converter '" + std::string(name) + "' does not exist");
        }
        try {
            return it->second(args);
        } catch (const std::invalid_argument& e) {
            throw RuleSyntaxError(e.what());
        }
    };

    try {
        // --- 1. 主机 / 子域部分，永远是第一段 ---
        parts_.clear();
        converters_.clear();
        if (domain_rule_.empty()) {
            parts_.emplace_back();
        } else {
            CompiledTemplate domain = compile_template(domain_rule_, resolve);
            parts_ = std::move(domain.parts);
            domain_trace_ = std::move(domain.trace);
            converters_ = std::move(domain.converters);
        }

        // --- 2. 路径部分 ---
        const std::string path = merge_slashes_ ? url_utils::merge_slashes(rule_) : rule_;
        CompiledTemplate compiled = compile_template(path, resolve);
        parts_.insert(parts_.end(), std::make_move_iterator(compiled.parts.begin()), std::make_move_iterator(compiled.parts.end()));
        path_trace_ = std::move(compiled.trace);
        for (auto& entry : compiled.converters) {
            converters_.push_back(std::move(entry));
        }
    } catch (const RuleSyntaxError& e) {
        throw RuleSyntaxError(std::string(e.what()) + " (rule '" + rule_ + "')");
    }

    // --- 3. 变量集合 ---
    arguments_.clear();
    for (const auto& [name, _] : converters_) {
        if (!arguments_.insert(name).second) {
            throw RuleSyntaxError("variable name '" + name + "' used more than once (rule '" + rule_ + "')");
        }
    }
    for (const auto& [name, _] : options_.defaults) {
        arguments_.insert(name);
    }

    bound_ = true;
    SPDLOG_DEBUG("bound rule '{}' -> '{}' (id={}, parts={})", rule_, options_.endpoint, id_, parts_.size());
}

std::string Rule::signature() const {
    std::string key;
    for (const auto& part : parts_) {
        key += part_key(part);
        key.push_back('\x1f');
    }
    key += options_.websocket ? "ws" : "http";
    return key;
}

bool Rule::methods_overlap(const Rule& other) const {
    if (!methods() || !other.methods()) {
        return true;
    }
    return std::any_of(methods()->begin(), methods()->end(), [&](const std::string& m) {
        return other.methods()->contains(m);
    });
}

bool Rule::accepts_method(std::string_view method) const {
    return !methods() || methods()->contains(method);
}

ConverterPtr Rule::converter_for(std::string_view name) const {
    for (const auto& [key, converter] : converters_) {
        if (key == name) return converter;
    }
    return nullptr;
}

std::optional<std::pair<std::string, std::string>> Rule::build(const RouteValues& values, bool append_unknown) const {
    // 按模板依次拼接：静态文本编码后原样输出，变量优先取默认值，其次取传入的值
    auto render = [&](const std::vector<TraceItem>& trace) -> std::optional<std::string> {
        std::string out;
        for (const auto& item : trace) {
            if (!item.is_variable) {
                out += url_utils::quote(item.text, url_utils::kPathSafe);
                continue;
            }
            const ConverterPtr converter = converter_for(item.text);
            if (const auto d = options_.defaults.find(item.text); d != options_.defaults.end()) {
                out += converter->to_url(d->second);
                continue;
            }
            const auto v = values.find(item.text);
            if (v == values.end() || is_none(v->second)) {
                return std::nullopt;
            }
            if (const auto* list = std::get_if<std::vector<std::string>>(&v->second)) {
                if (list->empty()) return std::nullopt;
                out += converter->to_url(RouteValue(list->front()));
            } else {
                out += converter->to_url(v->second);
            }
        }
        return out;
    };

    try {
        auto domain = render(domain_trace_);
        auto path = render(path_trace_);
        if (!domain || !path) {
            return std::nullopt;
        }

        if (append_unknown) {
            RouteValues unknown;
            for (const auto& [key, value] : values) {
                if (!arguments_.contains(key)) {
                    unknown.emplace(key, value);
                }
            }
            const QueryArgs query = url_utils::to_query_args(unknown);
            if (!query.empty()) {
                *path += "?" + url_utils::encode_query(query, sort_parameters_, sort_key_);
            }
        }
        return std::make_pair(std::move(*domain), std::move(*path));
    } catch (const ValidationError& e) {
        SPDLOG_DEBUG("rule '{}' rejected build value: {}", rule_, e.what());
        return std::nullopt;
    }
}

bool Rule::suitable_for(const RouteValues& values, const std::optional<std::string>& method) const {
    if (method && !accepts_method(*method)) {
        return false;
    }
    const auto& defaults = options_.defaults;
    for (const auto& key : arguments_) {
        if (!defaults.contains(key) && !values.contains(key)) {
            return false;
        }
    }
    for (const auto& [key, value] : defaults) {
        if (const auto it = values.find(key); it != values.end() && !values_equal(value, it->second)) {
            return false;
        }
    }
    return true;
}

bool Rule::provides_defaults_for(const Rule& rule) const {
    return !options_.build_only && !options_.defaults.empty() && options_.endpoint == rule.endpoint() &&
           id_ != rule.id() && arguments_ == rule.arguments();
}

std::tuple<int, int, int> Rule::build_compare_key() const {
    return {options_.alias ? 1 : 0,
            -static_cast<int>(arguments_.size()),
            -static_cast<int>(options_.defaults.size())};
}

std::string Rule::redirect_template_url(const RouteValues& values) const {
    const auto* target = std::get_if<std::string>(&options_.redirect_to);
    if (target == nullptr) {
        return {};
    }

    static const boost::regex placeholder_re("<([^>]+)>");
    std::string out;
    auto last = target->cbegin();
    for (boost::sregex_iterator it(target->cbegin(), target->cend(), placeholder_re), end; it != end; ++it) {
        const auto& m = *it;
        out.append(last, m[0].first);
        last = m[0].second;

        const std::string name = m[1].str();
        const auto value = values.find(name);
        if (value == values.end()) {
            SPDLOG_WARN("redirect_to of rule '{}' references unknown value '{}'", rule_, name);
            out += m[0].str();
            continue;
        }
        const ConverterPtr converter = converter_for(name);
        try {
            out += converter ? converter->to_url(value->second)
                             : url_utils::quote(to_string(value->second), url_utils::kSegmentSafe);
        } catch (const ValidationError&) {
            out += url_utils::quote(to_string(value->second), url_utils::kSegmentSafe);
        }
    }
    out.append(last, target->cend());
    return out;
}

} // namespace routix
