#include <routix/routing/map_adapter.hpp>

#include <algorithm>
#include <cctype>
#include <deque>
#include <tuple>

#include <spdlog/spdlog.h>

#include <routix/error/routix_error.hpp>
#include <routix/utils/url_utils.hpp>

namespace routix {

namespace {

    std::string to_lower(std::string_view s) {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return out;
    }

    /// 丢掉空值和空列表，单元素列表退化为字符串
    RouteValues clean_values(const RouteValues& values) {
        RouteValues out;
        for (const auto& [key, value] : values) {
            if (is_none(value)) continue;
            if (const auto* list = std::get_if<std::vector<std::string>>(&value)) {
                if (list->empty()) continue;
                if (list->size() == 1) {
                    out.emplace(key, RouteValue(list->front()));
                    continue;
                }
            }
            out.emplace(key, value);
        }
        return out;
    }

    /// ['a', 'b'] 形式
    template<typename Range>
    std::string quoted_list(const Range& items) {
        std::string out = "[";
        bool first = true;
        for (const auto& item : items) {
            if (!first) out += ", ";
            first = false;
            out += "'" + std::string(item) + "'";
        }
        out += "]";
        return out;
    }

    /**
     * @brief 两个字符串的相似度，取值 [0, 1]。
     *
     * 反复寻找最长公共子串并在两侧递归，ratio = 2 * 匹配字符数 / 总长度。
     */
    double similarity(std::string_view a, std::string_view b) {
        if (a.empty() && b.empty()) {
            return 1.0;
        }

        std::size_t matches = 0;
        std::deque<std::tuple<std::size_t, std::size_t, std::size_t, std::size_t>> queue;
        queue.emplace_back(0, a.size(), 0, b.size());
        std::vector<std::size_t> prev(b.size() + 1), curr(b.size() + 1);

        while (!queue.empty()) {
            const auto [alo, ahi, blo, bhi] = queue.back();
            queue.pop_back();

            // 最长公共子串，取最靠前的那个
            std::size_t best_i = alo, best_j = blo, best_size = 0;
            std::fill(prev.begin(), prev.end(), 0);
            for (std::size_t i = alo; i < ahi; ++i) {
                std::fill(curr.begin(), curr.end(), 0);
                for (std::size_t j = blo; j < bhi; ++j) {
                    if (a[i] != b[j]) continue;
                    const std::size_t k = (j > blo ? prev[j - 1] : 0) + 1;
                    curr[j] = k;
                    if (k > best_size) {
                        best_i = i + 1 - k;
                        best_j = j + 1 - k;
                        best_size = k;
                    }
                }
                std::swap(prev, curr);
            }

            if (best_size == 0) continue;
            matches += best_size;
            if (alo < best_i && blo < best_j) {
                queue.emplace_back(alo, best_i, blo, best_j);
            }
            if (best_i + best_size < ahi && best_j + best_size < bhi) {
                queue.emplace_back(best_i + best_size, ahi, best_j + best_size, bhi);
            }
        }
        return 2.0 * static_cast<double>(matches) / static_cast<double>(a.size() + b.size());
    }

} // namespace

MapAdapter::MapAdapter(const Map& map, std::string server_name, BindOptions options)
    : map_(&map),
      server_name_(std::move(server_name)),
      subdomain_(std::move(options.subdomain)),
      script_name_(std::move(options.script_name)),
      url_scheme_(to_lower(options.url_scheme)),
      path_info_(std::move(options.path_info)),
      default_method_(to_upper(options.default_method)),
      query_args_(std::move(options.query_args)),
      websocket_(url_scheme_ == "ws" || url_scheme_ == "wss") {
    if (script_name_.empty() || script_name_.back() != '/') {
        script_name_.push_back('/');
    }
}

// --- 匹配 ---

MatchResult MapAdapter::match() const {
    return match(path_info_);
}

MatchResult MapAdapter::match(std::string_view path_info,
                              std::optional<std::string_view> method,
                              const std::optional<QueryArgs>& query_args,
                              std::optional<bool> websocket) const {
    const auto snapshot = map_->snapshot();
    const MapConfig& config = map_->config();

    const std::string request_method = to_upper(method ? *method : std::string_view(default_method_));
    const bool is_websocket = websocket.value_or(websocket_);
    const QueryArgs& query = query_args ? *query_args : query_args_;

    std::string domain_part;
    if (config.host_matching) {
        domain_part = server_name_;
    } else if (config.subdomain_matching) {
        domain_part = subdomain_.value_or("");
        if (domain_part == kInvalidSubdomain) {
            return NotFound{};
        }
    }

    const std::string path_part = path_info.empty() ? std::string() : "/" + std::string(url_utils::lstrip(path_info, '/'));

    auto result = snapshot->matcher.match(domain_part, path_part, request_method, is_websocket);

    // --- 1. 斜杠修正 ---
    if (const auto* redirect = std::get_if<StateMachineMatcher::PathRedirect>(&result)) {
        std::string url = make_redirect_url(url_utils::quote(redirect->path, url_utils::kPathSafe), query);
        SPDLOG_DEBUG("'{}' redirects to '{}'", path_part, url);
        return RequestRedirect{std::move(url)};
    }

    // --- 2. 没有匹配 ---
    if (const auto* miss = std::get_if<StateMachineMatcher::NoMatch>(&result)) {
        if (!miss->have_match_for.empty()) {
            return MethodNotAllowed{miss->have_match_for};
        }
        if (miss->websocket_mismatch) {
            return WebsocketMismatch{};
        }
        return NotFound{};
    }

    auto& found = std::get<StateMachineMatcher::Found>(result);
    const RulePtr rule = snapshot->rules.at(found.rule->id());
    RouteValues values = std::move(found.values);
    for (const auto& [key, value] : rule->defaults()) {
        values.insert_or_assign(key, value);
    }

    // --- 3. 别名重定向到规范地址 ---
    if (rule->alias() && config.redirect_defaults) {
        if (auto url = make_alias_redirect_url(*snapshot, *rule, request_method, values, query)) {
            SPDLOG_DEBUG("alias rule '{}' redirects to '{}'", rule->rule(), *url);
            return RequestRedirect{std::move(*url)};
        }
    }

    // --- 4. 默认值重定向 ---
    if (config.redirect_defaults) {
        if (auto url = get_default_redirect(*snapshot, *rule, request_method, values, query)) {
            SPDLOG_DEBUG("rule '{}' redirects to defaults url '{}'", rule->rule(), *url);
            return RequestRedirect{std::move(*url)};
        }
    }

    // --- 5. redirect_to ---
    if (rule->has_redirect()) {
        std::string target;
        if (const auto* callback = std::get_if<RedirectCallback>(&rule->options().redirect_to)) {
            target = (*callback)(*this, values);
        } else {
            target = rule->redirect_template_url(values);
        }

        const std::string netloc = subdomain_ && !subdomain_->empty() ? *subdomain_ + "." + server_name_ : server_name_;
        const std::string base = (url_scheme_.empty() ? std::string("http") : url_scheme_) + "://" + netloc + script_name_;
        auto joined = url_utils::join(base, target);
        if (!joined) {
            SPDLOG_WARN("redirect target '{}' of rule '{}' cannot be resolved against '{}'", target, rule->rule(), base);
            joined = target;
        }
        SPDLOG_DEBUG("rule '{}' redirects to '{}'", rule->rule(), *joined);
        return RequestRedirect{std::move(*joined)};
    }

    return Matched{rule->endpoint(), std::move(values), rule};
}

bool MapAdapter::test(std::string_view path_info, std::optional<std::string_view> method) const {
    const MatchResult result = match(path_info, method);
    return result.is<Matched>() || result.is<RequestRedirect>();
}

MethodSet MapAdapter::allowed_methods(std::string_view path_info) const {
    const MatchResult result = match(path_info, std::string_view("--"));
    if (const auto* not_allowed = result.as<MethodNotAllowed>()) {
        return not_allowed->allowed;
    }
    return {};
}

std::optional<std::string> MapAdapter::get_default_redirect(const MapSnapshot& snapshot, const Rule& rule, const std::string& method,
                                                            const RouteValues& values, const QueryArgs& query_args) const {
    const auto it = snapshot.by_endpoint.find(rule.endpoint());
    if (it == snapshot.by_endpoint.end()) {
        return std::nullopt;
    }

    // 只看构建优先级比当前规则高的规则
    for (const auto& candidate : it->second) {
        if (candidate->id() == rule.id()) {
            break;
        }
        if (!candidate->provides_defaults_for(rule) || !candidate->suitable_for(values, method)) {
            continue;
        }
        RouteValues merged = values;
        for (const auto& [key, value] : candidate->defaults()) {
            merged.insert_or_assign(key, value);
        }
        if (auto built = candidate->build(merged)) {
            return make_redirect_url(built->second, query_args, built->first);
        }
    }
    return std::nullopt;
}

std::optional<std::string> MapAdapter::make_alias_redirect_url(const MapSnapshot& snapshot, const Rule& rule, const std::string& method,
                                                               const RouteValues& values, const QueryArgs& query_args) const {
    const auto result = partial_build(snapshot, rule.endpoint(), clean_values(values), method, false);
    // 构建失败或又回到了别名自身，没有规范地址可以重定向
    if (!result || result->rule->id() == rule.id()) {
        return std::nullopt;
    }

    std::string url = finish_build(*result, BuildOptions{.method = method, .force_external = true, .append_unknown = false});
    if (!query_args.empty()) {
        url += "?" + url_utils::encode_query(query_args);
    }
    return url;
}

std::string MapAdapter::make_redirect_url(std::string_view path_info, const QueryArgs& query_args,
                                          std::optional<std::string_view> domain_part) const {
    const std::string_view scheme = url_scheme_.empty() ? std::string_view("http") : std::string_view(url_scheme_);

    // script_name 去掉首尾的 '/' 后与路径拼接
    std::string_view script(script_name_);
    script.remove_suffix(1);
    script = url_utils::lstrip(script, '/');

    std::string path;
    const std::string_view tail = url_utils::lstrip(path_info, '/');
    if (script.empty()) {
        path = tail;
    } else {
        path = std::string(script) + "/" + std::string(tail);
    }

    std::string url = std::string(scheme) + "://" + get_host(domain_part) + "/" + path;
    if (!query_args.empty()) {
        url += "?" + url_utils::encode_query(query_args);
    }
    return url;
}

std::string MapAdapter::get_host(std::optional<std::string_view> domain_part) const {
    if (map_->config().host_matching) {
        return domain_part ? std::string(*domain_part) : server_name_;
    }
    const std::string subdomain = domain_part ? std::string(*domain_part) : subdomain_.value_or("");
    if (subdomain.empty()) {
        return server_name_;
    }
    return subdomain + "." + server_name_;
}

// --- 构建 ---

std::string MapAdapter::build(std::string_view endpoint, const RouteValues& values, const BuildOptions& options) const {
    const auto snapshot = map_->snapshot();
    const RouteValues cleaned = clean_values(values);

    std::optional<std::string> method;
    if (options.method) {
        method = to_upper(*options.method);
    }

    const auto result = partial_build(*snapshot, endpoint, cleaned, method, options.append_unknown);
    if (!result) {
        throw_build_error(*snapshot, endpoint, cleaned, method);
    }
    return finish_build(*result, options);
}

std::optional<MapAdapter::BuildResult> MapAdapter::partial_build(const MapSnapshot& snapshot, std::string_view endpoint,
                                                                 const RouteValues& values, const std::optional<std::string>& method,
                                                                 bool append_unknown) const {
    // 没有指定方法时优先选默认方法能用的规则
    if (!method) {
        if (auto result = partial_build(snapshot, endpoint, values, default_method_, append_unknown)) {
            return result;
        }
    }

    const auto it = snapshot.by_endpoint.find(endpoint);
    if (it == snapshot.by_endpoint.end()) {
        return std::nullopt;
    }

    std::optional<BuildResult> first_match;
    for (const auto& rule : it->second) {
        if (!rule->suitable_for(values, method)) {
            continue;
        }
        auto built = rule->build(values, append_unknown);
        if (!built) {
            continue;
        }
        BuildResult result{std::move(built->first), std::move(built->second), rule->websocket(), rule.get()};
        if (same_domain(result.domain)) {
            return result;
        }
        if (!first_match) {
            first_match = std::move(result);
        }
    }
    return first_match;
}

std::string MapAdapter::finish_build(const BuildResult& result, const BuildOptions& options) const {
    const std::string host = get_host(result.domain);

    std::string scheme = options.url_scheme ? to_lower(*options.url_scheme) : url_scheme_;
    const bool secure = scheme == "https" || scheme == "wss";
    bool force_external = options.force_external;
    if (result.websocket) {
        force_external = true;
        scheme = secure ? "wss" : "ws";
    } else if (!scheme.empty()) {
        scheme = secure ? "https" : "http";
    }

    const std::string_view path = url_utils::lstrip(result.path, '/');
    if (!force_external && same_domain(result.domain)) {
        return std::string(url_utils::rstrip(script_name_, '/')) + "/" + std::string(path);
    }

    std::string url = scheme.empty() ? std::string() : scheme + ":";
    url += "//" + host;
    url.append(script_name_, 0, script_name_.size() - 1);
    url += "/";
    url += path;
    return url;
}

bool MapAdapter::same_domain(std::string_view domain_part) const {
    const MapConfig& config = map_->config();
    if (config.host_matching) {
        return domain_part == server_name_;
    }
    if (!config.subdomain_matching) {
        return true;
    }
    return subdomain_ && domain_part == *subdomain_;
}

void MapAdapter::throw_build_error(const MapSnapshot& snapshot, std::string_view endpoint, const RouteValues& values,
                                   const std::optional<std::string>& method) const {
    std::vector<std::string> names;
    names.reserve(values.size());
    for (const auto& [key, _] : values) {
        names.push_back(key);
    }

    // --- 1. 找出最接近的规则 ---
    const Rule* suggested = nullptr;
    double best_score = 0.0;
    for (const auto& rule : snapshot.rules) {
        const bool values_fit = std::all_of(names.begin(), names.end(), [&](const std::string& name) {
            return rule->arguments().contains(name);
        });
        const bool method_fits = method && rule->methods() && rule->methods()->contains(*method);
        const double score = 0.98 * similarity(rule->endpoint(), endpoint) + 0.01 * (values_fit ? 1.0 : 0.0) +
                             0.01 * (method_fits ? 1.0 : 0.0);
        if (suggested == nullptr || score > best_score) {
            suggested = rule.get();
            best_score = score;
        }
    }

    // --- 2. 拼出错误信息 ---
    std::string message = "Could not build url for endpoint '" + std::string(endpoint) + "'";
    if (method) {
        message += " ('" + *method + "')";
    }
    if (!names.empty()) {
        message += " with values " + quoted_list(names);
    }
    message += ".";

    if (suggested != nullptr) {
        if (suggested->endpoint() == endpoint) {
            if (method && suggested->methods() && !suggested->methods()->contains(*method)) {
                message += " Did you mean to use methods " + quoted_list(*suggested->methods()) + "?";
            }
            std::vector<std::string> missing;
            for (const auto& arg : suggested->arguments()) {
                if (!values.contains(arg)) {
                    missing.push_back(arg);
                }
            }
            if (!missing.empty()) {
                message += " Did you forget to specify values " + quoted_list(missing) + "?";
            }
        } else {
            message += " Did you mean '" + suggested->endpoint() + "' instead?";
        }
    }

    SPDLOG_DEBUG("{}", message);
    throw BuildError(std::string(endpoint), std::move(names), method,
                     suggested ? std::optional<std::string>(suggested->endpoint()) : std::nullopt, message);
}

} // namespace routix
