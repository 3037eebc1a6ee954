#include <routix/routing/map.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include <routix/error/routix_error.hpp>
#include <routix/routing/map_adapter.hpp>
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

    bool is_secure(std::string_view scheme) noexcept {
        return scheme == "https" || scheme == "wss";
    }

    /// 去掉与 scheme 对应的默认端口
    std::string strip_default_port(std::string host, std::string_view scheme) {
        const std::string_view port = is_secure(scheme) ? ":443" : ":80";
        if (host.size() > port.size() && host.ends_with(port)) {
            host.resize(host.size() - port.size());
        }
        return host;
    }

    /// 拆成 (主机, 端口)，兼容 [::1]:8080
    std::pair<std::string_view, std::string_view> split_port(std::string_view host) {
        std::size_t colon = std::string_view::npos;
        if (!host.empty() && host.front() == '[') {
            const auto close = host.find(']');
            if (close != std::string_view::npos && close + 1 < host.size() && host[close + 1] == ':') {
                colon = close + 1;
            }
        } else {
            colon = host.rfind(':');
        }
        if (colon == std::string_view::npos) {
            return {host, {}};
        }
        return {host.substr(0, colon), host.substr(colon + 1)};
    }

    std::vector<std::string_view> split_dots(std::string_view s) {
        std::vector<std::string_view> out;
        while (true) {
            const auto dot = s.find('.');
            out.push_back(s.substr(0, dot));
            if (dot == std::string_view::npos) break;
            s.remove_prefix(dot + 1);
        }
        return out;
    }

    /// Connection 头中是否包含 upgrade
    bool wants_upgrade(std::string_view connection) {
        const std::string lowered = to_lower(connection);
        std::string_view rest = lowered;
        while (!rest.empty()) {
            const auto comma = rest.find(',');
            std::string_view token = rest.substr(0, comma);
            while (!token.empty() && token.front() == ' ') token.remove_prefix(1);
            while (!token.empty() && token.back() == ' ') token.remove_suffix(1);
            if (token == "upgrade") return true;
            if (comma == std::string_view::npos) break;
            rest.remove_prefix(comma + 1);
        }
        return false;
    }

} // namespace

Map::Map(MapConfig config)
    : config_(std::move(config)),
      converters_(default_converters()),
      snapshot_(rebuild({})) {}

Map::Map(const std::vector<RuleItem>& rules, MapConfig config)
    : Map(std::move(config)) {
    add(rules);
}

void Map::add(const RuleItem& item) {
    add(std::vector<RuleItem>{item});
}

void Map::add(const std::vector<RuleItem>& items) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    const auto current = snapshot();
    std::vector<RulePtr> rules = current->rules;

    // 签名 -> 已有规则，用于重复检测
    std::unordered_map<std::string, std::vector<const Rule*>> signatures;
    for (const auto& rule : rules) {
        if (!rule->build_only()) {
            signatures[rule->signature()].push_back(rule.get());
        }
    }

    std::size_t id = next_id_;
    for (const auto& item : items) {
        for (auto& rule : item.get_rules()) {
            auto bound = std::make_shared<Rule>(std::move(rule));
            bound->bind(config_, converters_, id++);

            if (!bound->build_only()) {
                auto& same = signatures[bound->signature()];
                for (const Rule* existing : same) {
                    if (existing->methods_overlap(*bound)) {
                        throw DuplicateRuleError("rule '" + bound->rule() + "' (endpoint '" + bound->endpoint() +
                                                 "') duplicates rule '" + existing->rule() + "' (endpoint '" +
                                                 existing->endpoint() + "')");
                    }
                }
                same.push_back(bound.get());
            }
            rules.push_back(std::move(bound));
        }
    }

    auto next = rebuild(std::move(rules));
    next_id_ = id;
    snapshot_.store(std::move(next), std::memory_order_release);
}

void Map::add_converter(const std::string& name, ConverterFactory factory) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    converters_.insert_or_assign(name, std::move(factory));
    SPDLOG_DEBUG("registered converter '{}'", name);
}

std::shared_ptr<const MapSnapshot> Map::rebuild(std::vector<RulePtr> rules) const {
    auto next = std::make_shared<MapSnapshot>(config_.merge_slashes);
    next->rules = std::move(rules);

    for (const auto& rule : next->rules) {
        if (!rule->build_only()) {
            next->matcher.add(*rule);
        }
        next->by_endpoint[rule->endpoint()].push_back(rule);
    }
    next->matcher.update();

    for (auto& [_, list] : next->by_endpoint) {
        std::stable_sort(list.begin(), list.end(), [](const RulePtr& a, const RulePtr& b) {
            return a->build_compare_key() < b->build_compare_key();
        });
    }

    SPDLOG_DEBUG("routing table rebuilt: {} rules, {} endpoints", next->rules.size(), next->by_endpoint.size());
    return next;
}

MapAdapter Map::bind(std::string_view server_name, BindOptions options) const {
    if (config_.host_matching) {
        if (options.subdomain) {
            throw std::invalid_argument("host matching enabled and a subdomain was provided");
        }
    } else if (!options.subdomain) {
        options.subdomain = config_.default_subdomain;
    }

    // 端口不参与 IDNA 编码
    const std::string lowered = to_lower(server_name);
    const auto [host, port] = split_port(lowered);
    const auto normalized = url_utils::normalize_host(host);
    if (!normalized) {
        throw std::invalid_argument("invalid server name '" + std::string(server_name) + "'");
    }

    std::string name = *normalized;
    if (!port.empty()) {
        name += ":";
        name += port;
    }
    return {*this, std::move(name), std::move(options)};
}

MapAdapter Map::bind_to_request(const RequestInfo& request,
                                std::optional<std::string> server_name,
                                std::optional<std::string> subdomain) const {
    const std::string request_scheme = to_lower(request.scheme.empty() ? "http" : request.scheme);
    std::string scheme = request_scheme;
    if (wants_upgrade(request.connection) && to_lower(request.upgrade) == "websocket") {
        scheme = is_secure(scheme) ? "wss" : "ws";
    }

    // --- 1. 请求的主机名 ---
    std::string request_host;
    if (!request.host.empty()) {
        request_host = strip_default_port(to_lower(request.host), request_scheme);
    } else {
        request_host = to_lower(request.server_name);
        const bool default_port = (is_secure(request_scheme) && request.server_port == "443") ||
                                  (!is_secure(request_scheme) && request.server_port == "80");
        if (!default_port && !request.server_port.empty()) {
            request_host += ":" + request.server_port;
        }
    }

    std::string name = server_name ? strip_default_port(to_lower(*server_name), scheme) : request_host;

    // --- 2. 推导子域 ---
    if (!subdomain && !config_.host_matching) {
        const auto current = split_dots(request_host);
        const auto configured = split_dots(name);
        if (current.size() < configured.size() ||
            !std::equal(configured.begin(), configured.end(), current.end() - static_cast<std::ptrdiff_t>(configured.size()))) {
            SPDLOG_WARN("current server name '{}' doesn't match configured server name '{}'", request_host, name);
            subdomain = std::string(kInvalidSubdomain);
        } else {
            std::string derived;
            for (auto it = current.begin(); it != current.end() - static_cast<std::ptrdiff_t>(configured.size()); ++it) {
                if (it->empty()) continue;
                if (!derived.empty()) derived.push_back('.');
                derived.append(*it);
            }
            subdomain = std::move(derived);
        }
    }

    BindOptions options;
    options.script_name = request.script_name.empty() ? "/" : request.script_name;
    options.subdomain = std::move(subdomain);
    options.url_scheme = scheme;
    options.default_method = request.method.empty() ? "GET" : request.method;
    options.path_info = request.path_info;
    options.query_args = url_utils::parse_query(request.query_string);
    return bind(name, std::move(options));
}

std::vector<RulePtr> Map::iter_rules(std::optional<std::string_view> endpoint) const {
    const auto current = snapshot();
    if (!endpoint) {
        return current->rules;
    }
    const auto it = current->by_endpoint.find(*endpoint);
    return it == current->by_endpoint.end() ? std::vector<RulePtr>{} : it->second;
}

std::size_t Map::size() const {
    return snapshot()->rules.size();
}

bool Map::is_endpoint_expecting(std::string_view endpoint, const std::vector<std::string>& arguments) const {
    const auto current = snapshot();
    const auto it = current->by_endpoint.find(endpoint);
    if (it == current->by_endpoint.end()) {
        return false;
    }
    return std::any_of(it->second.begin(), it->second.end(), [&](const RulePtr& rule) {
        return std::all_of(arguments.begin(), arguments.end(), [&](const std::string& arg) {
            return rule->arguments().contains(arg);
        });
    });
}

} // namespace routix
