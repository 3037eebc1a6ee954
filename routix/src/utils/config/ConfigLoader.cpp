#include <routix/utils/config/ConfigLoader.hpp>

#include <algorithm>
#include <array>
#include <filesystem>
#include <iostream>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include <routix/routing/rule.hpp>

namespace routix {

namespace {

    constexpr std::array<std::string_view, 9> kLogLevels = {
        "trace", "debug", "info", "warn", "warning", "err", "error", "critical", "off"};

    constexpr std::array<std::string_view, 4> kOutputTypes = {"console", "file", "all", "off"};

    template<std::size_t N>
    bool one_of(const std::array<std::string_view, N>& names, std::string_view value) {
        return std::find(names.begin(), names.end(), value) != names.end();
    }

    void finalize_config(RoutixConfig& config) {
        if (!one_of(kLogLevels, config.logging.level)) {
            throw std::runtime_error("logging config field 'level' has an incorrect value '" + config.logging.level + "'.");
        }
        if (!one_of(kOutputTypes, config.logging.output_type)) {
            throw std::runtime_error("logging config field 'output_type' has an incorrect value '" + config.logging.output_type +
                                     "'. Only console, file, all or off is supported");
        }
        if ((config.logging.output_type == "file" || config.logging.output_type == "all") && config.logging.file_path.empty()) {
            throw std::runtime_error("logging config is missing required field 'file_path'.");
        }

        // 只有子域匹配时才有意义
        if (!config.map.subdomain_matching && !config.map.default_subdomain.empty()) {
            SPDLOG_WARN("map.default_subdomain '{}' is ignored because subdomain matching is disabled", config.map.default_subdomain);
        }
        for (const auto& rule : config.rules) {
            if (config.map.host_matching && rule.subdomain) {
                SPDLOG_WARN("rule '{}' sets a subdomain but the map uses host matching", rule.path);
            }
            if (!config.map.host_matching && rule.host) {
                SPDLOG_WARN("rule '{}' sets a host but the map does not use host matching", rule.path);
            }
        }
    }

    /// toml 值转换为路由变量值，不支持的类型返回 std::nullopt
    std::optional<RouteValue> to_route_value(const toml::node& node) {
        if (const auto v = node.value_exact<bool>()) return RouteValue(*v);
        if (const auto v = node.value_exact<std::int64_t>()) return RouteValue(*v);
        if (const auto v = node.value_exact<double>()) return RouteValue(*v);
        if (const auto v = node.value_exact<std::string>()) return RouteValue(*v);
        if (const auto array = node.as_array()) {
            std::vector<std::string> items;
            for (const auto& elem : *array) {
                const auto str = elem.value<std::string>();
                if (!str) return std::nullopt;
                items.push_back(*str);
            }
            return RouteValue(std::move(items));
        }
        return std::nullopt;
    }

} // namespace

// --- 主加载函数 ---
RoutixConfig ConfigLoader::load(const std::string& filepath) {
    try {
        toml::table root_tbl = toml::parse_file(filepath);

        if (const auto value_op = root_tbl["active_profile"].value<std::string>()) {
            if (*value_op != "dev" && *value_op != "prod" && *value_op != "test") {
                throw std::runtime_error("无法识别的配置文件类型[ " + *value_op + " ]");
            }
            const std::filesystem::path path = filepath;
            const std::filesystem::path new_path =
                path.parent_path() / (path.stem().string() + "-" + *value_op + path.extension().string());
            root_tbl = toml::parse_file(new_path.string());
        }

        return parse_root(root_tbl);
    } catch (const toml::parse_error& err) {
        std::cerr << "Error parsing config file '" << filepath << "':\n" << err << std::endl;
        throw std::runtime_error(err.what());
    }
}

RoutixConfig ConfigLoader::load_from_string(std::string_view content) {
    try {
        return parse_root(toml::parse(content));
    } catch (const toml::parse_error& err) {
        throw std::runtime_error(err.what());
    }
}

std::unique_ptr<Map> ConfigLoader::make_map(const RoutixConfig& config) {
    std::vector<RuleItem> items;
    items.reserve(config.rules.size());

    for (const auto& rc : config.rules) {
        RuleOptions options;
        options.endpoint = rc.endpoint;
        if (!rc.methods.empty()) {
            options.methods = MethodSet(rc.methods.begin(), rc.methods.end());
        }
        options.defaults = rc.defaults;
        options.subdomain = rc.subdomain;
        options.host = rc.host;
        options.strict_slashes = rc.strict_slashes;
        options.merge_slashes = rc.merge_slashes;
        options.websocket = rc.websocket;
        options.build_only = rc.build_only;
        options.alias = rc.alias;
        if (rc.redirect_to) {
            options.redirect_to = *rc.redirect_to;
        }
        items.emplace_back(Rule(rc.path, std::move(options)));
    }

    auto map = std::make_unique<Map>(config.map);
    map->add(items);
    SPDLOG_INFO("routing map loaded with {} rules", map->size());
    return map;
}

// --- 私有帮助函数实现 ---

RoutixConfig ConfigLoader::parse_root(const toml::table& root_tbl) {
    RoutixConfig config;
    config.logging = parse_logging(root_tbl);
    config.map = parse_map(root_tbl);
    config.rules = parse_rules(root_tbl);
    config.demo = parse_demo(root_tbl);

    finalize_config(config);
    return config;
}

LoggingConfig ConfigLoader::parse_logging(const toml::table& log_tb) {
    LoggingConfig logConfig;
    if (const auto table = log_tb["logging"].as_table()) {
        logConfig.level = (*table)["level"].value_or(logConfig.level);
        logConfig.output_type = (*table)["output_type"].value_or(logConfig.output_type);
        logConfig.file_path = (*table)["file_path"].value_or(logConfig.file_path);
        logConfig.max_size_mb = (*table)["max_size_mb"].value_or(logConfig.max_size_mb);
        logConfig.max_files = (*table)["max_files"].value_or(logConfig.max_files);
    }
    return logConfig;
}

MapConfig ConfigLoader::parse_map(const toml::table& map_tb) {
    MapConfig mapConfig;
    if (const auto table = map_tb["map"].as_table()) {
        mapConfig.default_subdomain = (*table)["default_subdomain"].value_or(mapConfig.default_subdomain);
        mapConfig.strict_slashes = (*table)["strict_slashes"].value_or(mapConfig.strict_slashes);
        mapConfig.merge_slashes = (*table)["merge_slashes"].value_or(mapConfig.merge_slashes);
        mapConfig.redirect_defaults = (*table)["redirect_defaults"].value_or(mapConfig.redirect_defaults);
        mapConfig.sort_parameters = (*table)["sort_parameters"].value_or(mapConfig.sort_parameters);

        // 主机匹配与子域匹配互斥：开启主机匹配时子域匹配默认关闭，两者都显式开启则报错
        const auto host_matching = (*table)["host_matching"].value<bool>();
        const auto subdomain_matching = (*table)["subdomain_matching"].value<bool>();
        if (host_matching.value_or(false) && subdomain_matching.value_or(false)) {
            throw std::runtime_error("map config fields 'host_matching' and 'subdomain_matching' cannot both be enabled.");
        }
        mapConfig.host_matching = host_matching.value_or(false);
        mapConfig.subdomain_matching = subdomain_matching.value_or(!mapConfig.host_matching);
    }
    return mapConfig;
}

std::vector<RuleConfig> ConfigLoader::parse_rules(const toml::table& rule_tb) {
    std::vector<RuleConfig> rules;
    const auto array = rule_tb["rule"].as_array();
    if (!array) {
        return rules;
    }

    std::size_t index = 0;
    for (const auto& elem : *array) {
        const auto table = elem.as_table();
        if (!table) {
            throw std::runtime_error("rule config #" + std::to_string(index) + " is not a table.");
        }

        RuleConfig ruleConfig;
        const auto path = (*table)["path"].value<std::string>();
        const auto endpoint = (*table)["endpoint"].value<std::string>();
        if (!path) {
            throw std::runtime_error("rule config #" + std::to_string(index) + " is missing required field 'path'.");
        }
        if (!endpoint) {
            throw std::runtime_error("rule config '" + *path + "' is missing required field 'endpoint'.");
        }
        ruleConfig.path = *path;
        ruleConfig.endpoint = *endpoint;

        if (const auto methods = table->get("methods"); methods && methods->as_array()) {
            for (const auto& m : *methods->as_array()) {
                if (auto str = m.value<std::string>()) {
                    ruleConfig.methods.push_back(*str);
                }
            }
        }

        if (const auto defaults = (*table)["defaults"].as_table()) {
            for (auto&& [key, node] : *defaults) {
                auto value = to_route_value(node);
                if (!value) {
                    throw std::runtime_error("rule config '" + ruleConfig.path + "' has an unsupported value for default '" +
                                             std::string(key.str()) + "'.");
                }
                ruleConfig.defaults.emplace(std::string(key.str()), std::move(*value));
            }
        }

        ruleConfig.subdomain = (*table)["subdomain"].value<std::string>();
        ruleConfig.host = (*table)["host"].value<std::string>();
        ruleConfig.strict_slashes = (*table)["strict_slashes"].value<bool>();
        ruleConfig.merge_slashes = (*table)["merge_slashes"].value<bool>();
        ruleConfig.websocket = (*table)["websocket"].value_or(ruleConfig.websocket);
        ruleConfig.build_only = (*table)["build_only"].value_or(ruleConfig.build_only);
        ruleConfig.alias = (*table)["alias"].value_or(ruleConfig.alias);
        ruleConfig.redirect_to = (*table)["redirect_to"].value<std::string>();

        rules.push_back(std::move(ruleConfig));
        ++index;
    }
    return rules;
}

DemoConfig ConfigLoader::parse_demo(const toml::table& demo_tb) {
    DemoConfig demoConfig;
    if (const auto table = demo_tb["demo"].as_table()) {
        demoConfig.server_name = (*table)["server_name"].value_or(demoConfig.server_name);
        demoConfig.script_name = (*table)["script_name"].value_or(demoConfig.script_name);
        demoConfig.url_scheme = (*table)["url_scheme"].value_or(demoConfig.url_scheme);
    }
    return demoConfig;
}

} // namespace routix
