#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include <routix/routing/map_adapter.hpp>
#include <routix/utils/config/ConfigLoader.hpp>
#include <routix/utils/logger_manager.hpp>
#include <routix/version.hpp>

namespace {

    std::string describe(const routix::MatchResult& result) {
        if (const auto* m = result.as<routix::Matched>()) {
            std::string out = "200 " + m->endpoint;
            const routix::ParameterSet params = m->params();
            for (const auto& [name, _] : m->values) {
                out += " " + name + "=" + params.get_or_default<std::string>(name, "None");
            }
            return out;
        }
        if (const auto* r = result.as<routix::RequestRedirect>()) {
            return std::to_string(r->code) + " -> " + r->new_url;
        }
        if (const auto* na = result.as<routix::MethodNotAllowed>()) {
            std::string out = "405 allowed:";
            for (const auto& method : na->allowed) {
                out += " " + method;
            }
            return out;
        }
        return std::to_string(result.status_code()) + " " + result.error_code().message();
    }

} // namespace

// 用法: routix_demo [config.toml] [METHOD PATH ...]
int main(int argc, char* argv[]) {
    try {
        const std::string config_path = argc > 1 ? argv[1] : "../config.toml";
        const routix::RoutixConfig config = routix::ConfigLoader::load(config_path);
        routix::LoggerManager::init(config.logging);
        SPDLOG_INFO("{} {} starting", routix::framework::name, routix::framework::version);

        const auto map = routix::ConfigLoader::make_map(config);

        routix::BindOptions options;
        options.script_name = config.demo.script_name;
        options.url_scheme = config.demo.url_scheme;
        const routix::MapAdapter adapter = map->bind(config.demo.server_name, options);

        // 没有给出请求时列出所有规则
        if (argc <= 2) {
            for (const auto& rule : map->iter_rules()) {
                std::cout << rule->rule() << " -> " << rule->endpoint() << "\n";
            }
        }
        for (int i = 2; i + 1 < argc; i += 2) {
            const std::string method = argv[i];
            const std::string path = argv[i + 1];
            std::cout << method << " " << path << " : " << describe(adapter.match(path, method)) << "\n";
        }

        routix::LoggerManager::shutdown();
        return 0;
    } catch (const std::exception& e) {
        // 捕获配置加载或路由表构建时的错误
        std::cerr << "Fatal error during startup: " << e.what() << std::endl;
        routix::LoggerManager::shutdown();
        return 1;
    }
}
