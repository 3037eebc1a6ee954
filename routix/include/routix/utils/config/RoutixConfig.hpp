#ifndef ROUTIX_CONFIG_HPP
#define ROUTIX_CONFIG_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <routix/routing/common_types.hpp>
#include <routix/routing/map_config.hpp>

namespace routix {

    // ------------------------------------------------
    // [logging]
    // ------------------------------------------------
    struct LoggingConfig {
        ///  日志级别，如 "trace", "debug", "info", "warn", "error", "critical", "off"
        std::string level = "debug";
        /// 日志输出位置，如 "console", "file", "all", "off"
        std::string output_type = "console";
        /// 指定日志文件文件路径
        std::string file_path = "logs/routix.log";
        /// 日志轮转配置 : 单个日志文件的最大大小（MB）
        uint16_t max_size_mb = 5;
        /// 日志轮转配置 : 日志文件轮转数量
        uint16_t max_files = 50;
    };

    // ------------------------------------------------
    // [[rule]]
    // ------------------------------------------------
    struct RuleConfig {
        /// 规则模板，必填，例如 "/blog/<int:year>/"
        std::string path;
        /// 必填
        std::string endpoint;
        /// 为空表示允许所有方法
        std::vector<std::string> methods;
        /// [rule.defaults] 表
        RouteValues defaults;
        std::optional<std::string> subdomain;
        std::optional<std::string> host;
        /// 不设置时继承 [map]
        std::optional<bool> strict_slashes;
        std::optional<bool> merge_slashes;
        bool websocket = false;
        bool build_only = false;
        bool alias = false;
        /// 重定向模板，例如 "/new/<name>"
        std::optional<std::string> redirect_to;
    };

    // ------------------------------------------------
    // [demo]
    // ------------------------------------------------
    struct DemoConfig {
        /// 演示程序绑定的服务器名
        std::string server_name = "localhost";
        std::string script_name = "/";
        std::string url_scheme = "http";
    };

    // ------------------------------------------------
    // 顶层配置
    // ------------------------------------------------
    struct RoutixConfig {
        LoggingConfig logging;
        /// [map]
        MapConfig map;
        std::vector<RuleConfig> rules;
        DemoConfig demo;
    };

} // namespace routix

#endif //ROUTIX_CONFIG_HPP
