#ifndef ROUTIX_CONFIG_LOADER_HPP
#define ROUTIX_CONFIG_LOADER_HPP

#include <memory>
#include <string>
#include <string_view>

#include <toml++/toml.hpp>

#include <routix/routing/map.hpp>
#include <routix/utils/config/RoutixConfig.hpp>

namespace routix {

    class ConfigLoader {
    public:
        /**
         * @brief 从指定的 TOML 文件路径加载配置。
         *
         * 顶层存在 active_profile = "dev|prod|test" 时改为加载同目录下的 <stem>-<profile><ext>。
         *
         * @param filepath 配置文件的路径。
         * @return RoutixConfig 填充了配置数据的结构体。
         * @throws std::runtime_error 如果文件不存在、解析失败或配置不合法。
         */
        static RoutixConfig load(const std::string& filepath);

        /// @brief 从 TOML 文本加载，不支持 active_profile
        static RoutixConfig load_from_string(std::string_view content);

        /**
         * @brief 用配置创建路由表并注册所有 [[rule]]。
         * @throws RoutingSyntaxError / DuplicateRuleError 规则不合法
         */
        static std::unique_ptr<Map> make_map(const RoutixConfig& config);

    private:
        // 为了保持接口干净，所有解析函数都作为私有帮助函数
        static RoutixConfig parse_root(const toml::table& root_tbl);
        static LoggingConfig parse_logging(const toml::table& log_tb);
        static MapConfig parse_map(const toml::table& map_tb);
        static std::vector<RuleConfig> parse_rules(const toml::table& rule_tb);
        static DemoConfig parse_demo(const toml::table& demo_tb);
    };

} // namespace routix

#endif //ROUTIX_CONFIG_LOADER_HPP
