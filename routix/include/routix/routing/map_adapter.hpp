#ifndef ROUTIX_MAP_ADAPTER_HPP
#define ROUTIX_MAP_ADAPTER_HPP

#include <optional>
#include <string>
#include <string_view>

#include <routix/routing/common_types.hpp>
#include <routix/routing/map.hpp>
#include <routix/routing/match_result.hpp>

namespace routix {

    /// 请求主机不属于配置的 server_name 时使用的子域，永远不会匹配
    inline constexpr std::string_view kInvalidSubdomain = "<invalid>";

    /**
     * @struct BuildOptions
     * @brief MapAdapter::build() 的可选参数。
     */
    struct BuildOptions {
        /// 只考虑接受该方法的规则；不给出时先按默认方法尝试，再尝试所有规则
        std::optional<std::string> method;
        /// 总是生成带 scheme 和主机的绝对地址
        bool force_external = false;
        /// 模板中没有用到的值作为查询参数追加
        bool append_unknown = true;
        /// 覆盖绑定时的 scheme
        std::optional<std::string> url_scheme;
    };

    /**
     * @class MapAdapter
     * @brief Map 绑定到某个请求环境（主机、scheme、script_name）后的视图。
     *
     * 每个请求创建一个，不跨线程共享。自身不保存可变状态，
     * 每次 match() / build() 调用都重新获取一次 Map 的快照。
     * Map 的生命周期必须覆盖 adapter。
     */
    class MapAdapter {
    public:
        MapAdapter(const Map& map, std::string server_name, BindOptions options);

        /// @brief 使用绑定时的 path_info 与默认方法匹配
        MatchResult match() const;

        /**
         * @brief 匹配一个路径。
         * @param path_info  已解码的路径
         * @param method     不给出时使用默认方法，内部转为大写
         * @param query_args 重定向时保留的查询参数，不给出时使用绑定时的
         * @param websocket  不给出时由 scheme 决定 (ws / wss)
         */
        MatchResult match(std::string_view path_info,
                          std::optional<std::string_view> method = std::nullopt,
                          const std::optional<QueryArgs>& query_args = std::nullopt,
                          std::optional<bool> websocket = std::nullopt) const;

        /// @brief 路径能否匹配（重定向也算能匹配）
        bool test(std::string_view path_info, std::optional<std::string_view> method = std::nullopt) const;

        /// @brief 该路径允许的方法，路径不存在时为空
        MethodSet allowed_methods(std::string_view path_info) const;

        /**
         * @brief 反向构建 URL。
         *
         * 与当前主机/子域相同时返回相对地址 (script_name + path)，否则返回 //host/... 形式的绝对地址。
         * websocket 规则总是返回 ws:// 或 wss:// 开头的绝对地址。
         * @throws BuildError 没有任何规则能用这些值构建
         */
        std::string build(std::string_view endpoint, const RouteValues& values = {}, const BuildOptions& options = {}) const;

        /// @brief 拼出 scheme://host/script_name/path?query 形式的重定向地址
        std::string make_redirect_url(std::string_view path_info, const QueryArgs& query_args,
                                      std::optional<std::string_view> domain_part = std::nullopt) const;

        /// @brief 根据规则构建出的主机/子域部分得到完整主机名
        std::string get_host(std::optional<std::string_view> domain_part) const;

        const Map& map() const noexcept { return *map_; }
        const std::string& server_name() const noexcept { return server_name_; }
        const std::optional<std::string>& subdomain() const noexcept { return subdomain_; }
        const std::string& script_name() const noexcept { return script_name_; }
        const std::string& url_scheme() const noexcept { return url_scheme_; }
        const std::string& path_info() const noexcept { return path_info_; }
        const std::string& default_method() const noexcept { return default_method_; }
        const QueryArgs& query_args() const noexcept { return query_args_; }
        bool websocket() const noexcept { return websocket_; }

    private:
        struct BuildResult {
            std::string domain;
            std::string path;
            bool websocket = false;
            const Rule* rule = nullptr;
        };

        std::optional<BuildResult> partial_build(const MapSnapshot& snapshot, std::string_view endpoint, const RouteValues& values,
                                                 const std::optional<std::string>& method, bool append_unknown) const;

        [[noreturn]] void throw_build_error(const MapSnapshot& snapshot, std::string_view endpoint, const RouteValues& values,
                                            const std::optional<std::string>& method) const;

        std::optional<std::string> get_default_redirect(const MapSnapshot& snapshot, const Rule& rule, const std::string& method,
                                                        const RouteValues& values, const QueryArgs& query_args) const;

        std::optional<std::string> make_alias_redirect_url(const MapSnapshot& snapshot, const Rule& rule, const std::string& method,
                                                           const RouteValues& values, const QueryArgs& query_args) const;

        /// 把部分构建结果拼成最终 URL（相对或绝对）
        std::string finish_build(const BuildResult& result, const BuildOptions& options) const;

        bool same_domain(std::string_view domain_part) const;

        const Map* map_;
        std::string server_name_;
        std::optional<std::string> subdomain_;
        std::string script_name_;
        std::string url_scheme_;
        std::string path_info_;
        std::string default_method_;
        QueryArgs query_args_;
        bool websocket_;
    };

} // namespace routix

#endif //ROUTIX_MAP_ADAPTER_HPP
