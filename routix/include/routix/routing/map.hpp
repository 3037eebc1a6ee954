#ifndef ROUTIX_MAP_HPP
#define ROUTIX_MAP_HPP

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <routix/routing/common_types.hpp>
#include <routix/routing/converters.hpp>
#include <routix/routing/map_config.hpp>
#include <routix/routing/matcher.hpp>
#include <routix/routing/rule.hpp>

namespace routix {

    class MapAdapter;

    /**
     * @struct BindOptions
     * @brief Map::bind() 的请求相关参数。
     */
    struct BindOptions {
        /// 应用挂载的前缀，构建和重定向时拼在路径前面
        std::string script_name = "/";
        /// 子域匹配模式下的当前子域；不给出时使用 MapConfig::default_subdomain
        std::optional<std::string> subdomain;
        /// http / https / ws / wss
        std::string url_scheme = "http";
        /// match() 和 build() 未指定方法时使用
        std::string default_method = "GET";
        /// match() 未指定路径时使用（已解码的路径）
        std::string path_info = "/";
        /// 重定向时保留的查询参数
        QueryArgs query_args;
    };

    /**
     * @struct RequestInfo
     * @brief 从一个 HTTP 请求中提取出的、路由需要的全部信息。由调度层填写。
     */
    struct RequestInfo {
        std::string method = "GET";
        std::string scheme = "http";
        std::string host;          ///< Host 头，可能带端口
        std::string server_name;   ///< 没有 Host 头时使用
        std::string server_port = "80";
        std::string script_name;
        std::string path_info = "/";
        std::string query_string;
        std::string connection;    ///< Connection 头
        std::string upgrade;       ///< Upgrade 头
    };

    /**
     * @struct MapSnapshot
     * @brief 某一时刻的完整路由表。构建完成后只读，由 Map 以原子方式整体替换。
     */
    struct MapSnapshot {
        /// 下标即规则 id
        std::vector<RulePtr> rules;
        /// endpoint -> 规则，按 Rule::build_compare_key() 稳定排序
        std::unordered_map<std::string, std::vector<RulePtr>, StringHash, StringEqual> by_endpoint;
        StateMachineMatcher matcher;

        explicit MapSnapshot(bool merge_slashes) : matcher(merge_slashes) {}
    };

    /**
     * @class Map
     * @brief 路由表：规则的注册中心和全局配置。
     *
     * 并发模型（写时复制）：
     * - 写操作（add / add_converter）由 write_mutex_ 串行化。每次 add 复制规则列表、
     *   编译新规则、构建一个全新的 MapSnapshot，然后原子地替换 snapshot_
     * - 读操作（match / build）只做一次原子 load，拿到的快照在整个调用期间保持有效，
     *   读者从不加锁，也不会看到构建了一半的状态机
     *
     * 绑定失败（语法错误、重复规则）时抛出异常，路由表保持不变。
     */
    class Map {
    public:
        explicit Map(MapConfig config = {});
        explicit Map(const std::vector<RuleItem>& rules, MapConfig config = {});

        Map(const Map&) = delete;
        Map& operator=(const Map&) = delete;

        /**
         * @brief 注册一条规则或一个规则工厂（Submount 等）产出的全部规则。
         * @throws RoutingSyntaxError / RuleSyntaxError 模板不合法
         * @throws DuplicateRuleError 与已有规则签名相同且方法重叠
         */
        void add(const RuleItem& item);

        /// @brief 一次注册多项，要么全部成功，要么全部不生效
        void add(const std::vector<RuleItem>& items);

        /// @brief 注册自定义转换器，只影响之后添加的规则
        void add_converter(const std::string& name, ConverterFactory factory);

        /**
         * @brief 绑定到一个服务器名，得到请求级的 MapAdapter。
         *
         * server_name 会被转为小写并做 IDNA 编码，端口保留。
         * @throws std::invalid_argument 服务器名无效，或主机匹配模式下给出了 subdomain
         */
        MapAdapter bind(std::string_view server_name, BindOptions options = {}) const;

        /**
         * @brief 根据请求信息绑定，自动推导子域和 websocket 协议。
         *
         * 请求的主机不属于 server_name 时，子域为 "<invalid>"，之后的匹配一律 NotFound。
         */
        MapAdapter bind_to_request(const RequestInfo& request,
                                   std::optional<std::string> server_name = std::nullopt,
                                   std::optional<std::string> subdomain = std::nullopt) const;

        /// @brief 所有规则（按注册顺序），或某个 endpoint 的规则（按构建优先顺序）
        std::vector<RulePtr> iter_rules(std::optional<std::string_view> endpoint = std::nullopt) const;

        std::size_t size() const;

        /// @brief 该 endpoint 是否有一条规则的变量集合包含 arguments
        bool is_endpoint_expecting(std::string_view endpoint, const std::vector<std::string>& arguments) const;

        const MapConfig& config() const noexcept { return config_; }

        /// @brief 当前快照，读者在一次调用中只取一次
        std::shared_ptr<const MapSnapshot> snapshot() const { return snapshot_.load(std::memory_order_acquire); }

    private:
        std::shared_ptr<const MapSnapshot> rebuild(std::vector<RulePtr> rules) const;

        const MapConfig config_;
        std::mutex write_mutex_;
        ConverterRegistry converters_;
        std::size_t next_id_ = 0;
        std::atomic<std::shared_ptr<const MapSnapshot>> snapshot_;
    };

} // namespace routix

#endif //ROUTIX_MAP_HPP
