#ifndef ROUTIX_MATCHER_HPP
#define ROUTIX_MATCHER_HPP

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include <boost/regex.hpp>

#include <routix/routing/common_types.hpp>
#include <routix/routing/rule.hpp>

namespace routix {

    /**
     * @class StateMachineMatcher
     * @brief 由全部规则构建的状态机，构建完成后只读，可被多个线程同时查询。
     *
     * 每条规则的 RulePart 序列是一条从根出发的路径：
     * - 静态段对应 static_children 中的一项，O(1) 查找，优先尝试
     * - 动态段对应 dynamic 列表中的一条边，按 Weighting 排序后依次尝试
     * 到达终点的状态记录规则本身。匹配时请求被切分成 [domain, "", "a", "b"] 这样的段序列，
     * 深度优先地走状态机，失败时回溯到下一个候选。
     */
    class StateMachineMatcher {
    public:
        /// 匹配成功
        struct Found {
            const Rule* rule = nullptr;
            RouteValues values;
        };

        /// 需要重定向到修正后的路径（补上或去掉末尾斜杠、合并斜杠）
        struct PathRedirect {
            std::string path;
        };

        /// 没有匹配；have_match_for 非空表示路径匹配但方法不允许
        struct NoMatch {
            MethodSet have_match_for;
            bool websocket_mismatch = false;
        };

        using Result = std::variant<Found, PathRedirect, NoMatch>;

        explicit StateMachineMatcher(bool merge_slashes);

        StateMachineMatcher(const StateMachineMatcher&) = delete;
        StateMachineMatcher& operator=(const StateMachineMatcher&) = delete;
        StateMachineMatcher(StateMachineMatcher&&) noexcept = default;
        StateMachineMatcher& operator=(StateMachineMatcher&&) noexcept = default;

        /// 加入一条已绑定的规则。rule 的生命周期必须覆盖本对象
        void add(const Rule& rule);

        /// 全部规则加入后调用一次：对每个状态的动态边排序
        void update();

        /**
         * @brief 匹配一个请求。
         * @param domain    主机（主机匹配模式）、子域（子域匹配模式）或空串
         * @param path      以 '/' 开头的路径（空路径表示根之前，需要重定向到 '/'）
         * @param method    大写的方法名
         * @param websocket 请求是否为 websocket (ws/wss)
         */
        Result match(std::string_view domain, std::string_view path, std::string_view method, bool websocket) const;

    private:
        struct State;

        struct DynamicEdge {
            RulePart part;
            boost::regex pattern;
            std::unique_ptr<State> target;
        };

        struct State {
            std::unordered_map<std::string, std::unique_ptr<State>, StringHash, StringEqual> static_children;
            std::vector<DynamicEdge> dynamic;
            std::vector<const Rule*> rules;
        };

        struct Context;

        const Rule* traverse(const State& state, const std::vector<std::string_view>& parts, std::size_t index,
                             std::vector<RouteValue>& values, Context& ctx) const;

        const Rule* terminal(const State& state, Context& ctx) const;

        Result run(std::string_view domain, std::string_view path, Context& ctx) const;

        static void sort_state(State& state);

        std::unique_ptr<State> root_;
        bool merge_slashes_;
    };

} // namespace routix

#endif //ROUTIX_MATCHER_HPP
