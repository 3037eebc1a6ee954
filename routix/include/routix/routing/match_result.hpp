#ifndef ROUTIX_MATCH_RESULT_HPP
#define ROUTIX_MATCH_RESULT_HPP

#include <string>
#include <system_error>
#include <type_traits>
#include <variant>

#include <routix/error/routix_error.hpp>
#include <routix/routing/common_types.hpp>
#include <routix/routing/parameter_set.hpp>
#include <routix/routing/rule.hpp>

namespace routix {

    /// 匹配成功：endpoint 与转换后的变量（已合并规则的 defaults）
    struct Matched {
        std::string endpoint;
        RouteValues values;
        RulePtr rule;

        /// values 的类型化视图，生命周期不能超过本对象
        ParameterSet params() const { return ParameterSet(values); }
    };

    /// 需要重定向，new_url 是完整的绝对地址
    struct RequestRedirect {
        std::string new_url;
        int code = 308;
    };

    struct NotFound {};

    /// 路径匹配但方法不允许，allowed 为所有匹配规则接受的方法之并
    struct MethodNotAllowed {
        MethodSet allowed;
    };

    /// 路径匹配但 websocket / http 类型不符
    struct WebsocketMismatch {};

    using MatchOutcome = std::variant<Matched, RequestRedirect, NotFound, MethodNotAllowed, WebsocketMismatch>;

    /**
     * @class MatchResult
     * @brief MapAdapter::match() 的返回值。不使用异常表示 “未找到 / 重定向” 这类正常的控制流。
     *
     * @code
     * auto result = adapter.match("/user/42");
     * if (const auto* m = result.as<Matched>()) { ... }
     * else respond(result.status_code());
     * @endcode
     */
    class MatchResult {
    public:
        template<typename T> requires (!std::is_same_v<std::remove_cvref_t<T>, MatchResult>)
        MatchResult(T&& outcome) // NOLINT(google-explicit-constructor)
            : outcome_(std::forward<T>(outcome)) {}

        const MatchOutcome& outcome() const noexcept { return outcome_; }

        bool is_match() const noexcept { return std::holds_alternative<Matched>(outcome_); }

        template<typename T>
        bool is() const noexcept { return std::holds_alternative<T>(outcome_); }

        template<typename T>
        const T* as() const noexcept { return std::get_if<T>(&outcome_); }

        /// @throws std::bad_variant_access 不是 Matched 时
        const Matched& matched() const { return std::get<Matched>(outcome_); }

        /// 匹配成功时为空
        std::error_code error_code() const noexcept {
            namespace rc = routix_error::routing;
            switch (outcome_.index()) {
                case 1: return rc::request_redirect;
                case 2: return rc::not_found;
                case 3: return rc::method_not_allowed;
                case 4: return rc::websocket_mismatch;
                default: return {};
            }
        }

        /// 调度层应当返回的 HTTP 状态码
        int status_code() const noexcept {
            switch (outcome_.index()) {
                case 1: return std::get<RequestRedirect>(outcome_).code;
                case 2: return 404;
                case 3: return 405;
                case 4: return 400;
                default: return 200;
            }
        }

    private:
        MatchOutcome outcome_;
    };

} // namespace routix

#endif //ROUTIX_MATCH_RESULT_HPP
