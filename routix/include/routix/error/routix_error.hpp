#ifndef ROUTIX_ROUTIX_ERROR_HPP
#define ROUTIX_ROUTIX_ERROR_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

// =======================================================================
// 🔹 命名空间： routix_error::routing (匹配 / 构建结果的错误码)
// =======================================================================
namespace routix_error::routing {
    // 定义错误枚举
    enum class code {
        not_found = 1,          // 没有任何规则的路径匹配
        method_not_allowed,     // 路径匹配但方法不允许
        request_redirect,       // 需要重定向（斜杠修正、合并斜杠、别名等）
        websocket_mismatch,     // 路径匹配但协议类型(ws/http)不符
        build_failed,           // 反向构建 URL 失败
    };

    // 自定义路由错误类别 (继承 std::error_category)
    class category_impl final : public std::error_category {
    public:
        const char* name() const noexcept override {
            return "routing_error";
        }

        std::string message(int ev) const override {
            switch (static_cast<code>(ev)) {
                case code::not_found: return "No rule matched the requested path";
                case code::method_not_allowed: return "The requested method is not allowed for this path";
                case code::request_redirect: return "The request must be redirected";
                case code::websocket_mismatch: return "The rule exists but the protocol (websocket/http) does not match";
                case code::build_failed: return "Could not build url";
                default: return "Unknown routing error";
            }
        }
    };

    // 全局访问接口
    inline const std::error_category& category() {
        static category_impl instance;
        return instance;
    }

    // 为了让 error_code 能从枚举隐式构造，必须在同命名空间提供此函数 (ADL)
    inline std::error_code make_error_code(code e) {
        return {static_cast<int>(e), category()};
    }

    // 预定义的 error_code 常量
    inline const std::error_code not_found          = make_error_code(code::not_found);
    inline const std::error_code method_not_allowed = make_error_code(code::method_not_allowed);
    inline const std::error_code request_redirect   = make_error_code(code::request_redirect);
    inline const std::error_code websocket_mismatch = make_error_code(code::websocket_mismatch);
    inline const std::error_code build_failed       = make_error_code(code::build_failed);

} // namespace routix_error::routing


// =======================================================================
//  让枚举支持自动转换为 std::error_code (标准库集成)
// =======================================================================
namespace std {
    template <>
    struct is_error_code_enum<routix_error::routing::code> : true_type {};
} // namespace std


// =======================================================================
// 🔹 绑定期 / 构建期异常
// =======================================================================
namespace routix {

    /// 规则模板不合法（例如不以 '/' 开头）。只会在规则绑定时抛出
    class RoutingSyntaxError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /// 占位符语法错误、未知转换器、转换器参数解析失败
    class RuleSyntaxError final : public RoutingSyntaxError {
    public:
        using RoutingSyntaxError::RoutingSyntaxError;
    };

    /// 同一签名（路径、主机/子域、websocket、方法）的规则重复注册
    class DuplicateRuleError final : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief 转换器拒绝某个值。
     *
     * 匹配时：当前候选被放弃，继续尝试下一个优先级的候选；
     * 构建时：跳过当前规则。永远不会传播到调用方。
     */
    class ValidationError final : public std::runtime_error {
    public:
        ValidationError() : std::runtime_error("validation failed") {}
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief 没有任何规则能用给定的值构建出 URL。
     */
    class BuildError final : public std::runtime_error {
    public:
        BuildError(std::string endpoint,
                   std::vector<std::string> value_names,
                   std::optional<std::string> method,
                   std::optional<std::string> suggested_endpoint,
                   const std::string& message)
            : std::runtime_error(message),
              endpoint_(std::move(endpoint)),
              value_names_(std::move(value_names)),
              method_(std::move(method)),
              suggested_endpoint_(std::move(suggested_endpoint)) {}

        const std::string& endpoint() const noexcept { return endpoint_; }
        const std::vector<std::string>& value_names() const noexcept { return value_names_; }
        const std::optional<std::string>& method() const noexcept { return method_; }
        /// 与请求最接近的规则的 endpoint，map 为空时没有
        const std::optional<std::string>& suggested_endpoint() const noexcept { return suggested_endpoint_; }

        std::error_code code() const noexcept { return routix_error::routing::build_failed; }

    private:
        std::string endpoint_;
        std::vector<std::string> value_names_;
        std::optional<std::string> method_;
        std::optional<std::string> suggested_endpoint_;
    };

} // namespace routix

#endif //ROUTIX_ROUTIX_ERROR_HPP
