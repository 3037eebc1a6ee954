#ifndef ROUTIX_PARAMETER_SET_HPP
#define ROUTIX_PARAMETER_SET_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include <boost/uuid/uuid.hpp>

#include <routix/routing/common_types.hpp>
#include <routix/utils/param_parser.hpp>

namespace routix {

    // 处理函数取参数失败：缺少参数或类型不符
    class BadRequestError final : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @class ParameterSet
     * @brief Matched::values 的只读类型化视图，供处理函数取参数。
     *
     * @code
     * ParameterSet params(result.matched().values);
     * auto year = params.get<int>("year");
     * auto page = params.get_or_default<std::int64_t>("page", 1);
     * @endcode
     *
     * 字符串值在目标为数字或 bool 时会尝试解析（例如 defaults 里写成字符串的值）。
     */
    class ParameterSet {
    public:
        explicit ParameterSet(const RouteValues& params) : params_(params) {}

        bool contains(std::string_view key) const { return params_.contains(key); }

        const RouteValue* find(std::string_view key) const {
            auto it = params_.find(key);
            if (it != params_.end() && !is_none(it->second)) {
                return &it->second;
            }
            return nullptr;
        }

        template<typename T>
        T get(std::string_view key) const {
            const RouteValue* value = find(key);
            if (value == nullptr) {
                throw BadRequestError("Missing required parameter: " + std::string(key));
            }

            if constexpr (std::is_same_v<T, std::string>) {
                if (const auto* s = std::get_if<std::string>(value)) return *s;
                return to_string(*value);
            }
            else if constexpr (std::is_same_v<T, bool>) {
                if (const auto* b = std::get_if<bool>(value)) return *b;
                if (const auto* s = std::get_if<std::string>(value)) {
                    if (auto parsed = param_parser::tryParse<bool>(*s)) return *parsed;
                }
                throw type_error(key, *value, "boolean");
            }
            else if constexpr (std::is_integral_v<T>) {
                if (const auto* i = std::get_if<std::int64_t>(value)) return static_cast<T>(*i);
                if (const auto* s = std::get_if<std::string>(value)) {
                    if (auto parsed = param_parser::tryParse<T>(*s)) return *parsed;
                }
                throw type_error(key, *value, "integer");
            }
            else if constexpr (std::is_floating_point_v<T>) {
                if (const auto* d = std::get_if<double>(value)) return static_cast<T>(*d);
                if (const auto* i = std::get_if<std::int64_t>(value)) return static_cast<T>(*i);
                if (const auto* s = std::get_if<std::string>(value)) {
                    if (auto parsed = param_parser::tryParse<T>(*s)) return *parsed;
                }
                throw type_error(key, *value, "floating point number");
            }
            else if constexpr (std::is_same_v<T, boost::uuids::uuid>) {
                if (const auto* u = std::get_if<boost::uuids::uuid>(value)) return *u;
                throw type_error(key, *value, "uuid");
            }
            else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
                if (const auto* list = std::get_if<std::vector<std::string>>(value)) return *list;
                return {to_string(*value)};
            }
            else {
                // 静态断言，如果是不支持的类型，编译时就会报错
                static_assert(!sizeof(T), "Unsupported type for parameter conversion.");
            }
        }

        template<typename T>
        std::optional<T> get_optional(std::string_view key) const noexcept {
            try {
                return get<T>(key);
            } catch (const BadRequestError&) {
                return std::nullopt;
            }
        }

        template<typename T>
        T get_or_default(std::string_view key, T&& default_value) const {
            auto opt = get_optional<std::remove_cvref_t<T>>(key);
            return opt.value_or(std::forward<T>(default_value));
        }

    private:
        static BadRequestError type_error(std::string_view key, const RouteValue& value, std::string_view expected) {
            return BadRequestError("Parameter '" + std::string(key) + "' with value '" + to_string(value) +
                                   "' is not a valid " + std::string(expected) + ".");
        }

        const RouteValues& params_;
    };

} // namespace routix

#endif //ROUTIX_PARAMETER_SET_HPP
