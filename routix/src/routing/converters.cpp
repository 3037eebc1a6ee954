#include <routix/routing/converters.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <routix/error/routix_error.hpp>
#include <routix/routing/route_compiler.hpp>
#include <routix/utils/param_parser.hpp>
#include <routix/utils/url_utils.hpp>

namespace routix {

namespace {

    /**
     * @brief 按 “位置参数或同名关键字参数” 的规则读取转换器参数。
     *
     * 同一个参数既按位置又按关键字给出、出现未知关键字或多余的位置参数时，
     * 抛出 std::invalid_argument，由 Rule::bind 转换为 RuleSyntaxError。
     */
    class ArgReader {
    public:
        ArgReader(const ConverterArgs& args, std::string_view converter)
            : args_(args), converter_(converter) {}

        std::optional<RouteValue> take(std::size_t position, std::string_view name) {
            std::optional<RouteValue> out;
            if (position < args_.args.size()) {
                out = args_.args[position];
                positional_used_ = std::max(positional_used_, position + 1);
            }
            if (auto it = args_.kwargs.find(name); it != args_.kwargs.end()) {
                if (out) {
                    throw std::invalid_argument(converter_ + "() got multiple values for argument '" + std::string(name) + "'");
                }
                out = it->second;
                ++keywords_used_;
            }
            if (out && is_none(*out)) {
                return std::nullopt;
            }
            return out;
        }

        std::optional<std::int64_t> take_int(std::size_t position, std::string_view name) {
            auto v = take(position, name);
            if (!v) return std::nullopt;
            if (const auto* i = std::get_if<std::int64_t>(&*v)) return *i;
            throw std::invalid_argument(converter_ + "(): argument '" + std::string(name) + "' must be an integer");
        }

        std::optional<double> take_number(std::size_t position, std::string_view name) {
            auto v = take(position, name);
            if (!v) return std::nullopt;
            if (const auto* i = std::get_if<std::int64_t>(&*v)) return static_cast<double>(*i);
            if (const auto* d = std::get_if<double>(&*v)) return *d;
            throw std::invalid_argument(converter_ + "(): argument '" + std::string(name) + "' must be a number");
        }

        std::optional<std::size_t> take_size(std::size_t position, std::string_view name) {
            auto v = take_int(position, name);
            if (!v) return std::nullopt;
            if (*v < 0) {
                throw std::invalid_argument(converter_ + "(): argument '" + std::string(name) + "' must not be negative");
            }
            return static_cast<std::size_t>(*v);
        }

        bool take_bool(std::size_t position, std::string_view name, bool fallback) {
            auto v = take(position, name);
            if (!v) return fallback;
            if (const auto* b = std::get_if<bool>(&*v)) return *b;
            if (const auto* i = std::get_if<std::int64_t>(&*v)) return *i != 0;
            throw std::invalid_argument(converter_ + "(): argument '" + std::string(name) + "' must be True or False");
        }

        /// 所有参数都必须被消费
        void finish() const {
            if (positional_used_ < args_.args.size()) {
                throw std::invalid_argument(converter_ + "() got too many positional arguments");
            }
            if (keywords_used_ < args_.kwargs.size()) {
                throw std::invalid_argument(converter_ + "() got an unexpected keyword argument");
            }
        }

    private:
        const ConverterArgs& args_;
        std::string converter_;
        std::size_t positional_used_ = 0;
        std::size_t keywords_used_ = 0;
    };

    /// to_url 中把值统一取为整数
    std::int64_t integral_value(const RouteValue& value) {
        if (const auto* i = std::get_if<std::int64_t>(&value)) return *i;
        if (const auto* d = std::get_if<double>(&value)) {
            if (std::trunc(*d) == *d) return static_cast<std::int64_t>(*d);
        }
        if (const auto* s = std::get_if<std::string>(&value)) {
            if (auto parsed = param_parser::tryParse<std::int64_t>(*s)) return *parsed;
        }
        throw ValidationError("value is not an integer: " + to_string(value));
    }

} // namespace

// --- Converter ---

Converter::Converter(std::string regex, int weight, std::optional<bool> part_isolating)
    : regex_(std::move(regex)),
      weight_(weight),
      part_isolating_(part_isolating.value_or(regex_.find('/') == std::string::npos)) {}

RouteValue Converter::to_value(std::string_view text) const {
    return std::string(text);
}

std::string Converter::to_url(const RouteValue& value) const {
    return url_utils::quote(to_string(value), url_utils::kSegmentSafe);
}

// --- StringConverter ---

namespace {
    std::string string_regex(std::size_t minlength, std::optional<std::size_t> maxlength, std::optional<std::size_t> length) {
        if (length) {
            return "[^/]{" + std::to_string(*length) + "}";
        }
        std::string out = "[^/]{" + std::to_string(minlength) + ",";
        if (maxlength) {
            out += std::to_string(*maxlength);
        }
        return out + "}";
    }
} // namespace

StringConverter::StringConverter(std::size_t minlength, std::optional<std::size_t> maxlength, std::optional<std::size_t> length)
    : Converter(string_regex(minlength, maxlength, length)) {}

// --- AnyConverter ---

namespace {
    std::string any_regex(const std::vector<std::string>& items) {
        std::string out = "(?:";
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (i != 0) out.push_back('|');
            out += regex_escape(items[i]);
        }
        return out + ")";
    }
} // namespace

AnyConverter::AnyConverter(std::vector<std::string> items)
    : Converter(any_regex(items)), items_(std::move(items)) {}

std::string AnyConverter::to_url(const RouteValue& value) const {
    const std::string text = to_string(value);
    if (std::find(items_.begin(), items_.end(), text) == items_.end()) {
        throw ValidationError("'" + text + "' is not one of the allowed values");
    }
    return url_utils::quote(text, url_utils::kSegmentSafe);
}

// --- PathConverter ---

PathConverter::PathConverter() : Converter("[^/].*?", 200, false) {}

std::string PathConverter::to_url(const RouteValue& value) const {
    return url_utils::quote(to_string(value), url_utils::kPathSafe);
}

// --- IntegerConverter ---

IntegerConverter::IntegerConverter(std::size_t fixed_digits,
                                   std::optional<std::int64_t> min,
                                   std::optional<std::int64_t> max,
                                   bool is_signed)
    : Converter(is_signed ? "-?\\d+" : "\\d+", 50),
      fixed_digits_(fixed_digits),
      min_(min),
      max_(max),
      is_signed_(is_signed) {}

RouteValue IntegerConverter::to_value(std::string_view text) const {
    const std::string_view digits = (!text.empty() && text.front() == '-') ? text.substr(1) : text;
    if (fixed_digits_ != 0 && digits.size() != fixed_digits_) {
        throw ValidationError();
    }
    const auto value = param_parser::tryParse<std::int64_t>(text);
    if (!value) {
        throw ValidationError(); // 溢出
    }
    if ((min_ && *value < *min_) || (max_ && *value > *max_)) {
        throw ValidationError();
    }
    return *value;
}

std::string IntegerConverter::to_url(const RouteValue& value) const {
    const std::int64_t number = integral_value(value);
    // 构建出的地址必须能被同一个转换器匹配回来
    if (number < 0 && !is_signed_) {
        throw ValidationError("negative value for unsigned int converter: " + std::to_string(number));
    }
    if ((min_ && number < *min_) || (max_ && number > *max_)) {
        throw ValidationError("value out of range: " + std::to_string(number));
    }

    // 经 uint64 取绝对值，INT64_MIN 不会溢出
    const std::uint64_t magnitude = number < 0 ? std::uint64_t{0} - static_cast<std::uint64_t>(number)
                                               : static_cast<std::uint64_t>(number);
    std::string digits = std::to_string(magnitude);
    if (fixed_digits_ != 0 && digits.size() > fixed_digits_) {
        throw ValidationError("value has more than " + std::to_string(fixed_digits_) + " digits: " + std::to_string(number));
    }
    if (digits.size() < fixed_digits_) {
        digits.insert(0, fixed_digits_ - digits.size(), '0');
    }
    return number < 0 ? "-" + digits : digits;
}

// --- FloatConverter ---

FloatConverter::FloatConverter(std::optional<double> min, std::optional<double> max, bool is_signed)
    : Converter(is_signed ? "-?\\d+\\.\\d+" : "\\d+\\.\\d+", 50),
      min_(min),
      max_(max),
      is_signed_(is_signed) {}

RouteValue FloatConverter::to_value(std::string_view text) const {
    const auto value = param_parser::tryParse<double>(text);
    if (!value) {
        throw ValidationError();
    }
    if ((min_ && *value < *min_) || (max_ && *value > *max_)) {
        throw ValidationError();
    }
    return *value;
}

std::string FloatConverter::to_url(const RouteValue& value) const {
    std::optional<double> number;
    if (const auto* d = std::get_if<double>(&value)) {
        number = *d;
    } else if (const auto* i = std::get_if<std::int64_t>(&value)) {
        number = static_cast<double>(*i);
    } else if (const auto* s = std::get_if<std::string>(&value)) {
        number = param_parser::tryParse<double>(*s);
    }
    if (!number) {
        throw ValidationError("value is not a number: " + to_string(value));
    }
    if (*number < 0 && !is_signed_) {
        throw ValidationError("negative value for unsigned float converter: " + to_string(value));
    }
    if ((min_ && *number < *min_) || (max_ && *number > *max_)) {
        throw ValidationError("value out of range: " + to_string(value));
    }
    return to_string(RouteValue(*number));
}

// --- UuidConverter ---

UuidConverter::UuidConverter()
    : Converter("[A-Fa-f0-9]{8}-[A-Fa-f0-9]{4}-[A-Fa-f0-9]{4}-[A-Fa-f0-9]{4}-[A-Fa-f0-9]{12}") {}

RouteValue UuidConverter::to_value(std::string_view text) const {
    try {
        return boost::uuids::string_generator()(text.begin(), text.end());
    } catch (const std::runtime_error&) {
        throw ValidationError();
    }
}

std::string UuidConverter::to_url(const RouteValue& value) const {
    if (const auto* u = std::get_if<boost::uuids::uuid>(&value)) {
        return boost::uuids::to_string(*u);
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        try {
            return boost::uuids::to_string(boost::uuids::string_generator()(*s));
        } catch (const std::runtime_error&) {
            throw ValidationError("'" + *s + "' is not a valid UUID");
        }
    }
    throw ValidationError("value is not a UUID: " + to_string(value));
}

// --- 注册表 ---

ConverterRegistry default_converters() {
    ConverterRegistry registry;

    auto make_string = [](const ConverterArgs& args) -> ConverterPtr {
        ArgReader reader(args, "string");
        const auto minlength = reader.take_size(0, "minlength").value_or(1);
        const auto maxlength = reader.take_size(1, "maxlength");
        const auto length = reader.take_size(2, "length");
        reader.finish();
        return std::make_shared<StringConverter>(minlength, maxlength, length);
    };
    registry.emplace("default", make_string);
    registry.emplace("string", make_string);

    registry.emplace("any", [](const ConverterArgs& args) -> ConverterPtr {
        if (!args.kwargs.empty()) {
            throw std::invalid_argument("any() does not take keyword arguments");
        }
        if (args.args.empty()) {
            throw std::invalid_argument("any() requires at least one value");
        }
        std::vector<std::string> items;
        items.reserve(args.args.size());
        for (const auto& item : args.args) {
            items.push_back(to_string(item));
        }
        return std::make_shared<AnyConverter>(std::move(items));
    });

    registry.emplace("path", [](const ConverterArgs& args) -> ConverterPtr {
        ArgReader(args, "path").finish();
        return std::make_shared<PathConverter>();
    });

    registry.emplace("int", [](const ConverterArgs& args) -> ConverterPtr {
        ArgReader reader(args, "int");
        const auto fixed_digits = reader.take_size(0, "fixed_digits").value_or(0);
        const auto min = reader.take_int(1, "min");
        const auto max = reader.take_int(2, "max");
        const bool is_signed = reader.take_bool(3, "signed", false);
        reader.finish();
        return std::make_shared<IntegerConverter>(fixed_digits, min, max, is_signed);
    });

    registry.emplace("float", [](const ConverterArgs& args) -> ConverterPtr {
        ArgReader reader(args, "float");
        const auto min = reader.take_number(0, "min");
        const auto max = reader.take_number(1, "max");
        const bool is_signed = reader.take_bool(2, "signed", false);
        reader.finish();
        return std::make_shared<FloatConverter>(min, max, is_signed);
    });

    registry.emplace("uuid", [](const ConverterArgs& args) -> ConverterPtr {
        ArgReader(args, "uuid").finish();
        return std::make_shared<UuidConverter>();
    });

    return registry;
}

} // namespace routix
