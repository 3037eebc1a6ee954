#include <routix/routing/common_types.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <type_traits>

#include <boost/uuid/uuid_io.hpp>

namespace routix {

namespace {
    // 最短可往返表示；整数值补 ".0"，与浮点转换器的正则保持一致
    std::string format_double(double value) {
        std::array<char, 64> buffer{};
        auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
        if (ec != std::errc()) {
            return std::to_string(value);
        }
        std::string out(buffer.data(), ptr);
        if (out.find_first_of(".eEn") == std::string::npos) {
            out += ".0";
        }
        return out;
    }
} // namespace

std::string to_string(const RouteValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return {};
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "True" : "False";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return format_double(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, boost::uuids::uuid>) {
            return boost::uuids::to_string(v);
        } else {
            std::string joined;
            for (const auto& item : v) {
                if (!joined.empty()) joined.push_back(',');
                joined += item;
            }
            return joined;
        }
    }, value);
}

bool values_equal(const RouteValue& a, const RouteValue& b) {
    if (a.index() == b.index()) {
        return a == b;
    }
    const auto* ai = std::get_if<std::int64_t>(&a);
    const auto* bi = std::get_if<std::int64_t>(&b);
    const auto* ad = std::get_if<double>(&a);
    const auto* bd = std::get_if<double>(&b);
    if (ai && bd) return static_cast<double>(*ai) == *bd;
    if (ad && bi) return *ad == static_cast<double>(*bi);
    return false;
}

std::string to_upper(std::string_view method) {
    std::string out(method);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}

} // namespace routix
