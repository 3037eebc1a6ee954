#include <routix/utils/url_utils.hpp>

#include <algorithm>
#include <ada.h>
#include <boost/url/encode.hpp>
#include <boost/url/encoding_opts.hpp>
#include <boost/url/params_view.hpp>
#include <boost/url/parse_query.hpp>
#include <boost/url/pct_string_view.hpp>
#include <spdlog/spdlog.h>

namespace routix::url_utils {

std::string quote(std::string_view input, const grammar::lut_chars& safe) {
    return boost::urls::encode(input, safe);
}

std::string quote_plus(std::string_view input, const grammar::lut_chars& safe) {
    return boost::urls::encode(input, safe, boost::urls::encoding_opts(true, false, false));
}

std::string unquote(std::string_view input, bool plus_as_space) {
    const auto pct = boost::urls::make_pct_string_view(input);
    if (pct) {
        return pct->decode(boost::urls::encoding_opts(plus_as_space, false, false));
    }

    // 不合法的转义：不解码
    std::string out(input);
    if (plus_as_space) {
        std::replace(out.begin(), out.end(), '+', ' ');
    }
    return out;
}

std::string encode_query(const QueryArgs& args, bool sort, const SortKey& sort_key) {
    QueryArgs items = args;
    if (sort) {
        if (sort_key) {
            std::stable_sort(items.begin(), items.end(), [&](const auto& a, const auto& b) {
                return sort_key(a) < sort_key(b);
            });
        } else {
            std::stable_sort(items.begin(), items.end(), [](const auto& a, const auto& b) {
                return a.first < b.first;
            });
        }
    }

    std::string out;
    for (const auto& [key, value] : items) {
        if (!out.empty()) out.push_back('&');
        out += quote_plus(key);
        out.push_back('=');
        out += quote_plus(value);
    }
    return out;
}

QueryArgs to_query_args(const RouteValues& values) {
    QueryArgs args;
    for (const auto& [key, value] : values) {
        if (is_none(value)) continue;
        if (const auto* list = std::get_if<std::vector<std::string>>(&value)) {
            for (const auto& item : *list) {
                args.emplace_back(key, item);
            }
        } else {
            args.emplace_back(key, to_string(value));
        }
    }
    return args;
}

QueryArgs parse_query(std::string_view query) {
    QueryArgs args;
    if (!query.empty() && query.front() == '?') query.remove_prefix(1);
    if (query.empty()) {
        return args;
    }

    auto result = boost::urls::parse_query(query);
    if (!result) {
        SPDLOG_WARN("Query parse failed: {}", query);
        return args;
    }

    // 查询串里的 '+' 按空格解码
    const boost::urls::params_view decoded = *result;
    const boost::urls::params_view params(decoded, boost::urls::encoding_opts(true, false, false));
    for (const auto& param : params) {
        // "a&&b" 中间的空段
        if (param.key.empty() && !param.has_value) continue;
        args.emplace_back(param.key, param.has_value ? param.value : std::string{});
    }
    return args;
}

std::optional<std::string> normalize_host(std::string_view host, std::string_view scheme) {
    if (host.empty()) return std::string{};

    // ada 只解析完整的 URL，借用 scheme 拼出一个最小 URL 再取 host
    std::string host_url;
    host_url.reserve(scheme.size() + host.size() + 4);
    host_url.append(scheme.empty() ? "http" : scheme).append("://").append(host).append("/");

    auto url = ada::parse<ada::url_aggregator>(host_url);
    if (!url) {
        SPDLOG_DEBUG("无法解析主机名: {}", host);
        return std::nullopt;
    }
    return std::string(url->get_hostname());
}

std::optional<std::string> join(std::string_view base, std::string_view relative) {
    auto base_url = ada::parse<ada::url_aggregator>(base);
    if (!base_url) {
        return std::nullopt;
    }
    auto url = ada::parse<ada::url_aggregator>(relative, &*base_url);
    if (!url) {
        return std::nullopt;
    }
    return std::string(url->get_href());
}

std::string merge_slashes(std::string_view path) {
    std::string out;
    out.reserve(path.size());
    for (const char c : path) {
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(c);
    }
    return out;
}

std::string_view lstrip(std::string_view s, char c) noexcept {
    while (!s.empty() && s.front() == c) s.remove_prefix(1);
    return s;
}

std::string_view rstrip(std::string_view s, char c) noexcept {
    while (!s.empty() && s.back() == c) s.remove_suffix(1);
    return s;
}

} // namespace routix::url_utils
