#ifndef ROUTIX_TEST_SUPPORT_HPP
#define ROUTIX_TEST_SUPPORT_HPP

#include <cstdint>
#include <string>

#include <routix/routing/map_adapter.hpp>

namespace routix::test {

    /// 匹配到的 endpoint，没有匹配时返回 "<no match>"
    inline std::string endpoint_of(const MatchResult& result) {
        const auto* m = result.as<Matched>();
        return m ? m->endpoint : "<no match>";
    }

    /// 重定向地址，不是重定向时返回 "<no redirect>"
    inline std::string redirect_of(const MatchResult& result) {
        const auto* r = result.as<RequestRedirect>();
        return r ? r->new_url : "<no redirect>";
    }

    inline RouteValue int_value(std::int64_t v) {
        return RouteValue(v);
    }

} // namespace routix::test

#endif //ROUTIX_TEST_SUPPORT_HPP
