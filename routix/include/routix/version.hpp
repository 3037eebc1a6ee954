#ifndef ROUTIX_VERSION_HPP
#define ROUTIX_VERSION_HPP

#include <string_view>

namespace routix::framework {
    constexpr std::string_view name = "Routix";
    constexpr std::string_view version = "1.0.0";
}
#endif //ROUTIX_VERSION_HPP
