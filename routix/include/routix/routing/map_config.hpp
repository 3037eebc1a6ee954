#ifndef ROUTIX_MAP_CONFIG_HPP
#define ROUTIX_MAP_CONFIG_HPP

#include <string>

#include <routix/utils/url_utils.hpp>

namespace routix {

    /**
     * @struct MapConfig
     * @brief Map 的全局开关，构造 Map 时确定，之后不可修改。
     *
     * host_matching 为 true 时按完整主机名匹配（忽略 subdomain_matching）；
     * 否则 subdomain_matching 为 true 时按子域匹配；两者都为 false 时不区分主机。
     */
    struct MapConfig {
        /// 没有指定 subdomain 的规则使用的子域，以及 bind() 未给出子域时的默认值
        std::string default_subdomain;
        /// 分支规则（以 '/' 结尾）缺少末尾斜杠时重定向
        bool strict_slashes = true;
        /// 合并连续的 '/' 后重定向
        bool merge_slashes = true;
        /// 匹配到的值与另一条规则的 defaults 相同时，重定向到那条规则
        bool redirect_defaults = true;
        bool host_matching = false;
        bool subdomain_matching = true;
        /// 构建 URL 时对查询参数排序
        bool sort_parameters = false;
        /// 排序键，为空时按参数名排序
        url_utils::SortKey sort_key;
    };

} // namespace routix

#endif //ROUTIX_MAP_CONFIG_HPP
