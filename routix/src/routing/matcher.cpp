#include <routix/routing/matcher.hpp>

#include <algorithm>

#include <spdlog/spdlog.h>

#include <routix/error/routix_error.hpp>
#include <routix/utils/url_utils.hpp>

namespace routix {

namespace {

    std::vector<std::string_view> split_path(std::string_view domain, std::string_view path) {
        std::vector<std::string_view> parts;
        parts.reserve(8);
        parts.push_back(domain);
        while (true) {
            const auto slash = path.find('/');
            parts.push_back(path.substr(0, slash));
            if (slash == std::string_view::npos) break;
            path.remove_prefix(slash + 1);
        }
        return parts;
    }

    std::string join_parts(const std::vector<std::string_view>& parts, std::size_t from) {
        std::string out;
        for (std::size_t i = from; i < parts.size(); ++i) {
            if (i != from) out.push_back('/');
            out.append(parts[i]);
        }
        return out;
    }

    // 只剩一个空段，即请求路径以 '/' 结尾
    const std::vector<std::string_view> kTrailingSlash{std::string_view{}};

} // namespace

struct StateMachineMatcher::Context {
    std::string_view method;
    bool websocket = false;
    bool safe_method = false;
    MethodSet have_match_for;
    bool websocket_mismatch = false;
    bool slash_required = false;   ///< 立即终止搜索：补上末尾斜杠后可以匹配
    bool slash_forbidden = false;  ///< 记录候选：去掉末尾斜杠后可以匹配

    void record_methods(const Rule& rule) {
        if (rule.methods()) {
            have_match_for.insert(rule.methods()->begin(), rule.methods()->end());
        }
    }
};

StateMachineMatcher::StateMachineMatcher(bool merge_slashes)
    : root_(std::make_unique<State>()), merge_slashes_(merge_slashes) {}

void StateMachineMatcher::add(const Rule& rule) {
    State* state = root_.get();
    for (const auto& part : rule.parts()) {
        if (part.is_static) {
            auto& child = state->static_children[part.content];
            if (!child) {
                child = std::make_unique<State>();
            }
            state = child.get();
            continue;
        }

        auto it = std::find_if(state->dynamic.begin(), state->dynamic.end(), [&](const DynamicEdge& edge) {
            return edge.part.same_edge(part);
        });
        if (it == state->dynamic.end()) {
            boost::regex pattern;
            try {
                pattern.assign(part.content);
            } catch (const boost::regex_error& e) {
                throw RuleSyntaxError("invalid converter regex in rule '" + rule.rule() + "': " + e.what());
            }
            state->dynamic.push_back(DynamicEdge{part, std::move(pattern), std::make_unique<State>()});
            it = std::prev(state->dynamic.end());
        }
        state = it->target.get();
    }
    state->rules.push_back(&rule);

    if (rule.merge_slashes()) {
        merge_slashes_ = true;
    }
}

void StateMachineMatcher::update() {
    sort_state(*root_);
}

void StateMachineMatcher::sort_state(State& state) {
    std::stable_sort(state.dynamic.begin(), state.dynamic.end(), [](const DynamicEdge& a, const DynamicEdge& b) {
        return a.part.weight < b.part.weight;
    });
    for (auto& [_, child] : state.static_children) {
        sort_state(*child);
    }
    for (auto& edge : state.dynamic) {
        sort_state(*edge.target);
    }
}

// --- 匹配 ---

const Rule* StateMachineMatcher::terminal(const State& state, Context& ctx) const {
    for (const Rule* rule : state.rules) {
        if (!rule->accepts_method(ctx.method)) {
            ctx.record_methods(*rule);
        } else if (rule->websocket() != ctx.websocket) {
            ctx.websocket_mismatch = true;
        } else {
            return rule;
        }
    }

    // 路径再加一个 '/' 就能匹配到分支规则
    const auto it = state.static_children.find(std::string_view{});
    if (it == state.static_children.end()) {
        return nullptr;
    }
    for (const Rule* rule : it->second->rules) {
        if (rule->websocket() != ctx.websocket) {
            continue;
        }
        if (!rule->accepts_method(ctx.method)) {
            ctx.record_methods(*rule);
            continue;
        }
        if (!rule->strict_slashes()) {
            return rule;
        }
        if (ctx.safe_method) {
            ctx.slash_required = true;
            return nullptr;
        }
    }
    return nullptr;
}

const Rule* StateMachineMatcher::traverse(const State& state, const std::vector<std::string_view>& parts, std::size_t index,
                                          std::vector<RouteValue>& values, Context& ctx) const {
    if (index == parts.size()) {
        return terminal(state, ctx);
    }

    const std::string_view part = parts[index];

    // --- 1. 静态边优先 ---
    if (const auto it = state.static_children.find(part); it != state.static_children.end()) {
        if (const Rule* rule = traverse(*it->second, parts, index + 1, values, ctx)) {
            return rule;
        }
        if (ctx.slash_required) {
            return nullptr;
        }
    }

    // --- 2. 动态边，按权重依次尝试 ---
    for (const auto& edge : state.dynamic) {
        std::string joined;
        std::string_view target = part;
        const std::vector<std::string_view>* next_parts = &parts;
        std::size_t next_index = index + 1;
        if (edge.part.final) {
            joined = join_parts(parts, index);
            target = joined;
            next_index = parts.size();
        }

        boost::match_results<std::string_view::const_iterator> m;
        if (!boost::regex_match(target.begin(), target.end(), m, edge.pattern)) {
            continue;
        }
        if (edge.part.suffixed && m["rsfx"].matched && m["rsfx"].length() == 1) {
            // 吞掉的末尾斜杠交给下一步做斜杠检查
            next_parts = &kTrailingSlash;
            next_index = 0;
        }

        const std::size_t mark = values.size();
        try {
            for (std::size_t i = 0; i < edge.part.converters.size(); ++i) {
                const auto& group = m["rv" + std::to_string(i)];
                const auto offset = static_cast<std::size_t>(group.first - target.begin());
                values.push_back(edge.part.converters[i]->to_value(target.substr(offset, static_cast<std::size_t>(group.length()))));
            }
        } catch (const ValidationError&) {
            values.erase(values.begin() + static_cast<std::ptrdiff_t>(mark), values.end());
            continue;
        }

        if (const Rule* rule = traverse(*edge.target, *next_parts, next_index, values, ctx)) {
            return rule;
        }
        values.erase(values.begin() + static_cast<std::ptrdiff_t>(mark), values.end());
        if (ctx.slash_required) {
            return nullptr;
        }
    }

    // --- 3. 只剩末尾斜杠 ---
    if (index + 1 == parts.size() && part.empty()) {
        for (const Rule* rule : state.rules) {
            if (rule->strict_slashes()) {
                if (ctx.safe_method && rule->accepts_method(ctx.method) && rule->websocket() == ctx.websocket) {
                    ctx.slash_forbidden = true;
                }
                continue;
            }
            if (!rule->accepts_method(ctx.method)) {
                ctx.record_methods(*rule);
            } else if (rule->websocket() != ctx.websocket) {
                ctx.websocket_mismatch = true;
            } else {
                return rule;
            }
        }
    }
    return nullptr;
}

StateMachineMatcher::Result StateMachineMatcher::run(std::string_view domain, std::string_view path, Context& ctx) const {
    const std::vector<std::string_view> parts = split_path(domain, path);
    std::vector<RouteValue> values;

    const Rule* rule = traverse(*root_, parts, 0, values, ctx);
    if (ctx.slash_required) {
        return PathRedirect{std::string(path) + "/"};
    }
    if (rule != nullptr) {
        Found found{rule, {}};
        const auto& converters = rule->converters();
        for (std::size_t i = 0; i < converters.size() && i < values.size(); ++i) {
            found.values.emplace(converters[i].first, std::move(values[i]));
        }
        return found;
    }
    if (ctx.slash_forbidden && !path.empty() && path.back() == '/') {
        return PathRedirect{std::string(path.substr(0, path.size() - 1))};
    }
    return NoMatch{ctx.have_match_for, ctx.websocket_mismatch};
}

StateMachineMatcher::Result StateMachineMatcher::match(std::string_view domain, std::string_view path,
                                                       std::string_view method, bool websocket) const {
    Context ctx;
    ctx.method = method;
    ctx.websocket = websocket;
    ctx.safe_method = method == "GET" || method == "HEAD";

    Result result = run(domain, path, ctx);
    if (!std::holds_alternative<NoMatch>(result) || !merge_slashes_ || path.find("//") == std::string_view::npos) {
        return result;
    }

    // --- 合并斜杠后再试一次 ---
    const std::string merged = url_utils::merge_slashes(path);
    Context again;
    again.method = method;
    again.websocket = websocket;
    again.safe_method = ctx.safe_method;
    again.have_match_for = std::move(ctx.have_match_for);
    again.websocket_mismatch = ctx.websocket_mismatch;

    Result second = run(domain, merged, again);
    if (const auto* found = std::get_if<Found>(&second)) {
        if (found->rule->merge_slashes()) {
            SPDLOG_DEBUG("path '{}' matches after merging slashes", path);
            return PathRedirect{merged};
        }
        return NoMatch{again.have_match_for, again.websocket_mismatch};
    }
    return second;
}

} // namespace routix
