#ifndef OPLAWS_DESCRIBE_HPP
#define OPLAWS_DESCRIBE_HPP

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

#include <oplaws/bundle.hpp>
#include <oplaws/capabilities.hpp>
#include <oplaws/tags.hpp>

// Display text only. Nothing here takes part in identity or filtering.

namespace oplaws {

namespace detail {

inline std::string join(const std::vector<std::string>& parts,
                        const char* sep) {
    std::string s;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0)
            s += sep;
        s += parts[i];
    }
    return s;
}

template <std::size_t N>
std::vector<std::string> sorted_names(const Flag (&flags)[N],
                                      std::size_t count, const char* prefix) {
    std::vector<std::string> out;
    for (std::size_t i = 0; i < count; ++i)
        out.push_back(prefix + std::string(flags[i].name.view()));
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace detail

// "seq sorted !set (2 filters)"
template <std::size_t F, std::size_t S>
std::string describe(const Tags<F, S>& t) {
    auto parts = detail::sorted_names(t.required, t.required_count, "");
    auto negs = detail::sorted_names(t.excluded, t.excluded_count, "!");
    parts.insert(parts.end(), negs.begin(), negs.end());
    if (t.selector_count == 1)
        parts.push_back("(1 filter)");
    else if (t.selector_count > 1)
        parts.push_back("(" + std::to_string(t.selector_count) + " filters)");
    return detail::join(parts, " ");
}

// "endo=plusOne hetero=bit33 binary=summation predicate=mod3 partial=halfEven"
template <typename A, typename B>
std::string describe(const OpBundle<A, B>& ops) {
    std::vector<std::string> parts;
    auto names = ops.values().names();
    for (std::size_t i = 0; i < role_count; ++i)
        parts.push_back(std::string(role_name(static_cast<Role>(i))) + "=" +
                        std::string(names[i].view()));
    return detail::join(parts, " ");
}

// "{filter, flatMap, map}"
template <std::size_t Cap> std::string describe(const Capabilities<Cap>& c) {
    std::vector<std::string> parts;
    for (const auto& n : c)
        parts.emplace_back(n.view());
    std::sort(parts.begin(), parts.end());
    return "{" + detail::join(parts, ", ") + "}";
}

} // namespace oplaws

#endif // OPLAWS_DESCRIBE_HPP
