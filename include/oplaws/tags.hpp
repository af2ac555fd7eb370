#ifndef OPLAWS_TAGS_HPP
#define OPLAWS_TAGS_HPP

#include <cstddef>
#include <initializer_list>
#include <optional>

#include <oplaws/name.hpp>
#include <oplaws/test_info.hpp>

namespace oplaws {

struct NegatedFlag;

// --- Flag: a coarse label a law can require or shun ---
//
// A disabled flag is switched off for the whole run: it never blocks a
// configuration, whether required or excluded.

struct Flag {
    Name name{};
    bool disabled{false};

    constexpr Flag() = default;
    constexpr Flag(Name n, bool off = false) : name(n), disabled(off) {}
    constexpr Flag(const char* n, bool off = false) : name(n), disabled(off) {}

    constexpr bool operator==(const Flag& o) const { return name == o.name; }

    constexpr Flag y() const { return *this; }
    constexpr NegatedFlag n() const;
};

struct NegatedFlag {
    Flag flag{};
};

constexpr NegatedFlag Flag::n() const { return NegatedFlag{*this}; }
constexpr NegatedFlag operator!(const Flag& f) { return NegatedFlag{f}; }

enum class TagState { Required, Excluded, Disabled };

// Dynamic selector: nullopt keeps the test, a Skip drops it.
// Selectors are plain function pointers so Tags stays a literal type:
// stateless lambdas convert, capturing lambdas and functors are rejected.
// Put any data a selector needs in a namespace-scope constant.
using Selector = std::optional<Skip> (*)(const TestInfo&);

namespace detail {

template <std::size_t N>
constexpr int find_flag(const Flag (&flags)[N], std::size_t count,
                        const Flag& f) {
    for (std::size_t i = 0; i < count; ++i)
        if (flags[i] == f)
            return static_cast<int>(i);
    return -1;
}

template <std::size_t N>
constexpr void erase_flag(Flag (&flags)[N], std::size_t& count, int at) {
    for (std::size_t i = static_cast<std::size_t>(at); i + 1 < count; ++i)
        flags[i] = flags[i + 1];
    flags[--count] = Flag{};
}

template <std::size_t N>
constexpr void push_flag(Flag (&flags)[N], std::size_t& count,
                         const Flag& f) {
    if (count >= N)
        throw "Tags flag capacity exceeded";
    flags[count++] = f;
}

} // namespace detail

// --- Tags: structural (required/excluded) and dynamic (selector) filters ---
//
// Immutable: every mutator returns a new value. A flag is never both
// required and excluded.

template <std::size_t MaxFlags = 16, std::size_t MaxSelectors = 8>
struct Tags {
    Flag required[MaxFlags]{};
    std::size_t required_count{0};
    Flag excluded[MaxFlags]{};
    std::size_t excluded_count{0};
    Selector selectors[MaxSelectors]{};
    std::size_t selector_count{0};

    constexpr bool empty() const {
        return required_count == 0 && excluded_count == 0 &&
               selector_count == 0;
    }

    constexpr bool requires_flag(const Flag& f) const {
        return detail::find_flag(required, required_count, f) >= 0;
    }

    constexpr bool excludes(const Flag& f) const {
        return detail::find_flag(excluded, excluded_count, f) >= 0;
    }

    // Sets a flag that must be present
    constexpr Tags require(const Flag& f) const {
        if (requires_flag(f))
            return *this;
        Tags t = *this;
        int at = detail::find_flag(t.excluded, t.excluded_count, f);
        if (at >= 0)
            detail::erase_flag(t.excluded, t.excluded_count, at);
        detail::push_flag(t.required, t.required_count, f);
        return t;
    }

    // Sets a flag that must be absent
    constexpr Tags exclude(const Flag& f) const {
        if (excludes(f))
            return *this;
        Tags t = *this;
        int at = detail::find_flag(t.required, t.required_count, f);
        if (at >= 0)
            detail::erase_flag(t.required, t.required_count, at);
        detail::push_flag(t.excluded, t.excluded_count, f);
        return t;
    }

    constexpr Tags with_selector(Selector p) const {
        if (selector_count >= MaxSelectors)
            throw "Tags selector capacity exceeded";
        Tags t = *this;
        t.selectors[t.selector_count++] = p;
        return t;
    }

    constexpr std::optional<TagState> state(const Flag& f) const {
        int at = detail::find_flag(required, required_count, f);
        if (at >= 0)
            return required[at].disabled || f.disabled ? TagState::Disabled
                                                       : TagState::Required;
        at = detail::find_flag(excluded, excluded_count, f);
        if (at >= 0)
            return excluded[at].disabled || f.disabled ? TagState::Disabled
                                                       : TagState::Excluded;
        return std::nullopt;
    }

    // Compile-time compatibility: decided from the flags alone, before any
    // test data exists.
    template <typename Range>
    constexpr bool compatible(const Range& present) const {
        for (std::size_t i = 0; i < required_count; ++i) {
            if (required[i].disabled)
                continue;
            bool found = false;
            for (const Flag& p : present)
                if (p == required[i])
                    found = true;
            if (!found)
                return false;
        }
        for (const Flag& p : present)
            if (state(p) == TagState::Excluded)
                return false;
        return true;
    }

    constexpr bool compatible(std::initializer_list<Flag> present) const {
        return compatible<std::initializer_list<Flag>>(present);
    }

    // Run-time check: the first selector (in order added) that skips wins.
    constexpr std::optional<Skip> validate(const TestInfo& info) const {
        for (std::size_t i = 0; i < selector_count; ++i)
            if (auto skip = selectors[i](info))
                return skip;
        return std::nullopt;
    }
};

// --- Tag expressions ---
//
//   tags(Flag{"seq"}, !Flag{"set"}, select::has_identity)
//
// A flag given both plainly and negated ends up required.

namespace detail {

template <std::size_t F, std::size_t S>
constexpr Tags<F, S> add_negative(const Tags<F, S>& t, const NegatedFlag& n) {
    return t.exclude(n.flag);
}
template <std::size_t F, std::size_t S>
constexpr Tags<F, S> add_negative(const Tags<F, S>& t, const auto&) {
    return t;
}

template <std::size_t F, std::size_t S>
constexpr Tags<F, S> add_other(const Tags<F, S>& t, const Flag& f) {
    return t.require(f);
}
template <std::size_t F, std::size_t S>
constexpr Tags<F, S> add_other(const Tags<F, S>& t, const NegatedFlag&) {
    return t;
}
template <std::size_t F, std::size_t S>
constexpr Tags<F, S> add_other(const Tags<F, S>& t, Selector p) {
    return t.with_selector(p);
}

} // namespace detail

template <typename... Exprs> constexpr Tags<> tags(const Exprs&... exprs) {
    Tags<> t{};
    ((t = detail::add_negative(t, exprs)), ...);
    ((t = detail::add_other(t, exprs)), ...);
    return t;
}

// --- Stock selectors on the binary operation's declared hints ---

namespace select {

inline constexpr Selector has_identity =
    [](const TestInfo& t) -> std::optional<Skip> {
    if (t.has_identity)
        return std::nullopt;
    return Skip{"binary operation declares no identity element"};
};

inline constexpr Selector associative =
    [](const TestInfo& t) -> std::optional<Skip> {
    if (t.associative)
        return std::nullopt;
    return Skip{"binary operation is not associative"};
};

inline constexpr Selector symmetric =
    [](const TestInfo& t) -> std::optional<Skip> {
    if (t.symmetric)
        return std::nullopt;
    return Skip{"binary operation is not symmetric"};
};

} // namespace select

} // namespace oplaws

#endif // OPLAWS_TAGS_HPP
