#ifndef OPLAWS_NAME_HPP
#define OPLAWS_NAME_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>

#include <oplaws/str_utils.hpp>

namespace oplaws {

// --- Name: identity of a variant, flag or capability (structural type) ---

struct Name {
    static constexpr std::size_t capacity = 32;

    char data[capacity]{};

    constexpr Name() = default;
    constexpr Name(const char* s) {
        if (str_len(s) >= capacity)
            throw "name too long";
        copy_str(data, s, capacity);
    }
    constexpr Name(std::string_view s) {
        if (s.size() >= capacity)
            throw "name too long";
        for (std::size_t i = 0; i < s.size(); ++i)
            data[i] = s[i];
    }

    constexpr const char* c_str() const { return data; }
    constexpr std::string_view view() const { return data; }
    constexpr bool empty() const { return data[0] == '\0'; }
    constexpr std::uint64_t hash() const { return str_hash(data); }

    constexpr bool operator==(const Name& o) const {
        return str_eq(data, o.data);
    }
    constexpr bool operator==(const char* s) const { return str_eq(data, s); }
    constexpr bool operator<(const Name& o) const {
        return str_less(data, o.data);
    }
};

// --- Debug location (never part of identity) ---

struct Location {
    const char* file{""};
    std::uint_least32_t line{0};

    constexpr bool known() const { return line != 0; }
};

} // namespace oplaws

template <> struct std::hash<oplaws::Name> {
    std::size_t operator()(const oplaws::Name& n) const noexcept {
        return static_cast<std::size_t>(n.hash());
    }
};

#endif // OPLAWS_NAME_HPP
