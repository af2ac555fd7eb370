#ifndef OPLAWS_STR_UTILS_HPP
#define OPLAWS_STR_UTILS_HPP

#include <cstddef>
#include <cstdint>

namespace oplaws {

constexpr void copy_str(char* dst, const char* src, std::size_t max_len) {
    std::size_t i = 0;
    for (; i < max_len - 1 && src[i] != '\0'; ++i)
        dst[i] = src[i];
    dst[i] = '\0';
}

constexpr bool str_eq(const char* a, const char* b) {
    for (std::size_t i = 0;; ++i) {
        if (a[i] != b[i])
            return false;
        if (a[i] == '\0')
            return true;
    }
}

constexpr std::size_t str_len(const char* s) {
    std::size_t len = 0;
    while (s[len] != '\0')
        ++len;
    return len;
}

// Lexicographic, for sorted output only
constexpr bool str_less(const char* a, const char* b) {
    for (std::size_t i = 0;; ++i) {
        if (a[i] != b[i])
            return static_cast<unsigned char>(a[i]) <
                   static_cast<unsigned char>(b[i]);
        if (a[i] == '\0')
            return false;
    }
}

// 64-bit FNV-1a
constexpr std::uint64_t str_hash(const char* s) {
    std::uint64_t h = 0xcbf29ce484222325ull;
    for (std::size_t i = 0; s[i] != '\0'; ++i) {
        h ^= static_cast<unsigned char>(s[i]);
        h *= 0x100000001b3ull;
    }
    return h;
}

constexpr std::uint64_t hash_mix(std::uint64_t seed, std::uint64_t h) {
    return seed ^ (h + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2));
}

} // namespace oplaws

#endif // OPLAWS_STR_UTILS_HPP
