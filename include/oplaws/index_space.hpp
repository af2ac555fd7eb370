#ifndef OPLAWS_INDEX_SPACE_HPP
#define OPLAWS_INDEX_SPACE_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <vector>

namespace oplaws {

// --- Mixed-radix index spaces (one dimension per role) ---

template <std::size_t N> using Sizes = std::array<std::size_t, N>;
template <std::size_t N> using Indices = std::array<int, N>;

template <std::size_t N> constexpr std::size_t total(const Sizes<N>& sizes) {
    std::size_t t = 1;
    for (auto s : sizes)
        t *= s;
    return t;
}

template <std::size_t N>
constexpr bool in_range(const Sizes<N>& sizes, const Indices<N>& ixs) {
    for (std::size_t d = 0; d < N; ++d)
        if (ixs[d] < 0 || static_cast<std::size_t>(ixs[d]) >= sizes[d])
            return false;
    return true;
}

// Flat position -> index vector; the last dimension varies fastest.
template <std::size_t N>
constexpr std::optional<Indices<N>> decode(const Sizes<N>& sizes,
                                           std::size_t k) {
    if (k >= total(sizes))
        return std::nullopt;
    Indices<N> ixs{};
    for (std::size_t d = N; d-- > 0;) {
        ixs[d] = static_cast<int>(k % sizes[d]);
        k /= sizes[d];
    }
    return ixs;
}

template <std::size_t N>
constexpr std::size_t encode(const Sizes<N>& sizes, const Indices<N>& ixs) {
    std::size_t k = 0;
    for (std::size_t d = 0; d < N; ++d)
        k = k * sizes[d] + static_cast<std::size_t>(ixs[d]);
    return k;
}

// --- IndexCursor: odometer over every index vector, in decode order ---

template <std::size_t N> struct IndexCursor {
    Sizes<N> sizes{};
    Indices<N> current{};
    bool exhausted{false};

    constexpr explicit IndexCursor(const Sizes<N>& s)
        : sizes(s), exhausted(total(s) == 0) {}

    constexpr bool done() const { return exhausted; }
    constexpr const Indices<N>& operator*() const { return current; }

    constexpr bool advance() {
        if (exhausted)
            return false;
        for (std::size_t d = N; d-- > 0;) {
            if (static_cast<std::size_t>(++current[d]) < sizes[d])
                return true;
            current[d] = 0;
        }
        exhausted = true;
        return false;
    }
};

template <std::size_t N, typename F>
constexpr void for_each_index(const Sizes<N>& sizes, F&& fn) {
    for (IndexCursor<N> c{sizes}; !c.done(); c.advance())
        fn(*c);
}

// Up to `count` distinct vectors spread evenly over the space, starting at
// the all-zero vector. Deterministic: same sizes and count, same result.
template <std::size_t N>
std::vector<Indices<N>> sample(const Sizes<N>& sizes, std::size_t count) {
    std::vector<Indices<N>> out;
    const std::size_t t = total(sizes);
    const std::size_t n = count < t ? count : t;
    if (n == 0)
        return out;
    out.reserve(n);
    const std::size_t q = t / n;
    const std::size_t r = t % n;
    for (std::size_t i = 0; i < n; ++i)
        out.push_back(*decode(sizes, i * q + (i * r) / n));
    return out;
}

} // namespace oplaws

#endif // OPLAWS_INDEX_SPACE_HPP
