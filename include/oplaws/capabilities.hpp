#ifndef OPLAWS_CAPABILITIES_HPP
#define OPLAWS_CAPABILITIES_HPP

#include <array>
#include <cstddef>
#include <initializer_list>

#include <oplaws/name.hpp>

namespace oplaws {

// --- manifest: the operations a target type declares ---
//
// Supplied by the host, one specialization per target type:
//
//   template <> struct oplaws::manifest<MyVec> {
//       static constexpr std::array names{"map", "size", "fold"};
//   };

template <typename T> struct manifest;

template <typename T>
concept HasManifest = requires {
    { manifest<T>::names.size() };
    { manifest<T>::names[0] };
};

// Inherited by everything, never what a law is about
inline constexpr std::array ignored_names{
    "canEqual", "clone", "equals", "hashCode", "par", "seq", "toString"};

// Part of the shared capability contract, so always assumed present
inline constexpr std::array assumed_names{"filter", "flatMap", "map"};

// Room for everything T declares plus the assumed names
template <HasManifest T>
inline constexpr std::size_t manifest_capacity =
    manifest<T>::names.size() + assumed_names.size();

constexpr bool is_ignored(const Name& n) {
    for (const auto& i : ignored_names)
        if (n == i)
            return true;
    return false;
}

// --- Capabilities: a set of operation names ---

template <std::size_t Cap = 64> struct Capabilities {
    Name names[Cap]{};
    std::size_t count{0};

    constexpr std::size_t size() const { return count; }
    constexpr const Name* begin() const { return names; }
    constexpr const Name* end() const { return names + count; }

    constexpr bool contains(const Name& n) const {
        for (std::size_t i = 0; i < count; ++i)
            if (names[i] == n)
                return true;
        return false;
    }

    // In-place add for builders; duplicates are dropped
    constexpr void insert(const Name& n) {
        if (contains(n))
            return;
        if (count >= Cap)
            throw "Capabilities capacity exceeded";
        names[count++] = n;
    }

    constexpr Capabilities with(const Name& n) const {
        Capabilities c = *this;
        c.insert(n);
        return c;
    }

    constexpr Capabilities without(const Name& n) const {
        Capabilities c{};
        for (std::size_t i = 0; i < count; ++i)
            if (!(names[i] == n))
                c.names[c.count++] = names[i];
        return c;
    }

    static constexpr Capabilities of(std::initializer_list<Name> ns) {
        Capabilities c{};
        for (const auto& n : ns)
            c.insert(n);
        return c;
    }

    // manifest<T> - ignored_names + assumed_names, sized to fit T's manifest
    template <HasManifest T>
    static constexpr Capabilities<manifest_capacity<T>> from() {
        Capabilities<manifest_capacity<T>> c{};
        for (const auto& n : manifest<T>::names)
            if (!is_ignored(n))
                c.insert(n);
        for (const auto& n : assumed_names)
            c.insert(n);
        return c;
    }

    // True if every required name is here
    template <typename Range>
    constexpr bool passes(const Range& required) const {
        for (const auto& n : required)
            if (!contains(n))
                return false;
        return true;
    }

    constexpr bool passes(std::initializer_list<Name> required) const {
        return passes<std::initializer_list<Name>>(required);
    }

    template <std::size_t C2>
    constexpr bool passes(const Capabilities<C2>& other) const {
        for (std::size_t i = 0; i < other.count; ++i)
            if (!contains(other.names[i]))
                return false;
        return true;
    }

    template <std::size_t C2>
    constexpr Capabilities<Cap + C2>
    operator|(const Capabilities<C2>& other) const {
        Capabilities<Cap + C2> c{};
        for (std::size_t i = 0; i < count; ++i)
            c.insert(names[i]);
        for (std::size_t i = 0; i < other.count; ++i)
            c.insert(other.names[i]);
        return c;
    }
};

// Does T offer every one of the named operations?
template <HasManifest T>
constexpr bool has_capabilities(std::initializer_list<Name> required) {
    return Capabilities<manifest_capacity<T>>::template from<T>().passes(
        required);
}

} // namespace oplaws

#endif // OPLAWS_CAPABILITIES_HPP
