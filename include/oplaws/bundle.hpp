#ifndef OPLAWS_BUNDLE_HPP
#define OPLAWS_BUNDLE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>

#include <oplaws/operations.hpp>
#include <oplaws/str_utils.hpp>

namespace oplaws {

// --- Roles: one variant of each is chosen per bundle ---

enum class Role : std::size_t { Endo, Hetero, Binary, Predicate, Partial };

inline constexpr std::size_t role_count = 5;

constexpr const char* role_name(Role r) {
    switch (r) {
    case Role::Endo:
        return "endo";
    case Role::Hetero:
        return "hetero";
    case Role::Binary:
        return "binary";
    case Role::Predicate:
        return "predicate";
    case Role::Partial:
        return "partial";
    }
    return "?";
}

// --- OpValues: the chosen variants, without usage tracking ---

template <typename A, typename B> struct OpValues {
    Endo<A> f{};
    Fn<A, B> g{};
    BinaryOp<A> op{};
    Pred<A> p{};
    PartialFn<A> pf{};

    constexpr std::array<Name, role_count> names() const {
        return {f.name, g.name, op.name, p.name, pf.name};
    }

    constexpr std::uint64_t hash() const {
        std::uint64_t h = 0;
        for (const auto& n : names())
            h = hash_mix(h, n.hash());
        return h;
    }

    constexpr bool operator==(const OpValues&) const = default;
};

// --- OpBundle: one configuration plus per-role usage flags ---
//
// Every accessor call marks its role as used, so after a law has run the
// harness can check that the law exercised what it claims to. Equality and
// hashing ignore the flags.

template <typename A, typename B> class OpBundle {
  public:
    using element_type = A;
    using target_type = B;

    constexpr OpBundle(Endo<A> f, Fn<A, B> g, BinaryOp<A> op, Pred<A> p,
                       PartialFn<A> pf)
        : values_{std::move(f), std::move(g), std::move(op), std::move(p),
                  std::move(pf)} {}

    constexpr explicit OpBundle(OpValues<A, B> v) : values_(std::move(v)) {}

    // Changes an element to another of the same type
    constexpr const Endo<A>& endo_transform() {
        mark(Role::Endo);
        return values_.f;
    }

    // Changes an element to one of a different type
    constexpr const Fn<A, B>& hetero_transform() {
        mark(Role::Hetero);
        return values_.g;
    }

    // Combines two elements into one
    constexpr const BinaryOp<A>& binary_op() {
        mark(Role::Binary);
        return values_.op;
    }

    constexpr const Pred<A>& predicate() {
        mark(Role::Predicate);
        return values_.p;
    }

    // Changes some elements, is undefined on the rest
    constexpr const PartialFn<A>& partial_transform() {
        mark(Role::Partial);
        return values_.pf;
    }

    // Identity of binary_op(). Marks the *partial* slot: coverage reports
    // depend on this sharing, do not give it a slot of its own.
    // Throws MissingIdentityElement if the operation declares none.
    const A& identity_element() {
        mark(Role::Partial);
        return values_.op.zero();
    }

    constexpr bool used(Role r) const {
        return used_[static_cast<std::size_t>(r)];
    }

    constexpr bool touched() const {
        for (bool u : used_)
            if (u)
                return true;
        return false;
    }

    constexpr OpBundle& reset() {
        used_.fill(false);
        return *this;
    }

    constexpr const OpValues<A, B>& values() const { return values_; }

    constexpr std::uint64_t hash() const { return values_.hash(); }

    constexpr bool operator==(const OpBundle& o) const {
        return values_ == o.values_;
    }

  private:
    constexpr void mark(Role r) { used_[static_cast<std::size_t>(r)] = true; }

    OpValues<A, B> values_;
    std::array<bool, role_count> used_{};
};

} // namespace oplaws

template <typename A, typename B> struct std::hash<oplaws::OpBundle<A, B>> {
    std::size_t operator()(const oplaws::OpBundle<A, B>& b) const noexcept {
        return static_cast<std::size_t>(b.hash());
    }
};

#endif // OPLAWS_BUNDLE_HPP
