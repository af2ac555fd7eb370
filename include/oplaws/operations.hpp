#ifndef OPLAWS_OPERATIONS_HPP
#define OPLAWS_OPERATIONS_HPP

#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include <oplaws/name.hpp>

namespace oplaws {

// Thrown when a law asks for the identity of an operation that declares
// none. Filter such laws out with tags::has_identity instead of catching.
struct MissingIdentityElement : std::logic_error {
    explicit MissingIdentityElement(const Name& op)
        : std::logic_error("binary operation '" + std::string(op.view()) +
                           "' declares no identity element") {}
};

namespace detail {

constexpr Location located(const std::source_location& loc) {
    return Location{loc.file_name(), loc.line()};
}

template <typename F>
concept Stateless = std::is_empty_v<F> && std::is_default_constructible_v<F>;

} // namespace detail

// --- Fn: a named unary function ---
//
// Identity is the name alone. Two variants with the same body but different
// names are different; reusing a name means reusing the identity.

template <typename In, typename Out> struct Fn {
    using input_type = In;
    using output_type = Out;
    using function_type = Out (*)(In);

    Name name{};
    function_type fn{nullptr};
    Location where{};

    constexpr Fn() = default;

    constexpr Fn(Name n, function_type f,
                 std::source_location loc = std::source_location::current())
        : name(n), fn(f), where(detail::located(loc)) {}

    // Stateless lambdas with any compatible parameter form
    template <detail::Stateless F>
        requires std::is_invocable_r_v<Out, F, const In&>
    constexpr Fn(Name n, F,
                 std::source_location loc = std::source_location::current())
        : name(n), fn([](In x) -> Out { return F{}(x); }),
          where(detail::located(loc)) {}

    constexpr Out operator()(const In& x) const { return fn(x); }

    constexpr bool operator==(const Fn& o) const { return name == o.name; }
};

template <typename A> using Endo = Fn<A, A>;
template <typename A> using Pred = Fn<A, bool>;

// --- BinaryOp: a named operation with unverified algebraic hints ---

enum class Associativity { Associative, Nonassociative };
enum class Symmetry { Symmetric, Asymmetric };

template <typename A> struct BinaryOp {
    using value_type = A;
    using function_type = A (*)(A, A);

    Name name{};
    function_type fn{nullptr};
    std::optional<A> identity{};
    Associativity assoc{Associativity::Nonassociative};
    Symmetry sym{Symmetry::Asymmetric};
    Location where{};

    constexpr BinaryOp() = default;

    constexpr BinaryOp(
        Name n, function_type f, std::optional<A> zero, Associativity a,
        Symmetry s, std::source_location loc = std::source_location::current())
        : name(n), fn(f), identity(std::move(zero)), assoc(a), sym(s),
          where(detail::located(loc)) {}

    template <detail::Stateless F>
        requires std::is_invocable_r_v<A, F, const A&, const A&>
    constexpr BinaryOp(
        Name n, F, std::optional<A> zero, Associativity a, Symmetry s,
        std::source_location loc = std::source_location::current())
        : name(n), fn([](A x, A y) -> A { return F{}(x, y); }),
          identity(std::move(zero)), assoc(a), sym(s),
          where(detail::located(loc)) {}

    constexpr A operator()(const A& x, const A& y) const { return fn(x, y); }

    constexpr bool has_identity() const { return identity.has_value(); }
    constexpr bool associative() const {
        return assoc == Associativity::Associative;
    }
    constexpr bool symmetric() const { return sym == Symmetry::Symmetric; }

    const A& zero() const {
        if (!identity)
            throw MissingIdentityElement(name);
        return *identity;
    }

    constexpr bool operator==(const BinaryOp& o) const {
        return name == o.name;
    }
};

// --- PartialFn: a named function defined on part of its domain ---

template <typename A> struct PartialFn {
    using value_type = A;
    using function_type = std::optional<A> (*)(A);

    Name name{};
    function_type fn{nullptr};
    Location where{};

    constexpr PartialFn() = default;

    constexpr PartialFn(
        Name n, function_type f,
        std::source_location loc = std::source_location::current())
        : name(n), fn(f), where(detail::located(loc)) {}

    template <detail::Stateless F>
        requires std::is_invocable_r_v<std::optional<A>, F, const A&>
    constexpr PartialFn(
        Name n, F, std::source_location loc = std::source_location::current())
        : name(n), fn([](A x) -> std::optional<A> { return F{}(x); }),
          where(detail::located(loc)) {}

    constexpr std::optional<A> operator()(const A& x) const { return fn(x); }
    constexpr bool defined_at(const A& x) const { return fn(x).has_value(); }

    constexpr bool operator==(const PartialFn& o) const {
        return name == o.name;
    }
};

} // namespace oplaws

#endif // OPLAWS_OPERATIONS_HPP
