#include <gtest/gtest.h>
#include <oplaws/bundle.hpp>
#include <oplaws/stock.hpp>

#include <unordered_set>

using namespace oplaws;
using stock::int_explorer;

namespace {

OpBundle<int, long> bundle_at(Indices<role_count> ixs) {
    return *int_explorer.lookup(ixs);
}

} // namespace

// --- Usage flags ---

TEST(Bundle, FreshBundleIsUntouched) {
    auto ops = bundle_at({0, 0, 0, 0, 0});
    EXPECT_FALSE(ops.touched());
    for (std::size_t r = 0; r < role_count; ++r)
        EXPECT_FALSE(ops.used(static_cast<Role>(r)));
}

TEST(Bundle, EachAccessorMarksItsRole) {
    {
        auto ops = bundle_at({0, 0, 0, 0, 0});
        EXPECT_EQ(ops.endo_transform()(1), 2);
        EXPECT_TRUE(ops.used(Role::Endo));
        EXPECT_TRUE(ops.touched());
    }
    {
        auto ops = bundle_at({0, 1, 0, 0, 0});
        EXPECT_EQ(ops.hetero_transform()(7), 7L);
        EXPECT_TRUE(ops.used(Role::Hetero));
        EXPECT_FALSE(ops.used(Role::Endo));
    }
    {
        auto ops = bundle_at({0, 0, 0, 0, 0});
        EXPECT_EQ(ops.binary_op()(2, 3), 5);
        EXPECT_TRUE(ops.used(Role::Binary));
    }
    {
        auto ops = bundle_at({0, 0, 0, 0, 0});
        EXPECT_TRUE(ops.predicate()(9));
        EXPECT_TRUE(ops.used(Role::Predicate));
    }
    {
        auto ops = bundle_at({0, 0, 0, 0, 0});
        EXPECT_EQ(ops.partial_transform()(8), 4);
        EXPECT_TRUE(ops.used(Role::Partial));
    }
}

TEST(Bundle, RepeatedCallsKeepFlagSet) {
    auto ops = bundle_at({0, 0, 0, 0, 0});
    (void)ops.predicate();
    (void)ops.predicate();
    EXPECT_TRUE(ops.used(Role::Predicate));
    EXPECT_TRUE(ops.touched());
}

TEST(Bundle, ValuesDoNotMarkAnything) {
    auto ops = bundle_at({1, 1, 1, 1, 1});
    EXPECT_EQ(ops.values().f.name, "quadratic");
    EXPECT_EQ(ops.values().op(2, 2), 4 - 4 - 6 + 4);
    EXPECT_FALSE(ops.touched());
}

// --- identity_element shares the partial slot ---

TEST(Bundle, IdentityElementMarksPartialSlot) {
    auto ops = bundle_at({0, 0, 0, 0, 0}); // summation, identity 0
    EXPECT_EQ(ops.identity_element(), 0);
    EXPECT_TRUE(ops.used(Role::Partial));
    EXPECT_FALSE(ops.used(Role::Binary));
    EXPECT_TRUE(ops.touched());
}

TEST(Bundle, IdentityAndPartialAreIndistinguishable) {
    auto by_identity = bundle_at({0, 0, 0, 0, 0});
    auto by_partial = bundle_at({0, 0, 0, 0, 0});
    (void)by_identity.identity_element();
    (void)by_partial.partial_transform();
    for (std::size_t r = 0; r < role_count; ++r)
        EXPECT_EQ(by_identity.used(static_cast<Role>(r)),
                  by_partial.used(static_cast<Role>(r)));
}

TEST(Bundle, MissingIdentityElementThrows) {
    auto ops = bundle_at({0, 0, 1, 0, 0}); // multiply, no identity
    EXPECT_THROW((void)ops.identity_element(), MissingIdentityElement);
}

// --- reset ---

TEST(Bundle, ResetClearsEveryFlag) {
    auto ops = bundle_at({0, 0, 0, 0, 0});
    (void)ops.endo_transform();
    (void)ops.hetero_transform();
    (void)ops.binary_op();
    (void)ops.predicate();
    (void)ops.partial_transform();
    EXPECT_TRUE(ops.touched());
    EXPECT_FALSE(ops.reset().touched());
    for (std::size_t r = 0; r < role_count; ++r)
        EXPECT_FALSE(ops.used(static_cast<Role>(r)));
}

TEST(Bundle, ResetKeepsTheVariants) {
    auto ops = bundle_at({1, 0, 0, 2, 1});
    auto before = ops.values().names();
    (void)ops.endo_transform();
    ops.reset();
    EXPECT_EQ(ops.values().names(), before);
    EXPECT_EQ(ops, bundle_at({1, 0, 0, 2, 1}));
}

// --- Equality and hashing ---

TEST(Bundle, SameIndicesAreEqual) {
    auto a = bundle_at({1, 0, 1, 2, 0});
    auto b = bundle_at({1, 0, 1, 2, 0});
    EXPECT_EQ(a, b);
    EXPECT_EQ((std::hash<OpBundle<int, long>>{}(a)),
              (std::hash<OpBundle<int, long>>{}(b)));
}

TEST(Bundle, FlagsDoNotAffectEquality) {
    auto a = bundle_at({1, 0, 1, 2, 0});
    auto b = bundle_at({1, 0, 1, 2, 0});
    (void)a.binary_op();
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.hash(), b.hash());
}

TEST(Bundle, AnyDifferentIndexIsUnequal) {
    auto base = bundle_at({0, 0, 0, 0, 0});
    EXPECT_NE(base, bundle_at({1, 0, 0, 0, 0}));
    EXPECT_NE(base, bundle_at({0, 1, 0, 0, 0}));
    EXPECT_NE(base, bundle_at({0, 0, 1, 0, 0}));
    EXPECT_NE(base, bundle_at({0, 0, 0, 1, 0}));
    EXPECT_NE(base, bundle_at({0, 0, 0, 0, 1}));
}

TEST(Bundle, EqualityUsesNamesNotFunctions) {
    OpBundle<int, int> a{
        {"f", [](int i) { return i; }},
        {"g", [](int i) { return i; }},
        {"op", [](int i, int j) { return i + j; }, std::nullopt,
         Associativity::Associative, Symmetry::Symmetric},
        {"p", [](int) { return true; }},
        {"pf", [](int i) -> std::optional<int> { return i; }}};
    OpBundle<int, int> b{
        {"f", [](int i) { return -i; }},
        {"g", [](int i) { return i * 3; }},
        {"op", [](int i, int j) { return i * j; }, 1,
         Associativity::Associative, Symmetry::Symmetric},
        {"p", [](int) { return false; }},
        {"pf", [](int) -> std::optional<int> { return std::nullopt; }}};
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.hash(), b.hash());
}

TEST(Bundle, HashSetDeduplicates) {
    std::unordered_set<OpBundle<int, long>> seen;
    seen.insert(bundle_at({0, 1, 0, 1, 0}));
    seen.insert(bundle_at({0, 1, 0, 1, 0}));
    seen.insert(bundle_at({0, 1, 0, 1, 1}));
    EXPECT_EQ(seen.size(), 2u);
}

TEST(Bundle, RoleNames) {
    static_assert(str_eq(role_name(Role::Endo), "endo"));
    static_assert(str_eq(role_name(Role::Partial), "partial"));
}
