#include <gtest/gtest.h>
#include <oplaws/explorer.hpp>
#include <oplaws/stock.hpp>

#include <limits>
#include <set>
#include <string>
#include <unordered_set>

using namespace oplaws;
using namespace oplaws::stock;

// --- Sizes ---

TEST(Explorer, IntSpaceSizes) {
    static_assert(int_explorer.sizes() == Sizes<role_count>{2, 2, 2, 3, 3});
    static_assert(int_explorer.total() == 72);
}

TEST(Explorer, StringSpaceSizes) {
    EXPECT_EQ(str_explorer().sizes(), (Sizes<role_count>{2, 2, 2, 3, 3}));
    EXPECT_EQ(str_explorer().total(), 72u);
}

TEST(Explorer, MapEntrySpacesHaveOneOfEach) {
    EXPECT_EQ(long_str_explorer().sizes(), (Sizes<role_count>{1, 1, 1, 1, 1}));
    EXPECT_EQ(str_long_explorer().sizes(), (Sizes<role_count>{1, 1, 1, 1, 1}));
}

// --- lookup ---

TEST(Explorer, LookupAtCompileTime) {
    static_assert(int_explorer.lookup({1, 1, 1, 2, 2})->values().op.name ==
                  "multiply");
    static_assert(!int_explorer.lookup({2, 0, 0, 0, 0}).has_value());
}

TEST(Explorer, LookupSelectsExactlyTheIndexedVariants) {
    for_each_index(int_explorer.sizes(), [](const Indices<role_count>& ixs) {
        auto ops = int_explorer.lookup(ixs);
        ASSERT_TRUE(ops.has_value());
        const auto& v = ops->values();
        EXPECT_EQ(v.f, int_fns.index(ixs[0]));
        EXPECT_EQ(v.g, int_to_longs.index(ixs[1]));
        EXPECT_EQ(v.op, int_op_fns.index(ixs[2]));
        EXPECT_EQ(v.p, int_preds.index(ixs[3]));
        EXPECT_EQ(v.pf, int_parts.index(ixs[4]));
        EXPECT_FALSE(ops->touched());
    });
}

TEST(Explorer, OutOfRangeGivesNothing) {
    EXPECT_FALSE(int_explorer.lookup({2, 0, 0, 0, 0}).has_value());
    EXPECT_FALSE(int_explorer.lookup({0, 2, 0, 0, 0}).has_value());
    EXPECT_FALSE(int_explorer.lookup({0, 0, 2, 0, 0}).has_value());
    EXPECT_FALSE(int_explorer.lookup({0, 0, 0, 3, 0}).has_value());
    EXPECT_FALSE(int_explorer.lookup({0, 0, 0, 0, 3}).has_value());
    EXPECT_FALSE(int_explorer.lookup({-1, 0, 0, 0, 0}).has_value());
    EXPECT_FALSE(int_explorer.validate({0, 0, 0, 0, 99}));
    EXPECT_TRUE(int_explorer.validate({1, 1, 1, 2, 2}));
}

TEST(Explorer, EachLookupIsFresh) {
    auto a = int_explorer.lookup({0, 0, 0, 0, 0});
    (void)a->predicate();
    auto b = int_explorer.lookup({0, 0, 0, 0, 0});
    EXPECT_TRUE(a->touched());
    EXPECT_FALSE(b->touched());
}

// --- Enumeration ---

TEST(Explorer, FullEnumerationHasNoDuplicatesOrGaps) {
    std::unordered_set<OpBundle<int, long>> seen;
    std::set<std::string> keys;
    int visits = 0;
    int_explorer.for_each([&](const Indices<role_count>&, auto& ops) {
        seen.insert(ops);
        std::string key;
        for (const auto& n : ops.values().names())
            key += std::string(n.view()) + "/";
        keys.insert(key);
        ++visits;
    });
    EXPECT_EQ(visits, 72);
    EXPECT_EQ(seen.size(), 72u);
    EXPECT_EQ(keys.size(), 72u);
}

TEST(Explorer, StringEnumerationHasNoDuplicates) {
    std::unordered_set<OpBundle<std::string, std::optional<std::string>>> seen;
    str_explorer().for_each(
        [&](const Indices<role_count>&, auto& ops) { seen.insert(ops); });
    EXPECT_EQ(seen.size(), 72u);
}

TEST(Explorer, SampleHandsOutDistinctBundles) {
    auto picks = int_explorer.sample(12);
    ASSERT_EQ(picks.size(), 12u);
    std::unordered_set<OpBundle<int, long>> distinct(picks.begin(),
                                                     picks.end());
    EXPECT_EQ(distinct.size(), 12u);
    EXPECT_EQ(picks.front(), *int_explorer.lookup({0, 0, 0, 0, 0}));
    EXPECT_EQ(int_explorer.sample(500).size(), 72u);
}

// --- Stock variants behave as named ---

TEST(Explorer, StockIntVariants) {
    auto ops = *int_explorer.lookup({1, 0, 1, 0, 1});
    EXPECT_EQ(ops.endo_transform()(4), 16 - 12 + 1);
    EXPECT_EQ(ops.hetero_transform()(1), 0x200000001L);
    EXPECT_EQ(ops.binary_op()(3, 2), 6 - 6 - 6 + 4);
    EXPECT_FALSE(ops.predicate()(4));
    EXPECT_EQ(ops.partial_transform()(5), 5);
}

TEST(Explorer, StockIntVariantsWrapAtTheExtremes) {
    constexpr int max = std::numeric_limits<int>::max();
    constexpr int min = std::numeric_limits<int>::min();

    auto sum = *int_explorer.lookup({0, 0, 0, 0, 0});
    EXPECT_EQ(sum.endo_transform()(max), min);
    EXPECT_EQ(sum.binary_op()(max, 1), min);
    EXPECT_EQ(sum.binary_op()(min, -1), max);

    auto mul = *int_explorer.lookup({1, 0, 1, 0, 0});
    // 2499850001 and 4899650004 reduced modulo 2^32
    EXPECT_EQ(mul.endo_transform()(50000), -1795117295);
    EXPECT_EQ(mul.binary_op()(70000, 70000), 604682708);
    EXPECT_EQ(mul.endo_transform()(-1), 5);
    static_assert(int_fns.index(1).fn(50000) == -1795117295);
}

TEST(Explorer, StockStringVariants) {
    auto ops = *str_explorer().lookup({1, 1, 1, 0, 0});
    EXPECT_EQ(ops.endo_transform()("ab"), "<ab-<");
    EXPECT_EQ(ops.hetero_transform()("a1b2"), std::optional<std::string>("ab"));
    EXPECT_FALSE(ops.hetero_transform()("123").has_value());
    EXPECT_EQ(ops.binary_op()("abc", "xy"), "axby");
    EXPECT_FALSE(ops.values().op.has_identity());
    EXPECT_TRUE(ops.predicate()("abz"));
    EXPECT_FALSE(ops.predicate()("zba"));
    EXPECT_EQ(ops.partial_transform()("abc"), std::optional<std::string>("cba"));
    EXPECT_FALSE(ops.partial_transform()("ab").has_value());

    auto concat = *str_explorer().lookup({0, 0, 0, 0, 0});
    EXPECT_EQ(concat.endo_transform()("aB"), "AB");
    EXPECT_EQ(concat.identity_element(), "");
    EXPECT_EQ(concat.binary_op()("ab", "cd"), "abcd");
}

TEST(Explorer, StockMapEntryVariants) {
    auto ls = *long_str_explorer().lookup({0, 0, 0, 0, 0});
    EXPECT_EQ(ls.endo_transform()({3, "x"}), (LongStr{4, "x"}));
    EXPECT_EQ(ls.hetero_transform()({3, "x"}), (StrLong{"x", 3}));
    EXPECT_EQ(ls.binary_op()({1, "a"}, {2, "b"}), (LongStr{3, "ab"}));
    EXPECT_TRUE(ls.predicate()({5, "abc"}));
    EXPECT_EQ(ls.partial_transform()({3, "x"}), (LongStr{1, "x"}));
    EXPECT_FALSE(ls.partial_transform()({2, "x"}).has_value());

    auto sl = *str_long_explorer().lookup({0, 0, 0, 0, 0});
    EXPECT_EQ(sl.endo_transform()({"k", 1}), (StrLong{"k..", 1}));
    EXPECT_EQ(sl.hetero_transform()({"k", 1}), (LongStr{1, "k"}));
    EXPECT_TRUE(sl.predicate()({"ab", 3}));
    EXPECT_EQ(sl.partial_transform()({"k", 1}), (StrLong{"k!", 1}));
    EXPECT_FALSE(sl.partial_transform()({"k", 2}).has_value());
}
