// 02_filtering.cpp - Deciding which laws apply
//
// Shows: manifest<T> and Capabilities, tag expressions, compatible()
//        before generation, validate() per configuration.

#include <array>
#include <iostream>
#include <oplaws/oplaws.hpp>

using namespace oplaws;

struct Ring {};

template <> struct oplaws::manifest<Ring> {
    static constexpr std::array names{"fold", "size", "rotate", "clone"};
};

int main() {
    // --- Capability gate: is the law legal for this target at all? ---
    constexpr auto ring = Capabilities<>::from<Ring>();
    constexpr auto fold_law = Capabilities<>::of({"fold", "map"});
    constexpr auto sort_law = Capabilities<>::of({"sortBy"});
    static_assert(ring.passes(fold_law));
    static_assert(!ring.passes(sort_law));
    std::cout << "Ring offers " << describe(ring) << '\n';

    // --- Structural tags: decided before any data exists ---
    constexpr Flag seq{"seq"};
    constexpr Flag set{"set"};
    constexpr auto law_tags = tags(seq, !set, select::has_identity);
    std::cout << "law tags: " << describe(law_tags) << '\n';
    std::cout << "compatible with {seq}: " << law_tags.compatible({seq})
              << '\n';
    std::cout << "compatible with {seq, set}: "
              << law_tags.compatible({seq, set}) << '\n';

    // --- Dynamic selectors: decided per configuration ---
    int kept = 0;
    int skipped = 0;
    stock::int_explorer.for_each([&](const Indices<role_count>&, auto& ops) {
        if (auto skip = law_tags.validate(TestInfo::of(ops, "Ring", "Int"))) {
            if (skipped++ == 0)
                std::cout << "first skip: " << skip->reason << '\n';
        } else {
            ++kept;
        }
    });
    std::cout << kept << " kept, " << skipped << " skipped\n";
}
