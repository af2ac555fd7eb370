// 01_enumerate.cpp - Walking the space of operation configurations
//
// Shows: VariantRegistry, Explorer::sizes/lookup, for_each, sample,
//        describe() for bundles.

#include <iostream>
#include <oplaws/oplaws.hpp>

using namespace oplaws;

// A registry of your own, filled once at compile time
constexpr auto doublings = [] {
    VariantRegistry<Endo<int>> r;
    r.add({"twice", [](int i) { return 2 * i; }});
    r.add({"shift", [](int i) { return i << 1; }});
    r.add({"negate", [](int i) { return -i; }});
    return r;
}();

constexpr Explorer<int, long> explorer{doublings, stock::int_to_longs,
                                       stock::int_op_fns, stock::int_preds,
                                       stock::int_parts};

int main() {
    static_assert(explorer.total() == 3 * 2 * 2 * 3 * 3);

    auto sizes = explorer.sizes();
    std::cout << "sizes:";
    for (auto s : sizes)
        std::cout << ' ' << s;
    std::cout << "  (" << explorer.total() << " configurations)\n";

    // --- Direct lookup; out-of-range vectors give nothing ---
    if (auto ops = explorer.lookup({2, 1, 0, 0, 2}))
        std::cout << "lookup: " << describe(*ops) << '\n';
    if (!explorer.lookup({3, 0, 0, 0, 0}))
        std::cout << "lookup {3,0,0,0,0}: out of range\n";

    // --- Every configuration ---
    int n = 0;
    explorer.for_each([&](const Indices<role_count>&, auto&) { ++n; });
    std::cout << "for_each visited " << n << '\n';

    // --- A deterministic spread of a few ---
    for (const auto& ops : explorer.sample(4))
        std::cout << "sample: " << describe(ops) << '\n';
}
