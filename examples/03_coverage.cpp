// 03_coverage.cpp - Checking what a law body really used
//
// Shows: instrumented accessors, touched(), used(Role), reset() for a
//        retry, and identity_element() sharing the partial slot.

#include <iostream>
#include <vector>
#include <oplaws/oplaws.hpp>

using namespace oplaws;

using Ops = OpBundle<int, long>;

// "reduce from the identity equals reduce of the whole"
bool reduce_law(Ops& ops, const std::vector<int>& xs) {
    int lhs = ops.identity_element();
    for (int x : xs)
        lhs = ops.binary_op()(lhs, x);
    int rhs = xs.empty() ? ops.identity_element() : xs.front();
    for (std::size_t i = 1; i < xs.size(); ++i)
        rhs = ops.binary_op()(rhs, xs[i]);
    return lhs == rhs;
}

void report(const Ops& ops) {
    for (std::size_t r = 0; r < role_count; ++r)
        std::cout << "  " << role_name(static_cast<Role>(r)) << ": "
                  << (ops.used(static_cast<Role>(r)) ? "used" : "-") << '\n';
}

int main() {
    auto ops = *stock::int_explorer.lookup({0, 0, 0, 0, 0});
    std::cout << describe(ops) << '\n';
    std::cout << "law holds: " << reduce_law(ops, {1, 2, 3}) << '\n';
    report(ops);

    // Same bundle, second attempt
    ops.reset();
    std::cout << "after reset, touched: " << ops.touched() << '\n';
    std::cout << "law holds on empty: " << reduce_law(ops, {}) << '\n';
    report(ops);
}
