#ifndef OPLAWS_STOCK_HPP
#define OPLAWS_STOCK_HPP

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <utility>

#include <oplaws/explorer.hpp>
#include <oplaws/operations.hpp>
#include <oplaws/variants.hpp>

// Ready-made variants for the element types collection laws are usually
// instantiated with.

namespace oplaws::stock {

using enum Associativity;
using enum Symmetry;

// --- Int ---

// Int variants wrap on overflow: arithmetic is done in unsigned and brought
// back modulo 2^32.

inline constexpr auto int_fns = [] {
    VariantRegistry<Endo<int>> r;
    r.add({"plusOne", [](int i) {
                return static_cast<int>(static_cast<unsigned>(i) + 1u);
            }});
    r.add({"quadratic", [](int i) {
                auto u = static_cast<unsigned>(i);
                return static_cast<int>(u * u - 3u * u + 1u);
            }});
    return r;
}();

inline constexpr auto int_to_longs = [] {
    VariantRegistry<Fn<int, long>> r;
    r.add({"bit33", [](int i) { return 0x200000000L | i; }});
    r.add({"cast", [](int i) { return static_cast<long>(i); }});
    return r;
}();

inline constexpr auto int_op_fns = [] {
    VariantRegistry<BinaryOp<int>> r;
    r.add({"summation", [](int i, int j) {
               return static_cast<int>(static_cast<unsigned>(i) +
                                       static_cast<unsigned>(j));
           }, 0, Associative,
           Symmetric});
    r.add({"multiply", [](int i, int j) {
               auto u = static_cast<unsigned>(i);
               auto v = static_cast<unsigned>(j);
               return static_cast<int>(u * v - 2u * u - 3u * v + 4u);
           },
           std::nullopt, Nonassociative, Asymmetric});
    return r;
}();

inline constexpr auto int_preds = [] {
    VariantRegistry<Pred<int>> r;
    r.add({"mod3", [](int i) { return i % 3 == 0; }});
    r.add({"always", [](int) { return true; }});
    r.add({"never", [](int) { return false; }});
    return r;
}();

inline constexpr auto int_parts = [] {
    VariantRegistry<PartialFn<int>> r;
    r.add({"halfEven", [](int x) -> std::optional<int> {
               if (x % 2 == 0)
                   return x / 2;
               return std::nullopt;
           }});
    r.add({"identical", [](int x) -> std::optional<int> { return x; }});
    r.add({"uninhabited",
           [](int) -> std::optional<int> { return std::nullopt; }});
    return r;
}();

inline constexpr Explorer<int, long> int_explorer{
    int_fns, int_to_longs, int_op_fns, int_preds, int_parts};

// --- String ---
//
// BinaryOp<std::string> is not a literal type (its identity is a
// std::string), so the string registries are built on first use.

inline const VariantRegistry<Endo<std::string>>& str_fns() {
    static const auto r = [] {
        VariantRegistry<Endo<std::string>> r;
        r.add({"upper", [](const std::string& s) {
                   std::string u = s;
                   std::transform(u.begin(), u.end(), u.begin(), [](char c) {
                       return static_cast<char>(
                           std::toupper(static_cast<unsigned char>(c)));
                   });
                   return u;
               }});
        r.add({"fishy",
               [](const std::string& s) { return "<" + s + "-<"; }});
        return r;
    }();
    return r;
}

inline const VariantRegistry<Fn<std::string, std::optional<std::string>>>&
str_to_opts() {
    using Opt = std::optional<std::string>;
    static const auto r = [] {
        VariantRegistry<Fn<std::string, Opt>> r;
        r.add({"natural", [](const std::string& s) -> Opt {
                   if (s.empty())
                       return std::nullopt;
                   return s;
               }});
        r.add({"letter", [](const std::string& s) -> Opt {
                   std::string l;
                   for (char c : s)
                       if (std::isalpha(static_cast<unsigned char>(c)))
                           l.push_back(c);
                   if (l.empty())
                       return std::nullopt;
                   return l;
               }});
        return r;
    }();
    return r;
}

inline const VariantRegistry<BinaryOp<std::string>>& str_op_fns() {
    static const auto r = [] {
        VariantRegistry<BinaryOp<std::string>> r;
        r.add({"concat",
               [](const std::string& s, const std::string& t) {
                   return s + t;
               },
               std::string{}, Associative, Asymmetric});
        r.add({"interleave",
               [](const std::string& s, const std::string& t) {
                   std::string out;
                   for (std::size_t i = 0; i < s.size() && i < t.size(); ++i) {
                       out.push_back(s[i]);
                       out.push_back(t[i]);
                   }
                   return out;
               },
               std::nullopt, Nonassociative, Asymmetric});
        return r;
    }();
    return r;
}

inline const VariantRegistry<Pred<std::string>>& str_preds() {
    static const auto r = [] {
        VariantRegistry<Pred<std::string>> r;
        r.add({"increasing", [](const std::string& s) {
                   return s.size() < 2 || s.front() <= s.back();
               }});
        r.add({"always", [](const std::string&) { return true; }});
        r.add({"never", [](const std::string&) { return false; }});
        return r;
    }();
    return r;
}

inline const VariantRegistry<PartialFn<std::string>>& str_parts() {
    using Opt = std::optional<std::string>;
    static const auto r = [] {
        VariantRegistry<PartialFn<std::string>> r;
        r.add({"oddMirror", [](const std::string& s) -> Opt {
                   if (s.size() % 2 == 1)
                       return std::string(s.rbegin(), s.rend());
                   return std::nullopt;
               }});
        r.add({"identical", [](const std::string& s) -> Opt { return s; }});
        r.add({"uninhabited",
               [](const std::string&) -> Opt { return std::nullopt; }});
        return r;
    }();
    return r;
}

inline const Explorer<std::string, std::optional<std::string>>&
str_explorer() {
    static const Explorer<std::string, std::optional<std::string>> e{
        str_fns(), str_to_opts(), str_op_fns(), str_preds(), str_parts()};
    return e;
}

// --- Map entries ---
//
// One variant per role. Laws over maps assume keys stay distinct after
// mapping, so none of these may make two keys collide.

using LongStr = std::pair<long, std::string>;
using StrLong = std::pair<std::string, long>;

inline const Explorer<LongStr, StrLong>& long_str_explorer() {
    static const VariantRegistry<Endo<LongStr>> fns = [] {
        VariantRegistry<Endo<LongStr>> r;
        r.add({"inc1", [](const LongStr& kv) {
                   return LongStr{kv.first + 1, kv.second};
               }});
        return r;
    }();
    static const VariantRegistry<Fn<LongStr, StrLong>> to_bs = [] {
        VariantRegistry<Fn<LongStr, StrLong>> r;
        r.add({"swap", [](const LongStr& kv) {
                   return StrLong{kv.second, kv.first};
               }});
        return r;
    }();
    static const VariantRegistry<BinaryOp<LongStr>> op_fns = [] {
        VariantRegistry<BinaryOp<LongStr>> r;
        r.add({"sums",
               [](const LongStr& kv, const LongStr& cu) {
                   return LongStr{kv.first + cu.first, kv.second + cu.second};
               },
               std::nullopt, Nonassociative, Asymmetric});
        return r;
    }();
    static const VariantRegistry<Pred<LongStr>> preds = [] {
        VariantRegistry<Pred<LongStr>> r;
        r.add({"high", [](const LongStr& kv) {
                   return kv.first > static_cast<long>(kv.second.size());
               }});
        return r;
    }();
    static const VariantRegistry<PartialFn<LongStr>> parts = [] {
        VariantRegistry<PartialFn<LongStr>> r;
        r.add({"akin", [](const LongStr& kv) -> std::optional<LongStr> {
                   auto len = static_cast<long>(kv.second.size());
                   if (((kv.first ^ len) & 1) == 0)
                       return LongStr{kv.first - 2, kv.second};
                   return std::nullopt;
               }});
        return r;
    }();
    static const Explorer<LongStr, StrLong> e{fns, to_bs, op_fns, preds,
                                              parts};
    return e;
}

inline const Explorer<StrLong, LongStr>& str_long_explorer() {
    static const VariantRegistry<Endo<StrLong>> fns = [] {
        VariantRegistry<Endo<StrLong>> r;
        r.add({"dots", [](const StrLong& kv) {
                   return StrLong{kv.first + "..", kv.second};
               }});
        return r;
    }();
    static const VariantRegistry<Fn<StrLong, LongStr>> to_bs = [] {
        VariantRegistry<Fn<StrLong, LongStr>> r;
        r.add({"swap", [](const StrLong& kv) {
                   return LongStr{kv.second, kv.first};
               }});
        return r;
    }();
    static const VariantRegistry<BinaryOp<StrLong>> op_fns = [] {
        VariantRegistry<BinaryOp<StrLong>> r;
        r.add({"sums",
               [](const StrLong& kv, const StrLong& cu) {
                   return StrLong{kv.first + cu.first, kv.second + cu.second};
               },
               std::nullopt, Nonassociative, Asymmetric});
        return r;
    }();
    static const VariantRegistry<Pred<StrLong>> preds = [] {
        VariantRegistry<Pred<StrLong>> r;
        r.add({"high", [](const StrLong& kv) {
                   return static_cast<long>(kv.first.size()) < kv.second;
               }});
        return r;
    }();
    static const VariantRegistry<PartialFn<StrLong>> parts = [] {
        VariantRegistry<PartialFn<StrLong>> r;
        r.add({"akin", [](const StrLong& kv) -> std::optional<StrLong> {
                   auto len = static_cast<long>(kv.first.size());
                   if (((len ^ kv.second) & 1) == 0)
                       return StrLong{kv.first + "!", kv.second};
                   return std::nullopt;
               }});
        return r;
    }();
    static const Explorer<StrLong, LongStr> e{fns, to_bs, op_fns, preds,
                                              parts};
    return e;
}

} // namespace oplaws::stock

#endif // OPLAWS_STOCK_HPP
