#ifndef OPLAWS_EXPLORER_HPP
#define OPLAWS_EXPLORER_HPP

#include <cstddef>
#include <optional>
#include <vector>

#include <oplaws/bundle.hpp>
#include <oplaws/index_space.hpp>
#include <oplaws/operations.hpp>
#include <oplaws/variants.hpp>

namespace oplaws {

// --- Explorer: the Cartesian product of five variant registries ---
//
// Index vector order is {endo, hetero, binary, predicate, partial}. The
// registries are referenced, not owned, and must outlive the explorer.

template <typename A, typename B, std::size_t Cap = 16> class Explorer {
  public:
    using bundle_type = OpBundle<A, B>;
    using indices_type = Indices<role_count>;

    constexpr Explorer(const VariantRegistry<Endo<A>, Cap>& fns,
                       const VariantRegistry<Fn<A, B>, Cap>& to_bs,
                       const VariantRegistry<BinaryOp<A>, Cap>& op_fns,
                       const VariantRegistry<Pred<A>, Cap>& preds,
                       const VariantRegistry<PartialFn<A>, Cap>& parts)
        : fns_(&fns), to_bs_(&to_bs), op_fns_(&op_fns), preds_(&preds),
          parts_(&parts) {}

    constexpr Sizes<role_count> sizes() const {
        return {fns_->size(), to_bs_->size(), op_fns_->size(), preds_->size(),
                parts_->size()};
    }

    constexpr std::size_t total() const { return oplaws::total(sizes()); }

    constexpr bool validate(const indices_type& ixs) const {
        return in_range(sizes(), ixs);
    }

    // A fresh, untouched bundle, or nullopt if any index is out of range
    constexpr std::optional<bundle_type> lookup(const indices_type& ixs) const {
        if (!validate(ixs))
            return std::nullopt;
        return bundle_type(fns_->index(ixs[0]), to_bs_->index(ixs[1]),
                           op_fns_->index(ixs[2]), preds_->index(ixs[3]),
                           parts_->index(ixs[4]));
    }

    // Every combination exactly once, in index order
    template <typename F> void for_each(F&& fn) const {
        for_each_index(sizes(), [&](const indices_type& ixs) {
            auto b = lookup(ixs);
            fn(ixs, *b);
        });
    }

    std::vector<bundle_type> sample(std::size_t count) const {
        std::vector<bundle_type> out;
        for (const auto& ixs : oplaws::sample(sizes(), count))
            out.push_back(*lookup(ixs));
        return out;
    }

  private:
    const VariantRegistry<Endo<A>, Cap>* fns_;
    const VariantRegistry<Fn<A, B>, Cap>* to_bs_;
    const VariantRegistry<BinaryOp<A>, Cap>* op_fns_;
    const VariantRegistry<Pred<A>, Cap>* preds_;
    const VariantRegistry<PartialFn<A>, Cap>* parts_;
};

} // namespace oplaws

#endif // OPLAWS_EXPLORER_HPP
