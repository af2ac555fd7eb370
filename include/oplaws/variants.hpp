#ifndef OPLAWS_VARIANTS_HPP
#define OPLAWS_VARIANTS_HPP

#include <cstddef>
#include <utility>

#include <oplaws/name.hpp>

namespace oplaws {

// --- VariantRegistry: interchangeable implementations of one role ---
//
// Ordered and append-only. Fill it once (ideally in a constexpr initializer)
// and treat it as read-only afterwards; concurrent reads are then safe.
// Names are not checked for uniqueness.

template <typename Item, std::size_t Cap = 16> struct VariantRegistry {
    using value_type = Item;

    Item items[Cap]{};
    std::size_t count{0};

    constexpr const Item& add(Item item) {
        if (count >= Cap)
            throw "VariantRegistry capacity exceeded";
        items[count] = std::move(item);
        return items[count++];
    }

    // Indices come from the explorer's own bounds, so a bad one is a bug.
    constexpr const Item& index(std::size_t i) const {
        if (i >= count)
            throw "VariantRegistry index out of range";
        return items[i];
    }

    constexpr std::size_t size() const { return count; }
    constexpr bool empty() const { return count == 0; }

    constexpr const Item* begin() const { return items; }
    constexpr const Item* end() const { return items + count; }

    // First variant registered under the name
    constexpr const Item* find(const Name& name) const {
        for (std::size_t i = 0; i < count; ++i)
            if (items[i].name == name)
                return &items[i];
        return nullptr;
    }
};

} // namespace oplaws

#endif // OPLAWS_VARIANTS_HPP
