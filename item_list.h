#pragma once
#include "item.h"
#include <cstddef>
#include <deque>
#include <functional>
#include <utility>
#include <vector>

namespace boxpack {

class PackedItemList;

// true when a should be packed before b
using ItemOrder = std::function<bool(const Item& a, const Item& b)>;

// Volume desc, then weight desc, then description
bool volumeDescending(const Item& a, const Item& b);
bool weightDescending(const Item& a, const Item& b);

// Pending items in packing priority order. The list consumes an ordering,
// it never reorders on its own.
class ItemList {
public:
    ItemList() = default;
    explicit ItemList(std::vector<ItemPtr> items);

    static ItemList sorted(std::vector<ItemPtr> items, const ItemOrder& order = volumeDescending);

    void insert(ItemPtr item) { items_.push_back(std::move(item)); }
    ItemPtr top() const { return items_.empty() ? nullptr : items_.front(); }
    ItemPtr extract();
    ItemList topN(size_t n) const;

    // Multiset identity removal: one occurrence per listed entry
    void remove(const std::vector<ItemPtr>& items);
    void remove(const PackedItemList& packed);

    size_t count() const { return items_.size(); }
    bool empty() const { return items_.empty(); }
    std::vector<ItemPtr> toVector() const { return {items_.begin(), items_.end()}; }

private:
    std::deque<ItemPtr> items_;
};

} // namespace boxpack
