#include "item_list.h"
#include "packed_item.h"
#include <algorithm>

namespace boxpack {

bool volumeDescending(const Item& a, const Item& b) {
    if (a.volume() != b.volume()) return a.volume() > b.volume();
    if (a.weight() != b.weight()) return a.weight() > b.weight();
    return a.description() < b.description();
}

bool weightDescending(const Item& a, const Item& b) {
    if (a.weight() != b.weight()) return a.weight() > b.weight();
    if (a.volume() != b.volume()) return a.volume() > b.volume();
    return a.description() < b.description();
}

ItemList::ItemList(std::vector<ItemPtr> items) : items_(items.begin(), items.end()) {}

ItemList ItemList::sorted(std::vector<ItemPtr> items, const ItemOrder& order) {
    std::stable_sort(items.begin(), items.end(),
                     [&](const ItemPtr& a, const ItemPtr& b) { return order(*a, *b); });
    return ItemList(std::move(items));
}

ItemPtr ItemList::extract() {
    if (items_.empty()) return nullptr;
    ItemPtr head = std::move(items_.front());
    items_.pop_front();
    return head;
}

ItemList ItemList::topN(size_t n) const {
    ItemList out;
    n = std::min(n, items_.size());
    out.items_.assign(items_.begin(), items_.begin() + n);
    return out;
}

void ItemList::remove(const std::vector<ItemPtr>& items) {
    for (const auto& victim : items) {
        auto it = std::find(items_.begin(), items_.end(), victim);
        if (it != items_.end()) items_.erase(it);
    }
}

void ItemList::remove(const PackedItemList& packed) {
    remove(packed.sourceItems());
}

} // namespace boxpack
