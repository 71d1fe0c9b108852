#include "packed_item.h"
#include <algorithm>

namespace boxpack {

void PackedItemList::insert(const PackedItem& item) {
    items_.push_back(item);
    weight_ += item.item->weight();
    volume_ += item.volume();
}

void PackedItemList::remove(const std::vector<ItemPtr>& items) {
    for (const auto& victim : items) {
        auto it = std::find_if(items_.begin(), items_.end(),
                               [&](const PackedItem& p) { return p.item == victim; });
        if (it == items_.end()) continue;
        weight_ -= it->item->weight();
        volume_ -= it->volume();
        items_.erase(it);
    }
}

std::vector<ItemPtr> PackedItemList::sourceItems() const {
    std::vector<ItemPtr> out;
    out.reserve(items_.size());
    for (const auto& p : items_) out.push_back(p.item);
    return out;
}

size_t PackedItemList::countByDescription(const std::string& description) const {
    return std::count_if(items_.begin(), items_.end(),
                         [&](const PackedItem& p) { return p.item->description() == description; });
}

} // namespace boxpack
