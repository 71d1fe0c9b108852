#pragma once
#include "item.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace boxpack {

// One permutation of an item's dimensions (not yet positioned)
struct OrientedItem {
    ItemPtr item;
    int width = 0, length = 0, depth = 0;

    int64_t footprint() const { return int64_t(width) * length; }
    int64_t volume() const { return footprint() * depth; }
};

struct PackedItem {
    ItemPtr item;
    int x = 0, y = 0, z = 0;
    int width = 0, length = 0, depth = 0;

    static PackedItem fromOriented(const OrientedItem& o, int x, int y, int z) {
        return PackedItem{o.item, x, y, z, o.width, o.length, o.depth};
    }
    int64_t volume() const { return int64_t(width) * length * depth; }
    bool intersects(const PackedItem& o) const {
        return x < o.x + o.width && o.x < x + width &&
               y < o.y + o.length && o.y < y + length &&
               z < o.z + o.depth && o.z < z + depth;
    }
};

// ────────── ledger ──────────
class PackedItemList {
public:
    using const_iterator = std::vector<PackedItem>::const_iterator;

    void insert(const PackedItem& item);
    // Drop one placement per listed item (identity match), used to roll back trials
    void remove(const std::vector<ItemPtr>& items);

    const std::vector<PackedItem>& items() const { return items_; }
    std::vector<ItemPtr> sourceItems() const;
    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }
    const_iterator begin() const { return items_.begin(); }
    const_iterator end() const { return items_.end(); }

    int64_t weight() const { return weight_; }
    int64_t volume() const { return volume_; }
    size_t countByDescription(const std::string& description) const;

private:
    std::vector<PackedItem> items_;
    int64_t weight_ = 0;
    int64_t volume_ = 0;
};

} // namespace boxpack
