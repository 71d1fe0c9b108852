#include "packed_layer.h"
#include <algorithm>
#include <limits>

namespace boxpack {

namespace {

// min over members of f(item), 0 for an empty layer
template <class F>
int minOf(const std::vector<PackedItem>& items, F f) {
    if (items.empty()) return 0;
    int v = std::numeric_limits<int>::max();
    for (const auto& p : items) v = std::min(v, f(p));
    return v;
}

template <class F>
int maxOf(const std::vector<PackedItem>& items, F f) {
    if (items.empty()) return 0;
    int v = std::numeric_limits<int>::min();
    for (const auto& p : items) v = std::max(v, f(p));
    return v;
}

} // namespace

void PackedLayer::merge(const PackedLayer& other) {
    items_.insert(items_.end(), other.items_.begin(), other.items_.end());
}

int PackedLayer::startX() const { return minOf(items_, [](const PackedItem& p) { return p.x; }); }
int PackedLayer::endX() const { return maxOf(items_, [](const PackedItem& p) { return p.x + p.width; }); }
int PackedLayer::startY() const { return minOf(items_, [](const PackedItem& p) { return p.y; }); }
int PackedLayer::endY() const { return maxOf(items_, [](const PackedItem& p) { return p.y + p.length; }); }
int PackedLayer::startZ() const { return minOf(items_, [](const PackedItem& p) { return p.z; }); }
int PackedLayer::endZ() const { return maxOf(items_, [](const PackedItem& p) { return p.z + p.depth; }); }

int64_t PackedLayer::weight() const {
    int64_t w = 0;
    for (const auto& p : items_) w += p.item->weight();
    return w;
}

} // namespace boxpack
