#pragma once
#include "packed_item.h"
#include <cstdint>
#include <vector>

namespace boxpack {

// Items sharing one z-band. Geometry is derived from members on every call;
// an empty layer reports zero for everything (see empty()).
class PackedLayer {
public:
    void insert(const PackedItem& item) { items_.push_back(item); }
    // Appends other's members as-is; no overlap check, no repositioning
    void merge(const PackedLayer& other);

    const std::vector<PackedItem>& items() const { return items_; }
    bool empty() const { return items_.empty(); }

    int startX() const;
    int endX() const;
    int width() const { return empty() ? 0 : endX() - startX(); }
    int startY() const;
    int endY() const;
    int length() const { return empty() ? 0 : endY() - startY(); }
    int startZ() const;
    int endZ() const;
    int depth() const { return empty() ? 0 : endZ() - startZ(); }

    int64_t footprint() const { return int64_t(width()) * length(); }
    int64_t weight() const;

private:
    std::vector<PackedItem> items_;
};

} // namespace boxpack
