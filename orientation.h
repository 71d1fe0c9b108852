#pragma once
#include "item.h"
#include "packed_item.h"
#include <utility>
#include <vector>

namespace boxpack {

// Distinct dimension permutations allowed by the item's rotation policy,
// in preference order (as given, then width/length swap, then the rest).
std::vector<OrientedItem> permutations(const ItemPtr& item);

// Produces the orientations of an item that are valid at a given cursor
// inside one box: fit the free space, respect the box weight limit and pass
// the item's own placement check if it has one.
class OrientationEnumerator {
public:
    explicit OrientationEnumerator(Box box) : box_(std::move(box)) {}

    std::vector<OrientedItem> possibleOrientations(const ItemPtr& item,
                                                   int widthLeft, int lengthLeft, int depthLeft,
                                                   int x, int y, int z,
                                                   const PackedItemList& packed) const;

    bool fitsAnywhere(const ItemPtr& item, int widthLeft, int lengthLeft, int depthLeft,
                      int x, int y, int z, const PackedItemList& packed) const {
        return !possibleOrientations(item, widthLeft, lengthLeft, depthLeft, x, y, z, packed).empty();
    }

    const Box& box() const { return box_; }

private:
    Box box_;
};

} // namespace boxpack
