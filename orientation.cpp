#include "orientation.h"
#include <algorithm>
#include <array>
#include <utility>
#include <variant>

namespace boxpack {

std::vector<OrientedItem> permutations(const ItemPtr& item) {
    const int w = item->width(), l = item->length(), d = item->depth();
    std::vector<std::array<int, 3>> dims;
    dims.push_back({w, l, d});
    if (item->rotation() != Rotation::Never)
        dims.push_back({l, w, d});
    if (item->rotation() == Rotation::Any) {
        dims.push_back({w, d, l});
        dims.push_back({l, d, w});
        dims.push_back({d, w, l});
        dims.push_back({d, l, w});
    }

    std::vector<OrientedItem> out;
    out.reserve(dims.size());
    for (size_t i = 0; i < dims.size(); ++i) {
        // cubes and square faces produce repeats
        if (std::find(dims.begin(), dims.begin() + i, dims[i]) != dims.begin() + i) continue;
        out.push_back({item, dims[i][0], dims[i][1], dims[i][2]});
    }
    return out;
}

std::vector<OrientedItem> OrientationEnumerator::possibleOrientations(
    const ItemPtr& item, int widthLeft, int lengthLeft, int depthLeft,
    int x, int y, int z, const PackedItemList& packed) const
{
    std::vector<OrientedItem> out;
    if (packed.weight() + item->weight() > box_.maxWeight())
        return out;

    for (auto& o : permutations(item)) {
        if (o.width > widthLeft || o.length > lengthLeft || o.depth > depthLeft)
            continue;
        if (auto c = std::get_if<ConstrainedPlacement>(&item->placement())) {
            if (!c->canPlace(packed, x, y, z, o.width, o.length, o.depth))
                continue;
        }
        out.push_back(std::move(o));
    }
    return out;
}

} // namespace boxpack
