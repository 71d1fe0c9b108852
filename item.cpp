#include "item.h"
#include "packed_item.h"
#include <algorithm>
#include <stdexcept>

namespace boxpack {

const char* rotationName(Rotation r) {
    switch (r) {
        case Rotation::Any:      return "any";
        case Rotation::KeepFlat: return "keep_flat";
        case Rotation::Never:    return "never";
    }
    return "any";
}

Rotation parseRotation(const std::string& name) {
    if (name == "any" || name == "best_fit") return Rotation::Any;
    if (name == "keep_flat") return Rotation::KeepFlat;
    if (name == "never") return Rotation::Never;
    throw std::runtime_error("unknown rotation '" + name + "'");
}

Item::Item(std::string description, int width, int length, int depth, int weight,
           Rotation rotation, Placement placement)
    : description_(std::move(description)), width_(width), length_(length), depth_(depth),
      weight_(weight), rotation_(rotation), placement_(std::move(placement)) {
    if (width_ <= 0 || length_ <= 0 || depth_ <= 0)
        throw InvalidDimensions("item '" + description_ + "' must have positive dimensions");
    if (weight_ < 0)
        throw InvalidDimensions("item '" + description_ + "' has negative weight");
    if (auto c = std::get_if<ConstrainedPlacement>(&placement_); c && !c->canPlace)
        throw std::invalid_argument("item '" + description_ + "' has an empty placement check");
}

bool Item::isSameDimensions(const Item& other) const {
    return !isConstrained() && !other.isConstrained() &&
           width_ == other.width_ && length_ == other.length_ && depth_ == other.depth_ &&
           weight_ == other.weight_ && rotation_ == other.rotation_;
}

PlacementCheck maxPerBox(std::string description, int limit) {
    return [description = std::move(description), limit](const PackedItemList& packed,
                                                         int, int, int, int, int, int) {
        // called before the candidate is inserted, so count it as +1
        return packed.countByDescription(description) + 1 <= limit;
    };
}

Box::Box(std::string reference, int innerWidth, int innerLength, int innerDepth, int maxWeight)
    : reference_(std::move(reference)), innerWidth_(innerWidth), innerLength_(innerLength),
      innerDepth_(innerDepth), maxWeight_(maxWeight) {
    if (innerWidth_ <= 0 || innerLength_ <= 0 || innerDepth_ <= 0)
        throw InvalidDimensions("box '" + reference_ + "' must have positive inner dimensions");
    if (maxWeight_ <= 0)
        throw InvalidDimensions("box '" + reference_ + "' must have a positive max weight");
}

Box::Box(int width, int length, int depth)
    : reference_("working volume"), innerWidth_(width), innerLength_(length),
      innerDepth_(depth), maxWeight_(kUnlimitedWeight), working_(true) {
    if (width < 0 || length < 0 || depth < 0)
        throw InvalidDimensions("working volume cannot have negative extents");
}

Box Box::workingVolume(int width, int length, int depth) {
    return Box(width, length, depth);
}

} // namespace boxpack
