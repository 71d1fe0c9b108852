#pragma once
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace boxpack {

class PackedItemList;

// Construction-time fault: non-positive extents, negative weight etc.
struct InvalidDimensions : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

enum class Rotation {
    Any,        // all six axis permutations
    KeepFlat,   // depth stays vertical, width/length may swap
    Never
};

const char* rotationName(Rotation r);
Rotation parseRotation(const std::string& name);

// Veto hook: (already packed, x, y, z, width, length, depth) -> accept?
using PlacementCheck = std::function<bool(const PackedItemList&, int, int, int, int, int, int)>;

struct PlainPlacement {};
struct ConstrainedPlacement {
    PlacementCheck canPlace;
};
using Placement = std::variant<PlainPlacement, ConstrainedPlacement>;

// ────────── item ──────────
class Item {
public:
    Item(std::string description, int width, int length, int depth, int weight,
         Rotation rotation = Rotation::Any, Placement placement = PlainPlacement{});

    const std::string& description() const { return description_; }
    int width() const { return width_; }
    int length() const { return length_; }
    int depth() const { return depth_; }
    int weight() const { return weight_; }
    Rotation rotation() const { return rotation_; }
    const Placement& placement() const { return placement_; }

    bool isConstrained() const { return std::holds_alternative<ConstrainedPlacement>(placement_); }
    int64_t volume() const { return int64_t(width_) * length_ * depth_; }

    // Items that pack identically anywhere; constrained items never qualify
    bool isSameDimensions(const Item& other) const;

private:
    std::string description_;
    int width_, length_, depth_;
    int weight_;
    Rotation rotation_;
    Placement placement_;
};

using ItemPtr = std::shared_ptr<const Item>;

template <class... Args>
ItemPtr makeItem(Args&&... args) {
    return std::make_shared<Item>(std::forward<Args>(args)...);
}

// Caps how many items sharing a description one box may hold
PlacementCheck maxPerBox(std::string description, int limit);

// ────────── box ──────────
class Box {
public:
    static constexpr int kUnlimitedWeight = std::numeric_limits<int>::max();

    Box(std::string reference, int innerWidth, int innerLength, int innerDepth, int maxWeight);

    // Weightless scratch volume for lookahead simulations; zero extents allowed
    static Box workingVolume(int width, int length, int depth);

    const std::string& reference() const { return reference_; }
    int innerWidth() const { return innerWidth_; }
    int innerLength() const { return innerLength_; }
    int innerDepth() const { return innerDepth_; }
    int maxWeight() const { return maxWeight_; }
    int64_t innerVolume() const { return int64_t(innerWidth_) * innerLength_ * innerDepth_; }
    bool isWorkingVolume() const { return working_; }

private:
    Box(int width, int length, int depth);

    std::string reference_;
    int innerWidth_, innerLength_, innerDepth_;
    int maxWeight_;
    bool working_ = false;
};

} // namespace boxpack
