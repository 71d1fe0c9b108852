#pragma once
#include "item.h"
#include "item_list.h"
#include "orientation_sorter.h"
#include "packed_item.h"
#include "packed_layer.h"
#include <cstdint>
#include <memory>
#include <vector>
#include <spdlog/spdlog.h>

namespace boxpack {

// Result of packing one box: placements, the layers they were packed in and
// the items that found no place at all.
class PackedBox {
public:
    PackedBox(Box box, PackedItemList items, std::vector<PackedLayer> layers,
              std::vector<ItemPtr> unpacked);

    const Box& box() const { return box_; }
    const PackedItemList& items() const { return items_; }
    const std::vector<PackedLayer>& layers() const { return layers_; }
    const std::vector<ItemPtr>& unpacked() const { return unpacked_; }

    int64_t weight() const { return items_.weight(); }
    int64_t remainingWeight() const { return int64_t(box_.maxWeight()) - weight(); }
    int64_t usedVolume() const { return items_.volume(); }
    // percent of inner volume, one decimal
    double volumeUtilisation() const;

    int usedWidth() const { return extent_.endX(); }
    int usedLength() const { return extent_.endY(); }
    int usedDepth() const { return extent_.endZ(); }
    int remainingWidth() const { return box_.innerWidth() - usedWidth(); }
    int remainingLength() const { return box_.innerLength() - usedLength(); }
    int remainingDepth() const { return box_.innerDepth() - usedDepth(); }

private:
    Box box_;
    PackedItemList items_;
    std::vector<PackedLayer> layers_;
    std::vector<ItemPtr> unpacked_;
    PackedLayer extent_;    // every layer merged, for overall bounds
};

enum class PackState { RowOpen, RowClosing, LayerClosing, ContainerExhausted };

const char* packStateName(PackState s);

// Fills one box row by row (along width), rows into layers (along length),
// layers bottom-up (along depth). Orientation choice at each cursor goes
// through compareOrientations.
class VolumePacker {
public:
    // cache: shared lookahead memo for this top-level call; when null a Full
    // packer keeps its own for the duration of pack(). logger defaults to
    // spdlog's default logger.
    VolumePacker(Box box, ItemList items, PackMode mode = PackMode::Full,
                 LookaheadCache* cache = nullptr,
                 std::shared_ptr<spdlog::logger> logger = nullptr);

    PackedBox pack();

    PackMode mode() const { return mode_; }
    const Box& box() const { return box_; }

private:
    Box box_;
    ItemList items_;
    PackMode mode_;
    LookaheadCache* cache_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace boxpack
