#include "volume_packer.h"
#include "orientation.h"
#include <algorithm>
#include <cmath>
#include <memory>
#include <utility>

namespace boxpack {

PackedBox::PackedBox(Box box, PackedItemList items, std::vector<PackedLayer> layers,
                     std::vector<ItemPtr> unpacked)
    : box_(std::move(box)), items_(std::move(items)), layers_(std::move(layers)),
      unpacked_(std::move(unpacked)) {
    for (const auto& l : layers_) extent_.merge(l);
}

double PackedBox::volumeUtilisation() const {
    if (box_.innerVolume() == 0) return 0.0;
    double pct = double(usedVolume()) / double(box_.innerVolume()) * 100.0;
    return std::round(pct * 10.0) / 10.0;
}

const char* packStateName(PackState s) {
    switch (s) {
        case PackState::RowOpen:            return "row-open";
        case PackState::RowClosing:         return "row-closing";
        case PackState::LayerClosing:       return "layer-closing";
        case PackState::ContainerExhausted: return "container-exhausted";
    }
    return "?";
}

VolumePacker::VolumePacker(Box box, ItemList items, PackMode mode, LookaheadCache* cache,
                           std::shared_ptr<spdlog::logger> logger)
    : box_(std::move(box)), items_(std::move(items)), mode_(mode), cache_(cache),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

PackedBox VolumePacker::pack() {
    // lookahead memo lives for this call unless the caller scoped one wider
    std::unique_ptr<LookaheadCache> ownCache;
    LookaheadCache* cache = nullptr;
    if (mode_ == PackMode::Full) {
        if (!cache_) ownCache = std::make_unique<LookaheadCache>();
        cache = cache_ ? cache_ : ownCache.get();
    }

    // trial placements made by lookahead simulations are kept apart in traces
    const char* tag = box_.isWorkingVolume() ? "[LOOKAHEAD-SIM]" : "[PACK]";
    const OrientationEnumerator enumerator(box_);
    const size_t total = items_.count();
    ItemList items = items_;
    PackedItemList packed;
    std::vector<PackedLayer> layers;
    PackedLayer layer;
    std::vector<ItemPtr> skipped;   // did not fit in the current row
    std::vector<ItemPtr> unpacked;

    int x = 0, y = 0, z = 0;
    int rowLength = 0;
    PackState state = PackState::RowOpen;

    while (state != PackState::ContainerExhausted) {
        switch (state) {
        case PackState::RowOpen: {
            if (items.empty()) {
                state = PackState::RowClosing;
                break;
            }
            ItemPtr item = items.extract();
            // weight only grows, so too heavy now means too heavy for good
            if (packed.weight() + item->weight() > box_.maxWeight()) {
                logger_->trace("{} '{}' exceeds remaining weight {}", tag, item->description(),
                               int64_t(box_.maxWeight()) - packed.weight());
                unpacked.push_back(std::move(item));
                break;
            }

            SortContext ctx;
            ctx.widthLeft = box_.innerWidth() - x;
            ctx.lengthLeft = box_.innerLength() - y;
            ctx.depthLeft = box_.innerDepth() - z;
            ctx.x = x; ctx.y = y; ctx.z = z;
            ctx.rowLength = rowLength;
            ctx.nextItems = &items;
            ctx.packed = &packed;
            ctx.enumerator = &enumerator;
            ctx.mode = mode_;
            ctx.cache = cache;
            ctx.logger = logger_;

            auto candidates = enumerator.possibleOrientations(item, ctx.widthLeft, ctx.lengthLeft,
                                                              ctx.depthLeft, x, y, z, packed);
            if (candidates.empty()) {
                // interchangeable followers would fail the same way
                skipped.push_back(item);
                while (!items.empty() && items.top()->isSameDimensions(*item))
                    skipped.push_back(items.extract());
                break;
            }

            const OrientedItem& best = bestOrientation(ctx, candidates);
            PackedItem placed = PackedItem::fromOriented(best, x, y, z);
            packed.insert(placed);
            layer.insert(placed);
            logger_->trace("{} '{}' {}x{}x{} at ({},{},{})", tag, item->description(),
                           placed.width, placed.length, placed.depth, x, y, z);
            x += placed.width;
            rowLength = std::max(rowLength, placed.length);
            break;
        }
        case PackState::RowClosing:
            if (x > 0) {
                y += rowLength;
                x = 0;
                rowLength = 0;
                items = ItemList(std::move(skipped));
                skipped.clear();
                state = PackState::RowOpen;
            } else {
                state = PackState::LayerClosing;
            }
            break;
        case PackState::LayerClosing:
            if (!layer.empty()) {
                z = layer.endZ();
                y = 0;
                layers.push_back(std::move(layer));
                layer = PackedLayer();
                items = ItemList(std::move(skipped));
                skipped.clear();
                state = PackState::RowOpen;
            } else {
                state = PackState::ContainerExhausted;
            }
            break;
        case PackState::ContainerExhausted:
            break;
        }
    }

    unpacked.insert(unpacked.end(), skipped.begin(), skipped.end());
    for (const auto& item : items.toVector())
        unpacked.push_back(item);

    if (mode_ == PackMode::Full)
        logger_->debug("[PACK] {} ({}x{}x{}): packed {}/{} in {} layer(s)", box_.reference(),
                       box_.innerWidth(), box_.innerLength(), box_.innerDepth(),
                       packed.size(), total, layers.size());
    return PackedBox(box_, std::move(packed), std::move(layers), std::move(unpacked));
}

} // namespace boxpack
