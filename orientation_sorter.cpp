#include "orientation_sorter.h"
#include "volume_packer.h"
#include <algorithm>
#include <cstdint>
#include <functional>
#include <iterator>
#include <stdexcept>

namespace boxpack {

namespace {

inline void hashCombine(size_t& seed, size_t v) {
    seed ^= v + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

// exact fit on one axis beats a remainder on the same axis
int exactFitDecider(int aLeft, int bLeft) {
    if (aLeft == 0 && bLeft > 0) return -1;
    if (aLeft > 0 && bLeft == 0) return 1;
    return 0;
}

// Would `next` still go in beside `candidate`? The ledger does not hold the
// candidate yet, so its weight is added here.
bool nextFitsBeside(const SortContext& ctx, const OrientedItem& candidate, const ItemPtr& next,
                    int widthLeft) {
    const int64_t weight = ctx.packed->weight() + candidate.item->weight() + next->weight();
    if (weight > ctx.enumerator->box().maxWeight()) return false;
    return ctx.enumerator->fitsAnywhere(next, widthLeft, ctx.lengthLeft, ctx.depthLeft,
                                        ctx.x + candidate.width, ctx.y, ctx.z, *ctx.packed);
}

int lookAheadDecider(const SortContext& ctx, const OrientedItem& a, const OrientedItem& b,
                     int aWidthLeft, int bWidthLeft) {
    if (ctx.mode == PackMode::SinglePass) return 0;
    if (!ctx.nextItems || ctx.nextItems->empty()) return 0;

    const ItemPtr next = ctx.nextItems->top();
    const bool fitA = nextFitsBeside(ctx, a, next, aWidthLeft);
    const bool fitB = nextFitsBeside(ctx, b, next, bWidthLeft);
    if (fitA && !fitB) return -1;
    if (fitB && !fitA) return 1;

    // not an easy either/or, simulate what else would still go in
    const int packedA = lookaheadScore(ctx, a);
    const int packedB = lookaheadScore(ctx, b);
    if (packedA != packedB) return packedA > packedB ? -1 : 1;
    return 0;
}

} // namespace

size_t LookaheadKeyHash::operator()(const LookaheadKey& k) const {
    std::hash<int> h;
    size_t seed = h(k.widthLeft);
    hashCombine(seed, h(k.lengthLeft));
    hashCombine(seed, h(k.depthLeft));
    hashCombine(seed, h(k.candidateWidth));
    hashCombine(seed, h(k.candidateLength));
    hashCombine(seed, h(k.rowLength));
    hashCombine(seed, k.window.size());
    for (const auto& it : k.window) {
        hashCombine(seed, h(it.width));
        hashCombine(seed, h(it.length));
        hashCombine(seed, h(it.depth));
        hashCombine(seed, h(it.weight));
        hashCombine(seed, h(static_cast<int>(it.rotation)));
        hashCombine(seed, std::hash<const Item*>()(it.constrained));
    }
    return seed;
}

LookaheadKey makeLookaheadKey(const SortContext& ctx, const OrientedItem& candidate,
                              const ItemList& window) {
    LookaheadKey key{ctx.widthLeft, ctx.lengthLeft, ctx.depthLeft,
                     candidate.width, candidate.length,
                     std::max(candidate.length, ctx.rowLength), {}};
    key.window.reserve(window.count());
    for (const auto& item : window.toVector())
        key.window.push_back({item->width(), item->length(), item->depth(), item->weight(),
                              item->rotation(), item->isConstrained() ? item.get() : nullptr});
    return key;
}

int lookaheadScore(const SortContext& ctx, const OrientedItem& candidate) {
    if (ctx.mode == PackMode::SinglePass || !ctx.nextItems) return 0;

    const int currentRowLength = std::max(candidate.length, ctx.rowLength);
    const ItemList window = ctx.nextItems->topN(kLookaheadWindow);

    auto simulate = [&]() {
        ItemList remaining = window;
        VolumePacker restOfRow(Box::workingVolume(std::max(0, ctx.widthLeft - candidate.width),
                                                  currentRowLength, ctx.depthLeft),
                               remaining, PackMode::SinglePass, nullptr, ctx.logger);
        remaining.remove(restOfRow.pack().items());

        VolumePacker nextRows(Box::workingVolume(ctx.widthLeft,
                                                 std::max(0, ctx.lengthLeft - currentRowLength),
                                                 ctx.depthLeft),
                              remaining, PackMode::SinglePass, nullptr, ctx.logger);
        remaining.remove(nextRows.pack().items());

        const int packedCount = int(window.count() - remaining.count());
        if (ctx.logger)
            ctx.logger->debug("[LOOKAHEAD] {}x{}x{} in {}x{}x{} row {}: {}/{} follow",
                              candidate.width, candidate.length, candidate.depth,
                              ctx.widthLeft, ctx.lengthLeft, ctx.depthLeft, currentRowLength,
                              packedCount, window.count());
        return packedCount;
    };

    if (!ctx.cache) return simulate();
    return ctx.cache->getOrCompute(makeLookaheadKey(ctx, candidate, window), simulate);
}

int compareOrientations(const SortContext& ctx, const OrientedItem& a, const OrientedItem& b) {
    if (!ctx.enumerator || !ctx.packed)
        throw std::logic_error("orientation comparison needs an enumerator and a packed list");

    // prefer exact fits in width/length/depth order
    const int aWidthLeft = ctx.widthLeft - a.width;
    const int bWidthLeft = ctx.widthLeft - b.width;
    if (int d = exactFitDecider(aWidthLeft, bWidthLeft)) return d;

    const int aLengthLeft = ctx.lengthLeft - a.length;
    const int bLengthLeft = ctx.lengthLeft - b.length;
    if (int d = exactFitDecider(aLengthLeft, bLengthLeft)) return d;

    if (int d = exactFitDecider(ctx.depthLeft - a.depth, ctx.depthLeft - b.depth)) return d;

    // prefer leaving room for the next item(s)
    if (int d = lookAheadDecider(ctx, a, b, aWidthLeft, bWidthLeft)) return d;

    // otherwise the tightest gap, then the biggest footprint
    const int aMinGap = std::min(aWidthLeft, aLengthLeft);
    const int bMinGap = std::min(bWidthLeft, bLengthLeft);
    if (aMinGap != bMinGap) return aMinGap < bMinGap ? -1 : 1;
    if (a.footprint() != b.footprint()) return a.footprint() > b.footprint() ? -1 : 1;
    return 0;
}

const OrientedItem& bestOrientation(const SortContext& ctx, const std::vector<OrientedItem>& candidates) {
    if (candidates.empty())
        throw std::invalid_argument("bestOrientation: no candidates");
    auto best = candidates.begin();
    for (auto it = std::next(best); it != candidates.end(); ++it)
        if (compareOrientations(ctx, *it, *best) < 0) best = it;
    return *best;
}

} // namespace boxpack
