#pragma once
#include "item.h"
#include "item_list.h"
#include "orientation.h"
#include "packed_item.h"
#include <atomic>
#include <cstddef>
#include <memory>
#include <vector>
#include <spdlog/spdlog.h>
#include <tbb/concurrent_unordered_map.h>

namespace boxpack {

// Full runs may simulate ahead; SinglePass runs (the simulations themselves)
// never do, which caps the recursion at one level.
enum class PackMode { Full, SinglePass };

constexpr size_t kLookaheadWindow = 8;

// ────────── lookahead cache ──────────
struct LookaheadItemKey {
    int width, length, depth, weight;
    Rotation rotation;
    // placement checks are opaque, so constrained items key by identity;
    // null for plain items
    const Item* constrained;
    bool operator==(const LookaheadItemKey& o) const {
        return width == o.width && length == o.length && depth == o.depth &&
               weight == o.weight && rotation == o.rotation && constrained == o.constrained;
    }
};

// Every input the two lookahead simulations depend on
struct LookaheadKey {
    int widthLeft, lengthLeft, depthLeft;
    int candidateWidth, candidateLength;
    int rowLength;
    std::vector<LookaheadItemKey> window;

    bool operator==(const LookaheadKey& o) const {
        return widthLeft == o.widthLeft && lengthLeft == o.lengthLeft && depthLeft == o.depthLeft &&
               candidateWidth == o.candidateWidth && candidateLength == o.candidateLength &&
               rowLength == o.rowLength && window == o.window;
    }
};

struct LookaheadKeyHash {
    size_t operator()(const LookaheadKey& k) const;
};

// Memo of lookahead scores. One instance per top-level packing call; safe to
// share between packers running on different threads.
class LookaheadCache {
public:
    template <class F>
    int getOrCompute(const LookaheadKey& key, F&& simulate) {
        auto it = scores_.find(key);
        if (it != scores_.end()) {
            ++hits_;
            return it->second;
        }
        ++simulations_;
        int packed = simulate();
        scores_.insert({key, packed});
        return packed;
    }

    size_t size() const { return scores_.size(); }
    size_t hits() const { return hits_; }
    size_t simulations() const { return simulations_; }

private:
    tbb::concurrent_unordered_map<LookaheadKey, int, LookaheadKeyHash> scores_;
    std::atomic<size_t> hits_{0};
    std::atomic<size_t> simulations_{0};
};

// ────────── comparator ──────────
// Everything a comparison looks at. enumerator and packed must be set;
// cache may be null (no memoization).
struct SortContext {
    int widthLeft = 0, lengthLeft = 0, depthLeft = 0;
    int x = 0, y = 0, z = 0;
    int rowLength = 0;
    const ItemList* nextItems = nullptr;
    const PackedItemList* packed = nullptr;
    const OrientationEnumerator* enumerator = nullptr;
    PackMode mode = PackMode::Full;
    LookaheadCache* cache = nullptr;
    std::shared_ptr<spdlog::logger> logger;
};

// <0 prefers a, >0 prefers b, 0 when equivalent
int compareOrientations(const SortContext& ctx, const OrientedItem& a, const OrientedItem& b);

// First of the most preferred candidates; candidates must not be empty
const OrientedItem& bestOrientation(const SortContext& ctx, const std::vector<OrientedItem>& candidates);

// Items from the next kLookaheadWindow pending items that still fit if
// `candidate` is placed at the cursor (rest of row + rows below)
int lookaheadScore(const SortContext& ctx, const OrientedItem& candidate);

LookaheadKey makeLookaheadKey(const SortContext& ctx, const OrientedItem& candidate,
                              const ItemList& window);

} // namespace boxpack
