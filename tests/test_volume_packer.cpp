#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "item_list.h"
#include "volume_packer.h"
#include <algorithm>
#include <array>
#include <memory>
#include <random>
#include <sstream>
#include <string>
#include <vector>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

using namespace boxpack;

static std::vector<ItemPtr> copies(const ItemPtr& item, int n) {
    return std::vector<ItemPtr>(n, item);
}

TEST_CASE("two cubes side by side") {
    auto cube = makeItem("cube", 10, 10, 10, 1);
    VolumePacker packer(Box("box", 20, 10, 10, 100), ItemList::sorted(copies(cube, 2)));
    PackedBox r = packer.pack();

    REQUIRE(r.items().size() == 2);
    REQUIRE(r.unpacked().empty());
    REQUIRE(r.items().items()[0].x == 0);
    REQUIRE(r.items().items()[1].x == 10);
    REQUIRE(r.items().items()[1].y == 0);
    REQUIRE(r.items().items()[1].z == 0);
    REQUIRE(r.layers().size() == 1);
    REQUIRE(r.remainingWidth() == 0);
    REQUIRE(r.remainingLength() == 0);
    REQUIRE(r.weight() == 2);
    REQUIRE(r.remainingWeight() == 98);
    REQUIRE(r.volumeUtilisation() == Approx(100.0));
}

TEST_CASE("full row stacks into the next layer") {
    auto cube = makeItem("cube", 10, 10, 10, 1);
    PackedBox r = VolumePacker(Box("tower", 10, 10, 20, 100), ItemList(copies(cube, 3))).pack();

    REQUIRE(r.items().size() == 2);
    REQUIRE(r.unpacked().size() == 1);
    REQUIRE(r.layers().size() == 2);
    REQUIRE(r.items().items()[1].z == 10);
    REQUIRE(r.usedDepth() == 20);
    REQUIRE(r.remainingDepth() == 0);
}

TEST_CASE("weight limit sends items to unpacked") {
    auto a = makeItem("a", 10, 10, 10, 3);
    auto b = makeItem("b", 10, 10, 10, 3);
    PackedBox r = VolumePacker(Box("light", 100, 100, 100, 5), ItemList({a, b})).pack();

    REQUIRE(r.items().size() == 1);
    REQUIRE(r.items().items()[0].item == a);
    REQUIRE(r.unpacked().size() == 1);
    REQUIRE(r.unpacked()[0] == b);
    REQUIRE(r.weight() <= r.box().maxWeight());
}

TEST_CASE("item larger than the box is left out") {
    auto cube = makeItem("cube", 10, 10, 10, 1);
    auto pole = makeItem("pole", 30, 5, 5, 1);
    PackedBox r = VolumePacker(Box("small", 20, 20, 20, 100), ItemList::sorted({pole, cube})).pack();

    REQUIRE(r.items().size() == 1);
    REQUIRE(r.items().items()[0].item == cube);
    REQUIRE(r.unpacked().size() == 1);
    REQUIRE(r.unpacked()[0] == pole);
}

TEST_CASE("per-box cap holds back extra copies") {
    auto lamp = makeItem("lamp", 10, 10, 10, 1, Rotation::Any,
                         ConstrainedPlacement{maxPerBox("lamp", 2)});
    auto cube = makeItem("cube", 5, 5, 5, 1);
    std::vector<ItemPtr> items = copies(lamp, 3);
    items.push_back(cube);
    PackedBox r = VolumePacker(Box("big", 100, 100, 100, 1000), ItemList::sorted(items)).pack();

    REQUIRE(r.items().countByDescription("lamp") == 2);
    REQUIRE(r.items().countByDescription("cube") == 1);
    REQUIRE(r.unpacked().size() == 1);
    REQUIRE(r.unpacked()[0] == lamp);
}

TEST_CASE("nothing to pack") {
    PackedBox r = VolumePacker(Box("empty", 10, 10, 10, 10), ItemList()).pack();
    REQUIRE(r.items().empty());
    REQUIRE(r.unpacked().empty());
    REQUIRE(r.layers().empty());
    REQUIRE(r.usedWidth() == 0);
    REQUIRE(r.remainingWidth() == 10);
    REQUIRE(r.volumeUtilisation() == Approx(0.0));
}

TEST_CASE("random jobs stay in bounds, apart and under weight") {
    std::mt19937 rng(42);
    std::uniform_int_distribution<int> boxDim(20, 100);
    std::uniform_int_distribution<int> itemDim(1, 40);
    std::uniform_int_distribution<int> itemWeight(0, 20);
    std::uniform_int_distribution<int> boxWeight(50, 400);
    std::uniform_int_distribution<int> itemCount(1, 30);
    std::uniform_int_distribution<int> rotation(0, 2);

    for (int trial = 0; trial < 25; ++trial) {
        Box box("rand", boxDim(rng), boxDim(rng), boxDim(rng), boxWeight(rng));
        std::vector<ItemPtr> items;
        const int n = itemCount(rng);
        for (int i = 0; i < n; ++i)
            items.push_back(makeItem("i" + std::to_string(i), itemDim(rng), itemDim(rng), itemDim(rng),
                                     itemWeight(rng), static_cast<Rotation>(rotation(rng))));

        PackedBox r = VolumePacker(box, ItemList::sorted(items)).pack();
        REQUIRE(r.items().size() + r.unpacked().size() == items.size());
        REQUIRE(r.weight() <= box.maxWeight());

        const auto& placed = r.items().items();
        for (size_t i = 0; i < placed.size(); ++i) {
            const PackedItem& p = placed[i];
            REQUIRE(p.x >= 0);
            REQUIRE(p.y >= 0);
            REQUIRE(p.z >= 0);
            REQUIRE(p.x + p.width <= box.innerWidth());
            REQUIRE(p.y + p.length <= box.innerLength());
            REQUIRE(p.z + p.depth <= box.innerDepth());

            std::array<int, 3> given{p.item->width(), p.item->length(), p.item->depth()};
            std::array<int, 3> used{p.width, p.length, p.depth};
            std::sort(given.begin(), given.end());
            std::sort(used.begin(), used.end());
            REQUIRE(given == used);
            if (p.item->rotation() != Rotation::Any)
                REQUIRE(p.depth == p.item->depth());

            for (size_t j = i + 1; j < placed.size(); ++j)
                REQUIRE_FALSE(p.intersects(placed[j]));
        }
    }
}

TEST_CASE("shared lookahead cache is reused across runs") {
    auto crate = makeItem("crate", 30, 40, 50, 1, Rotation::KeepFlat);
    auto cube = makeItem("cube", 10, 10, 10, 1);
    std::vector<ItemPtr> items = copies(cube, 3);
    items.push_back(crate);
    const ItemList list = ItemList::sorted(items);
    const Box box("shared", 100, 100, 100, 1000);

    LookaheadCache cache;
    PackedBox first = VolumePacker(box, list, PackMode::Full, &cache).pack();
    const size_t simulated = cache.simulations();
    REQUIRE(simulated > 0);
    REQUIRE(cache.hits() == 0);

    PackedBox second = VolumePacker(box, list, PackMode::Full, &cache).pack();
    REQUIRE(cache.simulations() == simulated);
    REQUIRE(cache.hits() >= simulated);

    REQUIRE(first.items().size() == 4);
    REQUIRE(second.items().size() == first.items().size());
    for (size_t i = 0; i < first.items().size(); ++i) {
        REQUIRE(first.items().items()[i].x == second.items().items()[i].x);
        REQUIRE(first.items().items()[i].width == second.items().items()[i].width);
    }

    // a run without a cache gets the same answer
    PackedBox own = VolumePacker(box, list).pack();
    REQUIRE(own.items().items()[0].width == first.items().items()[0].width);
}

TEST_CASE("single pass packer never simulates") {
    auto crate = makeItem("crate", 30, 40, 50, 1, Rotation::KeepFlat);
    auto cube = makeItem("cube", 10, 10, 10, 1);
    LookaheadCache cache;
    VolumePacker packer(Box("quick", 100, 100, 100, 1000), ItemList({crate, cube, cube}),
                        PackMode::SinglePass, &cache);
    REQUIRE(packer.mode() == PackMode::SinglePass);
    PackedBox r = packer.pack();
    REQUIRE(r.items().size() == 3);
    REQUIRE(cache.simulations() == 0);
    REQUIRE(cache.size() == 0);
}

TEST_CASE("packer logs through the injected logger") {
    std::ostringstream oss;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(oss);
    auto logger = std::make_shared<spdlog::logger>("packer-test", sink);
    logger->set_level(spdlog::level::trace);

    auto cube = makeItem("cube", 10, 10, 10, 1);
    VolumePacker(Box("logged", 20, 10, 10, 100), ItemList(copies(cube, 2)), PackMode::Full,
                 nullptr, logger).pack();
    logger->flush();

    const std::string out = oss.str();
    REQUIRE(out.find("[PACK] 'cube' 10x10x10 at (10,0,0)") != std::string::npos);
    REQUIRE(out.find("packed 2/2 in 1 layer(s)") != std::string::npos);
}

TEST_CASE("state names") {
    REQUIRE(std::string(packStateName(PackState::RowOpen)) == "row-open");
    REQUIRE(std::string(packStateName(PackState::ContainerExhausted)) == "container-exhausted");
}

TEST_CASE("simulated placements are traced apart from real ones") {
    std::ostringstream oss;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(oss);
    auto logger = std::make_shared<spdlog::logger>("sim-test", sink);
    logger->set_level(spdlog::level::trace);

    auto crate = makeItem("crate", 30, 40, 50, 1, Rotation::KeepFlat);
    auto cube = makeItem("cube", 10, 10, 10, 1);
    std::vector<ItemPtr> items = copies(cube, 3);
    items.push_back(crate);
    LookaheadCache cache;
    PackedBox r = VolumePacker(Box("traced", 100, 100, 100, 1000), ItemList::sorted(items),
                               PackMode::Full, &cache, logger).pack();
    logger->flush();
    REQUIRE(cache.simulations() > 0);

    std::istringstream in(oss.str());
    std::string line;
    size_t real = 0, simulated = 0;
    while (std::getline(in, line)) {
        if (line.find("[PACK] '") != std::string::npos) ++real;
        if (line.find("[LOOKAHEAD-SIM] '") != std::string::npos) ++simulated;
    }
    REQUIRE(real == r.items().size());
    REQUIRE(simulated > 0);
}
