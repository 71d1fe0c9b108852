// boxpack: pack an item list into each listed box and export placements
// --------------------------------------------------------------------
//   boxpack -i job.json [-b 600x400x300:20000] [-o packing.csv] [--sort volume|weight|none] [-v]
// Every box is packed independently (in parallel); results are reported
// side by side, no box is picked over another.
// --------------------------------------------------------------------
#include "item_list.h"
#include "packing_io.h"
#include "volume_packer.h"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>

using namespace boxpack;

// ───────── CLI ─────────
struct CLI {
    std::string input;
    std::vector<std::string> boxes;
    std::string out = "packing.csv";
    std::string sort = "volume";
    bool verbose = false;
};

static CLI parse(int ac, char** av) {
    CLI c;
    cxxopts::Options options(av[0], "3D box packing");
    options.add_options()
        ("i,input", "job JSON file", cxxopts::value<std::string>())
        ("b,box", "box WxLxD[:maxWeight], repeatable", cxxopts::value<std::vector<std::string>>())
        ("o,out", "output csv", cxxopts::value<std::string>())
        ("sort", "item order: volume, weight or none", cxxopts::value<std::string>())
        ("v,verbose", "verbose", cxxopts::value<bool>()->default_value("false"))
        ("h,help", "print help");

    auto result = options.parse(ac, av);
    if (result.count("help") || ac == 1) {
        std::cout << options.help() << "\n";
        std::exit(0);
    }

    c.input   = result.count("input") ? result["input"].as<std::string>() : "";
    c.boxes   = result.count("box")   ? result["box"].as<std::vector<std::string>>() : std::vector<std::string>{};
    c.out     = result.count("out")   ? result["out"].as<std::string>()   : "packing.csv";
    c.sort    = result.count("sort")  ? result["sort"].as<std::string>()  : "volume";
    c.verbose = result["verbose"].as<bool>();

    if (c.input.empty())
        throw std::runtime_error("no input job, use --help for usage");
    if (c.sort != "volume" && c.sort != "weight" && c.sort != "none")
        throw std::runtime_error("unknown --sort '" + c.sort + "'");
    return c;
}

static ItemList orderItems(const std::vector<ItemPtr>& items, const std::string& sort) {
    if (sort == "weight") return ItemList::sorted(items, weightDescending);
    if (sort == "none") return ItemList(items);
    return ItemList::sorted(items, volumeDescending);
}

int main(int argc, char* argv[]) {
    try {
        CLI cli = parse(argc, argv);
        spdlog::set_pattern("[%H:%M:%S] %^%l%$ %v");
        spdlog::set_level(cli.verbose ? spdlog::level::debug : spdlog::level::warn);

        PackingJob job = loadJob(cli.input);
        if (!cli.boxes.empty()) {
            job.boxes.clear();
            for (const auto& spec : cli.boxes) job.boxes.push_back(parseBoxSpec(spec));
        }
        if (job.boxes.empty())
            throw std::runtime_error("no boxes in job and none given with --box");
        if (job.items.empty())
            throw std::runtime_error("no items to pack");

        const ItemList items = orderItems(job.items, cli.sort);
        spdlog::info("Packing {} item(s) into {} box type(s)", items.count(), job.boxes.size());

        // one memo for the whole invocation, shared by every box run
        LookaheadCache cache;
        std::vector<std::optional<PackedBox>> results(job.boxes.size());
        #pragma omp parallel for
        for (int i = 0; i < int(job.boxes.size()); ++i) {
            VolumePacker packer(job.boxes[i], items, PackMode::Full, &cache);
            results[i] = packer.pack();
        }
        spdlog::info("Lookahead cache: {} entries, {} hits, {} simulations",
                     cache.size(), cache.hits(), cache.simulations());

        std::ofstream csv(cli.out);
        if (!csv)
            throw std::runtime_error("cannot write " + cli.out);
        writeCsvHeader(csv);
        for (size_t i = 0; i < results.size(); ++i) {
            const PackedBox& r = *results[i];
            writeCsv(csv, int(i), r);
            spdlog::info("{}: weight {} / {}, utilisation {}%, {} layer(s)", r.box().reference(),
                         r.weight(), r.box().maxWeight(), r.volumeUtilisation(), r.layers().size());
            std::cout << r.box().reference() << ": placed " << r.items().size() << '/'
                      << items.count() << "  ->  " << cli.out << "\n";
        }
        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "ERR: " << e.what() << "\n";
        return 1;
    }
}
