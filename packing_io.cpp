#include "packing_io.h"
#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace boxpack {

namespace {

Box parseBox(const nlohmann::json& b, size_t index) {
    std::string ref = b.value("reference", "box" + std::to_string(index));
    return Box(ref, b.at("width").get<int>(), b.at("length").get<int>(),
               b.at("depth").get<int>(), b.value("max_weight", Box::kUnlimitedWeight));
}

void parseItem(const nlohmann::json& it, size_t index, std::vector<ItemPtr>& out) {
    std::string desc = it.value("description", "item" + std::to_string(index));
    Rotation rot = parseRotation(it.value("rotation", std::string("any")));
    Placement placement = PlainPlacement{};
    if (it.contains("max_per_box")) {
        int limit = it.at("max_per_box").get<int>();
        if (limit <= 0)
            throw std::runtime_error("item '" + desc + "': max_per_box must be positive");
        placement = ConstrainedPlacement{maxPerBox(desc, limit)};
    }
    int qty = it.value("quantity", 1);
    if (qty < 0)
        throw std::runtime_error("item '" + desc + "': negative quantity");

    auto item = makeItem(desc, it.at("width").get<int>(), it.at("length").get<int>(),
                         it.at("depth").get<int>(), it.value("weight", 0), rot, placement);
    for (int c = 0; c < qty; ++c) out.push_back(item);
}

} // namespace

PackingJob parseJob(const nlohmann::json& j) {
    if (!j.is_object())
        throw std::runtime_error("job must be a JSON object");
    PackingJob job;
    try {
        if (j.contains("boxes")) {
            const auto& boxes = j.at("boxes");
            if (!boxes.is_array()) throw std::runtime_error("'boxes' must be an array");
            for (size_t i = 0; i < boxes.size(); ++i)
                job.boxes.push_back(parseBox(boxes[i], i));
        }
        const auto& items = j.at("items");
        if (!items.is_array()) throw std::runtime_error("'items' must be an array");
        for (size_t i = 0; i < items.size(); ++i)
            parseItem(items[i], i, job.items);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("malformed job: ") + e.what());
    }
    return job;
}

PackingJob loadJob(const std::string& filename) {
    spdlog::info("[JSON] parsing {}", filename);
    std::ifstream fin(filename);
    if (!fin)
        throw std::runtime_error("cannot open " + filename);

    nlohmann::json j;
    try {
        fin >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("parse " + filename + ": " + e.what());
    }
    PackingJob job = parseJob(j);
    spdlog::info("[JSON] loaded {} box(es), {} item(s) from {}", job.boxes.size(),
                 job.items.size(), filename);
    return job;
}

Box parseBoxSpec(const std::string& spec) {
    int w = 0, l = 0, d = 0, maxWeight = Box::kUnlimitedWeight;
    char x1 = 0, x2 = 0;
    std::istringstream ss(spec);
    if (!(ss >> w >> x1 >> l >> x2 >> d) || x1 != 'x' || x2 != 'x')
        throw std::runtime_error("bad box spec '" + spec + "', expected WxLxD[:maxWeight]");
    char colon = 0;
    if (ss >> colon) {
        if (colon != ':' || !(ss >> maxWeight))
            throw std::runtime_error("bad box spec '" + spec + "', expected WxLxD[:maxWeight]");
    }
    return Box(spec, w, l, d, maxWeight);
}

void writeCsvHeader(std::ostream& out) {
    out << "run,box,item,status,x,y,z,width,length,depth,weight,utilisation_pct\n";
}

void writeCsv(std::ostream& out, int run, const PackedBox& result) {
    const double util = result.volumeUtilisation();
    out << std::fixed << std::setprecision(1);
    for (const auto& p : result.items())
        out << run << ',' << result.box().reference() << ',' << p.item->description() << ",packed,"
            << p.x << ',' << p.y << ',' << p.z << ','
            << p.width << ',' << p.length << ',' << p.depth << ','
            << p.item->weight() << ',' << util << '\n';
    for (const auto& item : result.unpacked())
        out << run << ',' << result.box().reference() << ',' << item->description() << ",unpacked,,,,"
            << item->width() << ',' << item->length() << ',' << item->depth() << ','
            << item->weight() << ',' << util << '\n';
}

} // namespace boxpack
