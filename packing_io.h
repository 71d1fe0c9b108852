#pragma once
#include "item.h"
#include "volume_packer.h"
#include <iosfwd>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace boxpack {

struct PackingJob {
    std::vector<Box> boxes;
    std::vector<ItemPtr> items;   // quantities expanded, copies share one Item
};

// Throws std::runtime_error on malformed input, InvalidDimensions on bad sizes
PackingJob parseJob(const nlohmann::json& j);
PackingJob loadJob(const std::string& filename);

// "WxLxD" or "WxLxD:maxWeight"
Box parseBoxSpec(const std::string& spec);

void writeCsvHeader(std::ostream& out);
void writeCsv(std::ostream& out, int run, const PackedBox& result);

} // namespace boxpack
