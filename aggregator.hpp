#pragma once

#include <ostream>
#include <vector>

#include <nlohmann/json.hpp>

#include "addon_record.hpp"

namespace amo {

// Filters and maps every raw search result, then sorts by pname. The first
// record that fails to map aborts the whole aggregation: its exception
// propagates and nothing is returned.
std::vector<AddonRecord> aggregate(const std::vector<nlohmann::json> &raw);

// Writes the artifact: a JSON array, two-space indent, trailing newline.
void writeAddons(std::ostream &out, const std::vector<AddonRecord> &records);

} // namespace amo
