#include "aggregator.hpp"

#include <algorithm>
#include <string>

#include "logging.hpp"

namespace amo {

namespace {

std::string describe(const nlohmann::json &raw, const char *key) {
  if (raw.is_object()) {
    auto it = raw.find(key);
    if (it != raw.end() && it->is_string()) {
      return it->get<std::string>();
    }
  }
  return "?";
}

} // namespace

std::vector<AddonRecord> aggregate(const std::vector<nlohmann::json> &raw) {
  std::vector<AddonRecord> records;
  records.reserve(raw.size());
  size_t skipped = 0;

  for (const auto &item : raw) {
    if (!isEligible(item)) {
      skipped++;
      logDebug("skipping non-public addon",
               {stringField("guid", describe(item, "guid"))});
      continue;
    }

    try {
      records.push_back(mapAddon(item));
    } catch (const std::exception &e) {
      logDebug("addon rejected", {stringField("guid", describe(item, "guid")),
                                  stringField("slug", describe(item, "slug")),
                                  stringField("reason", e.what())});
      throw;
    }
  }

  std::sort(records.begin(), records.end(),
            [](const AddonRecord &a, const AddonRecord &b) {
              return a.pname < b.pname;
            });

  logInfo("aggregated addons",
          {intField("kept", static_cast<int64_t>(records.size())),
           intField("skipped", static_cast<int64_t>(skipped))});
  return records;
}

void writeAddons(std::ostream &out, const std::vector<AddonRecord> &records) {
  nlohmann::ordered_json array = nlohmann::ordered_json::array();
  for (const auto &record : records) {
    array.push_back(toJson(record));
  }
  out << array.dump(2) << '\n';
}

} // namespace amo
