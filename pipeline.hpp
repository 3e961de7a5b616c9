#pragma once

#include <cstdint>
#include <vector>

#include "addon_record.hpp"
#include "page_fetcher.hpp"
#include "paginator.hpp"

namespace amo {

struct PipelineResult {
  std::vector<AddonRecord> addons; // sorted by pname
  uint64_t pageCount = 0;  // page_count reported by the API
  uint64_t totalCount = 0; // results the API reported before filtering
  uint32_t pagesFetched = 0;
};

// Fetch, filter, map and sort. Throws on the first failure of any kind; the
// caller writes the artifact only after this returns.
PipelineResult runPipeline(PageSource &source,
                           const PaginationOptions &options);

} // namespace amo
