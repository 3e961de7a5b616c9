#include "pipeline.hpp"

#include <utility>

#include "aggregator.hpp"

namespace amo {

PipelineResult runPipeline(PageSource &source,
                           const PaginationOptions &options) {
  PaginationResult pages = Paginator(source, options).run();

  PipelineResult result;
  result.pageCount = pages.pageCount;
  result.totalCount = pages.totalCount;
  result.pagesFetched = pages.pagesFetched;
  result.addons = aggregate(pages.records);
  return result;
}

} // namespace amo
