#include "paginator.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <thread>
#include <utility>

#include "logging.hpp"

namespace amo {

uint32_t effectiveLastPage(std::optional<uint32_t> pageLimit,
                           uint64_t pageCount) {
  uint64_t limit = pageLimit ? *pageLimit : pageCount;
  return static_cast<uint32_t>(
      std::min<uint64_t>({limit, pageCount, UINT32_MAX}));
}

Paginator::Paginator(PageSource &source, PaginationOptions options)
    : source_(source), options_(std::move(options)) {
  if (options_.concurrency == 0) {
    options_.concurrency = 1;
  }
}

void Paginator::fail(std::exception_ptr error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!firstError_) {
    firstError_ = std::move(error);
  }
  cancelled_ = true;
}

void Paginator::worker() {
  while (!cancelled_) {
    uint32_t page = nextPage_.fetch_add(1);
    if (page > lastPage_) {
      return;
    }
    assert(page <= pageCount_);

    try {
      SearchPage result = source_.fetchPage(page, cancelled_);
      std::lock_guard<std::mutex> lock(mutex_);
      pages_[page] = std::move(result.results);
    } catch (...) {
      fail(std::current_exception());
      return;
    }
  }
}

PaginationResult Paginator::run() {
  auto start = std::chrono::steady_clock::now();

  SearchPage first = source_.fetchPage(1, cancelled_);
  pageCount_ = first.pageCount;
  lastPage_ = effectiveLastPage(options_.pageLimit, pageCount_);

  logInfo("search reports",
          {intField("pages", static_cast<int64_t>(first.pageCount)),
           intField("addons", static_cast<int64_t>(first.count))});
  logDebug("fetching pages", {intField("last_page", lastPage_)});

  PaginationResult result;
  result.pageCount = first.pageCount;
  result.totalCount = first.count;
  result.pagesFetched = 1;
  result.records = std::move(first.results);

  if (lastPage_ <= 1) {
    return result;
  }

  uint32_t width = std::min(options_.concurrency, lastPage_ - 1);
  std::vector<std::thread> workers;
  workers.reserve(width);
  try {
    for (uint32_t i = 0; i < width; i++) {
      workers.emplace_back(&Paginator::worker, this);
    }
  } catch (...) {
    fail(std::current_exception());
  }
  for (auto &t : workers) {
    t.join();
  }

  if (firstError_) {
    std::rethrow_exception(firstError_);
  }

  for (auto &entry : pages_) {
    auto &records = entry.second;
    result.records.insert(result.records.end(),
                          std::make_move_iterator(records.begin()),
                          std::make_move_iterator(records.end()));
    result.pagesFetched++;
  }

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                     std::chrono::steady_clock::now() - start)
                     .count();
  logInfo("pagination complete",
          {intField("pages", result.pagesFetched),
           intField("records", static_cast<int64_t>(result.records.size())),
           intField("elapsed_ms", elapsed)});
  return result;
}

} // namespace amo
