#pragma once

#include <atomic>
#include <cstdint>
#include <exception>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

#include "page_fetcher.hpp"

namespace amo {

struct PaginationOptions {
  std::optional<uint32_t> pageLimit; // unset: every page the API reports
  uint32_t concurrency = 4;
};

struct PaginationResult {
  uint64_t pageCount = 0;  // as reported by page 1
  uint64_t totalCount = 0; // as reported by page 1
  uint32_t pagesFetched = 0;
  std::vector<nlohmann::json> records;
};

// Two-phase pagination: page 1 is fetched alone to learn page_count, the
// remaining pages are then spread over a fixed pool of worker threads. The
// first failure cancels the pool; run() joins every worker before it
// rethrows, and never returns partial results.
class Paginator {
private:
  PageSource &source_;
  PaginationOptions options_;

  uint64_t pageCount_ = 0;
  uint32_t lastPage_ = 0;

  std::atomic<uint32_t> nextPage_{2};
  std::atomic<bool> cancelled_{false};

  std::mutex mutex_;
  std::map<uint32_t, std::vector<nlohmann::json>> pages_;
  std::exception_ptr firstError_;

  void worker();
  void fail(std::exception_ptr error);

public:
  Paginator(PageSource &source, PaginationOptions options);

  PaginationResult run();
};

// Highest page the run may request given what page 1 reported.
uint32_t effectiveLastPage(std::optional<uint32_t> pageLimit,
                           uint64_t pageCount);

} // namespace amo
