#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "http_client.hpp"

namespace amo {

constexpr const char *DEFAULT_SEARCH_ENDPOINT =
    "https://addons.mozilla.org/api/v5/addons/search/";

// Query parameters shared by every page of one run.
struct SearchQuery {
  std::string endpoint = DEFAULT_SEARCH_ENDPOINT;
  std::string lang = "en-US";
  std::string app = "firefox";
  std::string type = "extension";
  std::string sort = "users";
  uint32_t pageSize = 50;
  std::optional<uint64_t> minUsers; // sent as users__gt when set
};

// One decoded search response.
struct SearchPage {
  uint32_t page = 0;
  uint64_t pageSize = 0;
  uint64_t pageCount = 0;
  uint64_t count = 0;
  std::optional<std::string> next;
  std::optional<std::string> previous;
  std::vector<nlohmann::json> results;
};

std::string buildSearchUrl(const SearchQuery &query, uint32_t page);

// Throws FetchError carrying the status unless it is 2xx.
void checkStatus(const HttpResponse &response, const std::string &url);

// Throws MalformedEnvelopeError when `body` is not a search envelope.
SearchPage parseSearchPage(const std::string &body, uint32_t page);

// Source of search pages. fetchPage must be safe to call from several
// threads at once and must throw rather than return a partial page.
class PageSource {
public:
  virtual ~PageSource() = default;
  virtual SearchPage fetchPage(uint32_t page,
                               const std::atomic<bool> &cancelled) = 0;
};

class CurlPageFetcher : public PageSource {
private:
  const HttpClient &http_;
  SearchQuery query_;

public:
  CurlPageFetcher(const HttpClient &http, SearchQuery query);

  SearchPage fetchPage(uint32_t page,
                       const std::atomic<bool> &cancelled) override;
};

} // namespace amo
