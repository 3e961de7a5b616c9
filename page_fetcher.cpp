#include "page_fetcher.hpp"

#include <sstream>
#include <utility>

#include "errors.hpp"
#include "logging.hpp"

namespace amo {

namespace {

uint64_t requireCount(const nlohmann::json &envelope, const char *key,
                      uint32_t page) {
  auto it = envelope.find(key);
  if (it == envelope.end() || !it->is_number_integer() ||
      it->get<int64_t>() < 0) {
    throw MalformedEnvelopeError("page " + std::to_string(page) +
                                 ": field '" + key +
                                 "' is missing or not a non-negative integer");
  }
  return it->get<uint64_t>();
}

std::optional<std::string> optionalLink(const nlohmann::json &envelope,
                                        const char *key) {
  auto it = envelope.find(key);
  if (it == envelope.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

} // namespace

std::string buildSearchUrl(const SearchQuery &query, uint32_t page) {
  std::ostringstream url;
  url << query.endpoint;
  url << (query.endpoint.find('?') == std::string::npos ? '?' : '&');
  url << "lang=" << urlEscape(query.lang);
  url << "&app=" << urlEscape(query.app);
  url << "&type=" << urlEscape(query.type);
  url << "&sort=" << urlEscape(query.sort);
  url << "&page_size=" << query.pageSize;
  url << "&page=" << page;
  if (query.minUsers) {
    url << "&users__gt=" << *query.minUsers;
  }
  return url.str();
}

void checkStatus(const HttpResponse &response, const std::string &url) {
  if (response.status < 200 || response.status >= 300) {
    throw FetchError("GET " + url + " returned HTTP " +
                         std::to_string(response.status),
                     response.status);
  }
}

SearchPage parseSearchPage(const std::string &body, uint32_t page) {
  nlohmann::json envelope;
  try {
    envelope = nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error &e) {
    throw MalformedEnvelopeError("page " + std::to_string(page) +
                                 ": response is not JSON: " + e.what());
  }
  if (!envelope.is_object()) {
    throw MalformedEnvelopeError("page " + std::to_string(page) +
                                 ": response is not a JSON object");
  }

  SearchPage result;
  result.page = page;
  result.pageCount = requireCount(envelope, "page_count", page);
  result.count = requireCount(envelope, "count", page);

  auto pageSize = envelope.find("page_size");
  if (pageSize != envelope.end() && pageSize->is_number_unsigned()) {
    result.pageSize = pageSize->get<uint64_t>();
  }
  result.next = optionalLink(envelope, "next");
  result.previous = optionalLink(envelope, "previous");

  auto results = envelope.find("results");
  if (results == envelope.end() || !results->is_array()) {
    throw MalformedEnvelopeError("page " + std::to_string(page) +
                                 ": 'results' is missing or not an array");
  }
  result.results.reserve(results->size());
  for (auto &item : *results) {
    result.results.push_back(std::move(item));
  }
  return result;
}

CurlPageFetcher::CurlPageFetcher(const HttpClient &http, SearchQuery query)
    : http_(http), query_(std::move(query)) {}

SearchPage CurlPageFetcher::fetchPage(uint32_t page,
                                      const std::atomic<bool> &cancelled) {
  std::string url = buildSearchUrl(query_, page);
  logDebug("fetching page", {intField("page", page), stringField("url", url)});

  HttpResponse response = http_.get(url, &cancelled);
  checkStatus(response, url);

  SearchPage result = parseSearchPage(response.body, page);
  logDebug("page fetched", {intField("page", page),
                            intField("results", static_cast<int64_t>(
                                                    result.results.size()))});
  return result;
}

} // namespace amo
