#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "page_fetcher.hpp"

namespace fixtures {

inline const std::string EMPTY_SHA256 =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
inline const std::string EMPTY_SRI =
    "sha256-47DEQpj8HBSa+/TImW+5JCeuQeRkm5NMpJWZG3hSuFU=";

// Minimal eligible search result: required fields only.
inline nlohmann::json minimalAddon(const std::string &slug) {
  return {
      {"slug", slug},
      {"guid", slug + "@example.org"},
      {"status", "public"},
      {"default_locale", "en-US"},
      {"current_version",
       {{"version", "1.0"},
        {"file",
         {{"url", "https://addons.example/" + slug + ".xpi"},
          {"hash", "sha256:" + EMPTY_SHA256},
          {"status", "public"}}}}},
  };
}

// Eligible search result with every optional field the mapper reads.
inline nlohmann::json fullAddon(const std::string &slug) {
  nlohmann::json addon = minimalAddon(slug);
  addon["homepage"] = {
      {"url", {{"en-US", "https://" + slug + ".example"}}},
      {"outgoing", {{"en-US", "https://outgoing.example"}}}};
  addon["summary"] = {{"en-US", "Summary of " + slug},
                      {"de", "Zusammenfassung"}};
  addon["current_version"]["license"] = {{"slug", "MPL-2.0"}, {"id", 6}};
  nlohmann::json &file = addon["current_version"]["file"];
  file["permissions"] = nlohmann::json::array({"storage", "tabs"});
  file["host_permissions"] = nlohmann::json::array({"<all_urls>"});
  file["optional_permissions"] = nlohmann::json::array();
  addon["requires_payment"] = false;
  addon["compatibility"] = {{"firefox", {{"min", "109.0"}, {"max", "*"}}},
                            {"android", {{"min", "120.0"}, {"max", "*"}}}};
  addon["categories"] = nlohmann::json::array({"privacy-security"});
  addon["tags"] = nlohmann::json::array({"ad blocker"});
  addon["has_eula"] = false;
  addon["has_privacy_policy"] = true;
  addon["promoted"] = {{"category", "recommended"},
                       {"apps", nlohmann::json::array({"firefox"})}};
  return addon;
}

inline amo::SearchPage makePage(uint32_t page, uint64_t pageCount,
                                std::vector<nlohmann::json> results) {
  amo::SearchPage out;
  out.page = page;
  out.pageSize = results.size();
  out.pageCount = pageCount;
  out.count = pageCount * results.size();
  out.results = std::move(results);
  return out;
}

// In-memory search API. Pages not listed in `pages` are served empty unless
// listed in `failing`, in which case the fetch throws FetchError.
class FakeSource : public amo::PageSource {
public:
  uint64_t pageCount = 1;
  std::map<uint32_t, std::vector<nlohmann::json>> pages;
  std::set<uint32_t> failing;

  amo::SearchPage fetchPage(uint32_t page,
                            const std::atomic<bool> &cancelled) override {
    (void)cancelled;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      requested_.push_back(page);
    }
    if (failing.count(page)) {
      throw amo::FetchError("GET page " + std::to_string(page) +
                                " returned HTTP 503",
                            503);
    }
    auto it = pages.find(page);
    return makePage(page, pageCount,
                    it == pages.end() ? std::vector<nlohmann::json>{}
                                      : it->second);
  }

  std::vector<uint32_t> requested() {
    std::lock_guard<std::mutex> lock(mutex_);
    return requested_;
  }

private:
  std::mutex mutex_;
  std::vector<uint32_t> requested_;
};

} // namespace fixtures
