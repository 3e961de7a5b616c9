#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace amo {

// Optional metadata carried into the generated package definitions. Each
// member is engaged only when the source record had a non-null value for it.
// Pass-through values (lists, compatibility ranges, flags) are kept as the
// JSON the API sent.
struct AddonMeta {
  std::optional<std::string> homepage;
  std::optional<std::string> description;
  std::optional<nlohmann::json> license;
  std::optional<nlohmann::json> permissions;
  std::optional<nlohmann::json> hostPermissions;
  std::optional<nlohmann::json> optionalPermissions;
  std::optional<nlohmann::json> requiresPayment;
  std::optional<nlohmann::json> compatibility;
  std::optional<nlohmann::json> categories;
  std::optional<nlohmann::json> tags;
  std::optional<nlohmann::json> hasEula;
  std::optional<nlohmann::json> hasPrivacyPolicy;
  std::optional<nlohmann::json> promotedCategory;

  bool empty() const;
};

struct AddonRecord {
  std::string pname;
  std::string version;
  std::string url;
  std::string hash; // SRI form, e.g. "sha256-..."
  std::string addonId;
  std::optional<AddonMeta> meta;
};

// True iff both the listing and its current file are "public".
bool isEligible(const nlohmann::json &raw);

// Maps one eligible search result. Throws MissingRequiredFieldError,
// MissingLocaleValueError or MalformedHashError; never returns a partially
// filled record.
AddonRecord mapAddon(const nlohmann::json &raw);

// Keys keep insertion order: pname, version, url, hash, addonId, meta.
nlohmann::ordered_json toJson(const AddonMeta &meta);
nlohmann::ordered_json toJson(const AddonRecord &record);

} // namespace amo
