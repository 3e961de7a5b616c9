#include "addon_record.hpp"

#include <initializer_list>
#include <utility>

#include "errors.hpp"
#include "locale.hpp"
#include "sri_hash.hpp"

namespace amo {

namespace {

constexpr const char *STATUS_PUBLIC = "public";

// Walks `path` through nested objects. Returns nullptr if any step is
// missing, is not an object, or the final value is null.
const nlohmann::json *lookup(const nlohmann::json &root,
                             std::initializer_list<const char *> path) {
  const nlohmann::json *node = &root;
  for (const char *key : path) {
    if (!node->is_object()) {
      return nullptr;
    }
    auto it = node->find(key);
    if (it == node->end()) {
      return nullptr;
    }
    node = &*it;
  }
  return node->is_null() ? nullptr : node;
}

std::string dotted(std::initializer_list<const char *> path) {
  std::string out;
  for (const char *key : path) {
    if (!out.empty()) {
      out += '.';
    }
    out += key;
  }
  return out;
}

std::string requireString(const nlohmann::json &root,
                          std::initializer_list<const char *> path) {
  const nlohmann::json *value = lookup(root, path);
  if (!value) {
    throw MissingRequiredFieldError(dotted(path));
  }
  if (!value->is_string()) {
    throw MissingRequiredFieldError(dotted(path),
                                    "required field " + dotted(path) +
                                        " is not a string: " + value->dump());
  }
  return value->get<std::string>();
}

std::optional<nlohmann::json>
optionalValue(const nlohmann::json &root,
              std::initializer_list<const char *> path) {
  const nlohmann::json *value = lookup(root, path);
  if (!value) {
    return std::nullopt;
  }
  return *value;
}

bool isPublic(const nlohmann::json &raw,
              std::initializer_list<const char *> path) {
  const nlohmann::json *status = lookup(raw, path);
  return status && status->is_string() &&
         status->get<std::string>() == STATUS_PUBLIC;
}

} // namespace

bool AddonMeta::empty() const {
  return !homepage && !description && !license && !permissions &&
         !hostPermissions && !optionalPermissions && !requiresPayment &&
         !compatibility && !categories && !tags && !hasEula &&
         !hasPrivacyPolicy && !promotedCategory;
}

bool isEligible(const nlohmann::json &raw) {
  return isPublic(raw, {"status"}) &&
         isPublic(raw, {"current_version", "file", "status"});
}

AddonRecord mapAddon(const nlohmann::json &raw) {
  std::string locale = requireString(raw, {"default_locale"});

  AddonRecord record;

  // slug is a plain string on v5, but older payloads translated it
  const nlohmann::json *slug = lookup(raw, {"slug"});
  if (!slug) {
    throw MissingRequiredFieldError("slug");
  }
  record.pname = resolveLocale(*slug, locale, "slug");

  record.version = requireString(raw, {"current_version", "version"});
  record.url = requireString(raw, {"current_version", "file", "url"});
  record.hash =
      toSriHash(requireString(raw, {"current_version", "file", "hash"}));
  record.addonId = requireString(raw, {"guid"});

  AddonMeta meta;

  if (lookup(raw, {"homepage"})) {
    if (const nlohmann::json *url = lookup(raw, {"homepage", "url"})) {
      meta.homepage = resolveLocale(*url, locale, "homepage.url");
    }
  }
  if (const nlohmann::json *summary = lookup(raw, {"summary"})) {
    meta.description = resolveLocale(*summary, locale, "summary");
  }

  meta.license = optionalValue(raw, {"current_version", "license", "slug"});
  meta.permissions =
      optionalValue(raw, {"current_version", "file", "permissions"});
  meta.hostPermissions =
      optionalValue(raw, {"current_version", "file", "host_permissions"});
  meta.optionalPermissions =
      optionalValue(raw, {"current_version", "file", "optional_permissions"});
  meta.requiresPayment = optionalValue(raw, {"requires_payment"});
  meta.compatibility = optionalValue(raw, {"compatibility", "firefox"});
  meta.categories = optionalValue(raw, {"categories"});
  meta.tags = optionalValue(raw, {"tags"});
  meta.hasEula = optionalValue(raw, {"has_eula"});
  meta.hasPrivacyPolicy = optionalValue(raw, {"has_privacy_policy"});
  meta.promotedCategory = optionalValue(raw, {"promoted", "category"});

  if (!meta.empty()) {
    record.meta = std::move(meta);
  }
  return record;
}

nlohmann::ordered_json toJson(const AddonMeta &meta) {
  nlohmann::ordered_json out = nlohmann::ordered_json::object();

  auto put = [&out](const char *key, const auto &value) {
    if (value) {
      out[key] = *value;
    }
  };
  put("homepage", meta.homepage);
  put("description", meta.description);
  put("license", meta.license);
  put("permissions", meta.permissions);
  put("hostPermissions", meta.hostPermissions);
  put("optionalPermissions", meta.optionalPermissions);
  put("requiresPayment", meta.requiresPayment);
  put("compatibility", meta.compatibility);
  put("categories", meta.categories);
  put("tags", meta.tags);
  put("hasEula", meta.hasEula);
  put("hasPrivacyPolicy", meta.hasPrivacyPolicy);
  put("promotedCategory", meta.promotedCategory);
  return out;
}

nlohmann::ordered_json toJson(const AddonRecord &record) {
  nlohmann::ordered_json out = nlohmann::ordered_json::object();
  out["pname"] = record.pname;
  out["version"] = record.version;
  out["url"] = record.url;
  out["hash"] = record.hash;
  out["addonId"] = record.addonId;
  if (record.meta) {
    out["meta"] = toJson(*record.meta);
  }
  return out;
}

} // namespace amo
