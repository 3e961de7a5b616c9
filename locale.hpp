#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace amo {

// Returns the value for `locale` out of a translated AMO field. `field` is the
// dotted source path, used for error reporting only.
//
// A translated field is normally an object keyed by locale code. Some
// endpoints return the already-resolved string instead; that is passed
// through unchanged. A missing or null entry for `locale` throws
// MissingLocaleValueError: the record declared that locale authoritative, so
// there is no fallback.
std::string resolveLocale(const nlohmann::json &value,
                          const std::string &locale, const std::string &field);

} // namespace amo
