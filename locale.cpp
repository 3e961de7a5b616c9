#include "locale.hpp"

#include "errors.hpp"

namespace amo {

std::string resolveLocale(const nlohmann::json &value,
                          const std::string &locale,
                          const std::string &field) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (!value.is_object()) {
    throw MissingLocaleValueError(field, locale);
  }

  auto it = value.find(locale);
  if (it == value.end() || !it->is_string()) {
    throw MissingLocaleValueError(field, locale);
  }
  return it->get<std::string>();
}

} // namespace amo
