#include "logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace amo {

namespace {

constexpr const char *LOGGER_NAME = "fetch-addons";

std::string resolvePattern() {
  if (const char *pattern = std::getenv("FETCH_ADDONS_LOG_PATTERN")) {
    return pattern;
  }
  return "%^%l%$: %v";
}

std::string serializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto &field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << field.value;
  }
  return out.str();
}

} // namespace

spdlog::level::level_enum resolveLogLevel(const char *requested,
                                          bool verbose) {
  auto fallback = verbose ? spdlog::level::debug : spdlog::level::warn;
  if (!requested) {
    return fallback;
  }
  std::string name(requested);
  auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to off
  if (level == spdlog::level::off && name != "off") {
    return fallback;
  }
  return level;
}

LogField stringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField intField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

void initLogging(bool verbose) {
  auto logger = spdlog::get(LOGGER_NAME);
  if (!logger) {
    logger = spdlog::stderr_color_mt(LOGGER_NAME);
  }
  logger->set_pattern(resolvePattern());
  logger->set_level(
      resolveLogLevel(std::getenv("FETCH_ADDONS_LOG_LEVEL"), verbose));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void shutdownLogging() { spdlog::shutdown(); }

void log(spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields) {
  auto serialized = serializeFields(fields);
  if (!serialized.empty()) {
    spdlog::log(level, "{} {}", message, serialized);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace amo
