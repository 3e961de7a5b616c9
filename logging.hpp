#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace amo {

// Diagnostics only ever go to stderr; stdout is reserved for the artifact.

struct LogField {
  std::string key;
  std::string value;
};

LogField stringField(std::string_view key, std::string_view value);
LogField intField(std::string_view key, std::int64_t value);

// Level named by `requested` (FETCH_ADDONS_LOG_LEVEL), else debug when
// verbose and warn otherwise. Unrecognised names get the same default.
spdlog::level::level_enum resolveLogLevel(const char *requested,
                                          bool verbose);

void initLogging(bool verbose);
void shutdownLogging();

void log(spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields = {});

inline void logDebug(std::string_view message,
                     std::initializer_list<LogField> fields = {}) {
  log(spdlog::level::debug, message, fields);
}

inline void logInfo(std::string_view message,
                    std::initializer_list<LogField> fields = {}) {
  log(spdlog::level::info, message, fields);
}

inline void logError(std::string_view message,
                     std::initializer_list<LogField> fields = {}) {
  log(spdlog::level::err, message, fields);
}

} // namespace amo
