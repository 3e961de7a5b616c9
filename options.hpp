#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace amo {

class OptionsError : public std::invalid_argument {
public:
  explicit OptionsError(const std::string &msg) : std::invalid_argument(msg) {}
};

struct Options {
  std::optional<uint32_t> pages;
  std::optional<uint64_t> minUsers;
  bool verbose = false;
  uint32_t parallel = 4;
  uint32_t pageSize = 50;
  long timeoutSeconds = 60;
  std::string endpoint;   // empty: the public AMO search endpoint
  std::string outputPath; // empty: stdout
  bool showHelp = false;
};

// args excludes the program name. Throws OptionsError.
Options parseOptions(const std::vector<std::string> &args);

void printUsage(std::ostream &out, const std::string &program);

} // namespace amo
