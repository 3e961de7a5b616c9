#include "options.hpp"

#include <cctype>
#include <limits>

namespace amo {

namespace {

uint64_t parsePositive(const std::string &option, const std::string &value,
                       uint64_t max) {
  bool digits = !value.empty();
  for (char c : value) {
    digits = digits && std::isdigit(static_cast<unsigned char>(c));
  }
  if (!digits) {
    throw OptionsError(option + " expects a positive integer, got '" + value +
                       "'");
  }

  uint64_t parsed;
  try {
    parsed = std::stoull(value);
  } catch (const std::out_of_range &) {
    throw OptionsError(option + " value is out of range: " + value);
  }
  if (parsed == 0) {
    throw OptionsError(option + " must be at least 1");
  }
  if (parsed > max) {
    throw OptionsError(option + " value is out of range: " + value);
  }
  return parsed;
}

uint64_t parseCount(const std::string &option, const std::string &value) {
  if (value == "0") {
    return 0;
  }
  return parsePositive(option, value, std::numeric_limits<uint64_t>::max());
}

} // namespace

Options parseOptions(const std::vector<std::string> &args) {
  Options opts;
  constexpr uint64_t U32_MAX = std::numeric_limits<uint32_t>::max();

  for (size_t i = 0; i < args.size(); i++) {
    const std::string &arg = args[i];

    auto value = [&]() -> const std::string & {
      if (i + 1 >= args.size()) {
        throw OptionsError(arg + " requires a value");
      }
      return args[++i];
    };

    if (arg == "-h" || arg == "--help") {
      opts.showHelp = true;
    } else if (arg == "-v" || arg == "--verbose") {
      opts.verbose = true;
    } else if (arg == "--pages") {
      opts.pages = static_cast<uint32_t>(parsePositive(arg, value(), U32_MAX));
    } else if (arg == "--min-users") {
      opts.minUsers = parseCount(arg, value());
    } else if (arg == "--parallel") {
      opts.parallel = static_cast<uint32_t>(parsePositive(arg, value(), 256));
    } else if (arg == "--page-size") {
      opts.pageSize =
          static_cast<uint32_t>(parsePositive(arg, value(), U32_MAX));
    } else if (arg == "--timeout") {
      opts.timeoutSeconds =
          static_cast<long>(parsePositive(arg, value(), 24 * 60 * 60));
    } else if (arg == "--endpoint") {
      opts.endpoint = value();
    } else if (arg == "-o") {
      opts.outputPath = value();
    } else {
      throw OptionsError("Unknown option: " + arg);
    }
  }
  return opts;
}

void printUsage(std::ostream &out, const std::string &program) {
  out << "Usage: " << program << " [options]\n"
      << "\nFetches Firefox extension metadata from addons.mozilla.org and\n"
      << "writes it as a JSON array sorted by pname.\n"
      << "\nOptions:\n"
      << "  --pages <n>        Number of pages to fetch (default: all)\n"
      << "  --min-users <n>    Only addons with more than n users\n"
      << "  --parallel <n>     Concurrent requests (default: 4)\n"
      << "  --page-size <n>    Results per page (default: 50)\n"
      << "  --timeout <s>      Per-request timeout in seconds (default: 60)\n"
      << "  --endpoint <url>   Search endpoint (default: "
         "https://addons.mozilla.org/api/v5/addons/search/)\n"
      << "  -o <file>          Write the result to a file instead of stdout\n"
      << "  -v, --verbose      Debug output on stderr\n"
      << "  -h, --help         Show this help\n"
      << "\nEnvironment:\n"
      << "  FETCH_ADDONS_LOG_LEVEL    Overrides the log level\n"
      << "  FETCH_ADDONS_LOG_PATTERN  Overrides the spdlog pattern\n";
}

} // namespace amo
