/*
 * fetch-addons
 *
 * Builds the Firefox extension package list from the addons.mozilla.org
 * search API.
 *
 * - Page 1 is fetched first to learn how many pages exist
 * - Remaining pages are fetched in parallel
 * - Only listings whose current file is public are kept
 * - Any malformed page or record aborts the run; nothing is written
 * - Output is a JSON array sorted by pname, on stdout or in the -o file
 */

#include <chrono>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "aggregator.hpp"
#include "http_client.hpp"
#include "logging.hpp"
#include "options.hpp"
#include "page_fetcher.hpp"
#include "paginator.hpp"
#include "pipeline.hpp"

namespace fs = std::filesystem;

namespace {

// The artifact only replaces an existing file once it is complete.
void writeOutputFile(const std::string &path,
                     const std::vector<amo::AddonRecord> &records) {
  fs::path target(path);
  fs::path tmp = target;
  tmp += ".tmp";

  try {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out.is_open()) {
      throw std::runtime_error("Failed to open " + tmp.string());
    }
    amo::writeAddons(out, records);
    out.close();
    if (!out) {
      throw std::runtime_error("Failed to write " + tmp.string());
    }
    fs::rename(tmp, target);
  } catch (const std::exception &) {
    std::error_code ec;
    fs::remove(tmp, ec);
    throw;
  }
}

int run(const amo::Options &opts) {
  auto start = std::chrono::steady_clock::now();

  amo::CurlGlobal curlGlobal;
  amo::HttpClient http(opts.timeoutSeconds);

  amo::SearchQuery query;
  if (!opts.endpoint.empty()) {
    query.endpoint = opts.endpoint;
  }
  query.pageSize = opts.pageSize;
  query.minUsers = opts.minUsers;
  amo::CurlPageFetcher fetcher(http, query);

  amo::PaginationOptions pagination;
  pagination.pageLimit = opts.pages;
  pagination.concurrency = opts.parallel;

  amo::PipelineResult result = amo::runPipeline(fetcher, pagination);
  const std::vector<amo::AddonRecord> &records = result.addons;

  if (opts.outputPath.empty()) {
    amo::writeAddons(std::cout, records);
    std::cout.flush();
    if (!std::cout) {
      throw std::runtime_error("Failed to write to stdout");
    }
  } else {
    writeOutputFile(opts.outputPath, records);
  }

  auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
                     std::chrono::steady_clock::now() - start)
                     .count();
  amo::logInfo("done",
               {amo::intField("addons", static_cast<int64_t>(records.size())),
                amo::intField("pages", result.pagesFetched),
                amo::intField("page_count",
                              static_cast<int64_t>(result.pageCount)),
                amo::intField("available",
                              static_cast<int64_t>(result.totalCount)),
                amo::intField("elapsed_s", elapsed)});
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);

  amo::Options opts;
  try {
    opts = amo::parseOptions(args);
  } catch (const amo::OptionsError &e) {
    std::cerr << "Error: " << e.what() << "\n\n";
    amo::printUsage(std::cerr, argv[0]);
    return 2;
  }
  if (opts.showHelp) {
    amo::printUsage(std::cerr, argv[0]);
    return 0;
  }

  amo::initLogging(opts.verbose);

  int status = 1;
  try {
    status = run(opts);
  } catch (const std::exception &e) {
    amo::logError(e.what());
  }

  amo::shutdownLogging();
  return status;
}
