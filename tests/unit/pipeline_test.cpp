#include "pipeline.hpp"

#include <cassert>
#include <iostream>
#include <sstream>
#include <string>

#include "aggregator.hpp"
#include "errors.hpp"
#include "test_fixtures.hpp"

namespace {

using amo::PaginationOptions;
using fixtures::FakeSource;
using nlohmann::json;

// Mirrors main(): the artifact is written only once the pipeline returned.
bool runToStream(FakeSource &source, const PaginationOptions &options,
                 std::ostream &out) {
  try {
    amo::PipelineResult result = amo::runPipeline(source, options);
    amo::writeAddons(out, result.addons);
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

json runOk(FakeSource &source, PaginationOptions options = {}) {
  std::ostringstream out;
  bool ok = runToStream(source, options, out);
  assert(ok);
  return json::parse(out.str());
}

void TestScenarioSinglePageSorted() {
  FakeSource source;
  source.pageCount = 1;
  source.pages[1] = {fixtures::minimalAddon("b-ext"),
                     fixtures::minimalAddon("a-ext")};

  json out = runOk(source);
  assert(out.size() == 2);
  assert(out[0]["pname"] == "a-ext");
  assert(out[1]["pname"] == "b-ext");
}

void TestScenarioDisabledAddonDropped() {
  json disabled = fixtures::minimalAddon("disabled-ext");
  disabled["status"] = "disabled";

  FakeSource source;
  source.pageCount = 2;
  source.pages[1] = {disabled, fixtures::minimalAddon("live-ext")};
  source.pages[2] = {fixtures::minimalAddon("other-ext")};

  json out = runOk(source);
  assert(out.size() == 2);
  assert(out[0]["pname"] == "live-ext");
  assert(out[1]["pname"] == "other-ext");

  FakeSource onlyDisabled;
  onlyDisabled.pages[1] = {disabled};
  assert(runOk(onlyDisabled).empty());
}

void TestScenarioHashReencoded() {
  json addon = fixtures::minimalAddon("hashed");
  addon["current_version"]["file"]["hash"] =
      "sha256:"
      "9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08";

  FakeSource source;
  source.pages[1] = {addon};

  json out = runOk(source);
  assert(out[0]["hash"] ==
         "sha256-n4bQgYhMfWWaL+qgxVrQFaO/TxsrC4Is0V1sFbDwCgg=");
}

void TestScenarioMissingHomepage() {
  json withOther = fixtures::fullAddon("with-meta");
  withOther.erase("homepage");
  json bare = fixtures::minimalAddon("bare");

  FakeSource source;
  source.pages[1] = {withOther, bare};

  json out = runOk(source);
  assert(out[0]["pname"] == "bare");
  assert(!out[0].contains("meta"));
  assert(out[1]["pname"] == "with-meta");
  assert(out[1].contains("meta"));
  assert(!out[1]["meta"].contains("homepage"));
}

void TestScenarioLaterPageFailureWritesNothing() {
  FakeSource source;
  source.pageCount = 3;
  source.pages[1] = {fixtures::minimalAddon("valid-ext")};
  source.failing = {2};

  PaginationOptions options;
  options.concurrency = 2;

  std::ostringstream out;
  assert(!runToStream(source, options, out));
  assert(out.str().empty());
}

void TestInvalidRecordOnLaterPageWritesNothing() {
  json broken = fixtures::minimalAddon("broken");
  broken.erase("default_locale");

  FakeSource source;
  source.pageCount = 2;
  source.pages[1] = {fixtures::minimalAddon("valid-ext")};
  source.pages[2] = {broken};

  std::ostringstream out;
  assert(!runToStream(source, PaginationOptions{}, out));
  assert(out.str().empty());
}

void TestPageLimitTruncatesRun() {
  FakeSource source;
  source.pageCount = 3;
  source.pages[1] = {fixtures::minimalAddon("p1")};
  source.pages[2] = {fixtures::minimalAddon("p2")};
  source.pages[3] = {fixtures::minimalAddon("p3")};

  PaginationOptions options;
  options.pageLimit = 2;
  json out = runOk(source, options);
  assert(out.size() == 2);
  assert(out[1]["pname"] == "p2");
}

void TestResultCarriesApiCounts() {
  FakeSource source;
  source.pageCount = 3;
  source.pages[1] = {fixtures::minimalAddon("p1")};
  source.pages[2] = {fixtures::minimalAddon("p2")};
  source.pages[3] = {fixtures::minimalAddon("p3")};

  PaginationOptions options;
  options.pageLimit = 2;
  amo::PipelineResult result = amo::runPipeline(source, options);
  assert(result.pageCount == 3);
  assert(result.totalCount == 3);
  assert(result.pagesFetched == 2);
  assert(result.addons.size() == 2);
}

} // namespace

int main() {
  TestScenarioSinglePageSorted();
  TestScenarioDisabledAddonDropped();
  TestScenarioHashReencoded();
  TestScenarioMissingHomepage();
  TestScenarioLaterPageFailureWritesNothing();
  TestInvalidRecordOnLaterPageWritesNothing();
  TestPageLimitTruncatesRun();
  TestResultCarriesApiCounts();

  std::cout << "fetch_addons_unit_pipeline: pass\n";
  return 0;
}
