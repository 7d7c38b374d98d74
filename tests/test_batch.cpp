#include <catch2/catch.hpp>

#include "batch.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

fs::path freshDir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

void touch(const fs::path& path) {
  std::ofstream(path) << "%PDF-1.4\n";
}

// Stands in for poppler: "broken" documents fail, the rest get one heading.
DocumentInput fakeCollector(const std::string& path, int maxPages) {
  if (path.find("broken") != std::string::npos) throw std::runtime_error("cannot parse " + path);
  DocumentInput input;
  input.metadataTitle = fs::path(path).stem().string();
  input.pageCount = maxPages > 2 ? 2 : maxPages;
  input.spans.push_back(makeSpan("Overview of Results", 18.0, 1, 100.0));
  addBodyLines(input.spans, 1, 130.0, 6);
  return input;
}

} // namespace

TEST_CASE("listPdfFiles finds PDFs case-insensitively in sorted order", "[batch]") {
  const fs::path dir = freshDir("pdfoutline_list_test");
  touch(dir / "b.PDF");
  touch(dir / "a.pdf");
  touch(dir / "notes.txt");
  fs::create_directories(dir / "sub.pdf");

  const auto files = listPdfFiles(dir.string());
  REQUIRE(files.size() == 2);
  REQUIRE(fs::path(files[0]).filename().string() == "a.pdf");
  REQUIRE(fs::path(files[1]).filename().string() == "b.PDF");

  REQUIRE_THROWS_AS(listPdfFiles((dir / "missing").string()), std::runtime_error);
  fs::remove_all(dir);
}

TEST_CASE("outputPathFor maps a PDF to a JSON file named after its stem", "[batch]") {
  REQUIRE(outputPathFor("/x/y/report.pdf", "out") == (fs::path("out") / "report.json").string());
}

TEST_CASE("runBatch keeps input order and isolates failures", "[batch]") {
  const fs::path out = freshDir("pdfoutline_batch_test");
  const std::vector<std::string> files = {"/docs/one.pdf", "/docs/broken.pdf", "/docs/three.pdf"};

  // Callbacks run on worker threads, so record and assert afterwards.
  std::set<std::string> seen;
  std::set<size_t> indices;
  size_t calls = 0;
  size_t lastTotal = 0;
  const BatchSummary summary = runBatch(
    files, out.string(), OutlineConfig::defaults(), 2, fakeCollector,
    [&](size_t index, size_t total, const DocumentReport& report) {
      calls++;
      indices.insert(index);
      lastTotal = total;
      seen.insert(report.path);
    });

  REQUIRE(calls == 3);
  REQUIRE(seen.size() == 3);
  REQUIRE(indices == std::set<size_t>{1, 2, 3});
  REQUIRE(lastTotal == 3);
  REQUIRE(summary.succeeded == 2);
  REQUIRE(summary.failed == 1);
  REQUIRE(summary.reports.size() == 3);
  for (size_t i = 0; i < files.size(); ++i) REQUIRE(summary.reports[i].path == files[i]);

  const DocumentReport& broken = summary.reports[1];
  REQUIRE_FALSE(broken.ok);
  REQUIRE(broken.error.find("cannot parse") != std::string::npos);
  REQUIRE_FALSE(fs::exists(out / "broken.json"));

  const DocumentReport& one = summary.reports[0];
  REQUIRE(one.ok);
  REQUIRE(one.headingCount == 1);
  REQUIRE(one.pageCount == 2);
  REQUIRE(fs::exists(out / "one.json"));
  REQUIRE(fs::exists(out / "three.json"));

  std::ostringstream os;
  printSummary(os, summary, out.string());
  REQUIRE(os.str().find("Successful: 2") != std::string::npos);
  REQUIRE(os.str().find("Failed: 1") != std::string::npos);

  std::ostringstream line;
  printReport(line, 2, 3, broken);
  REQUIRE(line.str() == "[2/3] Error processing broken.pdf: cannot parse /docs/broken.pdf\n");
  fs::remove_all(out);
}

TEST_CASE("runBatch with no files does nothing", "[batch]") {
  const BatchSummary summary = runBatch({}, "unused_dir", OutlineConfig::defaults(), 4, fakeCollector);
  REQUIRE(summary.reports.empty());
  REQUIRE(summary.succeeded == 0);
  REQUIRE_FALSE(fs::exists("unused_dir"));
}
