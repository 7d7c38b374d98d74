#include "batch.hpp"
#include "config.hpp"
#include "outline_json.hpp"
#include "pipeline.hpp"
#include "span_collector.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void printUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0
            << " [--input-dir=dir] [--output-dir=dir] [--jobs=N] [--max-pages=N] [--verbose] [file.pdf ...]\n";
}

int parsePositive(const std::string& value, const std::string& flag) {
  size_t used = 0;
  int n = 0;
  try {
    n = std::stoi(value, &used);
  } catch (const std::exception&) {
    throw std::invalid_argument(flag + " expects a positive integer, got '" + value + "'");
  }
  if (used != value.size() || n <= 0) {
    throw std::invalid_argument(flag + " expects a positive integer, got '" + value + "'");
  }
  return n;
}

} // namespace

int main(int argc, char** argv)
{
  std::string inputDir = "./input";
  std::string outputDir;
  std::vector<std::string> files;
  unsigned jobs = 0;
  bool verbose = false;

  OutlineConfig config = OutlineConfig::defaults();

  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--verbose" || arg == "-v") {
        verbose = true;
      } else if (arg == "--help" || arg == "-h") {
        printUsage(argv[0]);
        return 0;
      } else if (arg.rfind("--input-dir=", 0) == 0) {
        inputDir = arg.substr(std::string("--input-dir=").size());
      } else if (arg.rfind("--output-dir=", 0) == 0) {
        outputDir = arg.substr(std::string("--output-dir=").size());
      } else if (arg.rfind("--jobs=", 0) == 0) {
        jobs = static_cast<unsigned>(parsePositive(arg.substr(std::string("--jobs=").size()), "--jobs"));
      } else if (arg.rfind("--max-pages=", 0) == 0) {
        config.maxPagesToAnalyze = parsePositive(arg.substr(std::string("--max-pages=").size()), "--max-pages");
      } else if (arg.rfind("--", 0) == 0) {
        std::cerr << "Unknown option: " << arg << "\n";
        printUsage(argv[0]);
        return 2;
      } else {
        files.push_back(arg);
      }
    }
  } catch (const std::invalid_argument& ex) {
    std::cerr << ex.what() << "\n";
    printUsage(argv[0]);
    return 2;
  }

  try {
    // Explicit files without an output directory: print each outline to stdout.
    if (!files.empty() && outputDir.empty()) {
      int rc = 0;
      for (const auto& pdfPath : files) {
        if (!std::filesystem::exists(pdfPath)) {
          std::cerr << "PDF not found: " << pdfPath << "\n";
          rc = 1;
          continue;
        }
        PipelineStats stats;
        const Outline outline = extractOutline(collectDocument(pdfPath, config.maxPagesToAnalyze), config, &stats);
        if (verbose) {
          std::cerr << pdfPath << "\n";
          printStats(std::cerr, stats);
        }
        writeOutlineJson(std::cout, outline);
      }
      return rc;
    }

    if (outputDir.empty()) outputDir = "./output";
    if (files.empty()) files = listPdfFiles(inputDir);
    if (files.empty()) {
      std::cout << "No PDF files found in input directory.\n";
      return 0;
    }

    std::cout << "Starting processing of " << files.size() << " PDF files...\n";
    const BatchSummary summary = runBatch(
      files, outputDir, config, jobs, collectDocument,
      [&](size_t index, size_t total, const DocumentReport& report) {
        printReport(std::cout, index, total, report);
        if (verbose) printStats(std::cerr, report.stats);
      });
    printSummary(std::cout, summary, outputDir);
    return summary.failed == 0 ? 0 : 1;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
