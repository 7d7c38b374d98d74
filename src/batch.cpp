#include "batch.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <mutex>
#include <stdexcept>
#include <thread>

#include "outline_json.hpp"
#include "text_util.hpp"

namespace {

constexpr double kPerFileLimitSeconds = 10.0;

double secondsSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

std::vector<std::string> listPdfFiles(const std::string& dir) {
  if (!std::filesystem::is_directory(dir)) {
    throw std::runtime_error("Input directory not found: " + dir);
  }
  std::vector<std::string> files;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    if (!entry.is_regular_file()) continue;
    if (toLowerAscii(entry.path().extension().string()) == ".pdf") {
      files.push_back(entry.path().string());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

std::string outputPathFor(const std::string& pdfPath, const std::string& outputDir) {
  const std::filesystem::path stem = std::filesystem::path(pdfPath).stem();
  return (std::filesystem::path(outputDir) / stem).string() + ".json";
}

DocumentReport processDocument(const std::string& pdfPath, const std::string& outputDir,
                               const OutlineConfig& config, const DocumentCollector& collector) {
  DocumentReport report;
  report.path = pdfPath;
  const auto start = std::chrono::steady_clock::now();
  try {
    const DocumentInput input = collector(pdfPath, config.maxPagesToAnalyze);
    const Outline outline = extractOutline(input, config, &report.stats);
    report.outputPath = outputPathFor(pdfPath, outputDir);
    writeOutlineFile(report.outputPath, outline);
    report.pageCount = input.pageCount;
    report.headingCount = outline.entries.size();
    report.ok = true;
  } catch (const std::exception& ex) {
    report.ok = false;
    report.error = ex.what();
  }
  report.seconds = secondsSince(start);
  return report;
}

BatchSummary runBatch(const std::vector<std::string>& files, const std::string& outputDir,
                      const OutlineConfig& config, unsigned jobs, const DocumentCollector& collector,
                      const ReportCallback& onDone) {
  BatchSummary summary;
  summary.reports.resize(files.size());
  if (files.empty()) return summary;
  std::filesystem::create_directories(outputDir);

  const auto start = std::chrono::steady_clock::now();
  unsigned workers = jobs > 0 ? jobs : std::thread::hardware_concurrency();
  if (workers == 0) workers = 1;
  workers = std::min<unsigned>(workers, static_cast<unsigned>(files.size()));

  std::atomic<size_t> next{0};
  std::atomic<size_t> completed{0};
  std::mutex callbackMutex;
  auto work = [&]() {
    while (true) {
      const size_t i = next.fetch_add(1);
      if (i >= files.size()) break;
      summary.reports[i] = processDocument(files[i], outputDir, config, collector);
      const size_t done = completed.fetch_add(1) + 1;
      if (onDone) {
        std::lock_guard<std::mutex> lock(callbackMutex);
        onDone(done, files.size(), summary.reports[i]);
      }
    }
  };

  if (workers == 1) {
    work();
  } else {
    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (unsigned t = 0; t < workers; ++t) threads.emplace_back(work);
    for (auto& th : threads) th.join();
  }

  for (const auto& r : summary.reports) {
    if (r.ok) summary.succeeded++;
    else summary.failed++;
  }
  summary.totalSeconds = secondsSince(start);
  return summary;
}

void printReport(std::ostream& os, size_t index, size_t total, const DocumentReport& report) {
  const std::string name = std::filesystem::path(report.path).filename().string();
  os << "[" << index << "/" << total << "] ";
  if (!report.ok) {
    os << "Error processing " << name << ": " << report.error << "\n";
    return;
  }
  os << "Completed " << name << "\n";
  os << std::fixed << std::setprecision(3);
  os << "  |- Processing time: " << report.seconds << "s\n";
  os << "  |- Pages processed: " << report.pageCount << "\n";
  os << "  |- Headings found: " << report.headingCount << "\n";
  os << "  `- Language: " << scriptName(report.stats.script) << "\n";
  os << std::defaultfloat;
}

void printSummary(std::ostream& os, const BatchSummary& summary, const std::string& outputDir) {
  const size_t total = summary.reports.size();
  const double average = total > 0 ? summary.totalSeconds / static_cast<double>(total) : 0.0;
  os << "PROCESSING SUMMARY\n";
  os << "Total files processed: " << total << "\n";
  os << "Successful: " << summary.succeeded << "\n";
  os << "Failed: " << summary.failed << "\n";
  os << std::fixed << std::setprecision(2);
  os << "Total processing time: " << summary.totalSeconds << " seconds\n";
  os << "Average time per file: " << average << " seconds\n";
  if (summary.succeeded > 0) {
    os << std::setprecision(1)
       << "Success rate: " << 100.0 * static_cast<double>(summary.succeeded) / static_cast<double>(total) << "%\n";
  }
  os << std::setprecision(2);
  if (average <= kPerFileLimitSeconds) {
    os << "Performance: within " << kPerFileLimitSeconds << "s per file\n";
  } else {
    os << "Performance: " << average << "s per file (limit: " << kPerFileLimitSeconds << "s)\n";
  }
  os << std::defaultfloat;
  os << "Output files saved to: " << outputDir << "\n";
}
