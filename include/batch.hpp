#pragma once

#include <functional>
#include <ostream>
#include <string>
#include <vector>

#include "config.hpp"
#include "pipeline.hpp"

struct DocumentReport {
  std::string path;
  std::string outputPath;
  bool ok = false;
  std::string error;
  double seconds = 0.0;
  int pageCount = 0;
  size_t headingCount = 0;
  PipelineStats stats;
};

struct BatchSummary {
  std::vector<DocumentReport> reports; // same order as the input files
  size_t succeeded = 0;
  size_t failed = 0;
  double totalSeconds = 0.0;
};

using DocumentCollector = std::function<DocumentInput(const std::string& pdfPath, int maxPages)>;
using ReportCallback = std::function<void(size_t index, size_t total, const DocumentReport& report)>;

// Regular files in `dir` with a .pdf extension (any case), sorted by name.
// Throws std::runtime_error when `dir` is not a directory.
std::vector<std::string> listPdfFiles(const std::string& dir);

// <outputDir>/<stem>.json
std::string outputPathFor(const std::string& pdfPath, const std::string& outputDir);

// Collects, classifies and writes one document. Failures are recorded in the
// report instead of being thrown.
DocumentReport processDocument(const std::string& pdfPath, const std::string& outputDir,
                               const OutlineConfig& config, const DocumentCollector& collector);

// Processes documents on up to `jobs` threads. Documents share nothing but the
// read-only config; `onDone` is called once per document, never concurrently.
BatchSummary runBatch(const std::vector<std::string>& files, const std::string& outputDir,
                      const OutlineConfig& config, unsigned jobs, const DocumentCollector& collector,
                      const ReportCallback& onDone = nullptr);

void printReport(std::ostream& os, size_t index, size_t total, const DocumentReport& report);
void printSummary(std::ostream& os, const BatchSummary& summary, const std::string& outputDir);
