#pragma once

#include <string>
#include <vector>

#include "span.hpp"

struct PdfInfo {
  std::string title;
  int pageCount = 0;
};

// Parses the text printed by `pdfinfo`. Missing fields stay empty / zero.
PdfInfo parsePdfInfo(const std::string& text);

// Parses `pdftohtml -xml` output into spans in reading order. Page geometry
// found along the way is appended to `pages` when it is non-null.
std::vector<TextSpan> parsePdftohtmlXml(const std::string& xml, std::vector<PageGeometry>* pages = nullptr);

// Collects spans and metadata for one PDF by invoking poppler-utils
// (`pdfinfo` and `pdftohtml`). Only the first `maxPages` pages are read.
// Throws std::runtime_error if the file or the tools are missing or a tool fails.
DocumentInput collectDocument(const std::string& pdfPath, int maxPages);
