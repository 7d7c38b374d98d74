#pragma once

#include <string>
#include <vector>

struct BBox {
  double x0 = 0.0;
  double y0 = 0.0;
  double x1 = 0.0;
  double y1 = 0.0;
};

// A contiguous run of text sharing font attributes, as produced by the span collector.
// Pages are 1-based; y grows downwards from the top of the page.
struct TextSpan {
  std::string text;
  double fontSize = 0.0;
  bool isBold = false;
  bool isItalic = false;
  BBox bbox;
  int page = 1;
};

struct PageGeometry {
  int page = 1;
  double width = 0.0;
  double height = 0.0;
};

// Everything the outline pipeline needs for one document.
struct DocumentInput {
  std::vector<TextSpan> spans; // reading order
  std::string metadataTitle;
  int pageCount = 0;
  std::vector<PageGeometry> pages; // may be empty when the collector has no geometry
};
