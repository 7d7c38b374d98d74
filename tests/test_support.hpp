#pragma once

#include "span.hpp"

#include <string>
#include <vector>

inline TextSpan makeSpan(const std::string& text, double size, int page, double top,
                         bool bold = false, double left = 72.0, double width = 300.0) {
  TextSpan s;
  s.text = text;
  s.fontSize = size;
  s.isBold = bold;
  s.page = page;
  s.bbox = BBox{left, top, left + width, top + size};
  return s;
}

// `count` single-span body lines starting at `top`, 14 units apart (3 units of leading at 11pt).
inline void addBodyLines(std::vector<TextSpan>& spans, int page, double top, int count, double size = 11.0) {
  for (int i = 0; i < count; ++i) {
    spans.push_back(makeSpan("Body text line " + std::to_string(i) + " on page " + std::to_string(page) +
                               " with ordinary words",
                             size, page, top + 14.0 * i));
  }
}
