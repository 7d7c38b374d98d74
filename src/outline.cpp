#include "outline.hpp"

#include <algorithm>

#include "text_util.hpp"

std::string levelName(HeadingLevel level) {
  switch (level) {
    case HeadingLevel::H1: return "H1";
    case HeadingLevel::H2: return "H2";
    case HeadingLevel::H3: return "H3";
    case HeadingLevel::H4: return "H4";
  }
  return "H1";
}

Outline assembleOutline(const std::string& title, const std::vector<LeveledSpan>& headings) {
  std::vector<const LeveledSpan*> ordered;
  ordered.reserve(headings.size());
  for (const auto& h : headings) ordered.push_back(&h);
  std::sort(ordered.begin(), ordered.end(), [](const LeveledSpan* a, const LeveledSpan* b) {
    const TextSpan& sa = a->scored.span;
    const TextSpan& sb = b->scored.span;
    if (sa.page != sb.page) return sa.page < sb.page;
    if (sa.bbox.y0 != sb.bbox.y0) return sa.bbox.y0 < sb.bbox.y0;
    return a->scored.order < b->scored.order;
  });

  Outline outline;
  outline.title = title;
  for (const auto* h : ordered) {
    std::string text = normalizeSpaces(h->scored.span.text);
    if (text.empty()) continue;
    text += ' ';
    outline.entries.push_back(HeadingEntry{h->level, std::move(text), h->scored.span.page});
  }
  return outline;
}
