#pragma once

#include <string>
#include <vector>

#include "level_clusterer.hpp"

struct HeadingEntry {
  HeadingLevel level = HeadingLevel::H1;
  std::string text;
  int page = 1;
};

struct Outline {
  std::string title;
  std::vector<HeadingEntry> entries;
};

// "H1".."H4"
std::string levelName(HeadingLevel level);

// Orders headings by page, then top edge, then reading order, and normalizes
// their text. Each heading keeps a single trailing space, matching the output
// format downstream consumers expect.
Outline assembleOutline(const std::string& title, const std::vector<LeveledSpan>& headings);
