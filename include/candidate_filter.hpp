#pragma once

#include <string>
#include <vector>

#include "level_clusterer.hpp"

struct FilterStats {
  size_t duplicates = 0;
  size_t datesOrNumbers = 0;
  size_t tooShort = 0;
  size_t fragments = 0;
};

// Dates ("12/04/2024", "2024-01-01", "12 March 2024", "10:30 AM") and text
// made only of digits and punctuation.
bool isDateOrNumber(const std::string& text);

// True when `candidate` is a strict prefix or suffix of `neighbour`.
bool isFragmentOf(const std::string& candidate, const std::string& neighbour);

// True when `text` repeats the document title, ignoring spacing and ASCII case.
bool isTitleEcho(const std::string& text, const std::string& title);

// Removes non-headings in four passes: duplicate (text, page) pairs, dates and
// bare numbers, text shorter than config.minHeadingChars, and line-wrap
// fragments of an adjacent retained span on the same page.
std::vector<LeveledSpan> filterCandidates(const std::vector<LeveledSpan>& spans, ScriptProfile profile,
                                          const OutlineConfig& config, FilterStats* stats = nullptr);
