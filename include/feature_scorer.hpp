#pragma once

#include <optional>
#include <vector>

#include "config.hpp"
#include "span.hpp"

// A span together with the evidence that it is a heading.
struct ScoredSpan {
  TextSpan span;
  size_t order = 0; // index in document reading order
  double headingScore = 0.0;
  std::optional<PatternTag> patternTag;
  int patternDepth = 0;
  bool isolated = false;
};

// Most common font size weighted by character count, with sizes within
// config.sizeTolerance treated as one band. Ties go to the smaller size.
// Returns 0 for a document without text.
double bodyFontSize(const std::vector<TextSpan>& spans, const OutlineConfig& config);

// For each span: true when it is alone on its line and the whitespace above
// and below that line is larger than the document's median line gap.
std::vector<bool> isolationFlags(const std::vector<TextSpan>& spans);

std::vector<ScoredSpan> scoreSpans(const std::vector<TextSpan>& spans, double bodySize,
                                   ScriptProfile profile, const OutlineConfig& config);

// Threshold relative to the median score, never below config.minAcceptanceScore.
double acceptanceThreshold(const std::vector<ScoredSpan>& scored, const OutlineConfig& config);

std::vector<ScoredSpan> acceptCandidates(const std::vector<ScoredSpan>& scored, double threshold);
