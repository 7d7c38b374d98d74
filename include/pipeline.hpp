#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "candidate_filter.hpp"
#include "outline.hpp"
#include "span.hpp"
#include "title_extractor.hpp"

// What each stage absorbed while building one outline. Filled by the
// pipeline, printed by the caller if it wants to.
struct PipelineStats {
  ScriptProfile script = ScriptProfile::Latin;
  TitleSource titleSource = TitleSource::None;
  double bodySize = 0.0;
  double threshold = 0.0;
  size_t spansScored = 0;
  size_t titleEchoes = 0;
  size_t candidatesAccepted = 0;
  std::vector<double> centroids;
  FilterStats filtered;
  size_t headingsEmitted = 0;
  std::vector<std::string> notes;
};

// Runs the classification pipeline over one document. Never throws for
// content reasons: degenerate input gives an empty title and/or no entries.
Outline extractOutline(const DocumentInput& input, const OutlineConfig& config,
                       PipelineStats* stats = nullptr);

void printStats(std::ostream& os, const PipelineStats& stats);
