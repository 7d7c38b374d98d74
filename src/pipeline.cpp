#include "pipeline.hpp"

#include <iomanip>
#include <ostream>

#include "feature_scorer.hpp"
#include "level_clusterer.hpp"

Outline extractOutline(const DocumentInput& input, const OutlineConfig& config, PipelineStats* stats) {
  PipelineStats local;

  local.script = detectScript(input.spans);
  const TitleResult title = extractTitle(input, config);
  local.titleSource = title.source;
  if (title.source == TitleSource::None) local.notes.push_back("no usable title in metadata or first pages");

  if (input.spans.empty()) {
    local.notes.push_back("document has no text spans");
    if (stats != nullptr) *stats = std::move(local);
    return Outline{title.text, {}};
  }

  local.bodySize = bodyFontSize(input.spans, config);
  const std::vector<ScoredSpan> scored = scoreSpans(input.spans, local.bodySize, local.script, config);
  local.spansScored = scored.size();
  local.threshold = acceptanceThreshold(scored, config);
  std::vector<ScoredSpan> accepted;
  for (auto& s : acceptCandidates(scored, local.threshold)) {
    // The title is not part of its own outline, and must not claim a level.
    if (isTitleEcho(s.span.text, title.text)) {
      local.titleEchoes++;
      continue;
    }
    accepted.push_back(std::move(s));
  }
  local.candidatesAccepted = accepted.size();

  std::vector<double> sizes;
  sizes.reserve(accepted.size());
  for (const auto& s : accepted) sizes.push_back(s.span.fontSize);
  const LevelCluster cluster = clusterFontSizes(sizes, config);
  local.centroids = cluster.centroids;
  if (accepted.empty()) local.notes.push_back("no span passed the acceptance threshold");
  else if (cluster.levelCount() == 1) local.notes.push_back("single heading size, collapsed to H1");

  const std::vector<LeveledSpan> leveled = assignLevels(accepted, cluster, config);
  const std::vector<LeveledSpan> filtered = filterCandidates(leveled, local.script, config, &local.filtered);

  Outline outline = assembleOutline(title.text, filtered);
  local.headingsEmitted = outline.entries.size();
  if (stats != nullptr) *stats = std::move(local);
  return outline;
}

void printStats(std::ostream& os, const PipelineStats& stats) {
  static const char* sources[] = {"none", "metadata", "layout"};
  const std::streamsize precision = os.precision();
  os << "  script: " << scriptName(stats.script) << "\n";
  os << "  title source: " << sources[static_cast<int>(stats.titleSource)] << "\n";
  os << "  body size: " << std::fixed << std::setprecision(2) << stats.bodySize << "\n";
  os << "  threshold: " << stats.threshold << "\n";
  os << "  spans scored: " << stats.spansScored << ", accepted: " << stats.candidatesAccepted << "\n";
  os << "  centroids:";
  for (double c : stats.centroids) os << " " << c;
  os << "\n";
  os << "  dropped: " << stats.filtered.duplicates << " duplicate, " << stats.filtered.datesOrNumbers
     << " date/number, " << stats.filtered.tooShort << " short, " << stats.filtered.fragments << " fragment, "
     << stats.titleEchoes << " title\n";
  os << "  headings: " << stats.headingsEmitted << "\n";
  for (const auto& note : stats.notes) os << "  note: " << note << "\n";
  os << std::defaultfloat << std::setprecision(static_cast<int>(precision));
}
