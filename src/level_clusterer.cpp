#include "level_clusterer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <functional>

namespace {

struct Band {
  double sum = 0.0;
  size_t count = 0;
  double mean() const { return sum / static_cast<double>(count); }
};

std::vector<Band> buildBands(const std::vector<double>& sorted, double tolerance) {
  std::vector<Band> bands;
  for (size_t i = 0; i < sorted.size(); ++i) {
    if (bands.empty() || sorted[i] - sorted[i - 1] > tolerance) bands.push_back(Band{});
    bands.back().sum += sorted[i];
    bands.back().count++;
  }
  return bands;
}

// Ascending centroids: one per band when there are few enough, otherwise the
// bands are split into k contiguous runs of near-equal length.
std::vector<double> initialCentroids(const std::vector<Band>& bands, size_t k) {
  std::vector<double> centroids;
  const size_t n = bands.size();
  for (size_t i = 0; i < k; ++i) {
    const size_t from = i * n / k;
    const size_t to = (i + 1) * n / k;
    double sum = 0.0;
    size_t count = 0;
    for (size_t b = from; b < to; ++b) {
      sum += bands[b].sum;
      count += bands[b].count;
    }
    if (count > 0) centroids.push_back(sum / static_cast<double>(count));
  }
  return centroids;
}

// Nearest ascending centroid, ties resolved towards the larger one.
size_t nearestAscending(const std::vector<double>& centroids, double value) {
  size_t best = 0;
  double bestDist = std::abs(value - centroids[0]);
  for (size_t c = 1; c < centroids.size(); ++c) {
    const double d = std::abs(value - centroids[c]);
    if (d <= bestDist) {
      bestDist = d;
      best = c;
    }
  }
  return best;
}

} // namespace

size_t countSizeBands(std::vector<double> sizes, double tolerance) {
  std::sort(sizes.begin(), sizes.end());
  return buildBands(sizes, tolerance).size();
}

LevelCluster clusterFontSizes(const std::vector<double>& sizes, const OutlineConfig& config) {
  LevelCluster cluster;
  if (sizes.empty()) return cluster;

  std::vector<double> sorted = sizes;
  std::sort(sorted.begin(), sorted.end());
  const std::vector<Band> bands = buildBands(sorted, config.sizeTolerance);
  const size_t maxLevels = static_cast<size_t>(std::max(1, config.maxLevels));
  const size_t k = std::min(bands.size(), maxLevels);

  std::vector<double> centroids = initialCentroids(bands, k);
  std::vector<size_t> assignment(sorted.size(), 0);
  for (int iter = 0; iter < config.maxClusterIterations; ++iter) {
    bool changed = iter == 0;
    for (size_t i = 0; i < sorted.size(); ++i) {
      const size_t c = nearestAscending(centroids, sorted[i]);
      if (c != assignment[i]) {
        assignment[i] = c;
        changed = true;
      }
    }
    if (!changed) break;

    std::vector<double> sums(centroids.size(), 0.0);
    std::vector<size_t> counts(centroids.size(), 0);
    for (size_t i = 0; i < sorted.size(); ++i) {
      sums[assignment[i]] += sorted[i];
      counts[assignment[i]]++;
    }
    std::vector<double> next;
    for (size_t c = 0; c < centroids.size(); ++c) {
      if (counts[c] > 0) next.push_back(sums[c] / static_cast<double>(counts[c]));
    }
    if (next.size() != centroids.size()) {
      // an emptied cluster invalidates the assignment indices
      std::fill(assignment.begin(), assignment.end(), next.size());
    }
    centroids = std::move(next);
  }

  std::sort(centroids.begin(), centroids.end(), std::greater<double>());
  for (double c : centroids) {
    if (cluster.centroids.empty() || cluster.centroids.back() - c > 1e-9) {
      cluster.centroids.push_back(c);
    }
  }
  return cluster;
}

size_t nearestCentroid(const LevelCluster& cluster, double size) {
  size_t best = 0;
  double bestDist = std::abs(size - cluster.centroids[0]);
  for (size_t c = 1; c < cluster.centroids.size(); ++c) {
    const double d = std::abs(size - cluster.centroids[c]);
    if (d < bestDist) {
      bestDist = d;
      best = c;
    }
  }
  return best;
}

std::vector<LeveledSpan> assignLevels(const std::vector<ScoredSpan>& candidates,
                                      const LevelCluster& cluster, const OutlineConfig& config) {
  std::vector<LeveledSpan> leveled;
  if (cluster.centroids.empty()) return leveled;
  leveled.reserve(candidates.size());

  const int maxLevels = std::min(std::max(1, config.maxLevels), 4);
  for (const auto& candidate : candidates) {
    LeveledSpan out;
    out.scored = candidate;
    out.sizeLevel = static_cast<int>(nearestCentroid(cluster, candidate.span.fontSize)) + 1;

    int level = out.sizeLevel;
    // Numbering wins over size only for a one-level disagreement; a single
    // size band means the document collapses to H1.
    const int depth = candidate.patternDepth;
    if (cluster.levelCount() > 1 && depth >= 1 && depth <= maxLevels &&
        std::abs(depth - out.sizeLevel) == 1) {
      level = depth;
    }
    out.level = static_cast<HeadingLevel>(std::min(level, maxLevels));
    leveled.push_back(std::move(out));
  }
  return leveled;
}
