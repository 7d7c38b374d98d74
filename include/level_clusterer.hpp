#pragma once

#include <vector>

#include "feature_scorer.hpp"

enum class HeadingLevel {
  H1 = 1,
  H2 = 2,
  H3 = 3,
  H4 = 4,
};

// Font-size centroids ordered largest first; centroids[i] maps to level i + 1.
struct LevelCluster {
  std::vector<double> centroids;

  size_t levelCount() const { return centroids.size(); }
};

struct LeveledSpan {
  ScoredSpan scored;
  HeadingLevel level = HeadingLevel::H1;
  int sizeLevel = 1; // level from font size alone, before any pattern override
};

// Number of size bands in `sizes`: values are chained into one band while
// consecutive sorted values are no more than `tolerance` apart.
size_t countSizeBands(std::vector<double> sizes, double tolerance);

// Deterministic one-dimensional k-means with k = min(bands, config.maxLevels).
// Initial centroids come from splitting the sorted size bands into k runs, so
// the same input always gives the same clusters.
LevelCluster clusterFontSizes(const std::vector<double>& sizes, const OutlineConfig& config);

// Index into cluster.centroids of the nearest centroid; ties go to the larger size.
size_t nearestCentroid(const LevelCluster& cluster, double size);

std::vector<LeveledSpan> assignLevels(const std::vector<ScoredSpan>& candidates,
                                      const LevelCluster& cluster, const OutlineConfig& config);
