#pragma once

#include "patterns.hpp"

// Process-wide thresholds and tables. Built once at start-up and passed by
// const reference into every stage; never modified afterwards.
struct OutlineConfig {
  // Font sizes closer than this (points) belong to the same size band.
  double sizeTolerance = 0.5;

  // Feature scorer
  double sizeSaturationRatio = 1.8;
  double sizeFloor = 0.5;
  double sizeWeight = 0.5;
  double boldWeight = 0.2;
  double isolationWeight = 0.15;
  double lengthPenaltyWeight = 0.3;
  double patternBoost = 0.35;
  double minAcceptanceScore = 0.25;
  double acceptanceMargin = 0.15;

  // Level clusterer
  int maxLevels = 4;
  int maxClusterIterations = 100;

  // Candidate filter and length scoring
  size_t minHeadingChars = 2;
  size_t longSpanChars = 80;
  size_t maxHeadingChars = 150;
  size_t maxHeadingWords = 15;

  // Title extractor
  int titlePages = 3;
  double marginBandRatio = 0.06;
  size_t maxTitleLines = 3;

  // Span collector
  int maxPagesToAnalyze = 50;

  PatternTables patterns;

  static OutlineConfig defaults();
};
