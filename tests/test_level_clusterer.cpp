#include <catch2/catch.hpp>

#include "level_clusterer.hpp"
#include "test_support.hpp"

#include <vector>

namespace {

const OutlineConfig& config() {
  static const OutlineConfig c = OutlineConfig::defaults();
  return c;
}

ScoredSpan candidate(double size, int depth = 0) {
  ScoredSpan s;
  s.span = makeSpan("Heading", size, 1, 100.0);
  s.headingScore = 0.8;
  s.patternDepth = depth;
  if (depth > 0) s.patternTag = PatternTag::NumberedSection;
  return s;
}

void requireStrictlyDecreasing(const LevelCluster& c) {
  for (size_t i = 1; i < c.centroids.size(); ++i) {
    REQUIRE(c.centroids[i - 1] > c.centroids[i]);
  }
}

} // namespace

TEST_CASE("countSizeBands chains sizes within tolerance", "[clusterer]") {
  REQUIRE(countSizeBands({12.0, 12.2, 14.0, 18.0}, 0.5) == 3);
  REQUIRE(countSizeBands({}, 0.5) == 0);
}

TEST_CASE("clusterFontSizes gives one centroid per band up to four", "[clusterer]") {
  const LevelCluster c = clusterFontSizes({12.0, 18.0, 14.0, 18.0}, config());
  REQUIRE(c.levelCount() == 3);
  REQUIRE(c.centroids[0] == Catch::Detail::Approx(18.0));
  REQUIRE(c.centroids[1] == Catch::Detail::Approx(14.0));
  REQUIRE(c.centroids[2] == Catch::Detail::Approx(12.0));
}

TEST_CASE("clusterFontSizes reduces many bands to four ordered levels", "[clusterer]") {
  const std::vector<double> sizes = {24.0, 20.0, 16.0, 14.0, 12.0, 10.0};
  const LevelCluster c = clusterFontSizes(sizes, config());
  REQUIRE(c.levelCount() == 4);
  requireStrictlyDecreasing(c);
  REQUIRE(c.centroids[0] == Catch::Detail::Approx(22.0));
  REQUIRE(c.centroids[3] == Catch::Detail::Approx(10.0));
}

TEST_CASE("clusterFontSizes is deterministic and order independent", "[clusterer]") {
  const std::vector<double> a = {9.0, 30.0, 13.5, 17.0, 11.0, 22.0, 26.0, 15.0};
  const std::vector<double> b = {26.0, 15.0, 9.0, 22.0, 30.0, 11.0, 17.0, 13.5};
  const LevelCluster first = clusterFontSizes(a, config());
  const LevelCluster second = clusterFontSizes(a, config());
  const LevelCluster shuffled = clusterFontSizes(b, config());
  REQUIRE(first.centroids == second.centroids);
  REQUIRE(first.centroids == shuffled.centroids);
  requireStrictlyDecreasing(first);
}

TEST_CASE("clusterFontSizes degenerates gracefully", "[clusterer]") {
  REQUIRE(clusterFontSizes({}, config()).levelCount() == 0);
  const LevelCluster one = clusterFontSizes({14.0, 14.0, 14.2}, config());
  REQUIRE(one.levelCount() == 1);
}

TEST_CASE("assignLevels maps sizes and lets numbering win by one level", "[clusterer]") {
  const LevelCluster c = clusterFontSizes({18.0, 14.0, 12.0}, config());
  const std::vector<LeveledSpan> leveled = assignLevels(
    {candidate(18.0), candidate(14.0, 3), candidate(18.0, 3), candidate(12.0), candidate(14.0, 5)}, c, config());

  REQUIRE(leveled.size() == 5);
  REQUIRE(leveled[0].level == HeadingLevel::H1);
  REQUIRE(leveled[1].sizeLevel == 2);
  REQUIRE(leveled[1].level == HeadingLevel::H3);  // one level apart: numbering wins
  REQUIRE(leveled[2].level == HeadingLevel::H1);  // two levels apart: size wins
  REQUIRE(leveled[3].level == HeadingLevel::H3);
  REQUIRE(leveled[4].level == HeadingLevel::H2);  // depth beyond H4 is ignored
}

TEST_CASE("assignLevels collapses a single size band to H1", "[clusterer]") {
  const LevelCluster c = clusterFontSizes({14.0}, config());
  const std::vector<LeveledSpan> leveled = assignLevels({candidate(14.0, 2), candidate(14.0)}, c, config());
  REQUIRE(leveled.size() == 2);
  REQUIRE(leveled[0].level == HeadingLevel::H1);
  REQUIRE(leveled[1].level == HeadingLevel::H1);
}
