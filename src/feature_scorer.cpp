#include "feature_scorer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <regex>
#include <utility>

#include "pattern_matcher.hpp"
#include "text_util.hpp"

namespace {

struct LineGroup {
  int page;
  double top;
  double bottom;
  std::vector<size_t> members;
};

bool overlapsVertically(const LineGroup& line, const BBox& box) {
  const double overlap = std::min(line.bottom, box.y1) - std::max(line.top, box.y0);
  const double smaller = std::min(line.bottom - line.top, box.y1 - box.y0);
  if (smaller <= 0.0) return std::abs(line.top - box.y0) < 1e-6;
  return overlap >= smaller * 0.5;
}

std::vector<LineGroup> groupLines(const std::vector<TextSpan>& spans) {
  std::map<int, std::vector<LineGroup>> byPage;
  for (size_t i = 0; i < spans.size(); ++i) {
    const TextSpan& s = spans[i];
    auto& lines = byPage[s.page];
    auto it = std::find_if(lines.begin(), lines.end(), [&](const LineGroup& l) {
      return overlapsVertically(l, s.bbox);
    });
    if (it == lines.end()) {
      lines.push_back(LineGroup{s.page, s.bbox.y0, s.bbox.y1, {i}});
    } else {
      it->top = std::min(it->top, s.bbox.y0);
      it->bottom = std::max(it->bottom, s.bbox.y1);
      it->members.push_back(i);
    }
  }

  std::vector<LineGroup> all;
  for (auto& kv : byPage) {
    auto& lines = kv.second;
    std::sort(lines.begin(), lines.end(), [](const LineGroup& a, const LineGroup& b) {
      return a.top < b.top;
    });
    for (auto& l : lines) all.push_back(std::move(l));
  }
  return all;
}

double sizeFactor(double fontSize, double bodySize, const OutlineConfig& config) {
  if (bodySize <= 0.0 || fontSize - bodySize <= config.sizeTolerance) return 0.0;
  const double ratio = fontSize / bodySize;
  const double span = std::max(config.sizeSaturationRatio - 1.0, 1e-6);
  const double scaled = std::clamp((ratio - 1.0) / span, 0.0, 1.0);
  return config.sizeFloor + (1.0 - config.sizeFloor) * scaled;
}

bool looksMultiSentence(const std::string& text) {
  static const std::regex latinSentence(R"([a-z]{2,}[.!?]\s+[A-Z])");
  if (std::regex_search(text, latinSentence)) return true;
  // 。 or ！ or ？ followed by more text
  static const std::regex cjkSentence("(?:。|！|？)\\s*[^\\s]");
  return std::regex_search(text, cjkSentence);
}

double lengthPenalty(const std::string& text, const OutlineConfig& config) {
  const size_t chars = codePointCount(text);
  const size_t words = wordCount(text);
  if (chars > config.maxHeadingChars || words > config.maxHeadingWords) return 1.0;
  double penalty = 0.0;
  if (chars > config.longSpanChars && config.maxHeadingChars > config.longSpanChars) {
    penalty = static_cast<double>(chars - config.longSpanChars) /
              static_cast<double>(config.maxHeadingChars - config.longSpanChars);
  }
  if (looksMultiSentence(text)) penalty = std::max(penalty, 0.5);
  return penalty;
}

} // namespace

double bodyFontSize(const std::vector<TextSpan>& spans, const OutlineConfig& config) {
  std::vector<std::pair<double, size_t>> sized;
  for (const auto& s : spans) {
    if (s.fontSize <= 0.0) continue;
    size_t weight = 0;
    for (char32_t cp : decodeUtf8(s.text)) {
      if (!isUnicodeSpace(cp)) weight++;
    }
    if (weight > 0) sized.emplace_back(s.fontSize, weight);
  }
  if (sized.empty()) return 0.0;
  std::sort(sized.begin(), sized.end());

  // Sizes chain into one band while neighbours are within tolerance.
  struct BandTotals { size_t weight = 0; double sizeSum = 0.0; size_t count = 0; };
  std::vector<BandTotals> bands;
  for (size_t i = 0; i < sized.size(); ++i) {
    if (bands.empty() || sized[i].first - sized[i - 1].first > config.sizeTolerance) bands.emplace_back();
    bands.back().weight += sized[i].second;
    bands.back().sizeSum += sized[i].first;
    bands.back().count++;
  }

  // Bands run smallest first, so a strict > keeps ties on the smaller size.
  size_t best = 0;
  for (size_t b = 1; b < bands.size(); ++b) {
    if (bands[b].weight > bands[best].weight) best = b;
  }
  return bands[best].sizeSum / static_cast<double>(bands[best].count);
}

std::vector<bool> isolationFlags(const std::vector<TextSpan>& spans) {
  std::vector<bool> flags(spans.size(), false);
  const std::vector<LineGroup> lines = groupLines(spans);

  std::vector<double> gaps;
  for (size_t i = 1; i < lines.size(); ++i) {
    if (lines[i].page != lines[i - 1].page) continue;
    gaps.push_back(std::max(0.0, lines[i].top - lines[i - 1].bottom));
  }
  const double medianGap = median(gaps);
  const double inf = std::numeric_limits<double>::infinity();

  for (size_t i = 0; i < lines.size(); ++i) {
    const LineGroup& line = lines[i];
    if (line.members.size() != 1) continue;
    const bool firstOnPage = i == 0 || lines[i - 1].page != line.page;
    const bool lastOnPage = i + 1 == lines.size() || lines[i + 1].page != line.page;
    const double above = firstOnPage ? inf : std::max(0.0, line.top - lines[i - 1].bottom);
    const double below = lastOnPage ? inf : std::max(0.0, lines[i + 1].top - line.bottom);
    if (above > medianGap && below > medianGap) flags[line.members.front()] = true;
  }
  return flags;
}

std::vector<ScoredSpan> scoreSpans(const std::vector<TextSpan>& spans, double bodySize,
                                   ScriptProfile profile, const OutlineConfig& config) {
  std::vector<ScoredSpan> scored;
  scored.reserve(spans.size());
  const std::vector<bool> isolated = isolationFlags(spans);

  for (size_t i = 0; i < spans.size(); ++i) {
    ScoredSpan out;
    out.span = spans[i];
    out.order = i;
    out.isolated = isolated[i];

    const std::string text = normalizeSpaces(spans[i].text);
    if (text.empty() || spans[i].fontSize <= 0.0) {
      scored.push_back(std::move(out));
      continue;
    }

    const double size = sizeFactor(spans[i].fontSize, bodySize, config);
    double score = config.sizeWeight * size;
    if (spans[i].isBold) score += config.boldWeight;
    if (out.isolated) score += config.isolationWeight;
    // A pattern only counts on top of size, boldness or isolation.
    const bool styled = size > 0.0 || spans[i].isBold || out.isolated;
    if (styled) {
      if (auto match = matchPattern(text, profile, config)) {
        out.patternTag = match->tag;
        out.patternDepth = match->depth;
        score += match->boost;
      }
    }
    score -= config.lengthPenaltyWeight * lengthPenalty(text, config);
    out.headingScore = std::clamp(score, 0.0, 1.0);
    scored.push_back(std::move(out));
  }
  return scored;
}

double acceptanceThreshold(const std::vector<ScoredSpan>& scored, const OutlineConfig& config) {
  std::vector<double> scores;
  scores.reserve(scored.size());
  for (const auto& s : scored) scores.push_back(s.headingScore);
  return std::max(config.minAcceptanceScore, median(scores) + config.acceptanceMargin);
}

std::vector<ScoredSpan> acceptCandidates(const std::vector<ScoredSpan>& scored, double threshold) {
  std::vector<ScoredSpan> accepted;
  for (const auto& s : scored) {
    if (s.headingScore > 0.0 && s.headingScore >= threshold) accepted.push_back(s);
  }
  return accepted;
}
