#include "title_extractor.hpp"

#include <algorithm>
#include <regex>
#include <vector>

#include "script_profile.hpp"
#include "text_util.hpp"

namespace {

struct TitleLine {
  double top;
  double bottom;
  std::vector<const TextSpan*> spans;
};

double pageHeight(const DocumentInput& input, int page) {
  for (const auto& g : input.pages) {
    if (g.page == page && g.height > 0.0) return g.height;
  }
  // No geometry from the collector: the lowest text edge in the document stands in for the page height.
  double maxBottom = 0.0;
  for (const auto& s : input.spans) maxBottom = std::max(maxBottom, s.bbox.y1);
  return maxBottom;
}

bool inMarginBand(const TextSpan& span, double height, const OutlineConfig& config) {
  if (height <= 0.0) return false;
  const double band = height * config.marginBandRatio;
  return span.bbox.y1 <= band || span.bbox.y0 >= height - band;
}

bool hasLetters(const std::string& text) {
  for (char32_t cp : decodeUtf8(text)) {
    if (isLetter(cp)) return true;
  }
  return false;
}

std::string titleFromLayout(const DocumentInput& input, const OutlineConfig& config) {
  const bool rightToLeft = detectScript(input.spans) == ScriptProfile::Arabic;
  for (int page = 1; page <= config.titlePages; ++page) {
    const double height = pageHeight(input, page);
    std::vector<const TextSpan*> candidates;
    for (const auto& s : input.spans) {
      if (s.page != page || s.fontSize <= 0.0) continue;
      if (inMarginBand(s, height, config)) continue;
      if (!hasLetters(s.text)) continue;
      candidates.push_back(&s);
    }
    if (candidates.empty()) continue;

    double maxSize = 0.0;
    for (const auto* s : candidates) maxSize = std::max(maxSize, s->fontSize);

    // Contiguous run of maximal-size spans in reading order, grouped into lines.
    std::vector<TitleLine> lines;
    bool started = false;
    for (const auto* s : candidates) {
      const bool maximal = maxSize - s->fontSize <= config.sizeTolerance;
      if (!maximal) {
        if (started) break;
        continue;
      }
      started = true;
      auto it = std::find_if(lines.begin(), lines.end(), [&](const TitleLine& l) {
        const double overlap = std::min(l.bottom, s->bbox.y1) - std::max(l.top, s->bbox.y0);
        return overlap > 0.0;
      });
      if (it != lines.end()) {
        it->top = std::min(it->top, s->bbox.y0);
        it->bottom = std::max(it->bottom, s->bbox.y1);
        it->spans.push_back(s);
        continue;
      }
      if (!lines.empty()) {
        const double gap = s->bbox.y0 - lines.back().bottom;
        if (lines.size() >= config.maxTitleLines || gap > maxSize * 1.5) break;
      }
      lines.push_back(TitleLine{s->bbox.y0, s->bbox.y1, {s}});
    }

    std::string title;
    for (auto& line : lines) {
      std::stable_sort(line.spans.begin(), line.spans.end(), [rightToLeft](const TextSpan* a, const TextSpan* b) {
        return rightToLeft ? a->bbox.x1 > b->bbox.x1 : a->bbox.x0 < b->bbox.x0;
      });
      for (const auto* s : line.spans) {
        const std::string text = normalizeSpaces(s->text);
        if (text.empty()) continue;
        if (!title.empty()) title += ' ';
        title += text;
      }
    }
    if (!title.empty()) return title;
  }
  return {};
}

} // namespace

bool isPlaceholderTitle(const std::string& title) {
  const std::string t = toLowerAscii(normalizeSpaces(title));
  if (t.empty()) return true;
  static const std::regex placeholder(R"(^(untitled|untitled document|no title|title|document\d*|unknown)$)");
  static const std::regex fileOrTool(R"((\.(pdf|docx?|pptx?|xlsx?|rtf|odt)\b)|microsoft word|^slide \d+$)");
  return std::regex_match(t, placeholder) || std::regex_search(t, fileOrTool);
}

TitleResult extractTitle(const DocumentInput& input, const OutlineConfig& config) {
  TitleResult result;
  const std::string meta = normalizeSpaces(input.metadataTitle);
  if (!isPlaceholderTitle(meta)) {
    result.text = meta;
    result.source = TitleSource::Metadata;
    return result;
  }
  result.text = titleFromLayout(input, config);
  if (!result.text.empty()) result.source = TitleSource::Layout;
  return result;
}
