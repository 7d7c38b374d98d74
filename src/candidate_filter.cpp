#include "candidate_filter.hpp"

#include <regex>
#include <set>
#include <utility>

#include "text_util.hpp"

namespace {

const std::vector<std::regex>& datePatterns() {
  static const std::string month =
    "(?:jan|feb|mar|apr|may|jun|jul|aug|sep|sept|oct|nov|dec)[a-z]*\\.?";
  static const std::vector<std::regex> patterns = {
    std::regex(R"(^\d{1,2}[-/. ]\d{1,2}[-/. ]\d{2,4}$)"),
    std::regex(R"(^\d{4}[-/.]\d{1,2}[-/.]\d{1,2}$)"),
    std::regex("^\\d{1,2}(?:st|nd|rd|th)?\\s+" + month + ",?\\s+\\d{4}$", std::regex::icase),
    std::regex("^" + month + "\\s+\\d{1,2}(?:st|nd|rd|th)?,?\\s+\\d{4}$", std::regex::icase),
    std::regex("^" + month + "\\s+\\d{4}$", std::regex::icase),
    std::regex(R"(^\d{1,2}:\d{2}(?::\d{2})?\s*(?:[ap]\.?m\.?)?$)", std::regex::icase),
    std::regex("^\\d{4}\\s*年\\s*\\d{1,2}\\s*月(?:\\s*\\d{1,2}\\s*日)?$"),
    std::regex("^\\d{4}\\s*년\\s*\\d{1,2}\\s*월(?:\\s*\\d{1,2}\\s*일)?$"),
  };
  return patterns;
}

bool hasLetter(const std::string& text) {
  for (char32_t cp : decodeUtf8(text)) {
    if (isLetter(cp)) return true;
  }
  return false;
}

bool tooShort(const std::string& text, ScriptProfile profile, const OutlineConfig& config) {
  const std::u32string cps = decodeUtf8(text);
  if (cps.empty()) return true;
  if (cps.size() >= config.minHeadingChars) return false;
  return !(profile == ScriptProfile::Cjk && cps.size() == 1 && isCjkIdeograph(cps.front()));
}

std::string keyText(const LeveledSpan& s) {
  return normalizeSpaces(s.scored.span.text);
}

} // namespace

bool isDateOrNumber(const std::string& text) {
  const std::string normalized = normalizeDigits(normalizeSpaces(text));
  if (normalized.empty()) return false;
  if (!hasLetter(normalized)) return true;
  for (const auto& re : datePatterns()) {
    if (std::regex_match(normalized, re)) return true;
  }
  return false;
}

bool isTitleEcho(const std::string& text, const std::string& title) {
  const std::string t = toLowerAscii(normalizeSpaces(title));
  return !t.empty() && toLowerAscii(normalizeSpaces(text)) == t;
}

bool isFragmentOf(const std::string& candidate, const std::string& neighbour) {
  if (candidate.empty() || candidate.size() >= neighbour.size()) return false;
  return neighbour.compare(0, candidate.size(), candidate) == 0 ||
         neighbour.compare(neighbour.size() - candidate.size(), candidate.size(), candidate) == 0;
}

std::vector<LeveledSpan> filterCandidates(const std::vector<LeveledSpan>& spans, ScriptProfile profile,
                                          const OutlineConfig& config, FilterStats* stats) {
  FilterStats local;
  std::vector<LeveledSpan> kept;
  std::set<std::pair<std::string, int>> seen;

  for (const auto& s : spans) {
    const std::string text = keyText(s);
    if (!seen.insert({text, s.scored.span.page}).second) {
      local.duplicates++;
      continue;
    }
    if (isDateOrNumber(text)) {
      local.datesOrNumbers++;
      continue;
    }
    if (tooShort(text, profile, config)) {
      local.tooShort++;
      continue;
    }
    kept.push_back(s);
  }

  std::vector<LeveledSpan> result;
  result.reserve(kept.size());
  for (size_t i = 0; i < kept.size(); ++i) {
    const std::string text = keyText(kept[i]);
    const int page = kept[i].scored.span.page;
    bool fragment = false;
    if (i > 0 && kept[i - 1].scored.span.page == page) {
      fragment = isFragmentOf(text, keyText(kept[i - 1]));
    }
    if (!fragment && i + 1 < kept.size() && kept[i + 1].scored.span.page == page) {
      fragment = isFragmentOf(text, keyText(kept[i + 1]));
    }
    if (fragment) {
      local.fragments++;
      continue;
    }
    result.push_back(kept[i]);
  }

  if (stats != nullptr) *stats = local;
  return result;
}
