#include "pattern_matcher.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

#include "text_util.hpp"

namespace {

const std::regex& numberedPrefix() {
  static const std::regex re(R"(^(\d{1,3}(?:\.\d{1,3})*)\.?\s+\S)");
  return re;
}

// CJK headings often run the title straight into the number ("1.2概要").
// A counter after the number ("3月", "12人") makes it a quantity, not a heading.
const std::regex& numberedPrefixTight() {
  static const std::regex re(
    "^(\\d{1,3}(?:\\.\\d{1,3})*)\\.?\\s*"
    "(?!月|日|年|人|時|时|個|个|件|名|回|歳|岁|分|秒|点|點|倍|割|円|元|%|％|번|개|명|년|월|일)[^\\d.\\s]");
  return re;
}

// Right-to-left runs can come out of the extractor with the number at the end.
const std::regex& numberedSuffix() {
  static const std::regex re(R"(\S\s+[.\-(]?(\d{1,3}(?:\.\d{1,3})*)\.?$)");
  return re;
}

// A lone C., D., L. or M. reads as a letter prefix rather than a numeral.
const std::regex& romanPrefix() {
  static const std::regex re(R"(^(?![CDLM]\.)(?=[MDCLXVI])M{0,3}(?:CM|CD|D?C{0,3})(?:XC|XL|L?X{0,3})(?:IX|IV|V?I{0,3})\.(?:\s|$))");
  return re;
}

const std::regex& letterPrefix() {
  static const std::regex re(R"(^[A-Z]\.\s+\S)");
  return re;
}

std::optional<PatternMatch> matchNumbered(const std::string& text, const std::regex& re,
                                          const OutlineConfig& config) {
  std::smatch m;
  if (!std::regex_search(text, m, re)) return std::nullopt;
  return PatternMatch{PatternTag::NumberedSection, config.patternBoost, numberingDepth(m[1].str())};
}

std::optional<PatternMatch> matchRules(const std::string& text, const ScriptPatterns& table,
                                       const OutlineConfig& config) {
  for (const auto& rule : table.rules) {
    if (std::regex_search(text, rule.pattern)) {
      return PatternMatch{rule.tag, config.patternBoost, rule.depth};
    }
  }
  return std::nullopt;
}

std::optional<PatternMatch> matchLatin(const std::string& text, const OutlineConfig& config) {
  if (auto m = matchNumbered(text, numberedPrefix(), config)) return m;
  if (std::regex_search(text, romanPrefix())) {
    return PatternMatch{PatternTag::RomanNumeral, config.patternBoost, 1};
  }
  if (std::regex_search(text, letterPrefix())) {
    return PatternMatch{PatternTag::LetterPrefix, config.patternBoost, 2};
  }
  return matchRules(text, config.patterns.latin, config);
}

std::optional<PatternMatch> matchDevanagari(const std::string& text, const OutlineConfig& config) {
  if (auto m = matchNumbered(text, numberedPrefix(), config)) return m;
  return matchRules(text, config.patterns.devanagari, config);
}

std::optional<PatternMatch> matchCjk(const std::string& text, const OutlineConfig& config) {
  if (auto m = matchRules(text, config.patterns.cjk, config)) return m;
  return matchNumbered(text, numberedPrefixTight(), config);
}

std::optional<PatternMatch> matchHangul(const std::string& text, const OutlineConfig& config) {
  if (auto m = matchRules(text, config.patterns.hangul, config)) return m;
  return matchNumbered(text, numberedPrefix(), config);
}

std::optional<PatternMatch> matchArabic(const std::string& text, const OutlineConfig& config) {
  if (auto m = matchNumbered(text, numberedPrefix(), config)) return m;
  if (auto m = matchNumbered(text, numberedSuffix(), config)) return m;
  return matchRules(text, config.patterns.arabic, config);
}

} // namespace

int numberingDepth(const std::string& number) {
  if (number.empty() || !std::isdigit(static_cast<unsigned char>(number.front()))) return 0;
  return 1 + static_cast<int>(std::count(number.begin(), number.end(), '.'));
}

std::optional<PatternMatch> matchPattern(const std::string& text, ScriptProfile profile,
                                         const OutlineConfig& config) {
  const std::string normalized = normalizeDigits(normalizeSpaces(text));
  if (normalized.empty()) return std::nullopt;

  switch (profile) {
    case ScriptProfile::Latin: return matchLatin(normalized, config);
    case ScriptProfile::Devanagari: return matchDevanagari(normalized, config);
    case ScriptProfile::Cjk: return matchCjk(normalized, config);
    case ScriptProfile::Hangul: return matchHangul(normalized, config);
    case ScriptProfile::Arabic: return matchArabic(normalized, config);
  }
  return std::nullopt;
}
