#include "patterns.hpp"

#include <string>

// Patterns are matched against UTF-8 bytes, so multi-byte characters are only
// ever written as alternations, never inside bracket expressions.

namespace {

void addRule(ScriptPatterns& table, const std::string& re, PatternTag tag, int depth,
             std::regex::flag_type extra = std::regex::flag_type{}) {
  table.rules.push_back(KeywordRule{std::regex(re, std::regex::ECMAScript | extra), tag, depth});
}

ScriptPatterns latinPatterns() {
  ScriptPatterns t;
  const auto icase = std::regex::icase;
  // A numeral, a roman numeral, a single letter or a spelled-out number, then a
  // break. The article "a" only counts when nothing follows it ("Part A").
  const std::string numbers =
    R"([0-9]+(?:\.[0-9]+)*|[ivxlcdm]+|one|two|three|four|five|six|seven|eight|nine|ten|eleven|twelve)";
  const std::string end = R"((?=[\s.:\-]|$))";
  const std::string label = "(?:(?:" + numbers + "|[b-z])" + end + R"(|a(?=[.:\-]|$)))";
  const std::string appendixLabel = "(?:" + numbers + "|[a-z])" + end;
  addRule(t, R"(^(?:chapter|part|book)\s+)" + label, PatternTag::ChapterKeyword, 1, icase);
  addRule(t, R"(^appendix(?:\s+)" + appendixLabel + R"(|\s*(?:[.:\-]|$)))", PatternTag::ChapterKeyword, 1,
          icase);
  addRule(t, R"(^subsection\s+)" + label, PatternTag::SectionKeyword, 3, icase);
  addRule(t, R"(^section\s+)" + label, PatternTag::SectionKeyword, 2, icase);
  addRule(t, "^§\\s*[0-9]+", PatternTag::SectionKeyword, 2);
  addRule(t,
          R"(^(introduction|abstract|summary|executive summary|background|overview|conclusions?|)"
          R"(references|bibliography|acknowledge?ments|table of contents|contents|index|glossary)\s*:?$)",
          PatternTag::KnownHeading, 0, icase);
  return t;
}

ScriptPatterns devanagariPatterns() {
  ScriptPatterns t;
  // The keyword must end at a break, so "भाग्यवश" is not "भाग".
  const std::string brk = "(?:\\s|:|-|\\.|।|$)";
  addRule(t, "^(?:अध्याय|भाग|परिशिष्ट)" + brk, PatternTag::ChapterKeyword, 1);
  addRule(t, "^(?:अनुभाग|उपखंड|उपखण्ड)" + brk, PatternTag::SectionKeyword, 3);
  addRule(t, "^(?:खंड|खण्ड)" + brk, PatternTag::SectionKeyword, 2);
  addRule(t, "^(?:प्रस्तावना|भूमिका|परिचय|सारांश|निष्कर्ष|संदर्भ|विषय सूची|अनुक्रमणिका)\\s*:?$",
          PatternTag::KnownHeading, 0);
  return t;
}

ScriptPatterns cjkPatterns() {
  ScriptPatterns t;
  const std::string num = "(?:[0-9]+|(?:一|二|三|四|五|六|七|八|九|十|百|千|零|〇|两)+)";
  const std::string small = "(?:一|二|三|四|五|六|七|八|九|十)+";
  addRule(t, "^第\\s*" + num + "\\s*(?:章|部|篇|編|编)", PatternTag::ChapterKeyword, 1);
  addRule(t, "^第\\s*" + num + "\\s*(?:節|节)", PatternTag::SectionKeyword, 2);
  addRule(t, "^第\\s*" + num + "\\s*(?:項|项|款)", PatternTag::SectionKeyword, 3);
  addRule(t, "^" + small + "\\s*(?:、|．)", PatternTag::NumberedSection, 1);
  addRule(t, "^(?:\\(|（)\\s*" + small + "\\s*(?:\\)|）)", PatternTag::NumberedSection, 2);
  addRule(t, "^[0-9]+\\s*、", PatternTag::NumberedSection, 1);
  addRule(t, "^(?:付録|附录|附錄)", PatternTag::ChapterKeyword, 1);
  addRule(t,
          "^(?:概要|はじめに|序論|序章|目次|参考文献|おわりに|まとめ|结论|結論|摘要|引言|前言|序言|目录|目錄)\\s*$",
          PatternTag::KnownHeading, 0);
  return t;
}

ScriptPatterns hangulPatterns() {
  ScriptPatterns t;
  const std::string num = "(?:[0-9]+|(?:일|이|삼|사|오|육|칠|팔|구|십|백)+)";
  addRule(t, "^제\\s*" + num + "\\s*(?:장|편|부)", PatternTag::ChapterKeyword, 1);
  addRule(t, "^제\\s*" + num + "\\s*절", PatternTag::SectionKeyword, 2);
  addRule(t, "^제\\s*" + num + "\\s*(?:항|조)", PatternTag::SectionKeyword, 3);
  addRule(t, "^[0-9]+\\s*장", PatternTag::ChapterKeyword, 1);
  addRule(t, "^[0-9]+\\s*절", PatternTag::SectionKeyword, 2);
  addRule(t, "^(?:가|나|다|라|마|바|사|아|자|차|카|타|파|하)\\s*(?:\\.|\\))\\s*\\S", PatternTag::LetterPrefix, 2);
  addRule(t, "^부록", PatternTag::ChapterKeyword, 1);
  addRule(t, "^(?:서론|요약|개요|결론|참고\\s*문헌|목차|머리말|들어가며)\\s*$", PatternTag::KnownHeading, 0);
  return t;
}

ScriptPatterns arabicPatterns() {
  ScriptPatterns t;
  // Keywords may sit at either end of the line depending on how the
  // extractor ordered a right-to-left run, but never in the middle of one.
  const auto edges = [](const std::string& words) {
    return "(?:^(?:" + words + ")(?:\\s|:|$)|(?:\\s|:)(?:" + words + ")$)";
  };
  addRule(t, edges("الفصل|الباب|الجزء|فصل|باب"), PatternTag::ChapterKeyword, 1);
  addRule(t, edges("ملحق|الملحق|الملاحق"), PatternTag::ChapterKeyword, 1);
  addRule(t, edges("المبحث|القسم|مبحث|قسم"), PatternTag::SectionKeyword, 2);
  addRule(t, edges("المطلب|مطلب|الفرع"), PatternTag::SectionKeyword, 3);
  addRule(t, "^(?:أول|ثاني|ثالث|رابع|خامس|سادس|سابع|ثامن|تاسع|عاشر)(?:ً)?(?:ا)?(?:ً)?\\s*(?::|-|\\.|\\s)",
          PatternTag::NumberedSection, 1);
  addRule(t, "^(?:أ|ب|ج|د|هـ)\\s*(?:-|\\)|\\.)\\s*\\S", PatternTag::LetterPrefix, 2);
  addRule(t, edges("مقدمة|المقدمة|الخاتمة|خاتمة|ملخص|الملخص|المراجع|المصادر|فهرس|الفهرس"),
          PatternTag::KnownHeading, 0);
  return t;
}

} // namespace

const ScriptPatterns& PatternTables::forScript(ScriptProfile profile) const {
  switch (profile) {
    case ScriptProfile::Latin: return latin;
    case ScriptProfile::Devanagari: return devanagari;
    case ScriptProfile::Cjk: return cjk;
    case ScriptProfile::Hangul: return hangul;
    case ScriptProfile::Arabic: return arabic;
  }
  return latin;
}

PatternTables defaultPatternTables() {
  PatternTables tables;
  tables.latin = latinPatterns();
  tables.devanagari = devanagariPatterns();
  tables.cjk = cjkPatterns();
  tables.hangul = hangulPatterns();
  tables.arabic = arabicPatterns();
  return tables;
}

const char* patternTagName(PatternTag tag) {
  switch (tag) {
    case PatternTag::NumberedSection: return "numbered";
    case PatternTag::RomanNumeral: return "roman";
    case PatternTag::LetterPrefix: return "letter";
    case PatternTag::ChapterKeyword: return "chapter";
    case PatternTag::SectionKeyword: return "section";
    case PatternTag::KnownHeading: return "known";
  }
  return "unknown";
}
