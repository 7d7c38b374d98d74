#include "script_profile.hpp"

#include "text_util.hpp"

namespace {

bool inRange(char32_t cp, char32_t lo, char32_t hi) {
  return cp >= lo && cp <= hi;
}

bool isDevanagari(char32_t cp) {
  return inRange(cp, 0x0900, 0x097F);
}

bool isCjk(char32_t cp) {
  return inRange(cp, 0x3040, 0x309F) ||   // Hiragana
         inRange(cp, 0x30A0, 0x30FF) ||   // Katakana
         inRange(cp, 0xFF66, 0xFF9D) ||   // half-width Katakana
         isCjkIdeograph(cp);
}

bool isHangul(char32_t cp) {
  return inRange(cp, 0xAC00, 0xD7A3) ||
         inRange(cp, 0x1100, 0x11FF) ||
         inRange(cp, 0x3130, 0x318F);
}

bool isArabic(char32_t cp) {
  return inRange(cp, 0x0600, 0x06FF) ||
         inRange(cp, 0x0750, 0x077F) ||
         inRange(cp, 0xFB50, 0xFDFF) ||
         inRange(cp, 0xFE70, 0xFEFE);
}

} // namespace

ScriptTally tallyScripts(const std::vector<TextSpan>& spans) {
  ScriptTally tally;
  for (const auto& span : spans) {
    for (char32_t cp : decodeUtf8(span.text)) {
      if (isUnicodeSpace(cp)) continue;
      if (isDevanagari(cp)) tally.devanagari++;
      else if (isHangul(cp)) tally.hangul++;
      else if (isCjk(cp)) tally.cjk++;
      else if (isArabic(cp)) tally.arabic++;
      else if (isLetter(cp)) tally.latin++;
      else tally.other++;
    }
  }
  return tally;
}

ScriptProfile detectScript(const std::vector<TextSpan>& spans) {
  const ScriptTally tally = tallyScripts(spans);

  // Latin goes first and only a strictly larger share displaces it.
  ScriptProfile best = ScriptProfile::Latin;
  size_t bestCount = tally.latin;
  auto consider = [&](ScriptProfile profile, size_t count) {
    if (count > bestCount) {
      best = profile;
      bestCount = count;
    }
  };
  consider(ScriptProfile::Devanagari, tally.devanagari);
  consider(ScriptProfile::Cjk, tally.cjk);
  consider(ScriptProfile::Hangul, tally.hangul);
  consider(ScriptProfile::Arabic, tally.arabic);
  return best;
}

std::string scriptName(ScriptProfile profile) {
  switch (profile) {
    case ScriptProfile::Latin: return "latin";
    case ScriptProfile::Devanagari: return "devanagari";
    case ScriptProfile::Cjk: return "cjk";
    case ScriptProfile::Hangul: return "hangul";
    case ScriptProfile::Arabic: return "arabic";
  }
  return "latin";
}
