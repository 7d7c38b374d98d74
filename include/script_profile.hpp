#pragma once

#include <string>
#include <vector>

#include "span.hpp"

enum class ScriptProfile {
  Latin,
  Devanagari,
  Cjk,
  Hangul,
  Arabic,
};

// Character tallies per script over the non-whitespace text of a document.
// `other` counts digits, punctuation and symbols that belong to no profile.
struct ScriptTally {
  size_t latin = 0;
  size_t devanagari = 0;
  size_t cjk = 0;
  size_t hangul = 0;
  size_t arabic = 0;
  size_t other = 0;
};

ScriptTally tallyScripts(const std::vector<TextSpan>& spans);

// Picks the profile with the largest character share. Ties and empty input resolve to Latin.
ScriptProfile detectScript(const std::vector<TextSpan>& spans);

std::string scriptName(ScriptProfile profile);
