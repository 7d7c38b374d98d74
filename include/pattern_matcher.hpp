#pragma once

#include <optional>
#include <string>

#include "config.hpp"

struct PatternMatch {
  PatternTag tag;
  double boost;
  // Nesting depth suggested by the marker ("1.2.3" is 3), 0 when it has none.
  int depth;
};

// Looks for a structural heading marker in `text` using the strategy of the
// active script profile. Native digits are folded to ASCII before matching.
std::optional<PatternMatch> matchPattern(const std::string& text, ScriptProfile profile,
                                         const OutlineConfig& config);

// Depth of a dotted numeric prefix such as "2.1.4" (3); 0 when there is none.
int numberingDepth(const std::string& number);
