#pragma once

#include <regex>
#include <vector>

#include "script_profile.hpp"

enum class PatternTag {
  NumberedSection, // 1, 1.2, 1.2.3
  RomanNumeral,    // IV.
  LetterPrefix,    // A.  가.  أ-
  ChapterKeyword,  // Chapter 3, 第1章, अध्याय, 제1장, الفصل
  SectionKeyword,  // Section 2, 第2節, खंड, 제2절, المبحث
  KnownHeading,    // Introduction, 概要, सारांश ...
};

// A keyword or marker pattern for one script. depth is the heading level the
// marker suggests on its own (1-4), or 0 when it gives no nesting hint.
struct KeywordRule {
  std::regex pattern;
  PatternTag tag;
  int depth;
};

struct ScriptPatterns {
  std::vector<KeywordRule> rules;
};

struct PatternTables {
  ScriptPatterns latin;
  ScriptPatterns devanagari;
  ScriptPatterns cjk;
  ScriptPatterns hangul;
  ScriptPatterns arabic;

  const ScriptPatterns& forScript(ScriptProfile profile) const;
};

// Builds the built-in tables. Regexes are compiled once here and only read afterwards.
PatternTables defaultPatternTables();

const char* patternTagName(PatternTag tag);
