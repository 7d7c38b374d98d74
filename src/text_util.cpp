#include "text_util.hpp"

#include <algorithm>
#include <cctype>

std::string trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

std::string normalizeSpaces(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  bool pendingSpace = false;
  for (char32_t cp : decodeUtf8(s)) {
    if (isUnicodeSpace(cp)) {
      pendingSpace = !out.empty();
      continue;
    }
    if (pendingSpace) {
      out.push_back(' ');
      pendingSpace = false;
    }
    appendUtf8(out, cp);
  }
  return out;
}

std::u32string decodeUtf8(const std::string& s) {
  std::u32string out;
  out.reserve(s.size());
  size_t i = 0;
  while (i < s.size()) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    char32_t cp = 0;
    size_t extra = 0;
    if (c < 0x80) {
      cp = c;
    } else if ((c & 0xE0) == 0xC0) {
      cp = c & 0x1F; extra = 1;
    } else if ((c & 0xF0) == 0xE0) {
      cp = c & 0x0F; extra = 2;
    } else if ((c & 0xF8) == 0xF0) {
      cp = c & 0x07; extra = 3;
    } else {
      out.push_back(0xFFFD);
      i++;
      continue;
    }
    bool valid = true;
    for (size_t k = 1; k <= extra; ++k) {
      if (i + k >= s.size()) { valid = false; break; }
      unsigned char cc = static_cast<unsigned char>(s[i + k]);
      if ((cc & 0xC0) != 0x80) { valid = false; break; }
      cp = (cp << 6) | (cc & 0x3F);
    }
    if (!valid) {
      out.push_back(0xFFFD);
      i++;
      continue;
    }
    out.push_back(cp);
    i += extra + 1;
  }
  return out;
}

void appendUtf8(std::string& out, char32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp <= 0x10FFFF) {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    appendUtf8(out, 0xFFFD);
  }
}

std::string encodeUtf8(const std::u32string& s) {
  std::string out;
  out.reserve(s.size());
  for (char32_t cp : s) appendUtf8(out, cp);
  return out;
}

std::string toLowerAscii(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::string normalizeDigits(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char32_t cp : decodeUtf8(s)) {
    if (cp >= 0x0966 && cp <= 0x096F) {
      out.push_back(static_cast<char>('0' + (cp - 0x0966)));
    } else if (cp >= 0x0660 && cp <= 0x0669) {
      out.push_back(static_cast<char>('0' + (cp - 0x0660)));
    } else if (cp >= 0x06F0 && cp <= 0x06F9) {
      out.push_back(static_cast<char>('0' + (cp - 0x06F0)));
    } else if (cp >= 0xFF10 && cp <= 0xFF19) {
      out.push_back(static_cast<char>('0' + (cp - 0xFF10)));
    } else if (cp == 0x066B || cp == 0xFF0E) {
      out.push_back('.');
    } else {
      appendUtf8(out, cp);
    }
  }
  return out;
}

bool isUnicodeSpace(char32_t cp) {
  switch (cp) {
    case U' ': case U'\t': case U'\n': case U'\r': case U'\f': case U'\v':
    case 0x00A0: case 0x2002: case 0x2003: case 0x2009: case 0x200A:
    case 0x202F: case 0x3000:
      return true;
    default:
      return false;
  }
}

bool isCjkIdeograph(char32_t cp) {
  return (cp >= 0x3400 && cp <= 0x4DBF) ||
         (cp >= 0x4E00 && cp <= 0x9FFF) ||
         (cp >= 0xF900 && cp <= 0xFAFF);
}

bool isLetter(char32_t cp) {
  if ((cp >= U'A' && cp <= U'Z') || (cp >= U'a' && cp <= U'z')) return true;
  if (cp < 0xC0) return false;
  if (cp <= 0x024F) return cp != 0xD7 && cp != 0xF7;
  if (cp >= 0x0370 && cp <= 0x052F) return true;   // Greek, Cyrillic
  if (cp >= 0x05D0 && cp <= 0x05EA) return true;   // Hebrew
  if (cp >= 0x0620 && cp <= 0x064A) return true;   // Arabic letters
  if (cp >= 0x066E && cp <= 0x06D3) return true;
  if (cp >= 0x06FA && cp <= 0x06FF) return true;
  if (cp >= 0x0750 && cp <= 0x077F) return true;
  if (cp >= 0x0900 && cp <= 0x097F) return !(cp >= 0x0964 && cp <= 0x096F); // Devanagari minus danda/digits
  if (cp >= 0x0E01 && cp <= 0x0E30) return true;   // Thai
  if (cp >= 0x1100 && cp <= 0x11FF) return true;   // Hangul Jamo
  if (cp >= 0x3041 && cp <= 0x3096) return true;   // Hiragana
  if (cp >= 0x30A1 && cp <= 0x30FA) return true;   // Katakana
  if (cp >= 0x3130 && cp <= 0x318F) return true;   // Hangul compatibility Jamo
  if (isCjkIdeograph(cp)) return true;
  if (cp >= 0xAC00 && cp <= 0xD7A3) return true;   // Hangul syllables
  if (cp >= 0xFB50 && cp <= 0xFDFF) return true;   // Arabic presentation forms A
  if (cp >= 0xFE70 && cp <= 0xFEFF) return cp != 0xFEFF;
  if (cp >= 0xFF21 && cp <= 0xFF3A) return true;   // full-width Latin
  if (cp >= 0xFF41 && cp <= 0xFF5A) return true;
  if (cp >= 0xFF66 && cp <= 0xFF9D) return true;   // half-width Katakana
  return false;
}

size_t codePointCount(const std::string& s) {
  size_t n = 0;
  for (unsigned char c : s) {
    if ((c & 0xC0) != 0x80) n++;
  }
  return n;
}

std::vector<std::string> splitWords(const std::string& s) {
  std::vector<std::string> words;
  std::string current;
  for (char32_t cp : decodeUtf8(s)) {
    if (isUnicodeSpace(cp)) {
      if (!current.empty()) words.push_back(std::move(current));
      current.clear();
    } else {
      appendUtf8(current, cp);
    }
  }
  if (!current.empty()) words.push_back(std::move(current));
  return words;
}

size_t wordCount(const std::string& s) {
  return splitWords(s).size();
}

double median(std::vector<double> values) {
  if (values.empty()) return 0.0;
  std::sort(values.begin(), values.end());
  const size_t mid = values.size() / 2;
  if (values.size() % 2 == 1) return values[mid];
  return (values[mid - 1] + values[mid]) * 0.5;
}
