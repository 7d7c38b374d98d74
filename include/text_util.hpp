#pragma once

#include <string>
#include <vector>

std::string trim(const std::string& s);

// Collapses runs of ASCII whitespace (and U+00A0, U+3000) into a single space and trims.
std::string normalizeSpaces(const std::string& s);

// Lenient UTF-8 decoding; malformed bytes become U+FFFD.
std::u32string decodeUtf8(const std::string& s);

std::string encodeUtf8(const std::u32string& s);
void appendUtf8(std::string& out, char32_t cp);

std::string toLowerAscii(std::string s);

// Maps Devanagari, Arabic-Indic, Extended Arabic-Indic and full-width digits to ASCII digits.
// The Arabic decimal separator U+066B becomes '.'.
std::string normalizeDigits(const std::string& s);

bool isUnicodeSpace(char32_t cp);
bool isCjkIdeograph(char32_t cp);

// True for code points that read as letters in one of the supported scripts.
bool isLetter(char32_t cp);

size_t codePointCount(const std::string& s);
size_t wordCount(const std::string& s);

std::vector<std::string> splitWords(const std::string& s);

double median(std::vector<double> values);
