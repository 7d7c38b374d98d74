#pragma once

#include <ostream>
#include <string>

#include "outline.hpp"

// JSON string literal for `s` (with quotes). UTF-8 passes through; quotes,
// backslashes and control characters are escaped.
std::string jsonQuote(const std::string& s);

// {"title": ..., "outline": [{"level": "H1", "text": ..., "page": 1}, ...]}
void writeOutlineJson(std::ostream& os, const Outline& outline);

// Writes the outline to `path`, creating parent directories as needed.
// Throws std::runtime_error when the file cannot be written.
void writeOutlineFile(const std::string& path, const Outline& outline);
