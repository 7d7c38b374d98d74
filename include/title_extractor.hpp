#pragma once

#include <string>

#include "config.hpp"
#include "span.hpp"

enum class TitleSource {
  None,
  Metadata,
  Layout,
};

struct TitleResult {
  std::string text;
  TitleSource source = TitleSource::None;
};

// Empty, "untitled"-style placeholders, file names and authoring-tool names.
bool isPlaceholderTitle(const std::string& title);

// Metadata title when usable, otherwise the largest-font run of text on the
// first pages, skipping header and footer bands. Empty when nothing qualifies.
TitleResult extractTitle(const DocumentInput& input, const OutlineConfig& config);
