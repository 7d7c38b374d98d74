#include <catch2/catch.hpp>

#include "outline.hpp"
#include "test_support.hpp"

namespace {

LeveledSpan heading(const std::string& text, int page, double top, size_t order, HeadingLevel level) {
  LeveledSpan l;
  l.scored.span = makeSpan(text, 14.0, page, top);
  l.scored.order = order;
  l.level = level;
  return l;
}

} // namespace

TEST_CASE("assembleOutline sorts by page, then top edge, then reading order", "[outline]") {
  const std::vector<LeveledSpan> headings = {
    heading("Page two", 2, 50.0, 0, HeadingLevel::H1),
    heading("Lower on page one", 1, 300.0, 1, HeadingLevel::H2),
    heading("Right column", 1, 100.0, 3, HeadingLevel::H2),
    heading("Left column", 1, 100.0, 2, HeadingLevel::H2),
  };
  const Outline outline = assembleOutline("Doc", headings);

  REQUIRE(outline.title == "Doc");
  REQUIRE(outline.entries.size() == 4);
  REQUIRE(outline.entries[0].text == "Left column ");
  REQUIRE(outline.entries[1].text == "Right column ");
  REQUIRE(outline.entries[2].text == "Lower on page one ");
  REQUIRE(outline.entries[3].text == "Page two ");
  REQUIRE(outline.entries[3].page == 2);
  REQUIRE(outline.entries[3].level == HeadingLevel::H1);
}

TEST_CASE("assembleOutline normalizes spacing and skips blank text", "[outline]") {
  const Outline outline = assembleOutline("", {heading("  Spaced   out ", 1, 10.0, 0, HeadingLevel::H3),
                                               heading("   ", 1, 20.0, 1, HeadingLevel::H1)});
  REQUIRE(outline.entries.size() == 1);
  REQUIRE(outline.entries[0].text == "Spaced out ");
  REQUIRE(levelName(outline.entries[0].level) == "H3");
}
