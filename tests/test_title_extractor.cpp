#include <catch2/catch.hpp>

#include "test_support.hpp"
#include "title_extractor.hpp"

namespace {

const OutlineConfig& config() {
  static const OutlineConfig c = OutlineConfig::defaults();
  return c;
}

DocumentInput letterPage() {
  DocumentInput input;
  input.pageCount = 1;
  input.pages.push_back(PageGeometry{1, 612.0, 792.0});
  input.spans.push_back(makeSpan("Company Confidential", 30.0, 1, 10.0)); // header band
  input.spans.push_back(makeSpan("Survey", 24.0, 1, 100.0, true, 300.0, 100.0));
  input.spans.push_back(makeSpan("Deep Learning", 24.0, 1, 100.0, true, 100.0, 180.0));
  input.spans.push_back(makeSpan("A short abstract line", 11.0, 1, 140.0));
  addBodyLines(input.spans, 1, 160.0, 5);
  input.spans.push_back(makeSpan("Page 1 of 9 footer", 30.0, 1, 770.0)); // footer band
  return input;
}

} // namespace

TEST_CASE("isPlaceholderTitle rejects empty, untitled and file-like titles", "[title]") {
  REQUIRE(isPlaceholderTitle(""));
  REQUIRE(isPlaceholderTitle("   "));
  REQUIRE(isPlaceholderTitle("Untitled"));
  REQUIRE(isPlaceholderTitle("report_final.pdf"));
  REQUIRE(isPlaceholderTitle("Microsoft Word - draft.docx"));
  REQUIRE_FALSE(isPlaceholderTitle("Annual Report 2024"));
  REQUIRE_FALSE(isPlaceholderTitle("概要"));
}

TEST_CASE("extractTitle prefers usable metadata", "[title]") {
  DocumentInput input = letterPage();
  input.metadataTitle = "  Annual   Report 2024 ";
  const TitleResult t = extractTitle(input, config());
  REQUIRE(t.text == "Annual Report 2024");
  REQUIRE(t.source == TitleSource::Metadata);
}

TEST_CASE("extractTitle joins the largest first-page spans in reading order", "[title]") {
  DocumentInput input = letterPage();
  input.metadataTitle = "untitled";
  const TitleResult t = extractTitle(input, config());
  REQUIRE(t.text == "Deep Learning Survey");
  REQUIRE(t.source == TitleSource::Layout);
}

TEST_CASE("extractTitle continues a title over consecutive lines", "[title]") {
  DocumentInput input;
  input.spans.push_back(makeSpan("A Study of", 20.0, 1, 100.0));
  input.spans.push_back(makeSpan("Outline Extraction", 20.0, 1, 124.0));
  input.spans.push_back(makeSpan("by Someone", 12.0, 1, 160.0));
  addBodyLines(input.spans, 1, 200.0, 30);
  REQUIRE(extractTitle(input, config()).text == "A Study of Outline Extraction");
}

TEST_CASE("extractTitle falls through empty pages and gives up gracefully", "[title]") {
  DocumentInput input;
  REQUIRE(extractTitle(input, config()).text.empty());
  REQUIRE(extractTitle(input, config()).source == TitleSource::None);

  input.spans.push_back(makeSpan("Second Page Title", 18.0, 2, 100.0));
  addBodyLines(input.spans, 2, 140.0, 20);
  REQUIRE(extractTitle(input, config()).text == "Second Page Title");
}

TEST_CASE("extractTitle joins right-to-left titles from the right edge", "[title][arabic]") {
  DocumentInput input;
  // Emitted left span first; reading order starts at the right.
  input.spans.push_back(makeSpan("السنوي", 24.0, 1, 100.0, false, 100.0, 120.0));
  input.spans.push_back(makeSpan("التقرير", 24.0, 1, 100.0, false, 300.0, 120.0));
  for (int i = 0; i < 10; ++i) {
    input.spans.push_back(makeSpan("هذا نص عادي في متن الوثيقة", 11.0, 1, 140.0 + 14.0 * i));
  }
  REQUIRE(extractTitle(input, config()).text == "التقرير السنوي");
}
