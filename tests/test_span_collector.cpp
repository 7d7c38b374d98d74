#include <catch2/catch.hpp>

#include "span_collector.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace {

const char* kSampleXml = R"(<?xml version="1.0" encoding="UTF-8"?>
<!DOCTYPE pdf2xml SYSTEM "pdf2xml.dtd">
<pdf2xml producer="poppler" version="22.02.0">
<page number="1" position="absolute" top="0" left="0" height="792" width="612">
	<fontspec id="0" size="24" family="Helvetica-Bold" color="#000000"/>
	<fontspec id="1" size="11" family="Times" color="#000000"/>
	<fontspec id="2" size="11" family="Times-Italic" color="#000000"/>
<text top="90" left="72" width="240" height="28" font="0">Annual   Report</text>
<text top="130" left="72" width="300" height="13" font="1"><b>1. Scope &amp; Goals</b></text>
<text top="150" left="72" width="300" height="13" font="2">Caf&#233; notes on &#x4E2D; text</text>
<text top="170" left="72" width="300" height="13" font="1">   </text>
<text top="190" left="72" width="300" height="13" font="9">unknown font</text>
</page>
<page number="2" position="absolute" top="0" left="0" height="792" width="612">
	<fontspec id="3" size="14" family="Arial" color="#000000"/>
<text top="80" left="72" width="200" height="17" font="3">Methods</text>
<text top="110" left="72" width="300" height="13" font="1">Plain body <b>with</b> bold word</text>
</page>
</pdf2xml>
)";

} // namespace

TEST_CASE("parsePdftohtmlXml reads spans, fonts and pages", "[collector]") {
  std::vector<PageGeometry> pages;
  const std::vector<TextSpan> spans = parsePdftohtmlXml(kSampleXml, &pages);

  REQUIRE(spans.size() == 5);

  REQUIRE(spans[0].text == "Annual Report");
  REQUIRE(spans[0].fontSize == Catch::Detail::Approx(24.0));
  REQUIRE(spans[0].isBold);
  REQUIRE_FALSE(spans[0].isItalic);
  REQUIRE(spans[0].page == 1);
  REQUIRE(spans[0].bbox.x0 == Catch::Detail::Approx(72.0));
  REQUIRE(spans[0].bbox.y0 == Catch::Detail::Approx(90.0));
  REQUIRE(spans[0].bbox.x1 == Catch::Detail::Approx(312.0));
  REQUIRE(spans[0].bbox.y1 == Catch::Detail::Approx(118.0));

  REQUIRE(spans[1].text == "1. Scope & Goals");
  REQUIRE(spans[1].isBold);

  REQUIRE(spans[2].text == "Caf\xC3\xA9 notes on \xE4\xB8\xAD text");
  REQUIRE(spans[2].isItalic);
  REQUIRE_FALSE(spans[2].isBold);

  REQUIRE(spans[3].text == "Methods");
  REQUIRE(spans[3].page == 2);
  REQUIRE(spans[3].fontSize == Catch::Detail::Approx(14.0));
  REQUIRE_FALSE(spans[3].isBold);

  REQUIRE(spans[4].text == "Plain body with bold word");
  REQUIRE_FALSE(spans[4].isBold);
  REQUIRE(spans[4].page == 2);

  REQUIRE(pages.size() == 2);
  REQUIRE(pages[0].page == 1);
  REQUIRE(pages[0].height == Catch::Detail::Approx(792.0));
  REQUIRE(pages[1].width == Catch::Detail::Approx(612.0));
}

TEST_CASE("parsePdftohtmlXml tolerates empty output", "[collector]") {
  REQUIRE(parsePdftohtmlXml("").empty());
  REQUIRE(parsePdftohtmlXml("<pdf2xml></pdf2xml>").empty());
}

TEST_CASE("parsePdfInfo extracts title and page count", "[collector]") {
  const std::string text =
    "Title:          Quarterly Results  \n"
    "Author:         Finance Team\n"
    "Producer:       LibreOffice\n"
    "Pages:          12\r\n"
    "Encrypted:      no\n";
  const PdfInfo info = parsePdfInfo(text);
  REQUIRE(info.title == "Quarterly Results");
  REQUIRE(info.pageCount == 12);

  const PdfInfo none = parsePdfInfo("Producer: something\n");
  REQUIRE(none.title.empty());
  REQUIRE(none.pageCount == 0);
}

TEST_CASE("collectDocument rejects a missing file", "[collector]") {
  REQUIRE_THROWS_AS(collectDocument("/nonexistent/dir/missing.pdf", 5), std::runtime_error);
}
