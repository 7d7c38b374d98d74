#include "span_collector.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>

#include "text_util.hpp"

namespace {

bool commandExists(const std::string& command) {
  std::string test = "command -v " + command + " >/dev/null 2>&1";
  return std::system(test.c_str()) == 0;
}

std::string shellQuote(const std::string& s) {
  std::string out = "'";
  for (char ch : s) {
    if (ch == '\'') out += "'\\''";
    else out += ch;
  }
  out += "'";
  return out;
}

std::string runCaptureStdout(const std::string& cmd, const std::string& tool) {
  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) throw std::runtime_error("Failed to open pipe to " + tool);
  std::string out;
  char buf[8192];
  while (true) {
    size_t n = std::fread(buf, 1, sizeof(buf), pipe);
    if (n > 0) out.append(buf, n);
    if (n < sizeof(buf)) break;
  }
  int rc = pclose(pipe);
  if (rc != 0) throw std::runtime_error(tool + " returned non-zero exit code");
  return out;
}

std::string decodeEntities(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '&') {
      size_t j = in.find(';', i + 1);
      if (j != std::string::npos && j - i <= 10) {
        std::string ent = in.substr(i + 1, j - (i + 1));
        std::string rep;
        if (ent == "amp") rep = "&";
        else if (ent == "lt") rep = "<";
        else if (ent == "gt") rep = ">";
        else if (ent == "quot") rep = "\"";
        else if (ent == "apos") rep = "'";
        else if (ent == "nbsp") rep = " ";
        else if (ent.size() > 1 && ent[0] == '#') {
          const bool hex = ent[1] == 'x' || ent[1] == 'X';
          const std::string digits = ent.substr(hex ? 2 : 1);
          char* endPtr = nullptr;
          const unsigned long code = std::strtoul(digits.c_str(), &endPtr, hex ? 16 : 10);
          if (!digits.empty() && endPtr != nullptr && *endPtr == '\0' && code > 0 && code <= 0x10FFFF) {
            appendUtf8(rep, static_cast<char32_t>(code));
          }
        }
        if (!rep.empty()) {
          out += rep; i = j; continue;
        }
      }
    }
    out.push_back(in[i]);
  }
  return out;
}

std::map<std::string, std::string> parseAttributes(const std::string& tagBody) {
  static const std::regex attrRe(R"re(([A-Za-z_:][-A-Za-z0-9_:]*)="([^"]*)")re");
  std::map<std::string, std::string> attrs;
  for (std::sregex_iterator it(tagBody.begin(), tagBody.end(), attrRe), end; it != end; ++it) {
    attrs[(*it)[1].str()] = (*it)[2].str();
  }
  return attrs;
}

double attrDouble(const std::map<std::string, std::string>& attrs, const std::string& key) {
  auto it = attrs.find(key);
  if (it == attrs.end()) return 0.0;
  return std::strtod(it->second.c_str(), nullptr);
}

struct FontSpec {
  double size = 0.0;
  bool bold = false;
  bool italic = false;
};

FontSpec fontFromFamily(double size, const std::string& family) {
  static const std::regex boldRe("bold|black|heavy|semibold|demi", std::regex::icase);
  static const std::regex italicRe("italic|oblique", std::regex::icase);
  FontSpec f;
  f.size = size;
  f.bold = std::regex_search(family, boldRe);
  f.italic = std::regex_search(family, italicRe);
  return f;
}

// Strips inline markup from a <text> element. allBold / allItalic report
// whether every visible character sat inside <b> / <i>.
std::string stripInlineTags(const std::string& inner, bool& allBold, bool& allItalic) {
  std::string out;
  int boldDepth = 0;
  int italicDepth = 0;
  bool anyVisible = false;
  allBold = true;
  allItalic = true;
  size_t i = 0;
  while (i < inner.size()) {
    if (inner[i] == '<') {
      size_t close = inner.find('>', i);
      if (close == std::string::npos) break;
      const std::string tag = toLowerAscii(inner.substr(i + 1, close - i - 1));
      if (tag == "b") boldDepth++;
      else if (tag == "/b") boldDepth = boldDepth > 0 ? boldDepth - 1 : 0;
      else if (tag == "i") italicDepth++;
      else if (tag == "/i") italicDepth = italicDepth > 0 ? italicDepth - 1 : 0;
      i = close + 1;
      continue;
    }
    if (!std::isspace(static_cast<unsigned char>(inner[i]))) {
      anyVisible = true;
      if (boldDepth == 0) allBold = false;
      if (italicDepth == 0) allItalic = false;
    }
    out.push_back(inner[i]);
    i++;
  }
  if (!anyVisible) {
    allBold = false;
    allItalic = false;
  }
  return out;
}

} // namespace

PdfInfo parsePdfInfo(const std::string& text) {
  PdfInfo info;
  static const std::regex titleRe(R"(^Title:\s*(.*?)\s*$)");
  static const std::regex pagesRe(R"(^Pages:\s*([0-9]+)\s*$)");
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    std::smatch m;
    if (info.title.empty() && std::regex_match(line, m, titleRe)) {
      info.title = trim(m[1].str());
    } else if (std::regex_match(line, m, pagesRe)) {
      info.pageCount = std::stoi(m[1].str());
    }
  }
  return info;
}

std::vector<TextSpan> parsePdftohtmlXml(const std::string& xml, std::vector<PageGeometry>* pages) {
  std::vector<TextSpan> spans;
  std::map<std::string, FontSpec> fonts;
  int currentPage = 1;

  static const std::regex elementRe(
    R"re(<page\b([^>]*)>|<fontspec\b([^>]*?)/?>|<text\b([^>]*)>([\s\S]*?)</text>)re");

  for (std::sregex_iterator it(xml.begin(), xml.end(), elementRe), end; it != end; ++it) {
    const std::smatch& m = *it;
    if (m[1].matched) {
      auto attrs = parseAttributes(m[1].str());
      int number = static_cast<int>(attrDouble(attrs, "number"));
      currentPage = number > 0 ? number : currentPage + 1;
      if (pages != nullptr) {
        pages->push_back(PageGeometry{currentPage, attrDouble(attrs, "width"), attrDouble(attrs, "height")});
      }
      continue;
    }
    if (m[2].matched) {
      auto attrs = parseAttributes(m[2].str());
      auto family = attrs.find("family");
      fonts[attrs["id"]] = fontFromFamily(attrDouble(attrs, "size"),
                                          family == attrs.end() ? std::string() : family->second);
      continue;
    }

    auto attrs = parseAttributes(m[3].str());
    bool allBold = false;
    bool allItalic = false;
    std::string text = normalizeSpaces(decodeEntities(stripInlineTags(m[4].str(), allBold, allItalic)));
    if (text.empty()) continue;

    auto font = fonts.find(attrs["font"]);
    if (font == fonts.end() || font->second.size <= 0.0) continue;

    TextSpan span;
    span.text = std::move(text);
    span.fontSize = font->second.size;
    span.isBold = allBold || font->second.bold;
    span.isItalic = allItalic || font->second.italic;
    const double left = attrDouble(attrs, "left");
    const double top = attrDouble(attrs, "top");
    span.bbox = BBox{left, top, left + attrDouble(attrs, "width"), top + attrDouble(attrs, "height")};
    span.page = currentPage;
    spans.push_back(std::move(span));
  }
  return spans;
}

DocumentInput collectDocument(const std::string& pdfPath, int maxPages) {
  if (!std::filesystem::exists(pdfPath)) {
    throw std::runtime_error("PDF not found: " + pdfPath);
  }
  if (!commandExists("pdftohtml") || !commandExists("pdfinfo")) {
    throw std::runtime_error(
      "pdftohtml/pdfinfo not found. Please install poppler-utils (e.g., apt-get install -y poppler-utils)."
    );
  }

  DocumentInput input;
  const PdfInfo info = parsePdfInfo(runCaptureStdout("pdfinfo -enc UTF-8 " + shellQuote(pdfPath) + " 2>/dev/null", "pdfinfo"));
  input.metadataTitle = info.title;
  input.pageCount = info.pageCount;

  std::string cmd = "pdftohtml -xml -i -q -nodrm -zoom 1 -stdout";
  if (maxPages > 0) cmd += " -l " + std::to_string(maxPages);
  cmd += " " + shellQuote(pdfPath);
  input.spans = parsePdftohtmlXml(runCaptureStdout(cmd, "pdftohtml"), &input.pages);
  if (input.pageCount == 0) input.pageCount = static_cast<int>(input.pages.size());
  return input;
}
