#include "outline_json.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>

std::string jsonQuote(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  out += '"';
  for (char ch : s) {
    const unsigned char c = static_cast<unsigned char>(ch);
    switch (ch) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", c);
          out += buf;
        } else {
          out += ch;
        }
    }
  }
  out += '"';
  return out;
}

void writeOutlineJson(std::ostream& os, const Outline& outline) {
  os << "{\n";
  os << "  \"title\": " << jsonQuote(outline.title) << ",\n";
  if (outline.entries.empty()) {
    os << "  \"outline\": []\n";
    os << "}\n";
    return;
  }
  os << "  \"outline\": [\n";
  for (size_t i = 0; i < outline.entries.size(); ++i) {
    const HeadingEntry& e = outline.entries[i];
    os << "    {\n";
    os << "      \"level\": " << jsonQuote(levelName(e.level)) << ",\n";
    os << "      \"text\": " << jsonQuote(e.text) << ",\n";
    os << "      \"page\": " << e.page << "\n";
    os << "    }" << (i + 1 == outline.entries.size() ? "\n" : ",\n");
  }
  os << "  ]\n";
  os << "}\n";
}

void writeOutlineFile(const std::string& path, const Outline& outline) {
  const std::filesystem::path target(path);
  if (target.has_parent_path() && !std::filesystem::exists(target.parent_path())) {
    std::filesystem::create_directories(target.parent_path());
  }
  std::ofstream ofs(target);
  if (!ofs) throw std::runtime_error("Cannot write " + path);
  writeOutlineJson(ofs, outline);
  if (!ofs) throw std::runtime_error("Failed writing " + path);
}
