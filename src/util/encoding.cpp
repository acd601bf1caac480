#include "row_reader/encoding.hpp"
#include <cctype>

namespace rr {

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

bool parse_encoding(std::string_view name, Encoding& out) {
  if (ieq(name, "utf8") || ieq(name, "utf-8")) { out = Encoding::Utf8; return true; }
  if (ieq(name, "latin1") || ieq(name, "latin-1") || ieq(name, "iso-8859-1")) { out = Encoding::Latin1; return true; }
  return false;
}

void latin1_to_utf8(std::string_view in, std::string& out) {
  out.reserve(out.size() + in.size());
  for (unsigned char c : in) {
    if (c < 0x80) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back(static_cast<char>(0xC0 | (c >> 6)));
      out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    }
  }
}

bool strip_utf8_bom(std::string& line) {
  static constexpr char bom[] = "\xEF\xBB\xBF";
  if (line.size() >= 3 && line.compare(0, 3, bom) == 0) {
    line.erase(0, 3);
    return true;
  }
  return false;
}

void decode_line(std::string& line, Encoding enc, bool first_line) {
  if (enc == Encoding::Latin1) {
    bool ascii = true;
    for (unsigned char c : line) if (c >= 0x80) { ascii = false; break; }
    if (ascii) return;
    std::string out;
    latin1_to_utf8(line, out);
    line.swap(out);
    return;
  }
  if (first_line) strip_utf8_bom(line);
}

}
