#include "row_reader/value_parse.hpp"
#include <charconv>
#include <string>
#include <system_error>
#include <fast_float/fast_float.h>

namespace rr {

static bool is_space(unsigned char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

std::string_view normalize(std::string_view s) {
  while (!s.empty()) {
    if (is_space((unsigned char)s.front())) { s.remove_prefix(1); continue; }
    if (s.size() >= 2 && s[0] == '\xC2' && s[1] == '\xA0') { s.remove_prefix(2); continue; }
    break;
  }
  while (!s.empty()) {
    if (is_space((unsigned char)s.back())) { s.remove_suffix(1); continue; }
    if (s.size() >= 2 && s[s.size() - 2] == '\xC2' && s.back() == '\xA0') { s.remove_suffix(2); continue; }
    break;
  }
  return s;
}

// Strips '+' and thousands separators; `tmp` backs the result when needed.
static std::string_view prepare_number(std::string_view s, std::string& tmp) {
  s = normalize(s);
  if (!s.empty() && s.front() == '+') {
    s.remove_prefix(1);
    if (!s.empty() && (s.front() == '-' || s.front() == '+')) return {};
  }
  if (s.find(',') == std::string_view::npos) return s;
  tmp.clear();
  for (char c : s) if (c != ',') tmp.push_back(c);
  return tmp;
}

std::optional<int> parse_int(std::string_view s) {
  std::string tmp;
  s = prepare_number(s, tmp);
  if (s.empty()) return std::nullopt;
  int out = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out, 10);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

std::optional<double> parse_double(std::string_view s) {
  std::string tmp;
  s = prepare_number(s, tmp);
  if (s.empty()) return std::nullopt;
  double out;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

}
