#include "row_reader/money.hpp"
#include "row_reader/value_parse.hpp"
#include <limits>

namespace rr {

static bool is_digit(char c){ return c>='0' && c<='9'; }

std::optional<Money> Money::parse(std::string_view s) {
  s = normalize(s);
  bool neg = false;
  if (s.size() >= 2 && s.front() == '(' && s.back() == ')') {
    neg = true;
    s = normalize(s.substr(1, s.size() - 2));
  }
  // At most one sign and one '$', in either order. Parentheses already carry
  // the sign, so a second one inside them is malformed.
  bool seen_sign = neg;
  bool seen_symbol = false;
  while (!s.empty()) {
    const char c = s.front();
    if (c == '-' || c == '+') {
      if (seen_sign) return std::nullopt;
      seen_sign = true;
      neg = (c == '-');
    } else if (c == '$') {
      if (seen_symbol) return std::nullopt;
      seen_symbol = true;
    } else {
      break;
    }
    s.remove_prefix(1);
  }
  if (s.empty()) return std::nullopt;

  constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max() / 100 - 1;
  std::int64_t whole = 0;
  std::size_t i = 0;
  bool any_digit = false;
  for (; i < s.size() && s[i] != '.'; ++i) {
    const char c = s[i];
    if (c == ',') {
      if (!any_digit) return std::nullopt;
      continue;
    }
    if (!is_digit(c)) return std::nullopt;
    whole = whole * 10 + (c - '0');
    if (whole > kMax) return std::nullopt;
    any_digit = true;
  }

  std::int64_t frac = 0;
  int frac_digits = 0;
  bool round_up = false;
  if (i < s.size()) {
    ++i;  // '.'
    for (; i < s.size(); ++i) {
      const char c = s[i];
      if (!is_digit(c)) return std::nullopt;
      if (frac_digits < 2) frac = frac * 10 + (c - '0');
      else if (frac_digits == 2) round_up = (c >= '5');
      ++frac_digits;
      any_digit = true;
    }
  }
  if (!any_digit) return std::nullopt;
  if (frac_digits == 1) frac *= 10;

  std::int64_t cents = whole * 100 + frac + (round_up ? 1 : 0);
  return Money::from_cents(neg ? -cents : cents);
}

std::string Money::to_string() const {
  const bool neg = is_negative();
  // magnitude as unsigned so INT64_MIN does not overflow
  std::uint64_t mag = neg ? (0 - static_cast<std::uint64_t>(cents_)) : static_cast<std::uint64_t>(cents_);
  std::string whole = std::to_string(mag / 100);
  std::string grouped;
  grouped.reserve(whole.size() + whole.size() / 3);
  for (std::size_t k = 0; k < whole.size(); ++k) {
    if (k && (whole.size() - k) % 3 == 0) grouped.push_back(',');
    grouped.push_back(whole[k]);
  }
  const unsigned frac = static_cast<unsigned>(mag % 100);
  std::string out;
  if (neg) out.push_back('-');
  out.push_back('$');
  out += grouped;
  out.push_back('.');
  out.push_back(static_cast<char>('0' + frac / 10));
  out.push_back(static_cast<char>('0' + frac % 10));
  return out;
}

}
