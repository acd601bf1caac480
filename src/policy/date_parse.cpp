#include "row_reader/date_parse.hpp"
#include "row_reader/value_parse.hpp"
#include <cmath>
#include <cstdio>
#include <limits>

// Day/civil conversions follow H. Hinnant's days_from_civil algorithms.

namespace rr {

static bool is_digit(char c){ return c>='0' && c<='9'; }

static bool parse_uint(std::string_view s, int& out) {
  if (s.empty()) return false;
  int v = 0;
  for (char c : s) { if (!is_digit(c)) return false; v = v*10 + (c - '0'); }
  out = v; return true;
}

static bool is_leap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

bool is_valid_date(int year, int month, int day) noexcept {
  static constexpr int mdays[] = {31,28,31,30,31,30,31,31,30,31,30,31};
  if (month < 1 || month > 12 || day < 1) return false;
  int lim = mdays[month - 1] + ((month == 2 && is_leap(year)) ? 1 : 0);
  return day <= lim;
}

std::int64_t Date::to_days() const noexcept {
  const std::int64_t y = static_cast<std::int64_t>(year) - (month <= 2 ? 1 : 0);
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const std::int64_t yoe = y - era * 400;
  const std::int64_t mp = (month + 9) % 12;
  const std::int64_t doy = (153 * mp + 2) / 5 + day - 1;
  const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

Date Date::from_days(std::int64_t z) noexcept {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const std::int64_t doe = z - era * 146097;
  const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const std::int64_t mp = (5 * doy + 2) / 153;
  Date d;
  d.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
  d.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
  d.year = static_cast<int>(yoe + era * 400 + (d.month <= 2 ? 1 : 0));
  return d;
}

std::string Date::to_string() const {
  char buf[32];
  int n = std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
  return std::string(buf, (n > 0) ? static_cast<size_t>(n) : 0);
}

std::optional<Date> parse_iso_date(std::string_view s) {
  // YYYY-MM-DD only; no time part, no offsets.
  if (s.size() != 10 || s[4] != '-' || s[7] != '-') return std::nullopt;
  Date d;
  if (!(parse_uint(s.substr(0,4), d.year) && parse_uint(s.substr(5,2), d.month) && parse_uint(s.substr(8,2), d.day)))
    return std::nullopt;
  if (!is_valid_date(d.year, d.month, d.day)) return std::nullopt;
  return d;
}

Date excel_epoch() noexcept {
  return Date{1900, 1, 1}.plus_days(-2);
}

std::optional<Date> parse_excel_serial(std::string_view s) {
  auto v = parse_double(s);
  if (!v || !std::isfinite(*v)) return std::nullopt;
  const double days = std::trunc(*v);
  if (days < std::numeric_limits<std::int32_t>::min() || days > std::numeric_limits<std::int32_t>::max())
    return std::nullopt;
  return excel_epoch().plus_days(static_cast<std::int64_t>(days));
}

}
