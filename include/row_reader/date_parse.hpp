#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rr {

// Proleptic Gregorian calendar date.
struct Date {
  int year  = 1970;
  int month = 1;
  int day   = 1;

  // Days since 1970-01-01.
  std::int64_t to_days() const noexcept;
  static Date from_days(std::int64_t days) noexcept;

  Date plus_days(std::int64_t n) const noexcept { return from_days(to_days() + n); }
  std::string to_string() const;  // YYYY-MM-DD

  friend bool operator==(const Date& a, const Date& b) noexcept {
    return a.year == b.year && a.month == b.month && a.day == b.day;
  }
  friend bool operator!=(const Date& a, const Date& b) noexcept { return !(a == b); }
  friend bool operator<(const Date& a, const Date& b) noexcept { return a.to_days() < b.to_days(); }
};

bool is_valid_date(int year, int month, int day) noexcept;

// Strict YYYY-MM-DD with a real calendar day.
std::optional<Date> parse_iso_date(std::string_view s);

// Spreadsheet day zero: 1900-01-01 minus two days, i.e. 1899-12-30. The two
// days absorb the 1900 leap-year bug inherited from Lotus 1-2-3.
Date excel_epoch() noexcept;

// Day count since excel_epoch(); the fraction (time of day) is truncated
// toward zero. Fails on non-numeric text or counts beyond 32-bit range.
std::optional<Date> parse_excel_serial(std::string_view s);

}
