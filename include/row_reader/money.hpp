#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rr {

// Currency amount held as whole cents.
class Money {
public:
  Money() = default;
  static Money from_cents(std::int64_t cents) noexcept { Money m; m.cents_ = cents; return m; }

  // Accepts "12", "-3.5", "$1,234.56", "-$5", "$-5", "(7.25)". More than two
  // decimals round half away from zero. Empty or malformed text fails.
  static std::optional<Money> parse(std::string_view s);

  std::int64_t cents() const noexcept { return cents_; }
  bool is_negative() const noexcept { return cents_ < 0; }

  // "$1,234.56" / "-$0.05"
  std::string to_string() const;

  friend bool operator==(Money a, Money b) noexcept { return a.cents_ == b.cents_; }
  friend bool operator!=(Money a, Money b) noexcept { return a.cents_ != b.cents_; }
  friend bool operator<(Money a, Money b) noexcept { return a.cents_ < b.cents_; }

private:
  std::int64_t cents_{0};
};

}
