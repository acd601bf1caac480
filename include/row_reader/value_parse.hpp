#pragma once
#include <optional>
#include <string_view>

namespace rr {

// Trims ASCII whitespace and UTF-8 no-break spaces from both ends.
std::string_view normalize(std::string_view s);

// Decimal integer; accepts a leading '+' and ',' thousands separators.
std::optional<int> parse_int(std::string_view s);

// Floating point via fast_float; same leniency as parse_int.
std::optional<double> parse_double(std::string_view s);

}
