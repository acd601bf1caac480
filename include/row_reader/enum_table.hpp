#pragma once
#include <cctype>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rr {

// Caller-supplied mapping from case names to enum values.
//
// Lookup tries the exact name first, then a folded form where letters are
// upper-cased and ' ' / '-' become '_' ("past due" finds PAST_DUE).
template <typename E>
class EnumTable {
public:
  EnumTable(const char* type_name, std::initializer_list<std::pair<std::string, E>> cases)
    : type_name_(type_name), cases_(cases) {}

  std::optional<E> find(std::string_view name) const {
    for (const auto& c : cases_) if (c.first == name) return c.second;
    const std::string folded = fold(name);
    for (const auto& c : cases_) if (fold(c.first) == folded) return c.second;
    return std::nullopt;
  }

  std::optional<std::string_view> name_of(E value) const {
    for (const auto& c : cases_) if (c.second == value) return std::string_view(c.first);
    return std::nullopt;
  }

  const char* type_name() const noexcept { return type_name_; }
  std::size_t size() const noexcept { return cases_.size(); }

private:
  static std::string fold(std::string_view s) {
    std::string out; out.reserve(s.size());
    for (unsigned char c : s) {
      if (c == ' ' || c == '-') out.push_back('_');
      else out.push_back(static_cast<char>(std::toupper(c)));
    }
    return out;
  }

  const char* type_name_;
  std::vector<std::pair<std::string, E>> cases_;
};

}
