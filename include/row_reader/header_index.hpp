#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "row_reader/errors.hpp"
#include "row_reader/record_view.hpp"

namespace rr {

class RecordTokenizer;

// Column name -> zero-based position, built once from the header row.
// A name that appears twice maps to its last position; names() still lists
// every header cell in file order.
class HeaderIndex {
public:
  HeaderIndex() = default;

  static HeaderIndex from_record(const Record& header);
  static HeaderIndex from_view(const RecordView& header);

  std::optional<std::size_t> find(std::string_view name) const;
  bool contains(std::string_view name) const { return find(name).has_value(); }

  std::size_t size() const noexcept { return pos_.size(); }
  bool empty() const noexcept { return names_.empty(); }
  const std::vector<std::string>& names() const noexcept { return names_; }

  // Log a "[row] missing column" line when a lookup misses.
  void set_warn_missing(bool on) noexcept { warn_missing_ = on; }
  bool warn_missing() const noexcept { return warn_missing_; }

private:
  void add(std::string name);

  std::vector<std::string> names_;
  std::unordered_map<std::string, std::size_t> pos_;
  bool warn_missing_{false};
};

// Reads exactly one record from `tok` and indexes it. On End or Error `out`
// is left empty.
ReadStatus read_header_index(RecordTokenizer& tok, HeaderIndex& out);

}
