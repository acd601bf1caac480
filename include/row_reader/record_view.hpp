#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace rr {

// One logical record: field strings in column order.
using Record = std::vector<std::string>;

// Lightweight, non-owning view over a tokenized record.
// Views handed out by RecordTokenizer::next_borrowed() point at the
// tokenizer's scratch record and are invalidated by its next read.
class RecordView {
public:
  RecordView() = default;
  explicit RecordView(const Record* fields) : fields_(fields) {}

  std::size_t size() const noexcept { return fields_ ? fields_->size() : 0; }
  bool empty() const noexcept { return size() == 0; }

  // Get field by index; empty past the end.
  std::string_view at(std::size_t i) const {
    return (fields_ && i < fields_->size()) ? std::string_view((*fields_)[i]) : std::string_view{};
  }

  const Record* fields() const noexcept { return fields_; }

  // Owned copy, safe to keep across reads.
  Record to_record() const { return fields_ ? *fields_ : Record{}; }

private:
  const Record* fields_{nullptr};
};

}
