#include "row_reader/header_index.hpp"
#include "row_reader/record_tokenizer.hpp"

namespace rr {

void HeaderIndex::add(std::string name) {
  const std::size_t i = names_.size();
  pos_[name] = i;  // last occurrence wins
  names_.push_back(std::move(name));
}

HeaderIndex HeaderIndex::from_record(const Record& header) {
  HeaderIndex h;
  h.names_.reserve(header.size());
  for (const auto& name : header) h.add(name);
  return h;
}

HeaderIndex HeaderIndex::from_view(const RecordView& header) {
  HeaderIndex h;
  h.names_.reserve(header.size());
  for (std::size_t i = 0; i < header.size(); ++i) h.add(std::string(header.at(i)));
  return h;
}

std::optional<std::size_t> HeaderIndex::find(std::string_view name) const {
  auto it = pos_.find(std::string(name));
  if (it == pos_.end()) return std::nullopt;
  return it->second;
}

ReadStatus read_header_index(RecordTokenizer& tok, HeaderIndex& out) {
  out = HeaderIndex{};
  if (tok.config().reuse_buffer) {
    RecordView view;
    ReadStatus st = tok.next_borrowed(view);
    if (st == ReadStatus::Ok) out = HeaderIndex::from_view(view);
    return st;
  }
  Record row;
  ReadStatus st = tok.next(row);
  if (st == ReadStatus::Ok) out = HeaderIndex::from_record(row);
  return st;
}

}
