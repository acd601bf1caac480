#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "row_reader/errors.hpp"
#include "row_reader/record_view.hpp"

namespace rr {

class LineSource;

struct TokenizerConfig {
  char delimiter      = ',';
  char escape         = '"';
  bool reuse_buffer   = false;  // enables next_borrowed()
  std::size_t skip_lines = 0;   // physical lines dropped before the first record
};

// Pull-based tokenizer turning physical lines into logical records.
//
// A field opened with the escape character runs until an escape character
// that is followed by the delimiter or ends the line. Any other escape
// character inside an open field is dropped and the field stays open; there is
// no doubled-quote escaping. When a physical line ends inside an open field the
// next physical line is joined with '\n' and scanning continues.
//
// The width of the first record (a header row included) is the width every
// later record must have.
class RecordTokenizer {
public:
  RecordTokenizer(const TokenizerConfig& cfg, LineSource& src);

  RecordTokenizer(const RecordTokenizer&) = delete;
  RecordTokenizer& operator=(const RecordTokenizer&) = delete;

  // Reads the next record into `out`, replacing its contents with a freshly
  // allocated record the caller owns.
  ReadStatus next(Record& out);

  // Reads the next record into the tokenizer's scratch record and points `out`
  // at it. The view is valid only until the next call on this tokenizer; copy
  // it (RecordView::to_record) to keep it. Requires cfg.reuse_buffer.
  ReadStatus next_borrowed(RecordView& out);

  const ReadError& error() const noexcept { return err_; }
  const TokenizerConfig& config() const noexcept { return cfg_; }

  // 0 until the first record has been read.
  std::size_t expected_width() const noexcept { return width_; }
  std::uint64_t records() const noexcept { return records_; }
  std::uint64_t physical_lines() const noexcept { return lines_; }

private:
  ReadStatus read_into(Record& out);
  bool skip_leading();
  bool fetch(std::string& line);
  ReadStatus fail_io();

  TokenizerConfig cfg_;
  LineSource& src_;
  ReadError err_;

  std::string line_;   // current logical line, grows on continuation
  std::string next_;   // continuation line
  std::string field_;  // field accumulator
  Record scratch_;

  std::size_t width_{0};
  std::uint64_t records_{0};
  std::uint64_t lines_{0};
  bool skipped_{false};
};

}
