#include "row_reader/record_tokenizer.hpp"
#include "row_reader/line_source.hpp"
#include <cstring>
#include <string>

namespace rr {

RecordTokenizer::RecordTokenizer(const TokenizerConfig& cfg, LineSource& src)
  : cfg_(cfg), src_(src) {}

bool RecordTokenizer::fetch(std::string& line) {
  if (!src_.read_line(line)) return false;
  ++lines_;
  return true;
}

bool RecordTokenizer::skip_leading() {
  skipped_ = true;
  for (std::size_t i = 0; i < cfg_.skip_lines; ++i) {
    if (!fetch(line_)) return !src_.failed();
  }
  return true;
}

ReadStatus RecordTokenizer::fail_io() {
  err_.clear();
  err_.kind = ErrorKind::IoFailure;
  err_.sys_errno = src_.last_error();
  err_.line = lines_ + 1;
  err_.message = std::string("read failed at line ") + std::to_string(err_.line) + ": " +
                 std::strerror(err_.sys_errno);
  return ReadStatus::Error;
}

ReadStatus RecordTokenizer::read_into(Record& out) {
  err_.clear();
  if (!skipped_ && !skip_leading()) return fail_io();
  if (!fetch(line_)) return src_.failed() ? fail_io() : ReadStatus::End;

  std::size_t n = 0;
  auto push_field = [&] {
    if (n < out.size()) out[n].assign(field_);
    else out.emplace_back(field_);
    ++n;
    field_.clear();
  };

  enum class Mode { Unquoted, Quoted } mode = Mode::Unquoted;
  field_.clear();

  // line_ may grow inside the loop when a quoted field spans lines.
  for (std::size_t i = 0; i < line_.size(); ++i) {
    const char c = line_[i];
    const bool last = (i + 1 == line_.size());

    if (c == cfg_.escape) {
      if (mode == Mode::Quoted) {
        // Only closes before a delimiter or at end of line.
        if (last || line_[i + 1] == cfg_.delimiter) mode = Mode::Unquoted;
      } else {
        mode = Mode::Quoted;
      }
    } else if (mode == Mode::Unquoted && c == cfg_.delimiter) {
      push_field();
    } else {
      field_.push_back(c);
    }

    if (last && mode == Mode::Quoted) {
      if (fetch(next_)) {
        line_.push_back('\n');
        line_.append(next_);
      } else if (src_.failed()) {
        return fail_io();
      }
    }
  }
  push_field();
  out.resize(n);

  if (width_ == 0) {
    width_ = n;
  } else if (n != width_) {
    err_.kind = ErrorKind::RowWidthMismatch;
    err_.expected_width = width_;
    err_.actual_width = n;
    err_.line = lines_;
    err_.message = "Found a row with " + std::to_string(n) +
                   " elements when we previously saw a row with " + std::to_string(width_) +
                   " elements.";
    return ReadStatus::Error;
  }
  ++records_;
  return ReadStatus::Ok;
}

ReadStatus RecordTokenizer::next(Record& out) {
  Record rec;
  rec.reserve(width_);
  ReadStatus st = read_into(rec);
  if (st == ReadStatus::Ok) out = std::move(rec);
  return st;
}

ReadStatus RecordTokenizer::next_borrowed(RecordView& out) {
  if (!cfg_.reuse_buffer) {
    err_.clear();
    err_.kind = ErrorKind::InvalidState;
    err_.message = "borrowed reads require reuse_buffer";
    return ReadStatus::Error;
  }
  ReadStatus st = read_into(scratch_);
  if (st == ReadStatus::Ok) out = RecordView(&scratch_);
  return st;
}

}
