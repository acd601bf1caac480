#pragma once
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>

#include "row_reader/encoding.hpp"

namespace rr {

// Supplies physical lines, terminator ("\n" or "\r\n") removed.
class LineSource {
public:
  virtual ~LineSource() = default;

  // Returns false at end of input or on failure; failed() tells them apart.
  virtual bool read_line(std::string& out) = 0;

  // errno-style code of the last failure, 0 if none.
  virtual int last_error() const noexcept = 0;
  virtual std::uint64_t bytes_read() const noexcept = 0;

  bool failed() const noexcept { return last_error() != 0; }
};

// In-memory text. Already decoded, so no encoding step.
class StringLineSource : public LineSource {
public:
  explicit StringLineSource(std::string text);

  bool read_line(std::string& out) override;
  int last_error() const noexcept override { return 0; }
  std::uint64_t bytes_read() const noexcept override { return pos_; }

private:
  std::string text_;
  std::size_t pos_{0};
};

// Wraps a caller-owned stream, which must outlive the source.
class StreamLineSource : public LineSource {
public:
  explicit StreamLineSource(std::istream& in, Encoding enc = Encoding::Utf8);

  bool read_line(std::string& out) override;
  int last_error() const noexcept override { return err_; }
  std::uint64_t bytes_read() const noexcept override { return bytes_; }

private:
  std::istream& in_;
  Encoding enc_;
  int err_{0};
  std::uint64_t bytes_{0};
  bool first_{true};
};

std::unique_ptr<LineSource> make_string_source(std::string text);
std::unique_ptr<LineSource> make_stream_source(std::istream& in, Encoding enc = Encoding::Utf8);

}
