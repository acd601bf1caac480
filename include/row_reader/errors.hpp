#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace rr {

enum class ReadStatus { Ok, End, Error };

enum class ErrorKind { None, IoFailure, RowWidthMismatch, InvalidState };

const char* to_string(ErrorKind k) noexcept;

// Failure of a tokenizer read. `expected_width`/`actual_width` are set for
// RowWidthMismatch, `sys_errno` for IoFailure (0 when unknown).
struct ReadError {
  ErrorKind kind = ErrorKind::None;
  std::string message;
  std::size_t expected_width = 0;
  std::size_t actual_width = 0;
  std::uint64_t line = 0;
  int sys_errno = 0;

  bool ok() const noexcept { return kind == ErrorKind::None; }
  void clear() { *this = ReadError{}; }
};

// A typed accessor could not interpret a column's text.
struct FieldParseError {
  std::string column;
  std::string raw;
  std::string type_name; // "Integer", "Double", "Date", "Money", "Enum"

  std::string message() const;
};

}
