#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include "row_reader/encoding.hpp"
#include "row_reader/errors.hpp"
#include "row_reader/header_index.hpp"
#include "row_reader/record_view.hpp"

namespace rr {

class LineSource;
class RecordTokenizer;
class RowView;

struct ReaderConfig {
  char delimiter = ',';
  char escape    = '"';
  std::size_t skip_lines = 0;
  bool reuse_buffer = false;          // callbacks get the scratch record; copy to keep
  Encoding encoding = Encoding::Utf8; // raw byte sources only (stream, file)
};

// Owns a line source and a tokenizer over it, and adds the bulk helpers.
class CsvReader {
public:
  using RecordCallback = std::function<void(const RecordView&)>;
  using RowCallback    = std::function<void(const RowView&)>;

  CsvReader(std::unique_ptr<LineSource> src, const ReaderConfig& cfg = {});
  ~CsvReader();

  CsvReader(const CsvReader&) = delete;
  CsvReader& operator=(const CsvReader&) = delete;

  static std::unique_ptr<CsvReader> from_string(std::string text, const ReaderConfig& cfg = {});
  static std::unique_ptr<CsvReader> from_stream(std::istream& in, const ReaderConfig& cfg = {});
  static std::unique_ptr<CsvReader> from_file(std::string path, const ReaderConfig& cfg = {});

  // Reads the next record as the header row. False at end of input or on error.
  bool header_index(HeaderIndex& out);

  // Each remaining record, in order. Stops at the first error.
  bool for_each(const RecordCallback& cb);
  bool for_each_row(const HeaderIndex& header, const RowCallback& cb);

  // Appends every remaining record to `out`.
  bool read_all(std::vector<Record>& out);

  ReadStatus next(Record& out);

  // Details of the last failed read; kind None when a call stopped at end of input.
  const ReadError& error() const noexcept;
  RecordTokenizer& tokenizer() noexcept;
  std::uint64_t bytes_read() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
