#include "row_reader/csv_reader.hpp"
#include "row_reader/chunk_reader.hpp"
#include "row_reader/line_source.hpp"
#include "row_reader/record_tokenizer.hpp"
#include "row_reader/row_view.hpp"

namespace rr {

static TokenizerConfig tokenizer_config(const ReaderConfig& cfg) {
  TokenizerConfig t;
  t.delimiter = cfg.delimiter;
  t.escape = cfg.escape;
  t.reuse_buffer = cfg.reuse_buffer;
  t.skip_lines = cfg.skip_lines;
  return t;
}

struct CsvReader::Impl {
  std::unique_ptr<LineSource> src;
  RecordTokenizer tok;

  Impl(std::unique_ptr<LineSource> s, const ReaderConfig& cfg)
    : src(std::move(s)), tok(tokenizer_config(cfg), *src) {}

  // Pulls one record as a view, owned or borrowed depending on the mode.
  ReadStatus pull(Record& owned, RecordView& view) {
    if (tok.config().reuse_buffer) return tok.next_borrowed(view);
    ReadStatus st = tok.next(owned);
    if (st == ReadStatus::Ok) view = RecordView(&owned);
    return st;
  }
};

CsvReader::CsvReader(std::unique_ptr<LineSource> src, const ReaderConfig& cfg)
  : p_(new Impl(std::move(src), cfg)) {}

CsvReader::~CsvReader() { delete p_; }

std::unique_ptr<CsvReader> CsvReader::from_string(std::string text, const ReaderConfig& cfg) {
  return std::make_unique<CsvReader>(make_string_source(std::move(text)), cfg);
}

std::unique_ptr<CsvReader> CsvReader::from_stream(std::istream& in, const ReaderConfig& cfg) {
  return std::make_unique<CsvReader>(make_stream_source(in, cfg.encoding), cfg);
}

std::unique_ptr<CsvReader> CsvReader::from_file(std::string path, const ReaderConfig& cfg) {
  return std::make_unique<CsvReader>(make_file_source(std::move(path), cfg.encoding), cfg);
}

bool CsvReader::header_index(HeaderIndex& out) {
  return read_header_index(p_->tok, out) == ReadStatus::Ok;
}

bool CsvReader::for_each(const RecordCallback& cb) {
  Record owned;
  RecordView view;
  while (true) {
    ReadStatus st = p_->pull(owned, view);
    if (st == ReadStatus::End) return true;
    if (st == ReadStatus::Error) return false;
    cb(view);
  }
}

bool CsvReader::for_each_row(const HeaderIndex& header, const RowCallback& cb) {
  return for_each([&](const RecordView& rec) { cb(RowView(rec, header)); });
}

bool CsvReader::read_all(std::vector<Record>& out) {
  return for_each([&](const RecordView& rec) { out.push_back(rec.to_record()); });
}

ReadStatus CsvReader::next(Record& out) { return p_->tok.next(out); }

const ReadError& CsvReader::error() const noexcept { return p_->tok.error(); }
RecordTokenizer& CsvReader::tokenizer() noexcept { return p_->tok; }
std::uint64_t CsvReader::bytes_read() const noexcept { return p_->src->bytes_read(); }

}
