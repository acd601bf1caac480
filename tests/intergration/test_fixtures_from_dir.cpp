#include "row_reader/csv_reader.hpp"
#include "row_reader/header_index.hpp"
#include "row_reader/path_utils.hpp"
#include "row_reader/record_tokenizer.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

// Fixtures named *bad* must fail; every other fixture must read to the end.
static bool expected_ok_for(const fs::path& p) {
  const std::string n = p.filename().string();
  if (n.find("bad") != std::string::npos) return false;
  if (n.find("malformed") != std::string::npos) return false;
  return true;
}

static std::string show_snippet(std::string_view s, size_t max = 180) {
  std::string out; out.reserve(s.size());
  auto push_hex = [&](unsigned char c){
    const char *hex = "0123456789ABCDEF";
    out += "\\x"; out += hex[c>>4]; out += hex[c&0xF];
  };
  for (unsigned char c : s) {
    if (c == '\n') { out += "\\n"; }
    else if (c == '\r') { out += "\\r"; }
    else if (c == '\t') { out += "\\t"; }
    else if (c < 0x20 || c == 0x7f) { push_hex(c); }
    else { out.push_back(static_cast<char>(c)); }
    if (out.size() >= max) { out += "..."; break; }
  }
  return out;
}

struct Res {
  bool ok{true};
  uint64_t rows{0};
  uint64_t bytes{0};
  uint64_t width{0};
  uint64_t fail_line{0};
  std::string last_row;
  std::string err;
};

static Res run_csv(const fs::path& f){
  Res r;
  rr::ReaderConfig cfg;
  cfg.delimiter = rr::default_delimiter(rr::detect_format(f.string()));
  auto reader = rr::CsvReader::from_file(f.string(), cfg);

  rr::HeaderIndex header;
  bool ok = reader->header_index(header);
  if (ok) {
    ok = reader->for_each([&](const rr::RecordView& rec){
      ++r.rows;
      std::string joined;
      for (size_t i = 0; i < rec.size(); ++i) { if (i) joined += ','; joined += rec.at(i); }
      r.last_row = show_snippet(joined);
    });
  }
  if (!ok && !reader->error().ok()) {
    r.err = reader->error().message;
    r.fail_line = reader->error().line;
  }
  r.ok = ok;
  r.bytes = reader->bytes_read();
  r.width = reader->tokenizer().expected_width();
  return r;
}

int main(int argc, char** argv){
  fs::path dir = (argc > 1) ? fs::path(argv[1]) : fs::path("tests/data");
  if (!fs::exists(dir)) {
    std::cerr << "[ERR] fixtures dir not found: " << dir << "\n";
    return 2;
  }

  size_t total=0, passed=0, failed=0;
  for (auto& it : fs::directory_iterator(dir)) {
    if (!it.is_regular_file()) continue;
    const fs::path p = it.path();
    if (rr::detect_format(p.string()) == rr::FileFormat::Unknown) continue;

    Res r = run_csv(p);

    const bool expect_ok = expected_ok_for(p);
    const bool verdict = (r.ok == expect_ok);

    ++total; verdict ? ++passed : ++failed;

    if (verdict) {
      std::cout << "[PASS] " << p.filename().string()
                << "  rows=" << r.rows
                << "  width=" << r.width
                << "  bytes=" << r.bytes
                << "  expected_ok=" << (expect_ok?"true":"false") << "\n";
    } else {
      std::cout << "[FAIL] " << p.filename().string()
                << "  rows=" << r.rows
                << "  bytes=" << r.bytes
                << "  expected_ok=" << (expect_ok?"true":"false")
                << "  actual_ok=" << (r.ok?"true":"false") << "\n";
      if (!r.err.empty())
        std::cout << "       error: " << r.err << "\n";
      if (r.fail_line)
        std::cout << "       at line " << r.fail_line << "\n";
      if (!r.last_row.empty())
        std::cout << "       last row: " << r.last_row << "\n";
    }
  }

  std::cout << "\nSummary: total=" << total << " passed=" << passed << " failed=" << failed << "\n";
  return (failed == 0 && total > 0) ? 0 : 1;
}
