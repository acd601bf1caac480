#include "row_reader/chunk_reader.hpp"
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static fs::path write_tmp(const char* name, const std::string& bytes) {
  fs::path p = fs::temp_directory_path() / name;
  std::ofstream out(p, std::ios::binary);
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  return p;
}

static std::vector<std::string> all_lines(rr::LineSource& src) {
  std::vector<std::string> v; std::string s;
  while (src.read_line(s)) v.push_back(s);
  return v;
}

int main(){
  // Lines straddle chunk boundaries with a tiny chunk size.
  const std::string body = "id,name\r\n1,alpha\r\n2,\"be\nta\"\r\n3,gamma";
  fs::path f = write_tmp("rr_chunk_reader.csv", body);
  rr::ChunkReader::Config cfg;
  cfg.chunk_bytes = 4;
  rr::ChunkReader r(f.string(), cfg);
  auto lines = all_lines(r);
  const std::vector<std::string> want = {"id,name", "1,alpha", "2,\"be", "ta\"", "3,gamma"};
  if (lines != want) {
    std::cerr << "[FAIL] chunked lines mismatch, got " << lines.size() << " lines\n";
    for (auto& l : lines) std::cerr << "       '" << l << "'\n";
    return 1;
  }
  if (r.failed() || r.bytes_read() != body.size()) {
    std::cerr << "[FAIL] bytes_read=" << r.bytes_read() << " expected " << body.size() << "\n";
    return 1;
  }

  // Trailing newline does not produce an extra empty line; blank lines survive.
  fs::path g = write_tmp("rr_chunk_blank.csv", "a\n\nb\n");
  rr::ChunkReader rg(g.string());
  if (all_lines(rg) != std::vector<std::string>{"a", "", "b"}) {
    std::cerr << "[FAIL] blank line handling\n"; return 1;
  }

  // BOM dropped, Latin-1 transcoded.
  fs::path h = write_tmp("rr_chunk_bom.csv", "\xEF\xBB\xBFid\nx\n");
  rr::ChunkReader rh(h.string());
  auto bl = all_lines(rh);
  if (bl.empty() || bl[0] != "id") { std::cerr << "[FAIL] BOM not stripped\n"; return 1; }

  fs::path l = write_tmp("rr_chunk_latin1.csv", "caf\xE9\n");
  rr::ChunkReader::Config lc; lc.encoding = rr::Encoding::Latin1;
  rr::ChunkReader rl(l.string(), lc);
  auto ll = all_lines(rl);
  if (ll.size() != 1 || ll[0] != "caf\xC3\xA9") { std::cerr << "[FAIL] latin1 transcoding\n"; return 1; }

  // Line guard and missing file are failures, not end of input.
  rr::ChunkReader::Config small; small.max_line_bytes = 3;
  rr::ChunkReader rs(f.string(), small);
  std::string s;
  if (rs.read_line(s) || rs.last_error() != EFBIG) { std::cerr << "[FAIL] line guard\n"; return 1; }

  rr::ChunkReader missing((fs::temp_directory_path() / "rr_does_not_exist.csv").string());
  if (missing.read_line(s) || !missing.failed()) { std::cerr << "[FAIL] missing file not reported\n"; return 1; }

  std::cout << "[PASS] chunk_reader lines=" << lines.size() << " bytes=" << r.bytes_read() << "\n";
  return 0;
}
