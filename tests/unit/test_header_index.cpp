#include "row_reader/header_index.hpp"
#include "row_reader/line_source.hpp"
#include "row_reader/record_tokenizer.hpp"
#include <iostream>

int main(){
  int bad = 0;
  auto fail = [&](const char* what){ ++bad; std::cerr << "[FAIL] " << what << "\n"; };

  rr::StringLineSource src("id,name,id,amount\n1,a,9,2\n");
  rr::RecordTokenizer tok({}, src);
  rr::HeaderIndex h;
  if (rr::read_header_index(tok, h) != rr::ReadStatus::Ok) fail("header read");
  if (tok.records() != 1) fail("header consumes exactly one record");

  // duplicate "id": last occurrence wins, names() keeps all cells
  if (h.find("id") != std::optional<std::size_t>(2)) fail("duplicate name maps to last position");
  if (h.find("name") != std::optional<std::size_t>(1)) fail("name -> 1");
  if (h.find("amount") != std::optional<std::size_t>(3)) fail("amount -> 3");
  if (h.find("missing").has_value()) fail("unknown name not found");
  if (h.size() != 3) fail("three distinct names");
  if (h.names().size() != 4 || h.names()[0] != "id" || h.names()[3] != "amount") fail("names keep file order");

  // header width binds the data rows
  if (tok.expected_width() != 4) fail("header sets expected width");
  rr::Record row;
  if (tok.next(row) != rr::ReadStatus::Ok || row.size() != 4) fail("data row after header");

  // end of input: empty index, End status
  rr::StringLineSource empty("");
  rr::RecordTokenizer tok2({}, empty);
  rr::HeaderIndex h2;
  if (rr::read_header_index(tok2, h2) != rr::ReadStatus::End || !h2.empty()) fail("empty input -> End");

  auto h3 = rr::HeaderIndex::from_record({"a", "b"});
  if (!h3.contains("b") || h3.contains("c")) fail("from_record");

  // reuse mode: the header is indexed from the scratch view, then the scratch
  // is overwritten by the next row without disturbing the index
  rr::StringLineSource src4("k,v,k\nx,y,z\n");
  rr::TokenizerConfig reuse;
  reuse.reuse_buffer = true;
  rr::RecordTokenizer tok4(reuse, src4);
  rr::HeaderIndex h4;
  if (rr::read_header_index(tok4, h4) != rr::ReadStatus::Ok) fail("reuse header read");
  rr::RecordView v;
  if (tok4.next_borrowed(v) != rr::ReadStatus::Ok || v.at(0) != "x") fail("reuse data row");
  if (h4.find("k") != std::optional<std::size_t>(2) || h4.names()[0] != "k") fail("reuse header survives scratch reuse");

  const rr::Record hdr{"p", "q"};
  auto h5 = rr::HeaderIndex::from_view(rr::RecordView(&hdr));
  if (h5.find("q") != std::optional<std::size_t>(1) || h5.size() != 2) fail("from_view");

  if (bad) { std::cerr << "[FAIL] header_index: " << bad << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] header_index\n";
  return 0;
}
