#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "row_reader/chunk_reader.hpp"
#include "row_reader/header_index.hpp"
#include "row_reader/record_tokenizer.hpp"
#include "row_reader/row_view.hpp"

namespace fs = std::filesystem;
using clk = std::chrono::steady_clock;

static std::string make_synth_csv(std::size_t rows, std::size_t cols) {
  fs::path p = fs::temp_directory_path() / "rr_bench_synth.csv";
  std::ofstream out(p, std::ios::binary);
  // header
  for (size_t c = 0; c < cols; ++c) { out << "col" << c; if (c+1<cols) out << ","; }
  out << "\n";
  // rows; every 16th row carries a quoted field with a delimiter and a newline
  for (size_t r = 0; r < rows; ++r) {
    for (size_t c = 0; c < cols; ++c) {
      if (c == 1 && (r % 16) == 0) out << "\"note " << r << ",\nwrapped\"";
      else out << (r%10) << "." << (c*37%1000);
      if (c+1<cols) out << ",";
    }
    out << "\n";
  }
  out.flush();
  return p.string();
}

struct Args {
  std::string csv_path;        // if empty -> synth
  std::size_t rows = 200'000;  // for synth
  std::size_t cols = 8;        // for synth
  int iters = 3;
};

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i=1;i<argc;++i){
    std::string s(argv[i]);
    auto eq = s.find('=');
    auto key = s.substr(0, eq);
    auto val = (eq==std::string::npos) ? "" : s.substr(eq+1);
    if (key=="--csv") a.csv_path = val;
    else if (key=="--rows") a.rows = std::stoull(val);
    else if (key=="--cols") a.cols = std::stoull(val);
    else if (key=="--iters") a.iters = std::stoi(val);
    else if (key=="--help" || key=="-h") {
      std::cout <<
        "Usage: rr_bench_tokenizer [--csv=path] [--rows=N] [--cols=M] [--iters=K]\n"
        "If the path is omitted, a synthetic CSV is generated.\n";
      std::exit(0);
    }
  }
  return a;
}

static void report(const char* mode, int k, std::uint64_t nrec, std::uint64_t bytes, double sec) {
  const double mib = bytes / (1024.0*1024.0);
  std::cout << "  [" << mode << "] iter " << k
            << ": rows=" << nrec
            << " bytes=" << bytes
            << " time=" << sec << "s"
            << "  throughput=" << (mib/sec) << " MiB/s"
            << "  rows/s=" << (nrec/sec) << "\n";
}

// Owned records vs. the reuse_buffer scratch record, plus one typed read per row.
static void bench_csv(const std::string& path, int iters) {
  std::cout << "\n[CSV] file=" << path << " iters=" << iters << "\n";
  for (int k=1;k<=iters;++k) {
    for (bool reuse : {false, true}) {
      rr::ChunkReader rd(path);
      rr::TokenizerConfig cfg;
      cfg.reuse_buffer = reuse;
      rr::RecordTokenizer tok(cfg, rd);
      rr::HeaderIndex header;
      if (rr::read_header_index(tok, header) != rr::ReadStatus::Ok) {
        std::cerr << "[bench] header: " << tok.error().message << "\n";
        return;
      }

      std::uint64_t nrec=0;
      double sum = 0.0;
      auto t0 = clk::now();
      rr::Record owned;
      rr::RecordView view;
      while (true) {
        rr::ReadStatus st = reuse ? tok.next_borrowed(view) : tok.next(owned);
        if (st != rr::ReadStatus::Ok) {
          if (st == rr::ReadStatus::Error) std::cerr << "[bench] " << tok.error().message << "\n";
          break;
        }
        if (!reuse) view = rr::RecordView(&owned);
        rr::RowView row(view, header);
        if (auto v = row.get_double("col0")) sum += *v;
        ++nrec;
      }
      auto t1 = clk::now();
      report(reuse ? "reuse" : "owned", k, nrec, rd.bytes_read(), std::chrono::duration<double>(t1-t0).count());
      if (sum < 0) std::cout << sum;  // keep the reads alive
    }
  }
}

int main(int argc, char** argv){
  Args a = parse_args(argc, argv);

  std::string csv = a.csv_path;
  if (csv.empty() || !fs::exists(csv)) csv = make_synth_csv(a.rows, a.cols);
  bench_csv(csv, a.iters);
  return 0;
}
