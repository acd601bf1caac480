#include "row_reader/artifact_writer.hpp"
#include "row_reader/csv_reader.hpp"
#include "row_reader/enum_table.hpp"
#include "row_reader/header_index.hpp"
#include "row_reader/metrics.hpp"
#include "row_reader/path_utils.hpp"
#include "row_reader/record_tokenizer.hpp"
#include "row_reader/row_view.hpp"
#include "row_reader/run_json.hpp"
#include "row_reader/value_parse.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

enum class ValueType { Int, Double, IsoDate, ExcelDate, Money };

const rr::EnumTable<ValueType>& value_types() {
  static const rr::EnumTable<ValueType> t("ValueType", {
    {"int", ValueType::Int},
    {"double", ValueType::Double},
    {"iso_date", ValueType::IsoDate},
    {"excel_date", ValueType::ExcelDate},
    {"money", ValueType::Money},
  });
  return t;
}

struct Expect {
  std::string column;
  ValueType type = ValueType::Int;
};

struct Cli {
  std::string artifact_root = "artifacts/row-reader";
  std::string slug_mode = "hashprefix"; // hashprefix|basename|keypath
  int slug_len = 8;
  std::vector<std::string> scans; // explicit file paths
  rr::ReaderConfig reader;
  bool delimiter_set = false;
  bool warn_missing = false;
  int max_error_lines = 20;
  std::vector<Expect> expects;
};

void usage(std::ostream& o) {
  o <<
    "Usage: row-reader --scan <file> [--scan <file>...]\n"
    "                  [--delimiter=C] [--escape=C] [--skip-lines=N]\n"
    "                  [--encoding=utf8|latin1] [--reuse-buffer] [--warn-missing]\n"
    "                  [--expect=<column>:<int|double|iso_date|excel_date|money>]...\n"
    "                  [--max-error-lines=N] [--artifact-root=DIR]\n"
    "                  [--slug-mode=hashprefix|basename|keypath] [--slug-len=N]\n";
}

[[noreturn]] void bad_arg(const std::string& a, const char* why) {
  std::cerr << "[cli] " << why << ": " << a << "\n";
  usage(std::cerr);
  std::exit(64);
}

// "tab" and "\t" spell a tab; anything else must be one character.
bool parse_char(const std::string& v, char& out) {
  if (v == "tab" || v == "\\t") { out = '\t'; return true; }
  if (v.size() != 1) return false;
  out = v[0];
  return true;
}

Cli parse_cli(int argc, char** argv) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_i = [&](const char* pfx, int* out){
      if (a.rfind(pfx, 0) != 0) return false;
      auto v = rr::parse_int(a.substr(std::string(pfx).size()));
      if (!v || *v < 0) bad_arg(a, "expected a non-negative integer");
      *out = *v;
      return true;
    };
    std::string v;
    int n = 0;
    if (eat("--artifact-root=", &c.artifact_root)) continue;
    if (eat("--slug-mode=", &c.slug_mode)) continue;
    if (eat_i("--slug-len=", &c.slug_len)) continue;
    if (eat_i("--max-error-lines=", &c.max_error_lines)) continue;
    if (eat_i("--skip-lines=", &n)) { c.reader.skip_lines = static_cast<std::size_t>(n); continue; }
    if (eat("--delimiter=", &v)) {
      if (!parse_char(v, c.reader.delimiter)) bad_arg(a, "delimiter must be one character");
      c.delimiter_set = true;
      continue;
    }
    if (eat("--escape=", &v)) {
      if (!parse_char(v, c.reader.escape)) bad_arg(a, "escape must be one character");
      continue;
    }
    if (eat("--encoding=", &v)) {
      if (!rr::parse_encoding(v, c.reader.encoding)) bad_arg(a, "unknown encoding");
      continue;
    }
    if (eat("--expect=", &v)) {
      auto colon = v.rfind(':');
      if (colon == std::string::npos || colon == 0) bad_arg(a, "expected <column>:<type>");
      auto t = value_types().find(v.substr(colon + 1));
      if (!t) bad_arg(a, "unknown type");
      c.expects.push_back(Expect{v.substr(0, colon), *t});
      continue;
    }
    if (a == "--reuse-buffer") { c.reader.reuse_buffer = true; continue; }
    if (a == "--warn-missing") { c.warn_missing = true; continue; }
    if (a == "--scan" && i+1 < argc) { c.scans.push_back(argv[++i]); continue; }
    if (a.rfind("--scan=",0)==0) { c.scans.push_back(a.substr(7)); continue; }
    if (a == "-h" || a == "--help") {
      usage(std::cout);
      std::exit(0);
    }
    bad_arg(a, "unknown argument");
  }
  return c;
}

std::string make_slug_for(const std::string& path, const std::string& mode, int len) {
  // For hashprefix mode, hash the full absolute path to be stable across cwd.
  std::string key = (mode == "hashprefix")
      ? std::filesystem::weakly_canonical(std::filesystem::path(path)).string()
      : path;
  return rr::make_slug(key, mode, len);
}

// Empty cells count as nulls, not failures.
bool check_value(const rr::RowView& row, const Expect& e, rr::FieldParseError& err) {
  if (row.get_raw(e.column).empty()) return true;
  switch (e.type) {
    case ValueType::Int:       return row.get_int(e.column, &err).has_value();
    case ValueType::Double:    return row.get_double(e.column, &err).has_value();
    case ValueType::IsoDate:   return row.get_iso_date(e.column, &err).has_value();
    case ValueType::ExcelDate: return row.get_excel_date(e.column, &err).has_value();
    case ValueType::Money:     return row.get_money(e.column, &err).has_value();
  }
  return true;
}

int scan_one_file(const std::string& filepath, const Cli& cli) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  const rr::FileFormat fmt = rr::detect_format(filepath);
  rr::ReaderConfig rcfg = cli.reader;
  if (!cli.delimiter_set) rcfg.delimiter = rr::default_delimiter(fmt);

  auto reader = rr::CsvReader::from_file(filepath, rcfg);
  rr::MetricsRegistry metrics;

  rr::RunJsonPayload p{};
  p.filename = filepath;
  p.content_type = (fmt == rr::FileFormat::TSV) ? "text/tab-separated-values" : "text/csv";
  std::error_code fec;
  p.file_size = std::filesystem::file_size(filepath, fec);

  // --- header
  rr::HeaderIndex header;
  metrics.start_stage("header");
  bool ok = reader->header_index(header);
  metrics.end_stage("header");
  header.set_warn_missing(cli.warn_missing);
  p.columns = header.names();

  for (const auto& e : cli.expects) {
    if (ok && !header.contains(e.column))
      std::cerr << "[scan] column not in header, reads as empty: " << e.column << "\n";
  }

  // --- rows
  if (ok) {
    int shown = 0;
    metrics.start_stage("tokenize");
    ok = reader->for_each_row(header, [&](const rr::RowView& row){
      metrics.add_row();
      for (const auto& e : cli.expects) {
        rr::FieldParseError err;
        if (check_value(row, e, err)) continue;
        metrics.add_field_error(e.column);
        if (shown < cli.max_error_lines) {
          ++shown;
          std::cerr << "[scan] line " << reader->tokenizer().physical_lines()
                    << ": " << err.message() << "\n";
        }
      }
    });
    metrics.end_stage("tokenize");
  }

  const rr::ReadError& rerr = reader->error();
  if (!ok && !rerr.ok()) {
    std::cerr << "[scan] CSV error: " << rerr.message << "\n";
    p.status = rr::to_string(rerr.kind);
    p.error = rerr.message;
  } else if (!ok) {
    std::cerr << "[scan] empty input: " << filepath << "\n";
    ok = true;
  }

  const auto t1 = ch::steady_clock::now();
  const double wall_ms = ch::duration<double, std::milli>(t1 - t0).count();

  metrics.set_bytes(reader->bytes_read());
  const rr::RunStats stats = metrics.snapshot(wall_ms);
  p.rows = stats.rows;
  p.bytes = stats.bytes;
  p.width = reader->tokenizer().expected_width();
  p.wall_time_ms = wall_ms;
  p.throughput_mb_s = stats.throughput_mb_s;
  p.rows_per_sec = stats.rows_per_sec;
  for (const auto& s : stats.stages) p.stage_times.emplace_back(s.name, s.duration_ms);
  p.errors_by_field = stats.errors_by_field;
  p.slug = make_slug_for(filepath, cli.slug_mode, cli.slug_len);

  const std::string run_json = rr::RunJsonWriter::to_json(p);

  std::string out_path, err;
  if (!rr::write_run_json(cli.artifact_root, p.slug, run_json, &out_path, &err)) {
    std::cerr << "[scan] write_run_json failed: " << err << "\n";
    return 2;
  }

  std::cout << "[scan] " << (ok ? "ok" : "failed") << ": " << filepath
            << " rows=" << stats.rows
            << " field_errors=" << metrics.field_errors()
            << " -> " << out_path << "\n";
  return ok ? 0 : 3;
}

}

int main(int argc, char** argv) {
  auto cli = parse_cli(argc, argv);
  if (cli.scans.empty()) {
    usage(std::cerr);
    return 64;
  }

  int rc = 0;
  for (const auto& f : cli.scans) {
    int r = scan_one_file(f, cli);
    if (r != 0 && rc == 0) rc = r;
  }
  return rc;
}
