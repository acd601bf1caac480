#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "row_reader/encoding.hpp"
#include "row_reader/line_source.hpp"

namespace rr {

// File-backed line source reading fixed-size chunks with fread.
class ChunkReader : public LineSource {
public:
  struct Config {
    std::size_t chunk_bytes    = 512 * 1024;       // 512 KiB
    std::size_t max_line_bytes = 8 * 1024 * 1024;  // 8 MiB guard per physical line
    bool        strip_cr       = true;             // trim trailing '\r' (CRLF)
    Encoding    encoding       = Encoding::Utf8;
  };

  explicit ChunkReader(std::string path);      // uses default Config{}
  ChunkReader(std::string path, Config cfg);   // explicit Config
  ~ChunkReader() override;

  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;

  // Opens the file on first use. A line longer than max_line_bytes fails with EFBIG.
  bool read_line(std::string& out) override;

  int  last_error() const noexcept override;
  std::uint64_t bytes_read() const noexcept override;
  const std::string& path() const noexcept;

private:
  struct Impl; Impl* p_;
};

std::unique_ptr<LineSource> make_file_source(std::string path, Encoding enc = Encoding::Utf8);

}
