#include "row_reader/chunk_reader.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string_view>
#include <vector>

namespace rr {

struct ChunkReader::Impl {
  std::string path;
  Config cfg;
  FILE* f{nullptr};
  bool opened{false};
  bool eof{false};
  bool first_line{true};
  int last_errno{0};
  std::uint64_t bytes{0};

  std::vector<char> buf;
  std::size_t pos{0}, len{0};

  ~Impl() { if (f) std::fclose(f); }

  bool open() {
    opened = true;
    f = std::fopen(path.c_str(), "rb");
    if (!f) { last_errno = errno ? errno : ENOENT; return false; }
    buf.assign(cfg.chunk_bytes ? cfg.chunk_bytes : 1, 0);
    return true;
  }

  // Refill the chunk buffer. False on EOF or read error.
  bool fill() {
    std::size_t n = std::fread(buf.data(), 1, buf.size(), f);
    if (n == 0) {
      if (std::ferror(f)) last_errno = errno ? errno : EIO;
      eof = true;
      return false;
    }
    bytes += n;
    pos = 0; len = n;
    return true;
  }

  bool emit(std::string& out) {
    if (cfg.strip_cr && !out.empty() && out.back() == '\r') out.pop_back();
    decode_line(out, cfg.encoding, first_line);
    first_line = false;
    return true;
  }

  bool read_line(std::string& out) {
    if (last_errno) return false;
    if (!opened && !open()) return false;
    if (!f) return false;

    out.clear();
    bool have_any = false;
    while (true) {
      if (pos >= len) {
        if (eof || !fill()) {
          if (last_errno) return false;
          return have_any ? emit(out) : false;
        }
      }
      std::string_view block(buf.data() + pos, len - pos);
      std::size_t nl = block.find('\n');
      std::string_view slice = (nl == std::string_view::npos) ? block : block.substr(0, nl);

      if (out.size() + slice.size() > cfg.max_line_bytes) {
        last_errno = EFBIG;
        return false;
      }
      out.append(slice.data(), slice.size());
      have_any = true;

      if (nl != std::string_view::npos) {
        pos += nl + 1;
        return emit(out);
      }
      pos = len;
    }
  }
};

ChunkReader::ChunkReader(std::string path)
  : ChunkReader(std::move(path), Config{}) {}

ChunkReader::ChunkReader(std::string path, Config cfg)
  : p_(new Impl{std::move(path), cfg}) {}

ChunkReader::~ChunkReader() { delete p_; }

bool ChunkReader::read_line(std::string& out) { return p_->read_line(out); }
int  ChunkReader::last_error() const noexcept { return p_->last_errno; }
std::uint64_t ChunkReader::bytes_read() const noexcept { return p_->bytes; }
const std::string& ChunkReader::path() const noexcept { return p_->path; }

std::unique_ptr<LineSource> make_file_source(std::string path, Encoding enc) {
  ChunkReader::Config cfg;
  cfg.encoding = enc;
  return std::make_unique<ChunkReader>(std::move(path), cfg);
}

}
