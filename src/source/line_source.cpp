#include "row_reader/line_source.hpp"
#include <cerrno>
#include <istream>
#include <string_view>

namespace rr {

StringLineSource::StringLineSource(std::string text) : text_(std::move(text)) {}

bool StringLineSource::read_line(std::string& out) {
  if (pos_ >= text_.size()) return false;
  std::size_t nl = text_.find('\n', pos_);
  std::size_t end = (nl == std::string::npos) ? text_.size() : nl;
  std::string_view line(text_.data() + pos_, end - pos_);
  if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
  out.assign(line.data(), line.size());
  pos_ = (nl == std::string::npos) ? text_.size() : nl + 1;
  return true;
}

StreamLineSource::StreamLineSource(std::istream& in, Encoding enc) : in_(in), enc_(enc) {}

bool StreamLineSource::read_line(std::string& out) {
  if (err_) return false;
  if (!std::getline(in_, out)) {
    if (in_.bad()) err_ = EIO;
    return false;
  }
  bytes_ += out.size() + (in_.eof() ? 0 : 1);
  if (!out.empty() && out.back() == '\r') out.pop_back();
  decode_line(out, enc_, first_);
  first_ = false;
  return true;
}

std::unique_ptr<LineSource> make_string_source(std::string text) {
  return std::make_unique<StringLineSource>(std::move(text));
}

std::unique_ptr<LineSource> make_stream_source(std::istream& in, Encoding enc) {
  return std::make_unique<StreamLineSource>(in, enc);
}

}
