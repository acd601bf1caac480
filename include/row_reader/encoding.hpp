#pragma once
#include <string>
#include <string_view>

namespace rr {

// Byte encoding of a raw input source. Lines are always handed out as UTF-8.
enum class Encoding { Utf8, Latin1 };

bool parse_encoding(std::string_view name, Encoding& out);

// Append ISO-8859-1 bytes to `out` as UTF-8.
void latin1_to_utf8(std::string_view in, std::string& out);

// Drop a leading EF BB BF. Returns true if one was removed.
bool strip_utf8_bom(std::string& line);

// Bring one raw physical line to UTF-8 in place.
void decode_line(std::string& line, Encoding enc, bool first_line);

}
