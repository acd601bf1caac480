#include "row_reader/errors.hpp"

namespace rr {

const char* to_string(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::None:             return "none";
    case ErrorKind::IoFailure:        return "io_failure";
    case ErrorKind::RowWidthMismatch: return "row_width_mismatch";
    case ErrorKind::InvalidState:     return "invalid_state";
  }
  return "unknown";
}

std::string FieldParseError::message() const {
  return "Couldn't parse '" + raw + "' as " + type_name + ", for " + column + " column.";
}

}
