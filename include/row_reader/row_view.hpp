#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "row_reader/date_parse.hpp"
#include "row_reader/enum_table.hpp"
#include "row_reader/errors.hpp"
#include "row_reader/header_index.hpp"
#include "row_reader/money.hpp"
#include "row_reader/record_view.hpp"

namespace rr {

// Typed, column-name-addressed access to one record.
//
// Holds pointers to the record and the header index; both must outlive the
// view and must not change while it is in use. Values are parsed on every
// call. Accessors that fail return nullopt and, if `err_out` is given, fill it
// with the column, raw text and target type.
class RowView {
public:
  RowView(const Record& row, const HeaderIndex& header) : row_(&row), header_(&header) {}
  RowView(const RecordView& row, const HeaderIndex& header)
    : row_(row.fields() ? row.fields() : &empty_record()), header_(&header) {}

  // Normalized text of the column. A column missing from the header, or a
  // position past the end of the record, yields "" and is not an error.
  std::string_view get_raw(std::string_view column) const;

  std::optional<int>    get_int(std::string_view column, FieldParseError* err_out = nullptr) const;
  std::optional<double> get_double(std::string_view column, FieldParseError* err_out = nullptr) const;

  // YYYY-MM-DD.
  std::optional<Date> get_iso_date(std::string_view column, FieldParseError* err_out = nullptr) const;

  // Spreadsheet serial day count, see parse_excel_serial().
  std::optional<Date> get_excel_date(std::string_view column, FieldParseError* err_out = nullptr) const;

  std::optional<Money> get_money(std::string_view column, FieldParseError* err_out = nullptr) const;

  // An empty cell is a valid null: `out` is reset and the call succeeds.
  // Returns false only for a name the table does not know, filling `err_out`.
  template <typename E>
  bool get_enum(std::string_view column, const EnumTable<E>& table, std::optional<E>& out,
                FieldParseError* err_out = nullptr) const {
    out.reset();
    std::string_view s = get_raw(column);
    if (s.empty()) return true;
    out = table.find(s);
    if (out) return true;
    fail(column, s, table.type_name(), err_out);
    return false;
  }

  // The raw record, not normalized.
  const Record& fields() const noexcept { return *row_; }
  std::size_t size() const noexcept { return row_->size(); }
  const HeaderIndex& header() const noexcept { return *header_; }

private:
  static const Record& empty_record();
  static void fail(std::string_view column, std::string_view raw, const char* type_name,
                   FieldParseError* err_out);

  const Record* row_;
  const HeaderIndex* header_;
};

}
