#include "row_reader/row_view.hpp"
#include "row_reader/value_parse.hpp"
#include <iostream>

namespace rr {

const Record& RowView::empty_record() {
  static const Record empty;
  return empty;
}

void RowView::fail(std::string_view column, std::string_view raw, const char* type_name,
                   FieldParseError* err_out) {
  if (!err_out) return;
  err_out->column.assign(column.data(), column.size());
  err_out->raw.assign(raw.data(), raw.size());
  err_out->type_name = type_name;
}

std::string_view RowView::get_raw(std::string_view column) const {
  auto idx = header_->find(column);
  if (!idx) {
    if (header_->warn_missing()) std::cerr << "[row] Could not find header: " << column << "\n";
    return {};
  }
  if (*idx >= row_->size()) return {};
  return normalize((*row_)[*idx]);
}

std::optional<int> RowView::get_int(std::string_view column, FieldParseError* err_out) const {
  std::string_view s = get_raw(column);
  auto v = parse_int(s);
  if (!v) fail(column, s, "Integer", err_out);
  return v;
}

std::optional<double> RowView::get_double(std::string_view column, FieldParseError* err_out) const {
  std::string_view s = get_raw(column);
  auto v = parse_double(s);
  if (!v) fail(column, s, "Double", err_out);
  return v;
}

std::optional<Date> RowView::get_iso_date(std::string_view column, FieldParseError* err_out) const {
  std::string_view s = get_raw(column);
  auto v = parse_iso_date(s);
  if (!v) fail(column, s, "Date", err_out);
  return v;
}

std::optional<Date> RowView::get_excel_date(std::string_view column, FieldParseError* err_out) const {
  std::string_view s = get_raw(column);
  auto v = parse_excel_serial(s);
  if (!v) fail(column, s, "Date", err_out);
  return v;
}

std::optional<Money> RowView::get_money(std::string_view column, FieldParseError* err_out) const {
  std::string_view s = get_raw(column);
  auto v = Money::parse(s);
  if (!v) fail(column, s, "Money", err_out);
  return v;
}

}
