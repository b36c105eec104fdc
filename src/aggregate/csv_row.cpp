#include "csv_stream/csv_row.hpp"

namespace cs {

bool split_csv_record(std::string_view line,
                      std::vector<std::string>& fields,
                      const CsvDialect& d) {
  fields.clear();
  fields.emplace_back();

  enum class Mode { FieldStart, Unquoted, Quoted, QuoteEscape } mode = Mode::FieldStart;
  for (const char c : line) {
    switch (mode) {
      case Mode::FieldStart:
        if (c == d.quote) { mode = Mode::Quoted; break; }
        mode = Mode::Unquoted;
        [[fallthrough]];
      case Mode::Unquoted:
        if (c == d.delimiter) { fields.emplace_back(); mode = Mode::FieldStart; }
        else fields.back().push_back(c);
        break;
      case Mode::Quoted:
        if (c == d.quote) mode = Mode::QuoteEscape;
        else fields.back().push_back(c);
        break;
      case Mode::QuoteEscape:
        if (c == d.quote) {
          fields.back().push_back(c);     // escaped quote
          mode = Mode::Quoted;
        } else if (c == d.delimiter) {
          fields.emplace_back();
          mode = Mode::FieldStart;
        } else {
          fields.back().push_back(c);     // text after the closing quote joins the field
          mode = Mode::Unquoted;
        }
        break;
    }
  }
  return mode != Mode::Quoted;
}

void append_csv_field(std::string& out, std::string_view field, const CsvDialect& d) {
  bool needs_quotes = false;
  for (char c : field) {
    if (c == d.delimiter || c == d.quote || c == '\r' || c == '\n') { needs_quotes = true; break; }
  }
  if (!needs_quotes) { out.append(field.data(), field.size()); return; }

  out.push_back(d.quote);
  for (char c : field) {
    if (c == d.quote) out.push_back(d.quote);
    out.push_back(c);
  }
  out.push_back(d.quote);
}

}
