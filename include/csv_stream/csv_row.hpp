#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace cs {

struct CsvDialect {
  char delimiter = ',';
  char quote     = '"';
};

// Splits one record (terminator already removed) into unescaped fields.
// Returns false only for an unterminated quoted field. Text between a closing
// quote and the next delimiter is appended to the field (`"Home"x` -> `Homex`),
// and a quote inside an unquoted field is literal.
bool split_csv_record(std::string_view line,
                      std::vector<std::string>& fields,
                      const CsvDialect& d = {});

// Appends `field` to `out`, quoted only when it holds the delimiter, the quote, CR or LF.
void append_csv_field(std::string& out, std::string_view field, const CsvDialect& d = {});

}
