#pragma once
#include "csv_stream/csv_row.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cs {

enum class RowClass { HeaderAccepted, RowAccepted, RowMalformed, Skipped };

enum class MalformedReason {
  None,
  BadQuoting,
  ColumnCount,
  EmptyKey,
  EmptyMeasure,
  NotNumeric,
  Negative,
  Overflow,
};

const char* to_string(MalformedReason r) noexcept;

struct RowOutcome {
  RowClass cls = RowClass::Skipped;
  MalformedReason reason = MalformedReason::None;
};

enum class IntParse { Ok, NotNumeric, Negative, OutOfRange };

// Optionally signed base-10 literal, nothing else. Negative values report
// IntParse::Negative (value still stored when it fits).
IntParse parse_integer(std::string_view s, std::int64_t* out);

// Strips ASCII whitespace, line terminators included.
std::string_view trim_ascii(std::string_view s);

// Folds (key, ignored, measure) rows into per-key sums. Never throws on bad input:
// every line gets a classification.
class RowAggregator {
public:
  struct Config {
    std::size_t expected_columns = 3;
    CsvDialect dialect;
  };

  using Totals = std::unordered_map<std::string, std::int64_t>;

  RowAggregator();
  explicit RowAggregator(Config cfg);

  RowOutcome ingest(std::string_view line, bool is_header_expected);

  const Totals& totals() const noexcept { return totals_; }
  const std::vector<std::string>& header() const noexcept { return header_; }
  std::uint64_t rows_accepted() const noexcept { return accepted_; }
  std::uint64_t rows_malformed() const noexcept { return malformed_; }
  std::int64_t total_measure() const noexcept { return total_; }

  // Drops the mapping and its memory (cancelled sessions).
  void release();

private:
  RowOutcome malformed(MalformedReason why, std::string_view line);

  Config cfg_;
  std::vector<std::string> fields_;
  std::vector<std::string> header_;
  Totals totals_;
  std::uint64_t accepted_{0};
  std::uint64_t malformed_{0};
  std::int64_t total_{0};
};

}
