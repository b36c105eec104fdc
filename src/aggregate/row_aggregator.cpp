#include "csv_stream/row_aggregator.hpp"
#include "csv_stream/log.hpp"
#include <charconv>
#include <limits>
#include <system_error>

namespace cs {

const char* to_string(MalformedReason r) noexcept {
  switch (r) {
    case MalformedReason::None:         return "none";
    case MalformedReason::BadQuoting:   return "broken quoting";
    case MalformedReason::ColumnCount:  return "unexpected column count";
    case MalformedReason::EmptyKey:     return "empty department";
    case MalformedReason::EmptyMeasure: return "empty sales value";
    case MalformedReason::NotNumeric:   return "sales value is not numeric";
    case MalformedReason::Negative:     return "negative sales value";
    case MalformedReason::Overflow:     return "sales value out of range";
  }
  return "unknown";
}

std::string_view trim_ascii(std::string_view s) {
  constexpr std::string_view ws = " \t\r\n\f\v";
  const auto b = s.find_first_not_of(ws);
  if (b == std::string_view::npos) return {};
  const auto e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

IntParse parse_integer(std::string_view s, std::int64_t* out) {
  if (s.empty()) return IntParse::NotNumeric;
  const bool neg = s.front() == '-';
  std::string_view digits = (neg || s.front() == '+') ? s.substr(1) : s;
  if (digits.empty()) return IntParse::NotNumeric;
  for (char c : digits) {
    if (c < '0' || c > '9') return IntParse::NotNumeric;
  }

  std::int64_t v = 0;
  // from_chars takes '-' but not '+'
  const char* first = neg ? s.data() : digits.data();
  const char* last = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(first, last, v);
  if (ec == std::errc::result_out_of_range) return neg ? IntParse::Negative : IntParse::OutOfRange;
  if (ec != std::errc() || ptr != last) return IntParse::NotNumeric;

  if (out) *out = v;
  return v < 0 ? IntParse::Negative : IntParse::Ok;
}

static std::string snippet(std::string_view s, std::size_t max = 160) {
  s = trim_ascii(s);
  if (s.size() <= max) return std::string(s);
  return std::string(s.substr(0, max)) + "...";
}

RowAggregator::RowAggregator() : RowAggregator(Config{}) {}

RowAggregator::RowAggregator(Config cfg) : cfg_(cfg) {
  fields_.reserve(cfg_.expected_columns + 1);
}

RowOutcome RowAggregator::malformed(MalformedReason why, std::string_view line) {
  ++malformed_;
  if (log_enabled(LogLevel::Debug)) {
    log_debug("rows", concat("malformed row (", to_string(why), "): ", snippet(line)));
  }
  return RowOutcome{RowClass::RowMalformed, why};
}

RowOutcome RowAggregator::ingest(std::string_view line, bool is_header_expected) {
  const std::string_view body = trim_ascii(line);

  if (is_header_expected) {
    if (body.empty()) return RowOutcome{RowClass::Skipped, MalformedReason::None};
    log_info("rows", concat("CSV header found: ", snippet(body)));
    if (!split_csv_record(body, fields_, cfg_.dialect)) {
      log_warn("rows", "failed to parse header (broken quoting)");
    } else if (fields_.size() != cfg_.expected_columns) {
      log_warn("rows", concat("unexpected header format. Expected ", cfg_.expected_columns, " columns, got ",
                              fields_.size()));
    }
    header_ = fields_;
    return RowOutcome{RowClass::HeaderAccepted, MalformedReason::None};
  }

  if (!split_csv_record(body, fields_, cfg_.dialect)) return malformed(MalformedReason::BadQuoting, line);
  if (body.empty() || fields_.size() != cfg_.expected_columns) {
    return malformed(MalformedReason::ColumnCount, line);
  }

  const std::string_view key = trim_ascii(fields_.front());
  const std::string_view measure_text = trim_ascii(fields_.back());
  if (key.empty()) return malformed(MalformedReason::EmptyKey, line);
  if (measure_text.empty()) return malformed(MalformedReason::EmptyMeasure, line);

  std::int64_t measure = 0;
  switch (parse_integer(measure_text, &measure)) {
    case IntParse::Ok:         break;
    case IntParse::NotNumeric: return malformed(MalformedReason::NotNumeric, line);
    case IntParse::Negative:   return malformed(MalformedReason::Negative, line);
    case IntParse::OutOfRange: return malformed(MalformedReason::Overflow, line);
  }

  constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
  if (measure > kMax - total_) return malformed(MalformedReason::Overflow, line);

  // total_ bounds every per-key sum, so the key sum cannot overflow either
  totals_[std::string(key)] += measure;
  total_ += measure;
  ++accepted_;
  return RowOutcome{RowClass::RowAccepted, MalformedReason::None};
}

void RowAggregator::release() {
  Totals().swap(totals_);
  std::vector<std::string>().swap(fields_);
}

}
