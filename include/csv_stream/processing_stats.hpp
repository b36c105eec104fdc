#pragma once
#include <cstdint>

namespace cs {

// Cumulative counters for one session. Every field only grows until finalize().
struct ProcessingStats {
  std::uint64_t rows_processed = 0;
  std::uint64_t malformed_rows = 0;
  std::uint64_t processed_bytes = 0;   // raw input bytes, before decoding
  std::uint64_t unique_keys = 0;
  std::int64_t  total_measure = 0;
  std::uint64_t replaced_sequences = 0; // invalid UTF-8 sequences substituted
};

inline bool operator==(const ProcessingStats& a, const ProcessingStats& b) {
  return a.rows_processed == b.rows_processed && a.malformed_rows == b.malformed_rows &&
         a.processed_bytes == b.processed_bytes && a.unique_keys == b.unique_keys &&
         a.total_measure == b.total_measure && a.replaced_sequences == b.replaced_sequences;
}

}
