#include "csv_stream/stream_processor.hpp"
#include "csv_stream/csv_row.hpp"
#include "csv_stream/log.hpp"
#include "csv_stream/path_utils.hpp"
#include "csv_stream/storage_backend.hpp"
#include <algorithm>
#include <exception>
#include <fstream>
#include <new>
#include <system_error>

namespace cs {

namespace {

constexpr std::string_view kEol = "\r\n";

void append_result_row(std::string& out, std::string_view key, std::int64_t value) {
  append_csv_field(out, key);
  out.push_back(',');
  out += std::to_string(value);
  out.append(kEol);
}

std::string result_header() {
  std::string h;
  append_csv_field(h, kResultKeyColumn);
  h.push_back(',');
  append_csv_field(h, kResultValueColumn);
  h.append(kEol);
  return h;
}

}

struct StreamProcessor::Impl {
  Config cfg;
  StorageBackend* storage;
  LineAssembler assembler;
  RowAggregator rows;
  State state{State::CollectingHeader};
  std::string err;

  Impl(Config c, StorageBackend* s)
    : cfg(c), storage(s), assembler(c.assembler), rows(c.rows) {}

  void ingest(std::string_view line) {
    const bool header_expected = (state == State::CollectingHeader);
    const RowOutcome r = rows.ingest(line, header_expected);
    if (r.cls == RowClass::HeaderAccepted) state = State::Aggregating;
  }

  std::vector<std::pair<std::string, std::int64_t>> sorted() const {
    std::vector<std::pair<std::string, std::int64_t>> out(rows.totals().begin(), rows.totals().end());
    std::sort(out.begin(), out.end(),
              [](const auto& a, const auto& b){ return a.first < b.first; });
    return out;
  }

  std::string render() const {
    std::string out = result_header();
    for (const auto& kv : sorted()) append_result_row(out, kv.first, kv.second);
    return out;
  }

  // Rows go straight to disk; the finished file appears under its final name only once complete.
  bool write_local(const std::filesystem::path& dest) {
    if (!ensure_parent_dirs(dest)) { err = "cannot create directory for " + dest.string(); return false; }

    std::filesystem::path tmp = dest;
    tmp += ".part";
    {
      std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
      if (!out) { err = "failed to open output file at " + tmp.string(); return false; }

      const std::string header = result_header();
      out.write(header.data(), static_cast<std::streamsize>(header.size()));
      std::string line;
      for (const auto& kv : sorted()) {
        line.clear();
        append_result_row(line, kv.first, kv.second);
        out.write(line.data(), static_cast<std::streamsize>(line.size()));
      }
      out.flush();
      if (!out) { err = "failed to write output file at " + dest.string(); return false; }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, dest, ec);
    if (ec) {
      std::filesystem::remove(tmp, ec);
      err = "failed to move output file into place at " + dest.string();
      return false;
    }
    return true;
  }
};

StreamProcessor::StreamProcessor(StorageBackend* storage)
  : StreamProcessor(Config{}, storage) {}

StreamProcessor::StreamProcessor(Config cfg, StorageBackend* storage)
  : p_(new Impl(cfg, storage)) {}

StreamProcessor::~StreamProcessor() { delete p_; }

bool StreamProcessor::process_chunk(std::string_view bytes) {
  if (p_->state == State::Finalized) {
    p_->err = "Chunk processing failed: processor already finalized";
    return false;
  }

  const std::uint64_t replaced_before = p_->assembler.replaced_sequences();
  bool ok = false;
  try {
    ok = p_->assembler.feed(bytes, [this](std::string_view line){ p_->ingest(line); });
  } catch (const std::exception& e) {
    p_->err = std::string("Chunk processing failed: ") + e.what();
    log_error("processor", p_->err);
    return false;
  }
  if (!ok) {
    p_->err = "Chunk processing failed: " + p_->assembler.error();
    log_error("processor", p_->err);
    return false;
  }

  const std::uint64_t replaced = p_->assembler.replaced_sequences() - replaced_before;
  if (replaced > 0) {
    log_warn("processor", concat("invalid UTF-8 in chunk, replaced ", replaced, " sequence(s)"));
  }
  return true;
}

std::optional<ProcessingStats> StreamProcessor::finalize(const std::string& destination,
                                                         bool use_external_storage) {
  if (p_->state == State::Finalized) {
    p_->err = "Finalization failed: finalize already called";
    return std::nullopt;
  }
  log_info("processor", concat("finalizing aggregation, writing results to ", destination));

  try {
    const std::string tail = p_->assembler.take_partial();
    if (!trim_ascii(tail).empty() && p_->state == State::Aggregating) {
      log_debug("processor", "processing final buffered row");
      p_->ingest(tail);
    }
    p_->state = State::Finalized;

    if (use_external_storage && p_->storage) {
      std::string serr;
      auto locator = p_->storage->save(destination, p_->render(), &serr);
      if (!locator) {
        p_->err = "Finalization failed: storage save failed for " + destination + ": " + serr;
        log_error("processor", p_->err);
        return std::nullopt;
      }
      log_info("processor", concat("results saved via ", p_->storage->kind(), " storage: ", *locator));
    } else if (!p_->write_local(destination)) {
      p_->err = "Finalization failed: " + p_->err;
      log_error("processor", p_->err);
      return std::nullopt;
    }
  } catch (const std::bad_alloc&) {
    p_->state = State::Finalized;
    p_->err = "Finalization failed: out of memory";
    return std::nullopt;
  } catch (const std::exception& e) {
    p_->state = State::Finalized;
    p_->err = std::string("Finalization failed: ") + e.what();
    return std::nullopt;
  }

  log_info("processor", "successfully wrote result file");
  return stats();
}

ProcessingStats StreamProcessor::stats() const {
  ProcessingStats s;
  s.rows_processed = p_->rows.rows_accepted();
  s.malformed_rows = p_->rows.rows_malformed();
  s.processed_bytes = p_->assembler.bytes_fed();
  s.unique_keys = p_->rows.totals().size();
  s.total_measure = p_->rows.total_measure();
  s.replaced_sequences = p_->assembler.replaced_sequences();
  return s;
}

StreamProcessor::State StreamProcessor::state() const noexcept { return p_->state; }

const RowAggregator::Totals& StreamProcessor::totals() const noexcept { return p_->rows.totals(); }

std::vector<std::pair<std::string, std::int64_t>> StreamProcessor::sorted_totals() const {
  return p_->sorted();
}

std::string StreamProcessor::render_csv() const { return p_->render(); }

std::optional<std::string> StreamProcessor::storage_url(const std::string& path) const {
  if (!p_->storage) return std::nullopt;
  return p_->storage->url_for(path);
}

void StreamProcessor::release() {
  p_->rows.release();
  (void)p_->assembler.take_partial();
}

const std::string& StreamProcessor::error() const noexcept { return p_->err; }

}
