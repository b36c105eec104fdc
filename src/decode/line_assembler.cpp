#include "csv_stream/line_assembler.hpp"
#include <exception>
#include <new>

namespace cs {

static constexpr const char kReplacement[] = "\xEF\xBF\xBD"; // U+FFFD

static inline bool in_range(unsigned char c, unsigned char lo, unsigned char hi) {
  return c >= lo && c <= hi;
}

std::size_t Utf8Decoder::decode_span(std::string_view in, std::string& out, bool final) {
  std::size_t replaced = 0;
  const std::size_t n = in.size();
  std::size_t i = 0;
  out.reserve(out.size() + n);

  while (i < n) {
    // ASCII run
    std::size_t j = i;
    while (j < n && static_cast<unsigned char>(in[j]) < 0x80) ++j;
    if (j > i) { out.append(in.data() + i, j - i); i = j; if (i == n) break; }

    const unsigned char b0 = static_cast<unsigned char>(in[i]);
    std::size_t len = 0;
    unsigned char lo = 0x80, hi = 0xBF; // valid range for the second byte
    if (in_range(b0, 0xC2, 0xDF))      { len = 2; }
    else if (b0 == 0xE0)               { len = 3; lo = 0xA0; }
    else if (b0 == 0xED)               { len = 3; hi = 0x9F; }
    else if (in_range(b0, 0xE1, 0xEF)) { len = 3; }
    else if (b0 == 0xF0)               { len = 4; lo = 0x90; }
    else if (b0 == 0xF4)               { len = 4; hi = 0x8F; }
    else if (in_range(b0, 0xF1, 0xF3)) { len = 4; }

    if (len == 0) { out.append(kReplacement); ++replaced; ++i; continue; }

    std::size_t k = 1;
    bool truncated = false;
    for (; k < len; ++k) {
      if (i + k >= n) { truncated = true; break; }
      const unsigned char c = static_cast<unsigned char>(in[i + k]);
      const bool ok = (k == 1) ? in_range(c, lo, hi) : in_range(c, 0x80, 0xBF);
      if (!ok) break;
    }

    if (k == len) { out.append(in.data() + i, len); i += len; continue; }

    if (truncated && !final) {
      pending_.assign(in.data() + i, n - i);
      return replaced;
    }
    // maximal valid prefix collapses into a single replacement
    out.append(kReplacement);
    ++replaced;
    i += k;
  }
  return replaced;
}

std::size_t Utf8Decoder::decode(std::string_view raw, std::string& out) {
  if (pending_.empty()) return decode_span(raw, out, false);
  std::string joined;
  joined.reserve(pending_.size() + raw.size());
  joined.append(pending_);
  joined.append(raw.data(), raw.size());
  pending_.clear();
  return decode_span(joined, out, false);
}

std::size_t Utf8Decoder::finish(std::string& out) {
  if (pending_.empty()) return 0;
  std::string held;
  held.swap(pending_);
  return decode_span(held, out, true);
}

struct LineAssembler::Impl {
  Config cfg;
  Utf8Decoder decoder;
  std::string carry;    // partial line held across feeds
  std::string decoded;  // scratch, reused between feeds
  std::uint64_t bytes{0};
  std::uint64_t replaced{0};
  std::string err;

  bool feed(std::string_view raw, const LineCallback& on_line) {
    decoded.clear();
    replaced += decoder.decode(raw, decoded);
    bytes += raw.size();

    std::string work;
    std::string_view text;
    if (carry.empty()) {
      text = decoded;
    } else {
      work.swap(carry);
      work.append(decoded);
      text = work;
    }

    std::size_t start = 0;
    const std::size_t n = text.size();
    for (std::size_t i = 0; i < n; ++i) {
      const char c = text[i];
      if (c == '\n') {
        on_line(text.substr(start, i + 1 - start));
        start = i + 1;
      } else if (c == '\r') {
        if (i + 1 == n) break;          // "\r\n" may straddle the chunk edge
        if (text[i + 1] == '\n') ++i;
        on_line(text.substr(start, i + 1 - start));
        start = i + 1;
      }
    }

    carry.assign(text.data() + start, n - start);
    if (carry.size() > cfg.max_line_bytes) {
      err = "line exceeds " + std::to_string(cfg.max_line_bytes) + " bytes without a terminator";
      return false;
    }
    return true;
  }
};

LineAssembler::LineAssembler() : LineAssembler(Config{}) {}

LineAssembler::LineAssembler(Config cfg) : p_(new Impl{cfg, {}, {}, {}, 0, 0, {}}) {}

LineAssembler::~LineAssembler() { delete p_; }

bool LineAssembler::feed(std::string_view raw, const LineCallback& on_line) {
  p_->err.clear();
  try {
    return p_->feed(raw, on_line);
  } catch (const std::bad_alloc&) {
    p_->err = "out of memory while assembling lines";
  } catch (const std::exception& e) {
    p_->err = e.what();
  }
  return false;
}

std::string LineAssembler::take_partial() {
  p_->replaced += p_->decoder.finish(p_->carry);
  std::string out;
  out.swap(p_->carry);
  return out;
}

const std::string& LineAssembler::partial() const noexcept { return p_->carry; }
std::uint64_t LineAssembler::bytes_fed() const noexcept { return p_->bytes; }
std::uint64_t LineAssembler::replaced_sequences() const noexcept { return p_->replaced; }
const std::string& LineAssembler::error() const noexcept { return p_->err; }

}
