#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace cs {

// Incremental UTF-8 validator. Invalid sequences become U+FFFD; an incomplete
// sequence at the end of the input is held back until the next call.
class Utf8Decoder {
public:
  // Appends decoded text to `out`; returns the number of replacements made.
  std::size_t decode(std::string_view raw, std::string& out);

  // End of input: a held incomplete sequence is replaced. Returns replacements made.
  std::size_t finish(std::string& out);

  bool has_pending() const noexcept { return !pending_.empty(); }

private:
  std::size_t decode_span(std::string_view in, std::string& out, bool final);
  std::string pending_;
};

// Byte chunks in, complete lines out. Lines keep their terminator ("\n", "\r\n"
// or "\r"); the trailing fragment without one is held until the next feed().
class LineAssembler {
public:
  struct Config {
    std::size_t max_line_bytes = 8 * 1024 * 1024; // 8 MiB guard on the held partial line
  };

  using LineCallback = std::function<void(std::string_view)>;

  LineAssembler();                     // uses default Config{}
  explicit LineAssembler(Config cfg);
  ~LineAssembler();

  LineAssembler(const LineAssembler&) = delete;
  LineAssembler& operator=(const LineAssembler&) = delete;

  // Returns false on an assembler fault (see error()); state is then unspecified.
  bool feed(std::string_view raw, const LineCallback& on_line);

  // Hands over whatever is held (flushing any incomplete UTF-8 as U+FFFD) and clears it.
  std::string take_partial();

  const std::string& partial() const noexcept;
  std::uint64_t bytes_fed() const noexcept;
  std::uint64_t replaced_sequences() const noexcept;
  const std::string& error() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
