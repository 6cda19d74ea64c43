#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "jsonl_rev/byte_source.hpp"

namespace jr {

// Reads the lines of a seekable source last-to-first, keeping memory at
// O(capacity + longest line). The source is owned for the reader's lifetime
// (see release()); nothing else may move its cursor while the reader is in use.
//
// Terminators are "\n" and "\r\n" and may be mixed. A terminator at the very
// end of the source closes the last line, so "a\n" yields one line and "\n"
// yields one empty line.
class ReverseLineReader {
public:
  static constexpr std::size_t kDefaultCapacity = 8 * 1024;

  struct Config {
    std::size_t capacity = kDefaultCapacity; // bytes per backward fetch, > 0
  };

  enum class Status {
    Line,        // `out` holds the next line
    EndOfInput,  // start of source reached; every later call returns this too
    IoError,     // seek/read failed; reader state untouched, call again to retry
    DecodeError, // line is not valid UTF-8; raw bytes in `out`, line consumed
  };

  // Throw std::invalid_argument (null source, zero capacity) or
  // std::system_error (source cannot report its length).
  explicit ReverseLineReader(std::unique_ptr<ByteSource> src);
  ReverseLineReader(std::unique_ptr<ByteSource> src, Config cfg);
  static ReverseLineReader with_capacity(std::size_t capacity,
                                         std::unique_ptr<ByteSource> src);

  ReverseLineReader(ReverseLineReader&& other) noexcept;
  ReverseLineReader& operator=(ReverseLineReader&& other) noexcept;
  ReverseLineReader(const ReverseLineReader&) = delete;
  ReverseLineReader& operator=(const ReverseLineReader&) = delete;
  ~ReverseLineReader();

  Status next_line(std::string& out);

  // Pulls lines until `cb` returns false or input ends. False on I/O or decode error.
  using LineCallback = std::function<bool(std::string_view)>;
  bool for_each_line(const LineCallback& cb);

  // Bytes of the loaded chunk not yet scanned.
  std::string_view buffer() const noexcept;

  // Null after release().
  ByteSource* source() noexcept;
  std::unique_ptr<ByteSource> release() noexcept;

  std::uint64_t position() const noexcept;
  std::uint64_t length() const noexcept;
  std::size_t   capacity() const noexcept;

  std::uint64_t bytes_read() const noexcept;
  std::uint64_t fetches() const noexcept;
  std::uint64_t lines() const noexcept; // Status::Line results only

  int last_error() const noexcept;
  const std::string& error() const noexcept;

private:
  struct Impl; Impl* p_;
};

const char* to_string(ReverseLineReader::Status s) noexcept;

}
