#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "jsonl_rev/byte_source.hpp"
#include "jsonl_rev/reverse_line_reader.hpp"

namespace jr {

class JsonlTokenizer;
class RecordView;

enum class Direction { Forward, Reverse };

// JSON Lines over a seekable source. Lines are trimmed of surrounding
// whitespace and blank lines are skipped. Each operation lends the source to a
// ChunkReader (forward) or ReverseLineReader (reverse) and takes it back
// afterwards, so operations can be repeated on the same instance.
class Jsonl {
public:
  struct Config {
    std::size_t buffer_bytes     = ReverseLineReader::kDefaultCapacity; // > 0
    std::size_t max_record_bytes = 8 * 1024 * 1024; // longer lines fail forward walks (EFBIG)
  };

  using LineCallback   = std::function<bool(std::string_view)>;
  using RecordCallback = std::function<bool(const RecordView&)>;

  // Throws std::invalid_argument on a null source or zero buffer_bytes.
  explicit Jsonl(std::unique_ptr<ByteSource> src);
  Jsonl(std::unique_ptr<ByteSource> src, Config cfg);
  ~Jsonl();
  Jsonl(const Jsonl&) = delete;
  Jsonl& operator=(const Jsonl&) = delete;

  // Null (and the reason in *err_out) if the file cannot be opened.
  static std::unique_ptr<Jsonl> from_path(const std::string& path,
                                          std::string* err_out = nullptr);
  static std::unique_ptr<Jsonl> from_path(const std::string& path, Config cfg,
                                          std::string* err_out = nullptr);

  // All callbacks may return false to stop early; that is not an error.
  // Every operation returns false on I/O, decode or parse failure (see error()).
  bool for_each_line(Direction dir, const LineCallback& cb);
  bool first_n(std::size_t n, const LineCallback& cb);  // head, file order
  bool last_n(std::size_t n, const LineCallback& cb);   // tail, last line first
  bool count_lines(std::uint64_t& out);
  bool for_each_record(Direction dir, JsonlTokenizer& tok, const RecordCallback& cb);

  // Counters of the most recent operation.
  std::uint64_t bytes_read() const noexcept;
  std::uint64_t fetches() const noexcept;

  int last_error() const noexcept;
  const std::string& error() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
