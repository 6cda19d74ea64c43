#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "jsonl_rev/byte_source.hpp"

namespace jr {

// Forward line reader over a ByteSource, reading from offset 0.
class ChunkReader {
public:
  struct Config {
    std::size_t chunk_bytes      = 64 * 1024;       // 64 KiB
    std::size_t max_record_bytes = 8 * 1024 * 1024; // 8 MiB guard per line
    bool        strip_cr         = true;            // trim trailing '\r' (CRLF)
    bool        drop_oversize    = true;            // drop lines exceeding guard
  };

  explicit ChunkReader(std::unique_ptr<ByteSource> src);   // uses default Config{}
  ChunkReader(std::unique_ptr<ByteSource> src, Config cfg);
  ~ChunkReader();
  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;

  // Next line; the view stays valid until the following call.
  // False at end of input or on error (last_error() != 0).
  bool read_next(std::string_view& out);

  // Returning false from the callback stops the walk early (not an error).
  using LineCallback = std::function<bool(std::string_view)>;
  bool for_each_line(const LineCallback& cb);

  std::unique_ptr<ByteSource> release() noexcept;

  int  last_error() const noexcept;
  std::uint64_t bytes_read() const noexcept;
  // Lines longer than max_record_bytes seen so far (dropped or truncated).
  std::uint64_t oversize_lines() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
