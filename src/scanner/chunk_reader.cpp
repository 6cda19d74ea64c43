#include "jsonl_rev/chunk_reader.hpp"
#include <cerrno>
#include <string_view>
#include <utility>
#include <vector>

namespace jr {

struct ChunkReader::Impl {
  std::unique_ptr<ByteSource> src;
  Config cfg;
  int last_errno{0};
  std::uint64_t bytes{0};
  std::uint64_t oversize{0};        // lines that hit the guard

  std::vector<char> buf;
  std::size_t start{0}, end{0};     // unread window of buf
  std::string carry;                // partial line spanning chunks
  std::string line;                 // storage for lines assembled from carry
  bool opened{false};
  bool eof{false};
  bool skipping_oversize{false};    // if true, drop until next newline

  Impl(std::unique_ptr<ByteSource> s, Config c)
    : src(std::move(s)), cfg(c), buf(c.chunk_bytes ? c.chunk_bytes : 1) {
    carry.reserve(256);
  }

  std::string_view finish(std::string_view out) const {
    if (cfg.strip_cr && !out.empty() && out.back() == '\r') out.remove_suffix(1);
    return out;
  }

  std::string_view take_carry() {
    line.swap(carry);
    carry.clear();
    return finish(line);
  }

  bool next(std::string_view& out) {
    if (!src) { last_errno = EBADF; return false; }
    if (!opened) {
      // pipes cannot rewind; read them from where they are
      if (!src->seek(0) && src->last_error() != ESPIPE) { last_errno = src->last_error(); return false; }
      opened = true;
    }

    while (true) {
      if (start == end) {
        if (eof) {
          if (!carry.empty() && !skipping_oversize) { out = take_carry(); return true; }
          return false;
        }
        std::int64_t n = src->read(buf.data(), buf.size());
        if (n < 0) { last_errno = src->last_error(); return false; }
        if (n == 0) { eof = true; continue; }
        bytes += static_cast<std::uint64_t>(n);
        start = 0;
        end = static_cast<std::size_t>(n);
      }

      std::string_view block(buf.data() + start, end - start);
      std::size_t pos = block.find('\n');

      if (pos == std::string_view::npos) {
        // unfinished line -> check guard
        start = end;
        if (skipping_oversize) continue;
        if (carry.size() + block.size() > cfg.max_record_bytes) {
          ++oversize;
          if (cfg.drop_oversize) {
            carry.clear();
            skipping_oversize = true;
            continue;
          }
          // truncate and emit as best-effort, drop the rest until newline
          carry.append(block.substr(0, cfg.max_record_bytes - carry.size()));
          skipping_oversize = true;
          out = take_carry();
          return true;
        }
        carry.append(block);
        continue;
      }

      std::string_view slice = block.substr(0, pos);
      start += pos + 1;

      if (skipping_oversize) { skipping_oversize = false; continue; }

      if (carry.size() + slice.size() > cfg.max_record_bytes) {
        ++oversize;
        if (cfg.drop_oversize) { carry.clear(); continue; }
        slice = slice.substr(0, cfg.max_record_bytes - carry.size());
      }

      if (carry.empty()) { out = finish(slice); return true; }
      carry.append(slice);
      out = take_carry();
      return true;
    }
  }
};

ChunkReader::ChunkReader(std::unique_ptr<ByteSource> src)
  : ChunkReader(std::move(src), Config{}) {}

ChunkReader::ChunkReader(std::unique_ptr<ByteSource> src, Config cfg)
  : p_(new Impl(std::move(src), cfg)) {}

ChunkReader::~ChunkReader() { delete p_; }

bool ChunkReader::read_next(std::string_view& out) { return p_->next(out); }

bool ChunkReader::for_each_line(const LineCallback& cb) {
  std::string_view s;
  while (p_->next(s)) {
    if (!cb(s)) return true;
  }
  return p_->last_errno == 0;
}

std::unique_ptr<ByteSource> ChunkReader::release() noexcept { return std::move(p_->src); }

int  ChunkReader::last_error() const noexcept { return p_->last_errno; }
std::uint64_t ChunkReader::bytes_read() const noexcept { return p_->bytes; }
std::uint64_t ChunkReader::oversize_lines() const noexcept { return p_->oversize; }

}
