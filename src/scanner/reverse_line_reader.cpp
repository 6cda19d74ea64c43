#include "jsonl_rev/reverse_line_reader.hpp"

#include <simdjson.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

namespace jr {

namespace {

// Bytes of the line under assembly. Filled back-to-front: live bytes sit at
// the tail of `store_`, from `head_` to the end, so prepending never shifts them.
class Carry {
public:
  void prepend(const char* p, std::size_t n) {
    if (n == 0) return;
    if (head_ < n) grow(n);
    head_ -= n;
    std::memcpy(store_.data() + head_, p, n);
  }

  // Moves the assembled bytes into `out`; storage is kept for the next line.
  void take(std::string& out) {
    if (empty()) { out.clear(); return; }
    out.assign(store_.data() + head_, store_.size() - head_);
    head_ = store_.size();
  }

  std::size_t size() const noexcept { return store_.size() - head_; }
  bool empty() const noexcept { return head_ == store_.size(); }

private:
  void grow(std::size_t n) {
    const std::size_t live = size();
    const std::size_t cap  = std::max(live + n, store_.size() + store_.size() / 2 + 1);
    std::vector<char> next(cap);
    if (live) std::memcpy(next.data() + cap - live, store_.data() + head_, live);
    store_.swap(next);
    head_ = cap - live;
  }

  std::vector<char> store_;
  std::size_t head_{0};
};

enum class State { Scanning, Refilling, Draining, Done };

std::string errno_text(int code) {
  return std::error_code(code, std::generic_category()).message();
}

}

struct ReverseLineReader::Impl {
  std::unique_ptr<ByteSource> src;
  std::vector<char> buf;
  std::size_t   scan{0};   // buf[0, scan) not yet scanned
  std::uint64_t pos{0};    // absolute offset of buf[0]; never increases
  std::uint64_t length{0};
  Carry carry;
  State state{State::Refilling};
  bool started{false};     // trailing byte of the source examined
  bool closed{false};      // line under assembly was terminated by '\n'

  std::uint64_t bytes{0};
  std::uint64_t fetch_count{0};
  std::uint64_t line_count{0};  // returned as Status::Line
  std::uint64_t consumed{0};    // including DecodeError lines
  int last_errno{0};
  std::string err;

  Impl(std::unique_ptr<ByteSource> s, std::size_t cap, std::uint64_t len)
    : src(std::move(s)), buf(cap), pos(len), length(len),
      state(len == 0 ? State::Done : State::Refilling) {}

  void fail(int code, std::string msg) {
    last_errno = code;
    err = std::move(msg);
  }

  // Loads the chunk ending at `pos`. Nothing is committed unless the whole
  // chunk arrives; only called with scan == 0, so buf holds no live bytes.
  bool fetch() {
    const std::uint64_t want = std::min<std::uint64_t>(buf.size(), pos);
    const std::uint64_t at   = pos - want;

    if (!src->seek(at)) {
      const int e = src->last_error();
      fail(e, "seek to " + std::to_string(at) + " failed: " + errno_text(e));
      return false;
    }
    std::size_t total = 0;
    while (total < want) {
      const std::int64_t n = src->read(buf.data() + total, static_cast<std::size_t>(want - total));
      if (n < 0) {
        const int e = src->last_error();
        fail(e, "read at " + std::to_string(at + total) + " failed: " + errno_text(e));
        return false;
      }
      if (n == 0) break;
      total += static_cast<std::size_t>(n);
    }
    if (total < want) {
      fail(EIO, "short read at " + std::to_string(at) + ": got " + std::to_string(total) +
                " of " + std::to_string(want) + " bytes (source shrank?)");
      return false;
    }

    pos  = at;
    scan = static_cast<std::size_t>(want);
    bytes += want;
    ++fetch_count;
    return true;
  }

  Status emit(std::string& out) {
    carry.take(out);
    if (closed && !out.empty() && out.back() == '\r') out.pop_back();
    ++consumed;
    if (!simdjson::validate_utf8(out.data(), out.size())) {
      fail(EILSEQ, "line " + std::to_string(consumed) + " from the end is not valid UTF-8");
      return Status::DecodeError;
    }
    ++line_count;
    return Status::Line;
  }

  Status next(std::string& out) {
    out.clear();
    for (;;) {
      switch (state) {
        case State::Done:
          return Status::EndOfInput;

        case State::Refilling:
          if (pos == 0) { state = State::Draining; break; }
          if (!src) { fail(EBADF, "source was released"); return Status::IoError; }
          if (!fetch()) return Status::IoError;
          if (!started) {
            // A terminator at the very end closes the last line.
            started = true;
            if (buf[scan - 1] == '\n') { --scan; closed = true; }
          }
          state = State::Scanning;
          break;

        case State::Scanning: {
          const std::size_t nl = std::string_view(buf.data(), scan).rfind('\n');
          if (nl == std::string_view::npos) {
            carry.prepend(buf.data(), scan);
            scan = 0;
            state = State::Refilling;
            break;
          }
          carry.prepend(buf.data() + nl + 1, scan - nl - 1);
          scan = nl;
          const Status st = emit(out);
          closed = true; // buf[nl] ends the preceding line
          return st;
        }

        case State::Draining: {
          const Status st = emit(out);
          state = State::Done;
          return st;
        }
      }
    }
  }
};

ReverseLineReader::ReverseLineReader(std::unique_ptr<ByteSource> src)
  : ReverseLineReader(std::move(src), Config{}) {}

ReverseLineReader::ReverseLineReader(std::unique_ptr<ByteSource> src, Config cfg) : p_(nullptr) {
  if (!src) throw std::invalid_argument("ReverseLineReader: null source");
  if (cfg.capacity == 0) throw std::invalid_argument("ReverseLineReader: capacity must be positive");

  std::uint64_t len = 0;
  if (!src->size(len)) {
    throw std::system_error(src->last_error(), std::generic_category(),
                            "ReverseLineReader: source length probe failed");
  }
  p_ = new Impl(std::move(src), cfg.capacity, len);
}

ReverseLineReader ReverseLineReader::with_capacity(std::size_t capacity,
                                                   std::unique_ptr<ByteSource> src) {
  Config cfg;
  cfg.capacity = capacity;
  return ReverseLineReader(std::move(src), cfg);
}

ReverseLineReader::ReverseLineReader(ReverseLineReader&& other) noexcept : p_(other.p_) {
  other.p_ = nullptr;
}

ReverseLineReader& ReverseLineReader::operator=(ReverseLineReader&& other) noexcept {
  if (this != &other) {
    delete p_;
    p_ = other.p_;
    other.p_ = nullptr;
  }
  return *this;
}

ReverseLineReader::~ReverseLineReader() { delete p_; }

ReverseLineReader::Status ReverseLineReader::next_line(std::string& out) { return p_->next(out); }

bool ReverseLineReader::for_each_line(const LineCallback& cb) {
  std::string line;
  for (;;) {
    switch (p_->next(line)) {
      case Status::Line:
        if (!cb(line)) return true;
        break;
      case Status::EndOfInput:
        return true;
      case Status::IoError:
      case Status::DecodeError:
        return false;
    }
  }
}

std::string_view ReverseLineReader::buffer() const noexcept {
  return std::string_view(p_->buf.data(), p_->scan);
}

ByteSource* ReverseLineReader::source() noexcept { return p_->src.get(); }
std::unique_ptr<ByteSource> ReverseLineReader::release() noexcept { return std::move(p_->src); }

std::uint64_t ReverseLineReader::position() const noexcept { return p_->pos; }
std::uint64_t ReverseLineReader::length() const noexcept { return p_->length; }
std::size_t   ReverseLineReader::capacity() const noexcept { return p_->buf.size(); }

std::uint64_t ReverseLineReader::bytes_read() const noexcept { return p_->bytes; }
std::uint64_t ReverseLineReader::fetches() const noexcept { return p_->fetch_count; }
std::uint64_t ReverseLineReader::lines() const noexcept { return p_->line_count; }

int ReverseLineReader::last_error() const noexcept { return p_->last_errno; }
const std::string& ReverseLineReader::error() const noexcept { return p_->err; }

const char* to_string(ReverseLineReader::Status s) noexcept {
  switch (s) {
    case ReverseLineReader::Status::Line:        return "line";
    case ReverseLineReader::Status::EndOfInput:  return "end-of-input";
    case ReverseLineReader::Status::IoError:     return "io-error";
    case ReverseLineReader::Status::DecodeError: return "decode-error";
  }
  return "unknown";
}

}
