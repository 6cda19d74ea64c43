#include "jsonl_rev/jsonl.hpp"
#include "jsonl_rev/chunk_reader.hpp"
#include "jsonl_rev/record_view.hpp"
#include "jsonl_rev/token_jsonl_simdjson.hpp"

#include <simdjson.h>
#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace jr {

namespace {

enum class Step { Continue, Stop, Fail };

// Visitor over trimmed, non-blank lines; `no` is the 1-based physical line
// number counted in the walk's direction.
using LineVisitor = std::function<Step(std::string_view line, std::uint64_t no)>;

std::string_view trim(std::string_view s) {
  auto ws = [](char c){ return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
  while (!s.empty() && ws(s.front())) s.remove_prefix(1);
  while (!s.empty() && ws(s.back()))  s.remove_suffix(1);
  return s;
}

std::string where(Direction dir, std::uint64_t no) {
  return "line " + std::to_string(no) + (dir == Direction::Reverse ? " from the end" : "");
}

}

struct Jsonl::Impl {
  std::unique_ptr<ByteSource> src;
  Config cfg;
  std::uint64_t bytes{0};
  std::uint64_t fetch_count{0};
  int last_errno{0};
  std::string err;

  Impl(std::unique_ptr<ByteSource> s, Config c) : src(std::move(s)), cfg(c) {}

  void fail(int code, std::string msg) {
    last_errno = code;
    err = std::move(msg);
  }

  bool begin() {
    bytes = fetch_count = 0;
    last_errno = 0;
    err.clear();
    if (!src) { fail(EBADF, "source unavailable"); return false; }
    return true;
  }

  bool walk_forward(const LineVisitor& visit) {
    ChunkReader::Config rc;
    rc.chunk_bytes = cfg.buffer_bytes;
    rc.max_record_bytes = cfg.max_record_bytes;
    rc.drop_oversize = false; // an over-long line fails the walk instead of vanishing
    ChunkReader reader(std::move(src), rc);

    std::uint64_t no = 0;
    bool failed = false;
    const bool ok = reader.for_each_line([&](std::string_view raw) {
      ++no;
      if (reader.oversize_lines() != 0) {
        fail(EFBIG, where(Direction::Forward, no) + ": line exceeds max_record_bytes (" +
                    std::to_string(cfg.max_record_bytes) + ")");
        failed = true;
        return false;
      }
      std::string_view s = trim(raw);
      if (s.empty()) return true;
      if (!simdjson::validate_utf8(s.data(), s.size())) {
        fail(EILSEQ, where(Direction::Forward, no) + ": invalid UTF-8");
        failed = true;
        return false;
      }
      switch (visit(s, no)) {
        case Step::Continue: return true;
        case Step::Stop:     return false;
        case Step::Fail:     failed = true; return false;
      }
      return false;
    });

    bytes = reader.bytes_read();
    fetch_count = 0;
    src = reader.release();
    if (!ok) {
      const int e = reader.last_error();
      fail(e, "read failed: " + std::error_code(e, std::generic_category()).message());
      return false;
    }
    return !failed;
  }

  bool walk_reverse(const LineVisitor& visit) {
    // Probe first so a non-seekable source is reported without losing it.
    std::uint64_t len = 0;
    if (!src->size(len)) {
      const int e = src->last_error();
      fail(e, "source is not seekable: " + std::error_code(e, std::generic_category()).message());
      return false;
    }

    ReverseLineReader::Config rc;
    rc.capacity = cfg.buffer_bytes;
    ReverseLineReader reader(std::move(src), rc);

    std::uint64_t no = 0;
    std::string line;
    bool ok = true;
    for (bool more = true; more;) {
      switch (reader.next_line(line)) {
        case ReverseLineReader::Status::Line: {
          ++no;
          std::string_view s = trim(line);
          if (s.empty()) break;
          const Step st = visit(s, no);
          if (st == Step::Stop) more = false;
          if (st == Step::Fail) { ok = false; more = false; }
          break;
        }
        case ReverseLineReader::Status::EndOfInput:
          more = false;
          break;
        case ReverseLineReader::Status::DecodeError:
          fail(reader.last_error(), where(Direction::Reverse, no + 1) + ": invalid UTF-8");
          ok = false;
          more = false;
          break;
        case ReverseLineReader::Status::IoError:
          fail(reader.last_error(), reader.error());
          ok = false;
          more = false;
          break;
      }
    }

    bytes = reader.bytes_read();
    fetch_count = reader.fetches();
    src = reader.release();
    return ok;
  }

  bool walk(Direction dir, const LineVisitor& visit) {
    if (!begin()) return false;
    return dir == Direction::Forward ? walk_forward(visit) : walk_reverse(visit);
  }
};

Jsonl::Jsonl(std::unique_ptr<ByteSource> src) : Jsonl(std::move(src), Config{}) {}

Jsonl::Jsonl(std::unique_ptr<ByteSource> src, Config cfg) : p_(nullptr) {
  if (!src) throw std::invalid_argument("Jsonl: null source");
  if (cfg.buffer_bytes == 0) throw std::invalid_argument("Jsonl: buffer_bytes must be positive");
  p_ = new Impl(std::move(src), cfg);
}

Jsonl::~Jsonl() { delete p_; }

std::unique_ptr<Jsonl> Jsonl::from_path(const std::string& path, std::string* err_out) {
  return from_path(path, Config{}, err_out);
}

std::unique_ptr<Jsonl> Jsonl::from_path(const std::string& path, Config cfg,
                                        std::string* err_out) {
  int e = 0;
  auto f = FileSource::open(path, &e);
  if (!f) {
    if (err_out) *err_out = "failed to open " + path + ": " +
                            std::error_code(e, std::generic_category()).message();
    return nullptr;
  }
  return std::unique_ptr<Jsonl>(new Jsonl(std::move(f), cfg));
}

bool Jsonl::for_each_line(Direction dir, const LineCallback& cb) {
  return p_->walk(dir, [&](std::string_view s, std::uint64_t) {
    return cb(s) ? Step::Continue : Step::Stop;
  });
}

bool Jsonl::first_n(std::size_t n, const LineCallback& cb) {
  if (n == 0) return p_->begin();
  std::size_t left = n;
  return p_->walk(Direction::Forward, [&](std::string_view s, std::uint64_t) {
    if (!cb(s)) return Step::Stop;
    return --left == 0 ? Step::Stop : Step::Continue;
  });
}

bool Jsonl::last_n(std::size_t n, const LineCallback& cb) {
  if (n == 0) return p_->begin();
  std::size_t left = n;
  return p_->walk(Direction::Reverse, [&](std::string_view s, std::uint64_t) {
    if (!cb(s)) return Step::Stop;
    return --left == 0 ? Step::Stop : Step::Continue;
  });
}

bool Jsonl::count_lines(std::uint64_t& out) {
  std::uint64_t n = 0;
  const bool ok = p_->walk(Direction::Forward, [&](std::string_view, std::uint64_t) {
    ++n;
    return Step::Continue;
  });
  out = n;
  return ok;
}

bool Jsonl::for_each_record(Direction dir, JsonlTokenizer& tok, const RecordCallback& cb) {
  return p_->walk(dir, [&](std::string_view s, std::uint64_t no) {
    bool keep = true;
    if (!tok.feed_line(s, [&](const RecordView& rv) { keep = cb(rv); })) {
      p_->fail(EINVAL, where(dir, no) + ": " + tok.error());
      return Step::Fail;
    }
    return keep ? Step::Continue : Step::Stop;
  });
}

std::uint64_t Jsonl::bytes_read() const noexcept { return p_->bytes; }
std::uint64_t Jsonl::fetches() const noexcept { return p_->fetch_count; }

int Jsonl::last_error() const noexcept { return p_->last_errno; }
const std::string& Jsonl::error() const noexcept { return p_->err; }

}
