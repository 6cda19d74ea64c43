#include "jsonl_rev/byte_source.hpp"
#include <cerrno>
#include <cstring>
#include <limits>
#include <sys/types.h>

namespace jr {

std::unique_ptr<FileSource> FileSource::open(const std::string& path, int* err_out) {
  std::FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) {
    if (err_out) *err_out = errno;
    return nullptr;
  }
  return std::unique_ptr<FileSource>(new FileSource(f, true));
}

std::unique_ptr<FileSource> FileSource::adopt(std::FILE* f, bool owns) {
  if (!f) return nullptr;
  return std::unique_ptr<FileSource>(new FileSource(f, owns));
}

FileSource::~FileSource() {
  if (f_ && owns_) std::fclose(f_);
}

bool FileSource::seek(std::uint64_t offset) {
  if (offset > static_cast<std::uint64_t>(std::numeric_limits<off_t>::max())) {
    last_errno_ = EOVERFLOW;
    return false;
  }
  if (fseeko(f_, static_cast<off_t>(offset), SEEK_SET) != 0) {
    last_errno_ = errno;
    return false;
  }
  return true;
}

std::int64_t FileSource::read(char* dst, std::size_t n) {
  std::size_t got = std::fread(dst, 1, n, f_);
  if (got < n && std::ferror(f_)) {
    last_errno_ = errno ? errno : EIO;
    std::clearerr(f_);
    return -1;
  }
  return static_cast<std::int64_t>(got);
}

bool FileSource::size(std::uint64_t& out) {
  if (fseeko(f_, 0, SEEK_END) != 0) { last_errno_ = errno; return false; }
  off_t end = ftello(f_);
  if (end < 0) { last_errno_ = errno; return false; }
  out = static_cast<std::uint64_t>(end);
  return true;
}

bool MemorySource::seek(std::uint64_t offset) {
  if (offset > data_.size()) { last_errno_ = EINVAL; return false; }
  cursor_ = static_cast<std::size_t>(offset);
  return true;
}

std::int64_t MemorySource::read(char* dst, std::size_t n) {
  std::size_t left = data_.size() - cursor_;
  std::size_t take = n < left ? n : left;
  if (take) std::memcpy(dst, data_.data() + cursor_, take);
  cursor_ += take;
  return static_cast<std::int64_t>(take);
}

bool MemorySource::size(std::uint64_t& out) {
  cursor_ = data_.size();
  out = data_.size();
  return true;
}

}
