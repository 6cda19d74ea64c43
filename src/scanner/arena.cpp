#include "jsonl_rev/arena.hpp"
#include <algorithm>
#include <cstring>

namespace jr {

Arena::Arena(std::size_t block_bytes) : block_bytes_(block_bytes ? block_bytes : 1) {}

void* Arena::alloc(std::size_t n) {
  if (n == 0) n = 1;
  while (current_ < blocks_.size() && head_ + n > blocks_[current_].size) {
    ++current_;
    head_ = 0;
  }
  if (current_ == blocks_.size()) {
    // oversized requests get a block of their own
    std::size_t size = std::max(n, block_bytes_);
    blocks_.push_back(Block{std::unique_ptr<char[]>(new char[size]), size});
    head_ = 0;
  }
  void* p = blocks_[current_].data.get() + head_;
  head_ += n;
  used_ += n;
  if (used_ > high_water_) high_water_ = used_;
  return p;
}

std::string_view Arena::copy(std::string_view s) {
  if (s.empty()) return {};
  void* p = alloc(s.size());
  std::memcpy(p, s.data(), s.size());
  return std::string_view(static_cast<const char*>(p), s.size());
}

void Arena::reset() noexcept {
  current_ = 0;
  head_ = 0;
  used_ = 0;
}

void Arena::reset_and_shrink() {
  reset();
  if (blocks_.size() > 1) blocks_.resize(1);
}

std::size_t Arena::used() const noexcept { return used_; }

std::size_t Arena::capacity() const noexcept {
  std::size_t total = 0;
  for (const auto& b : blocks_) total += b.size;
  return total;
}

std::size_t Arena::high_water() const noexcept { return high_water_; }

}
