#pragma once
#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

namespace jr {

// Bump allocator for decoded record text. Memory comes in blocks that are
// never moved, so every view handed out stays valid until reset().
class Arena {
public:
  explicit Arena(std::size_t block_bytes = 64 * 1024);

  void* alloc(std::size_t n);
  std::string_view copy(std::string_view s);

  // Rewind to the first block; blocks are kept for reuse.
  void reset() noexcept;

  // Rewind and free all blocks but the first.
  void reset_and_shrink();

  std::size_t used() const noexcept;
  std::size_t capacity() const noexcept;
  std::size_t high_water() const noexcept;

private:
  struct Block {
    std::unique_ptr<char[]> data;
    std::size_t size;
  };

  std::size_t block_bytes_;
  std::vector<Block> blocks_;
  std::size_t current_{0};    // index of the block being filled
  std::size_t head_{0};       // bytes used in blocks_[current_]
  std::size_t used_{0};
  std::size_t high_water_{0};
};

}
