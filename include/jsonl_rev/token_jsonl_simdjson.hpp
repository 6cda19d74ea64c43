#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace jr {

class Arena;
class RecordView;

struct JsonlConfig {
  bool   strict = true;                      // object-only in strict mode
  size_t cap_nested_value_bytes = 32 * 1024; // cap for arrays/objects raw storage
  bool   intern_keys = true;                 // store keys in header arena (stable)
  bool   align_to_header = true;             // false: each object keeps its own keys
};

class JsonlTokenizer {
public:
  using RecordCallback = std::function<void(const RecordView&)>;

  JsonlTokenizer(const JsonlConfig& cfg, Arena& header_arena, Arena& row_arena);
  ~JsonlTokenizer();
  JsonlTokenizer(const JsonlTokenizer&) = delete;
  JsonlTokenizer& operator=(const JsonlTokenizer&) = delete;

  // Parses one line. False (see error()) on malformed JSON or, in strict
  // mode, a non-object line.
  bool feed_line(std::string_view line, const RecordCallback& on_record);

  // Forget the captured header; the next object defines a new one.
  void reset_header();

  const std::vector<std::string_view>& header() const;
  std::uint64_t rows() const noexcept { return rows_; }
  const std::string& error() const { return err_; }

private:
  struct Impl; Impl* p_;
  std::uint64_t rows_{0};
  std::string err_;
};

}
