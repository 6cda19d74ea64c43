#pragma once
#include <string_view>
#include <vector>
#include <cstddef>

namespace jr {

// Lightweight view over one tokenized JSONL record.
// fields_ hold values aligned to header_: the key order of the first object
// seen, or the record's own keys when the tokenizer does not align. header_ is
// null for lenient scalar/array lines.
class RecordView {
public:
  RecordView() = default;
  RecordView(const std::vector<std::string_view>* header,
             const std::vector<std::string_view>* fields)
      : header_(header), fields_(fields) {}

  std::size_t size() const noexcept { return fields_ ? fields_->size() : 0; }

  std::string_view at(std::size_t i) const {
    return (fields_ && i < fields_->size()) ? (*fields_)[i] : std::string_view{};
  }

  std::string_view colname(std::size_t i) const {
    return (header_ && i < header_->size()) ? (*header_)[i] : std::string_view{};
  }

  // Value for `key`, or an empty view when the key is unknown or the value is null.
  std::string_view find(std::string_view key) const {
    if (!header_) return {};
    for (std::size_t i = 0; i < header_->size(); ++i)
      if ((*header_)[i] == key) return at(i);
    return {};
  }

  const std::vector<std::string_view>* header() const noexcept { return header_; }
  const std::vector<std::string_view>* fields() const noexcept { return fields_; }

private:
  const std::vector<std::string_view>* header_{nullptr};
  const std::vector<std::string_view>* fields_{nullptr};
};

}
