#include "jsonl_rev/token_jsonl_simdjson.hpp"
#include "jsonl_rev/arena.hpp"
#include "jsonl_rev/record_view.hpp"

#include <simdjson.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jr {

static std::string_view trim_token(std::string_view tok) {
  while (!tok.empty() && (tok.back() == ' ' || tok.back() == '\t' ||
                          tok.back() == '\r' || tok.back() == '\n')) {
    tok.remove_suffix(1);
  }
  return tok;
}

// Largest prefix length <= n that does not end inside a UTF-8 sequence.
static size_t utf8_floor(std::string_view s, size_t n) {
  while (n > 0 && n < s.size() && (static_cast<unsigned char>(s[n]) & 0xC0) == 0x80) --n;
  return n;
}

static std::string_view copy_capped(Arena& arena, std::string_view s, size_t cap) {
  if (s.size() <= cap) return arena.copy(s);
  if (cap <= 3) return arena.copy(s.substr(0, utf8_floor(s, cap)));
  std::string out; out.reserve(cap);
  out.append(s.substr(0, utf8_floor(s, cap - 3)));
  out.append("...");
  return arena.copy(out);
}

struct JsonlTokenizer::Impl {
  JsonlConfig cfg;
  Arena& header_arena; // owns header keys (interned)
  Arena& row_arena;    // per-line values

  std::vector<std::string_view> header;
  std::vector<std::string_view> keys;   // per-record keys when not aligning
  std::vector<std::string_view> fields;
  std::vector<std::pair<std::string_view, std::string_view>> kvs;

  simdjson::ondemand::parser parser;
  std::string scratch; // padded copy of the current line

  Impl(const JsonlConfig& c, Arena& ha, Arena& ra)
    : cfg(c), header_arena(ha), row_arena(ra) {}

  std::string_view scalar(simdjson::ondemand::value v) {
    switch (v.type().value()) {
      case simdjson::ondemand::json_type::number:
        // keep the JSON text; 0.1 stays "0.1"
        return row_arena.copy(trim_token(v.raw_json_token()));
      case simdjson::ondemand::json_type::string: {
        std::string_view s = v.get_string().value();
        return row_arena.copy(s);
      }
      case simdjson::ondemand::json_type::boolean:
        return v.get_bool().value() ? std::string_view("true") : std::string_view("false");
      case simdjson::ondemand::json_type::null:
        return std::string_view{};
      default: {
        // arrays/objects: cap their raw text
        std::string_view raw = simdjson::to_json_string(v).value();
        return copy_capped(row_arena, raw, cfg.cap_nested_value_bytes);
      }
    }
  }
};

JsonlTokenizer::JsonlTokenizer(const JsonlConfig& cfg, Arena& header_arena, Arena& row_arena)
  : p_(new Impl(cfg, header_arena, row_arena)) {}

JsonlTokenizer::~JsonlTokenizer() { delete p_; }

const std::vector<std::string_view>& JsonlTokenizer::header() const { return p_->header; }

void JsonlTokenizer::reset_header() { p_->header.clear(); }

bool JsonlTokenizer::feed_line(std::string_view line, const RecordCallback& on_record) {
  p_->fields.clear();
  err_.clear();

  std::string& scratch = p_->scratch;
  scratch.assign(line.data(), line.size());
  scratch.resize(line.size() + simdjson::SIMDJSON_PADDING, '\0');
  simdjson::padded_string_view view(scratch.data(), line.size(), scratch.size());

  try {
    auto doc = p_->parser.iterate(view).value();
    auto t   = doc.type().value();

    if (t == simdjson::ondemand::json_type::object) {
      // Single pass over object: build header (if needed) and collect kv pairs
      auto& kvs = p_->kvs;
      kvs.clear();
      const bool align = p_->cfg.align_to_header;
      const bool capture_header = align && p_->header.empty();

      simdjson::ondemand::object obj = doc.get_object().value();
      for (auto field : obj) {
        std::string_view k = field.unescaped_key().value();
        std::string_view ksv = (p_->cfg.intern_keys && capture_header)
          ? p_->header_arena.copy(k)
          : p_->row_arena.copy(k);

        if (p_->cfg.intern_keys && capture_header) {
          // First object seen -> capture header order
          p_->header.emplace_back(ksv);
        }
        simdjson::ondemand::value v = field.value();
        kvs.emplace_back(ksv, p_->scalar(v));
      }
      if (!doc.at_end()) {
        err_ = "trailing content after JSON object";
        return false;
      }

      // Align values by header order if present; else preserve discovery order
      if (align && !p_->header.empty()) {
        p_->fields.reserve(p_->header.size());
        for (auto hk : p_->header) {
          std::string_view val{};
          for (auto& kv : kvs) if (kv.first == hk) { val = kv.second; break; }
          p_->fields.push_back(val);
        }
      } else {
        p_->fields.reserve(kvs.size());
        for (auto& kv : kvs) p_->fields.push_back(kv.second);
      }

      const std::vector<std::string_view>* names = nullptr;
      if (!align) {
        p_->keys.clear();
        for (auto& kv : kvs) p_->keys.push_back(kv.first);
        names = &p_->keys;
      } else if (!p_->header.empty()) {
        names = &p_->header;
      }

      ++rows_;
      RecordView rv(names, &p_->fields);
      on_record(rv);
      return true;
    }

    // Non-object line handling
    if (p_->cfg.strict) {
      err_ = "JSONL strict mode: non-object line";
      return false;
    }

    // Lenient scalar/array -> 1-field record. Scalar documents cannot be
    // turned into ondemand values, so read them off the document directly.
    std::string_view val{};
    switch (t) {
      case simdjson::ondemand::json_type::number:
        val = p_->row_arena.copy(trim_token(doc.raw_json_token().value()));
        break;
      case simdjson::ondemand::json_type::string:
        val = p_->row_arena.copy(doc.get_string().value());
        break;
      case simdjson::ondemand::json_type::boolean:
        val = doc.get_bool().value() ? std::string_view("true") : std::string_view("false");
        break;
      case simdjson::ondemand::json_type::null:
        if (!doc.is_null().value()) { err_ = "malformed null"; return false; }
        break;
      default:
        val = copy_capped(p_->row_arena, simdjson::to_json_string(doc).value(),
                          p_->cfg.cap_nested_value_bytes);
        break;
    }
    if (!doc.at_end()) {
      err_ = "trailing content after JSON value";
      return false;
    }

    p_->fields.push_back(val);
    ++rows_;
    RecordView rv(nullptr, &p_->fields);
    on_record(rv);
    return true;

  } catch (const simdjson::simdjson_error& e) {
    err_ = e.what();
    return false;
  }
}

}
