#include "jsonl_rev/token_jsonl_simdjson.hpp"
#include "jsonl_rev/record_view.hpp"
#include "jsonl_rev/arena.hpp"
#include <iostream>
#include <string>
#include <vector>

static int failures = 0;
static void expect(bool cond, const std::string& what) {
  if (!cond) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

// Feeds one line and copies the record out (views die with the row arena).
static bool feed(jr::JsonlTokenizer& tok, std::string_view line, std::vector<std::string>& fields,
                 bool* has_header = nullptr) {
  fields.clear();
  return tok.feed_line(line, [&](const jr::RecordView& rv){
    for (std::size_t i = 0; i < rv.size(); ++i) fields.emplace_back(rv.at(i));
    if (has_header) *has_header = rv.header() != nullptr;
  });
}

int main(){
  jr::Arena hdr(4 * 1024), rows(16 * 1024);

  // strict: objects aligned to the first object's key order
  {
    jr::JsonlConfig cfg;
    jr::JsonlTokenizer tok(cfg, hdr, rows);
    std::vector<std::string> f;

    bool ok = feed(tok, R"({"id":1,"name":"a\"b","score":0.10,"tags":[1,2],"ok":true,"none":null})", f);
    expect(ok, "first object: " + tok.error());
    expect(tok.header().size() == 6 && tok.header()[1] == "name", "header captured in key order");
    expect(f == std::vector<std::string>{"1", "a\"b", "0.10", "[1,2]", "true", ""},
           "scalar rendering, raw number text, null as empty");

    std::string extra;
    ok = tok.feed_line(R"({"name":"b","id":2,"extra":5})", [&](const jr::RecordView& rv){
      f.clear();
      for (std::size_t i = 0; i < rv.size(); ++i) f.emplace_back(rv.at(i));
      extra = std::string(rv.find("extra"));
      expect(rv.find("name") == "b", "find by key");
      expect(rv.colname(0) == "id", "colname");
    });
    expect(ok, "second object: " + tok.error());
    expect(f.size() == 6 && f[0] == "2" && f[1] == "b" && f[2].empty(), "reordered keys realigned");
    expect(extra.empty(), "unknown key not in header");
    expect(tok.rows() == 2, "rows counted");

    expect(!feed(tok, "[1,2]", f), "array rejected in strict mode");
    expect(tok.error().find("non-object") != std::string::npos, "strict error message: " + tok.error());
    expect(!feed(tok, "42", f), "scalar rejected in strict mode");
    expect(!feed(tok, R"({"id":)", f), "truncated object rejected");
    expect(!tok.error().empty(), "parse error message kept");
    expect(!feed(tok, R"({"id":3} {"id":4})", f), "two documents on one line rejected");
    expect(tok.rows() == 2, "failed lines do not count");

    tok.reset_header();
    ok = feed(tok, R"({"k":"v"})", f);
    expect(ok && tok.header().size() == 1 && tok.header()[0] == "k", "reset_header starts a new header");
  }

  // lenient: non-object lines become one-field records without a header
  {
    jr::JsonlConfig cfg;
    cfg.strict = false;
    jr::JsonlTokenizer tok(cfg, hdr, rows);
    std::vector<std::string> f;
    bool has_header = true;

    expect(feed(tok, "42", f, &has_header) && f == std::vector<std::string>{"42"}, "number line");
    expect(!has_header, "no header on scalar lines");
    expect(feed(tok, R"("hi\n")", f) && f == std::vector<std::string>{"hi\n"}, "string line unescaped");
    expect(feed(tok, "false", f) && f == std::vector<std::string>{"false"}, "bool line");
    expect(feed(tok, "null", f) && f.size() == 1 && f[0].empty(), "null line");
    expect(feed(tok, "[1,2]", f) && f == std::vector<std::string>{"[1,2]"}, "array line");
    expect(!feed(tok, "nul", f), "malformed literal");
    expect(!feed(tok, "1 2", f), "trailing content after scalar");
  }

  // nested values are capped
  {
    jr::JsonlConfig cfg;
    cfg.cap_nested_value_bytes = 8;
    jr::JsonlTokenizer tok(cfg, hdr, rows);
    std::vector<std::string> f;
    expect(feed(tok, R"({"a":[1,2,3,4,5,6,7]})", f) && f.size() == 1 && f[0] == "[1,2,...",
           "nested value capped with ellipsis: " + (f.empty() ? std::string() : f[0]));
  }

  // the cap never splits a multi-byte character
  {
    jr::JsonlConfig cfg;
    cfg.cap_nested_value_bytes = 8;
    jr::JsonlTokenizer tok(cfg, hdr, rows);
    std::vector<std::string> f;
    // raw value is ["ééééé"]; byte 5 is the second half of the second é
    expect(feed(tok, "{\"a\":[\"\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\"]}", f) && f.size() == 1
           && f[0] == "[\"\xC3\xA9...", "cap backs off to a character boundary");
  }

  // without alignment every object reports its own keys
  {
    jr::JsonlConfig cfg;
    cfg.align_to_header = false;
    jr::JsonlTokenizer tok(cfg, hdr, rows);
    std::vector<std::string> names, values;
    auto grab = [&](const jr::RecordView& rv){
      names.clear(); values.clear();
      for (std::size_t i = 0; i < rv.size(); ++i) {
        names.emplace_back(rv.colname(i));
        values.emplace_back(rv.at(i));
      }
    };
    expect(tok.feed_line(R"({"a":1})", grab) && names == std::vector<std::string>{"a"}, "first object keys");
    expect(tok.feed_line(R"({"b":2,"c":"x"})", grab)
           && names == std::vector<std::string>{"b", "c"}
           && values == std::vector<std::string>{"2", "x"}, "second object keeps its own keys");
    expect(tok.header().empty(), "no shared header when not aligning");
  }

  if (failures) {
    std::cerr << "[FAIL] jsonl tokenizer: " << failures << " check(s)\n";
    return 1;
  }
  std::cout << "[PASS] jsonl tokenizer\n";
  return 0;
}
