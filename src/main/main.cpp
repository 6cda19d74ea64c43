#include "jsonl_rev/arena.hpp"
#include "jsonl_rev/byte_source.hpp"
#include "jsonl_rev/jsonl.hpp"
#include "jsonl_rev/path_utils.hpp"
#include "jsonl_rev/record_view.hpp"
#include "jsonl_rev/reverse_line_reader.hpp"
#include "jsonl_rev/run_stats.hpp"
#include "jsonl_rev/token_jsonl_simdjson.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>

namespace {

constexpr const char* kUsage =
  "Usage: jsonl-rev [--buffer-bytes=N] [--head=N | --tail=N | --reverse | --count]\n"
  "                 [--records] [--lenient] [--stats] <file>|-\n";

constexpr std::size_t kMaxBufferBytes = 1024 * 1024 * 1024; // 1 GiB

struct Cli {
  std::size_t buffer_bytes = jr::ReverseLineReader::kDefaultCapacity;
  std::string mode = "reverse"; // reverse|head|tail|count
  std::size_t n = 10;
  bool records = false;
  bool lenient = false;
  bool stats = false;
  std::string path;
};

bool parse_cli(int argc, char** argv, Cli& c) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat_n = [&](const char* pfx, std::size_t* out){
      const std::string p(pfx);
      if (a.rfind(p, 0) != 0) return false;
      const std::string v = a.substr(p.size());
      // stoull accepts "-1" and wraps; digits only
      if (v.empty() || v.find_first_not_of("0123456789") != std::string::npos)
        throw std::invalid_argument(v);
      *out = static_cast<std::size_t>(std::stoull(v));
      return true;
    };
    try {
      if (eat_n("--buffer-bytes=", &c.buffer_bytes)) continue;
      if (eat_n("--head=", &c.n)) { c.mode = "head"; continue; }
      if (eat_n("--tail=", &c.n)) { c.mode = "tail"; continue; }
    } catch (const std::exception&) {
      std::cerr << "[jsonl-rev] bad number in " << a << "\n";
      return false;
    }
    if (a == "--reverse") { c.mode = "reverse"; continue; }
    if (a == "--count")   { c.mode = "count";   continue; }
    if (a == "--records") { c.records = true;   continue; }
    if (a == "--lenient") { c.lenient = true;   continue; }
    if (a == "--stats")   { c.stats = true;     continue; }
    if (a == "-h" || a == "--help") {
      std::cout << kUsage;
      std::exit(0);
    }
    if (a.size() > 1 && a[0] == '-') {
      std::cerr << "[jsonl-rev] unknown option: " << a << "\n";
      return false;
    }
    if (!c.path.empty()) {
      std::cerr << "[jsonl-rev] more than one input given\n";
      return false;
    }
    c.path = a;
  }
  if (c.path.empty()) {
    std::cerr << "[jsonl-rev] no input given\n";
    return false;
  }
  if (c.buffer_bytes == 0 || c.buffer_bytes > kMaxBufferBytes) {
    std::cerr << "[jsonl-rev] --buffer-bytes must be in 1.." << kMaxBufferBytes << "\n";
    return false;
  }
  return true;
}

std::unique_ptr<jr::ByteSource> open_input(const std::string& path) {
  if (path == "-") return jr::FileSource::adopt(stdin, /*owns=*/false);
  int e = 0;
  auto f = jr::FileSource::open(path, &e);
  if (!f) {
    std::cerr << "[jsonl-rev] open failed: " << path << ": "
              << std::error_code(e, std::generic_category()).message() << "\n";
  }
  return f;
}

void print_record(const jr::RecordView& rv) {
  for (std::size_t i = 0; i < rv.size(); ++i) {
    if (i) std::cout << '\t';
    std::string_view k = rv.colname(i);
    if (!k.empty()) std::cout << k << '=';
    std::cout << rv.at(i);
  }
  std::cout << '\n';
}

// tac-style: every line, blank ones included, last line first.
bool run_plain_reverse(std::unique_ptr<jr::ByteSource> src, const Cli& cli, jr::RunStats& st) {
  jr::ReverseLineReader::Config rc;
  rc.capacity = cli.buffer_bytes;
  std::unique_ptr<jr::ReverseLineReader> reader;
  try {
    reader.reset(new jr::ReverseLineReader(std::move(src), rc));
  } catch (const std::system_error& e) {
    st.error = e.what();
    std::cerr << "[jsonl-rev] cannot read backward: " << e.what() << "\n";
    return false;
  }

  std::string line;
  bool ok = true;
  for (bool more = true; more;) {
    switch (reader->next_line(line)) {
      case jr::ReverseLineReader::Status::Line:
        std::cout << line << '\n';
        ++st.lines;
        break;
      case jr::ReverseLineReader::Status::DecodeError:
        // the line is consumed; keep going with the one before it
        std::cerr << "[jsonl-rev] skipped: " << reader->error() << "\n";
        ok = false;
        break;
      case jr::ReverseLineReader::Status::IoError:
        st.error = reader->error();
        std::cerr << "[jsonl-rev] read error: " << reader->error() << "\n";
        return false;
      case jr::ReverseLineReader::Status::EndOfInput:
        more = false;
        break;
    }
  }
  st.bytes_read = reader->bytes_read();
  st.fetches = reader->fetches();
  if (!ok) st.error = "undecodable lines skipped";
  return ok;
}

bool run_jsonl(std::unique_ptr<jr::ByteSource> src, const Cli& cli, jr::RunStats& st) {
  jr::Jsonl::Config jc;
  jc.buffer_bytes = cli.buffer_bytes;
  jr::Jsonl jsonl(std::move(src), jc);

  jr::Arena header_arena(64 * 1024);
  jr::Arena row_arena(1024 * 1024);
  jr::JsonlConfig tcfg;
  tcfg.strict = !cli.lenient;
  tcfg.align_to_header = false; // print every key a record has
  jr::JsonlTokenizer tok(tcfg, header_arena, row_arena);

  auto on_line = [&](std::string_view s) {
    std::cout << s << '\n';
    ++st.lines;
    return true;
  };

  bool ok = true;
  if (cli.mode == "count") {
    std::uint64_t n = 0;
    ok = jsonl.count_lines(n);
    if (ok) std::cout << n << '\n';
    st.lines = n;
  } else if (!cli.records) {
    if (cli.mode == "head")      ok = jsonl.first_n(cli.n, on_line);
    else if (cli.mode == "tail") ok = jsonl.last_n(cli.n, on_line);
    else                         ok = jsonl.for_each_line(jr::Direction::Reverse, on_line);
  } else {
    const bool limited = cli.mode != "reverse";
    const jr::Direction dir = cli.mode == "head" ? jr::Direction::Forward : jr::Direction::Reverse;
    std::size_t left = cli.n;
    if (!(limited && left == 0)) {
      ok = jsonl.for_each_record(dir, tok, [&](const jr::RecordView& rv) {
        print_record(rv);
        ++st.lines;
        row_arena.reset();
        return !limited || --left > 0;
      });
    }
    st.records = tok.rows();
  }

  st.bytes_read = jsonl.bytes_read();
  st.fetches = jsonl.fetches();
  if (!ok) {
    st.error = jsonl.error();
    std::cerr << "[jsonl-rev] " << cli.mode << " failed: " << jsonl.error() << "\n";
  }
  return ok;
}

}

int main(int argc, char** argv) {
  std::ios::sync_with_stdio(false);

  Cli cli;
  if (!parse_cli(argc, argv, cli)) {
    std::cerr << kUsage;
    return 1;
  }

  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  auto src = open_input(cli.path);
  if (!src) return 2;

  const jr::FileFormat fmt = jr::detect_format(cli.path);
  jr::RunStats st;
  st.mode = cli.mode;
  st.filename = cli.path;
  st.content_type = std::string(jr::content_type(fmt));
  st.buffer_bytes = cli.buffer_bytes;
  if (cli.path != "-") {
    std::error_code fec;
    auto sz = std::filesystem::file_size(cli.path, fec);
    if (!fec) st.file_size = sz;
  }

  const bool plain = cli.mode == "reverse" && !cli.records;
  bool ok = false;
  try {
    ok = plain ? run_plain_reverse(std::move(src), cli, st)
               : run_jsonl(std::move(src), cli, st);
  } catch (const std::exception& e) {
    // e.g. std::bad_alloc for the read window
    st.error = e.what();
    std::cerr << "[jsonl-rev] " << cli.mode << " aborted: " << e.what() << "\n";
  }
  std::cout.flush();

  const auto t1 = ch::steady_clock::now();
  st.wall_time_ms = ch::duration<double, std::milli>(t1 - t0).count();
  const double sec = st.wall_time_ms / 1000.0;
  st.throughput_mb_s = sec > 0.0 ? (st.bytes_read / (1024.0 * 1024.0)) / sec : 0.0;
  st.ok = ok;

  if (cli.stats) std::cerr << jr::RunStatsWriter::to_json(st) << "\n";
  return ok ? 0 : 3;
}
