#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

#include "jsonl_rev/arena.hpp"
#include "jsonl_rev/byte_source.hpp"
#include "jsonl_rev/chunk_reader.hpp"
#include "jsonl_rev/jsonl.hpp"
#include "jsonl_rev/record_view.hpp"
#include "jsonl_rev/reverse_line_reader.hpp"
#include "jsonl_rev/token_jsonl_simdjson.hpp"

namespace fs = std::filesystem;
using clk = std::chrono::steady_clock;

static std::string make_synth_jsonl(std::size_t rows, std::size_t cols) {
  fs::path p = fs::temp_directory_path() / "jr_bench_synth.jsonl";
  std::ofstream out(p, std::ios::binary);
  for (size_t r = 0; r < rows; ++r) {
    out << "{";
    for (size_t c = 0; c < cols; ++c) {
      out << "\"k" << c << "\":\"" << (r%10) << "." << (c*37%1000) << "\"";
      if (c+1<cols) out << ",";
    }
    out << "}\n";
  }
  out.flush();
  return p.string();
}

struct Args {
  std::string path;               // if empty -> synth
  std::size_t rows = 200'000;     // for synth
  std::size_t cols = 8;           // for synth
  std::size_t buffer_bytes = jr::ReverseLineReader::kDefaultCapacity;
  std::size_t tail = 10;
  int iters = 3;
};

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i=1;i<argc;++i){
    std::string s(argv[i]);
    auto eq = s.find('=');
    auto key = s.substr(0, eq);
    auto val = (eq==std::string::npos) ? "" : s.substr(eq+1);
    if (key=="--jsonl") a.path = val;
    else if (key=="--rows") a.rows = std::stoull(val);
    else if (key=="--cols") a.cols = std::stoull(val);
    else if (key=="--buffer-bytes") a.buffer_bytes = std::stoull(val);
    else if (key=="--tail") a.tail = std::stoull(val);
    else if (key=="--iters") a.iters = std::stoi(val);
    else if (key=="--help" || key=="-h") {
      std::cout <<
        "Usage: jr_bench_reverse [--jsonl=path] [--rows=N] [--cols=M] [--buffer-bytes=B] [--tail=T] [--iters=K]\n"
        "If the path is omitted, a synthetic JSONL file is generated.\n";
      std::exit(0);
    }
  }
  if (a.buffer_bytes == 0) a.buffer_bytes = 1;
  return a;
}

static std::unique_ptr<jr::ByteSource> open_or_die(const std::string& path) {
  int e = 0;
  auto f = jr::FileSource::open(path, &e);
  if (!f) { std::cerr << "[bench] cannot open " << path << " errno=" << e << "\n"; std::exit(2); }
  return f;
}

static void report(const char* label, int k, std::uint64_t lines, std::uint64_t bytes, double sec) {
  const double mib = bytes / (1024.0*1024.0);
  std::cout << "  " << label << " iter " << k
            << ": lines=" << lines
            << " bytes=" << bytes
            << " time=" << sec << "s"
            << "  throughput=" << (sec > 0 ? mib/sec : 0.0) << " MiB/s\n";
}

// Whole file front to back, as a baseline.
static void bench_forward(const Args& a, const std::string& path) {
  for (int k=1;k<=a.iters;++k) {
    jr::ChunkReader::Config cfg;
    cfg.chunk_bytes = a.buffer_bytes;
    jr::ChunkReader rd(open_or_die(path), cfg);
    std::uint64_t n=0;
    auto t0 = clk::now();
    rd.for_each_line([&](std::string_view){ ++n; return true; });
    auto t1 = clk::now();
    report("forward", k, n, rd.bytes_read(), std::chrono::duration<double>(t1-t0).count());
  }
}

// Whole file back to front.
static void bench_reverse(const Args& a, const std::string& path) {
  for (int k=1;k<=a.iters;++k) {
    auto rd = jr::ReverseLineReader::with_capacity(a.buffer_bytes, open_or_die(path));
    std::uint64_t n=0;
    auto t0 = clk::now();
    rd.for_each_line([&](std::string_view){ ++n; return true; });
    auto t1 = clk::now();
    report("reverse", k, n, rd.bytes_read(), std::chrono::duration<double>(t1-t0).count());
  }
}

// Last N records parsed; should read a few windows regardless of file size.
static void bench_tail_records(const Args& a, const std::string& path) {
  for (int k=1;k<=a.iters;++k) {
    jr::Jsonl::Config cfg;
    cfg.buffer_bytes = a.buffer_bytes;
    jr::Jsonl j(open_or_die(path), cfg);
    jr::Arena header(64*1024), rows(1024*1024);
    jr::JsonlConfig tcfg;
    jr::JsonlTokenizer tok(tcfg, header, rows);
    std::size_t left = a.tail;
    auto t0 = clk::now();
    bool ok = a.tail == 0 || j.for_each_record(jr::Direction::Reverse, tok, [&](const jr::RecordView&){
      return --left > 0;
    });
    auto t1 = clk::now();
    if (!ok) { std::cerr << "[bench] tail failed: " << j.error() << "\n"; return; }
    report("tail-records", k, tok.rows(), j.bytes_read(), std::chrono::duration<double>(t1-t0).count());
  }
}

int main(int argc, char** argv){
  Args a = parse_args(argc, argv);

  std::string path = a.path;
  if (path.empty() || !fs::exists(path)) path = make_synth_jsonl(a.rows, a.cols);

  std::cout << "\n[JSONL] file=" << path << " size=" << fs::file_size(path)
            << " buffer=" << a.buffer_bytes << " iters=" << a.iters << "\n";
  bench_forward(a, path);
  bench_reverse(a, path);
  bench_tail_records(a, path);
  return 0;
}
