#pragma once
#include <cstdint>
#include <string>

namespace jr {

// Counters for one CLI run, printed with --stats.
struct RunStats {
  std::string mode;            // reverse | head | tail | count
  std::string filename;
  std::string content_type;
  std::uint64_t file_size = 0;
  std::uint64_t buffer_bytes = 0;

  std::uint64_t lines = 0;     // lines handed to the output
  std::uint64_t records = 0;   // lines parsed as JSON (with --records)
  std::uint64_t bytes_read = 0;
  std::uint64_t fetches = 0;   // backward chunk reads (reverse modes)
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;

  bool ok = true;
  std::string error;
};

class RunStatsWriter {
public:
  // Serialize stats to a single-line JSON object.
  static std::string to_json(const RunStats& s);
};

}
