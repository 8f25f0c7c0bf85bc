#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace smux {

struct RunSummary {
  std::uint64_t rows = 0;
  std::uint64_t bytes = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;
  double rows_per_sec = 0.0;

  std::string format;                 // "csv" | "jsonl"
  std::vector<std::string> header;
  // Rows per source, in first-seen order.
  std::vector<std::pair<std::string, std::uint64_t>> sources;

  std::string status = "ok";          // StatusCode name
  std::string message;
};

class RunJsonWriter {
public:
  // Serialize summary to compact JSON.
  static std::string to_json(const RunSummary& s);
};

}
