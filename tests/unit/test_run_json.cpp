#include "source_mux/run_json.hpp"
#include "support/test_sources.hpp"

#include <simdjson.h>

using namespace smux_test;

int main() {
  smux::RunSummary s;
  s.rows = 3;
  s.bytes = 120;
  s.wall_time_ms = 2.5;
  s.throughput_mb_s = 0.05;
  s.rows_per_sec = 1200;
  s.format = "csv";
  s.header = {"id", "na\"me"};
  s.sources = {{"b.csv", 2}, {"a\tc.csv", 1}};
  s.status = "parse error";
  s.message = "line\n2";

  const std::string json = smux::RunJsonWriter::to_json(s);
  simdjson::padded_string buf(json);
  simdjson::ondemand::parser p;
  try {
    auto doc = p.iterate(buf);
    check(uint64_t(doc["rows"]) == 3, "rows");
    check(uint64_t(doc["bytes"]) == 120, "bytes");
    check(double(doc["wall_time_ms"]) == 2.5, "wall time");
    check(std::string_view(doc["format"]) == "csv", "format");

    std::vector<std::string> header;
    for (auto v : doc["header"].get_array()) header.emplace_back(std::string_view(v));
    check(header == std::vector<std::string>{"id", "na\"me"}, "header escaped and restored");

    std::vector<std::pair<std::string, uint64_t>> sources;
    for (auto o : doc["sources"].get_array()) {
      std::string name((std::string_view(o["name"])));
      sources.emplace_back(name, uint64_t(o["rows"]));
    }
    check(sources == s.sources, "per-source rows in order");
    check(std::string_view(doc["status"]) == "parse error", "status");
    check(std::string_view(doc["message"]) == "line\n2", "message with newline");
  } catch (const simdjson::simdjson_error& e) {
    check(false, std::string("summary JSON parses: ") + e.what() + "\n" + json);
  }
  return finish();
}
