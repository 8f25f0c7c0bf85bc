#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <sys/wait.h>
#include <simdjson.h>

namespace fs = std::filesystem;

static std::string env_or(const char* k, const char* defv) {
  const char* v = std::getenv(k);
  return (v && *v) ? std::string(v) : std::string(defv);
}

static std::string slurp(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

int main(int argc, char** argv) {
  std::string bin = (argc > 1) ? argv[1] : env_or("SMUX_BIN", "build/source-mux");
  if (!fs::exists(bin)) { std::cerr << "[ERR] binary not found: " << bin << "\n"; return 2; }

  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  fs::path work = fs::temp_directory_path() / ("smux-e2e-jsonl-" + std::to_string(stamp));
  fs::create_directories(work);
  const fs::path summary = work / "summary.json";
  const fs::path printed = work / "rows.txt";

  // Two specs: a file: URL and a bare path; the format comes from the extension.
  const std::string url = "file://" + fs::absolute("tests/data/jsonl/day-1.jsonl").generic_string();
  std::string cmd = "\"" + bin + "\" --print --delimiter='|' --summary-json=\"" + summary.string() + "\" '" +
                    url + "' tests/data/jsonl/day-2.jsonl >\"" + printed.string() + "\" 2>/dev/null";
  int rc = std::system(cmd.c_str());
  if (rc == -1 || !WIFEXITED(rc) || WEXITSTATUS(rc) != 0) {
    std::cerr << "[FAIL] source-mux returned " << rc << "\n";
    return 1;
  }

  simdjson::ondemand::parser p;
  auto json = simdjson::padded_string::load(summary.string());
  auto doc = p.iterate(json);

  bool ok = true;
  uint64_t rows = doc["rows"].get_uint64().value_or(0);
  std::string_view format = doc["format"].get_string().value_or("");
  std::vector<std::string> header;
  for (auto v : doc["header"].get_array()) header.emplace_back(v.get_string().value_or(""));

  if (rows != 4) { std::cerr << "[FAIL] rows=" << rows << " want 4\n"; ok = false; }
  if (format != "jsonl") { std::cerr << "[FAIL] format=" << format << "\n"; ok = false; }
  if (header != std::vector<std::string>{"city", "temp_c", "tags"}) { std::cerr << "[FAIL] header\n"; ok = false; }

  const std::string out = slurp(printed);
  const std::string want =
      "Oslo|-3.5|\"[\"\"cold\"\",\"\"north\"\"]\"\n"
      "Lima|22.1|[]\n"
      "Cairo|18.0|\n"
      "Perth||\n";
  if (out != want) { std::cerr << "[FAIL] printed rows differ:\n" << out; ok = false; }

  std::error_code ec;
  fs::remove_all(work, ec);

  if (!ok) return 1;
  std::cout << "[PASS] end-to-end JSONL: rows=" << rows << "\n";
  return 0;
}
