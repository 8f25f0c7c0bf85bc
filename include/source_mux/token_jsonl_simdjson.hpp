#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace smux {

struct JsonlConfig {
  bool   strict = true;                       // object-only in strict mode
  size_t cap_nested_value_bytes = 32 * 1024;  // cap for arrays/objects raw storage
};

// One JSON document per line, via simdjson on-demand.
class JsonlTokenizer {
public:
  explicit JsonlTokenizer(const JsonlConfig& cfg);
  ~JsonlTokenizer();

  JsonlTokenizer(const JsonlTokenizer&) = delete;
  JsonlTokenizer& operator=(const JsonlTokenizer&) = delete;

  // Objects: keys in document order with their rendered values. Non-object
  // lines (lenient mode only): no keys, one value holding the raw JSON.
  bool parse_line(std::string_view line,
                  std::vector<std::string>& keys,
                  std::vector<std::string>& values);

  const std::string& error() const { return err_; }

private:
  struct Impl; Impl* p_;
  std::string err_;
};

}
