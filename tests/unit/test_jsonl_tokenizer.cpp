#include "source_mux/token_jsonl_simdjson.hpp"
#include "support/test_sources.hpp"

using namespace smux_test;
using Strs = std::vector<std::string>;

int main() {
  smux::JsonlTokenizer tok(smux::JsonlConfig{});
  Strs keys, values;

  check(tok.parse_line(R"({"a":1,"b":"x\"y","c":true,"d":null,"e":2.50})", keys, values),
        "object line parses: " + tok.error());
  check(keys == Strs{"a", "b", "c", "d", "e"}, "keys in document order");
  check(values == Strs{"1", "x\"y", "true", "", "2.50"}, "scalars rendered, numbers keep their text");

  check(tok.parse_line(R"({"arr":[1, 2],"obj":{"k":"v"}})", keys, values) &&
        values == Strs{"[1, 2]", R"({"k":"v"})"}, "nested values keep their raw JSON");

  check(tok.parse_line("{}", keys, values) && keys.empty() && values.empty(), "empty object");

  check(!tok.parse_line("[1,2]", keys, values) && !tok.error().empty(), "array line rejected in strict mode");
  check(!tok.parse_line(R"({"a":)", keys, values) && !tok.error().empty(), "truncated object rejected");
  check(!tok.parse_line(R"({"a":1} {"b":2})", keys, values), "trailing content rejected");

  smux::JsonlConfig lenient;
  lenient.strict = false;
  lenient.cap_nested_value_bytes = 8;
  smux::JsonlTokenizer loose(lenient);
  check(loose.parse_line("  42 ", keys, values) && keys.empty() && values == Strs{"42"},
        "lenient mode keeps a scalar line as one raw value");
  check(loose.parse_line(R"({"big":[1,2,3,4,5,6,7,8]})", keys, values) && values.size() == 1 &&
        values[0].size() == 8 && values[0].substr(5) == "...", "nested values are capped");

  return finish();
}
