#include "source_mux/date_parse.hpp"
#include "source_mux/parse_policy.hpp"
#include "support/test_sources.hpp"

using namespace smux_test;

int main() {
  smux::ParsePolicy p;

  check(p.parse_number("3.25") == 3.25 && p.parse_number("-1e3") == -1000.0 && p.parse_number("+7") == 7.0,
        "numbers");
  check(!p.parse_number("1.2.3") && !p.parse_number("") && !p.parse_number("12abc"), "bad numbers rejected");
  check(p.parse_int("42") == 42 && p.parse_int("-9") == -9 && !p.parse_int("4.2"), "integers");
  check(!p.parse_number("+-5") && !p.parse_number("++5") && !p.parse_number("+") &&
        !p.parse_int("+-5") && !p.parse_int("+") && p.parse_int("+12") == 12,
        "a leading '+' is not followed by another sign");
  check(p.parse_bool("TRUE") == true && p.parse_bool("no") == false && !p.parse_bool("maybe"), "booleans");
  check(p.is_null_token("") && p.is_null_token("NA") && !p.is_null_token("0"), "null tokens");

  check(smux::parse_iso8601_ms("1970-01-01") == 0, "epoch date");
  check(smux::parse_iso8601_ms("2024-01-15T08:00:00Z") == 1705305600000LL, "UTC timestamp");
  check(smux::parse_iso8601_ms("2024-01-15T10:00:00.500Z") == 1705312800500LL, "fractional seconds");
  check(smux::parse_iso8601_ms("2024-01-15T10:00:00+02:00") == 1705305600000LL, "offset applied");
  check(!smux::parse_iso8601_ms("2024-02-30") && !smux::parse_iso8601_ms("2024-01-15T25:00:00") &&
        !smux::parse_iso8601_ms("2024-01-15Tjunk"), "invalid dates rejected");

  smux::Header h({"n", "flag", "when"});
  std::vector<std::string> fields{"abc", "yes", "NA"};
  smux::SrcMeta meta{"s", 10};
  smux::RecordView rec(&h, &fields, &meta);

  std::optional<double> num;
  check(p.number(rec, "n", num).ok() && !num, "lenient-null policy leaves a bad number empty");

  smux::ParsePolicy strict;
  strict.on_error = smux::ParsePolicy::OnError::Strict;
  smux::Status st = strict.number(rec, "n", num);
  check(st.code() == smux::StatusCode::Parse && st.message() == "field n: cannot parse \"abc\" as number",
        "strict policy names the field: " + st.to_string());

  std::optional<bool> flag;
  check(strict.boolean(rec, "flag", flag).ok() && flag == true, "bool field");

  std::optional<std::int64_t> when;
  check(strict.date_ms(rec, "when", when).ok() && !when, "null token is not a conversion failure");

  check(strict.integer(rec, "nope", when).code() == smux::StatusCode::Configuration, "unknown field");

  return finish();
}
