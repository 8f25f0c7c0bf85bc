#include "source_mux/chunk_reader.hpp"
#include "source_mux/stream_mux.hpp"
#include "source_mux/token_csv_fsm.hpp"
#include "support/test_sources.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;
using namespace smux_test;

static std::vector<std::string> split(std::string_view rec, smux::CsvConfig cfg = {}) {
  smux::CsvFsm csv(cfg);
  std::vector<std::string> f;
  if (!csv.split(rec, f)) f = {"<error>", csv.error()};
  return f;
}

int main() {
  const fs::path f = "tests/data/edge_delimiters.csv";
  if (!fs::exists(f)) { std::cerr << "[ERR] missing: " << f << "\n"; return 2; }

  {
    smux::SourceList s;
    s.push_back(std::make_unique<smux::FileSource>(f.string()));
    smux::StreamMux mux(std::move(s));
    smux::ChunkReader r(mux);
    smux::CsvFsm csv(smux::CsvConfig{});

    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> fields;
    std::string_view line;
    smux::RecordMeta meta;
    bool ok = true;
    while (r.read_next(line, meta)) {
      if (!csv.split(line, fields)) { ok = false; break; }
      rows.push_back(fields);
    }
    check(ok && r.status().eof_reached(), "fixture splits cleanly: " + csv.error());
    check(rows.size() == 7 && csv.records() == 7, "header plus 6 data rows");
    if (rows.size() == 7) {
      check(rows[1][1] == "Smith, John", "quoted delimiter");
      check(rows[2][1] == "say \"hi\"", "doubled quote");
      check(rows[3][1] == "multi\nline", "quoted newline");
      check(rows[4][1].empty() && rows[4].size() == 3, "empty middle field");
      check(rows[5][1] == "padded", "leading space trimmed");
      check(rows[6][1].empty(), "empty quoted field");
    }
  }

  check(split("a,b,c") == std::vector<std::string>{"a", "b", "c"}, "plain split");
  check(split("a,,") == std::vector<std::string>{"a", "", ""}, "trailing empty fields");
  check(split("") == std::vector<std::string>{""}, "empty record is one empty field");
  check(split("  \"x\",y") == std::vector<std::string>{"x", "y"}, "space before opening quote");
  check(split("\"a\r\nb\",c") == std::vector<std::string>{"a\nb", "c"}, "CRLF inside quotes becomes LF");

  {
    smux::CsvConfig semi;
    semi.delimiter = ';';
    check(split("a;b,c;\"d;e\"", semi) == std::vector<std::string>{"a", "b,c", "d;e"}, "custom delimiter");

    smux::CsvConfig tab;
    tab.delimiter = '\t';
    check(split("a\t\tb", tab) == std::vector<std::string>{"a", "", "b"}, "tab delimiter is not trimmed");
  }

  {
    smux::CsvConfig keep;
    keep.trim_leading_space = false;
    check(split(" a, b", keep) == std::vector<std::string>{" a", " b"}, "trimming can be turned off");
  }

  auto bare = split("a,b\"c");
  check(bare[0] == "<error>" && bare[1].rfind("bare \" in non-quoted field", 0) == 0, "bare quote: " + bare[1]);

  auto extra = split("\"a\"b,c");
  check(extra[0] == "<error>" && extra[1].rfind("extraneous or missing \" in quoted field", 0) == 0,
        "text after closing quote: " + extra[1]);

  auto open = split("\"abc");
  check(open[0] == "<error>" && open[1].rfind("extraneous or missing \" in quoted field", 0) == 0,
        "unterminated quote: " + open[1]);

  check(smux::valid_delimiter(',') && smux::valid_delimiter('\t') && smux::valid_delimiter('|'),
        "ordinary delimiters are valid");
  check(!smux::valid_delimiter('"') && !smux::valid_delimiter('\n') && !smux::valid_delimiter('\r') &&
        !smux::valid_delimiter('\0'), "quote and line breaks are not valid delimiters");

  return finish();
}
