#include "source_mux/chunk_reader.hpp"
#include "source_mux/stream_mux.hpp"
#include "support/test_sources.hpp"

#include <string>
#include <vector>

using namespace smux_test;

struct Rec {
  std::string text;
  smux::RecordMeta meta;
};

static std::vector<Rec> split_all(std::vector<std::pair<std::string, std::string>> sources,
                                  smux::ChunkReader::Config cfg, smux::Status* end = nullptr,
                                  std::uint64_t* bytes = nullptr) {
  smux::StreamMux::Config mcfg;
  mcfg.chunk_bytes = 3;
  smux::StreamMux mux(memory_sources(sources), mcfg);
  smux::ChunkReader r(mux, cfg);
  std::vector<Rec> out;
  std::string_view line;
  smux::RecordMeta meta;
  while (r.read_next(line, meta)) out.push_back({std::string(line), meta});
  if (end) *end = r.status();
  if (bytes) *bytes = r.bytes_read();
  return out;
}

static smux::ChunkReader::Config small() {
  smux::ChunkReader::Config c;
  c.chunk_bytes = 4;
  return c;
}

int main() {
  {
    smux::Status end;
    std::uint64_t bytes = 0;
    auto recs = split_all({{"a", "h1,h2\nx,y\n"}, {"b", "h1,h2\r\nz,w"}}, small(), &end, &bytes);
    check(recs.size() == 4, "four records across two sources");
    if (recs.size() == 4) {
      check(recs[0].text == "h1,h2" && recs[0].meta.src.name == "a" && recs[0].meta.begin_offset == 0 &&
            recs[0].meta.line == 1 && recs[0].meta.src.byte_offset == 6, "first record of a");
      check(recs[1].text == "x,y" && recs[1].meta.begin_offset == 6 && recs[1].meta.line == 2,
            "second record of a");
      check(recs[2].text == "h1,h2" && recs[2].meta.src.name == "b" && recs[2].meta.begin_offset == 0 &&
            recs[2].meta.line == 1, "CR stripped and line numbers restart in b");
      check(recs[3].text == "z,w" && recs[3].meta.begin_offset == 7 && recs[3].meta.line == 2,
            "final record without newline is emitted at end of stream");
    }
    check(end.eof_reached(), "status is end of stream after exhaustion");
    check(bytes == 21, "bytes_read counts every byte pulled");
  }

  {
    auto recs = split_all({{"a", "p,q"}, {"b", "r,s\n"}}, small());
    check(recs.size() == 2 && recs[0].text == "p,q" && recs[0].meta.src.name == "a" &&
          recs[1].text == "r,s" && recs[1].meta.src.name == "b",
          "end of a source terminates a record without newline");
  }

  {
    auto recs = split_all({{"a", "p,q"}, {"a", "r,s"}}, small());
    check(recs.size() == 2 && recs[1].meta.begin_offset == 0,
          "same-named sources still split at the boundary");
  }

  {
    auto recs = split_all({{"a", "id,text\n1,\"line1\nline2\"\n2,x\n"}}, small());
    check(recs.size() == 3, "quoted newline stays inside its record");
    if (recs.size() == 3) {
      check(recs[1].text == "1,\"line1\nline2\"" && recs[1].meta.line == 2, "multi-line record starts on line 2");
      check(recs[2].text == "2,x" && recs[2].meta.line == 4, "line count includes quoted newlines");
    }
  }

  {
    auto recs = split_all({{"a", "a\n\n\r\nb\n"}}, small());
    check(recs.size() == 2 && recs[0].text == "a" && recs[1].text == "b" && recs[1].meta.line == 4,
          "blank lines are skipped but counted");
  }

  {
    auto cfg = small();
    cfg.quote = '\0';
    auto recs = split_all({{"a", "\"x\nnext\n"}}, cfg);
    check(recs.size() == 2 && recs[0].text == "\"x", "quote tracking can be disabled");
  }

  {
    auto cfg = small();
    cfg.max_record_bytes = 8;
    smux::Status end;
    auto recs = split_all({{"a", "ok\n0123456789\nlater\n"}}, cfg, &end);
    check(recs.size() == 1 && end.code() == smux::StatusCode::Parse, "oversize record is a parse error");
  }

  {
    smux::SourceList s;
    s.push_back(std::make_unique<FailingSource>("a", "x,y\nz", "disk gone"));
    smux::StreamMux mux(std::move(s));
    smux::ChunkReader r(mux, small());
    std::string_view line;
    smux::RecordMeta meta;
    std::vector<std::string> got;
    while (r.read_next(line, meta)) got.emplace_back(line);
    check(got.size() == 1 && got[0] == "x,y", "complete records before a read failure are served");
    check(r.status().code() == smux::StatusCode::Read, "read failure is reported: " + r.status().to_string());
    check(!r.read_next(line, meta) && r.status().code() == smux::StatusCode::Read, "failure is sticky");
  }

  return finish();
}
