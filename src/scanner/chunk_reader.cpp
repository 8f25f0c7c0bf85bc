#include "source_mux/chunk_reader.hpp"
#include "source_mux/stream_mux.hpp"

#include <string>
#include <utility>
#include <vector>

namespace smux {

struct ChunkReader::Impl {
  SourceAwareStream& in;
  Config cfg;
  Context ctx;
  Status st;
  Status deferred;  // failure that arrived together with the last bytes
  std::uint64_t bytes{0};

  std::vector<char> buf;
  std::size_t pos{0};
  std::size_t len{0};
  bool entering{false};      // buf holds the first bytes of a source not yet entered
  SrcMeta chunk;             // source of buf and its offset just past buf

  std::string seg_name;      // source currently being split
  std::int64_t seg_off{0};   // source offset of buf[pos]
  std::uint64_t line{1};
  bool any_source{false};

  std::string carry;

  Impl(SourceAwareStream& s, Config c, Context x)
    : in(s), cfg(c), ctx(std::move(x)), buf(c.chunk_bytes ? c.chunk_bytes : 64 * 1024) {}

  bool fill() {
    if (deferred.failed()) { st = deferred; return false; }
    ReadResult r = in.read(ctx, buf.data(), buf.size());
    if (r.n == 0) {
      if (r.status.ok()) st = Status::eof();
      else if (r.status.failed() && ctx.done()) st = ctx.err();  // stream closed by cancellation
      else st = r.status;
      return false;
    }
    if (!r.status.ok()) deferred = r.status;
    bytes += r.n;
    pos = 0;
    len = r.n;
    const std::int64_t base = r.meta.byte_offset - static_cast<std::int64_t>(r.n);
    entering = !any_source || r.meta.name != seg_name || base == 0;
    chunk = std::move(r.meta);
    return true;
  }

  void enter() {
    seg_name = chunk.name;
    seg_off = chunk.byte_offset - static_cast<std::int64_t>(len);
    line = 1;
    any_source = true;
    entering = false;
  }

  void consume(std::size_t n) {
    pos += n;
    seg_off += static_cast<std::int64_t>(n);
  }

  bool emit(std::string_view& out, RecordMeta& meta,
            std::int64_t begin, std::uint64_t rec_line) {
    std::string_view rec(carry);
    if (cfg.strip_cr && !rec.empty() && rec.back() == '\r') rec.remove_suffix(1);
    out = rec;
    meta.src = SrcMeta{seg_name, seg_off};
    meta.begin_offset = begin;
    meta.line = rec_line;
    return true;
  }

  bool read_next(std::string_view& out, RecordMeta& meta) {
    if (!st.ok()) return false;
    carry.clear();
    bool in_quotes = false;
    std::int64_t begin = seg_off;
    std::uint64_t rec_line = line;

    for (;;) {
      if (entering) {
        // End of a source terminates the pending record.
        if (!carry.empty()) return emit(out, meta, begin, rec_line);
        enter();
        in_quotes = false;
        begin = seg_off;
        rec_line = line;
      }

      if (pos == len) {
        if (fill()) continue;
        if (st.eof_reached() && !carry.empty()) return emit(out, meta, begin, rec_line);
        return false;
      }

      const char* s = buf.data() + pos;
      const char* e = buf.data() + len;
      const char* p = s;
      for (; p < e; ++p) {
        if (cfg.quote != '\0' && *p == cfg.quote) in_quotes = !in_quotes;
        else if (*p == '\n') {
          if (!in_quotes) break;
          ++line;  // newline inside a quoted field
        }
      }

      carry.append(s, static_cast<std::size_t>(p - s));
      if (carry.size() > cfg.max_record_bytes) {
        st = Status(StatusCode::Parse, "record on line " + std::to_string(rec_line) + " of " +
                    seg_name + " exceeds " + std::to_string(cfg.max_record_bytes) + " bytes");
        return false;
      }

      if (p == e) { consume(static_cast<std::size_t>(p - s)); continue; }

      consume(static_cast<std::size_t>(p - s) + 1);  // include '\n'
      ++line;
      const bool blank = carry.empty() || (cfg.strip_cr && carry == "\r");
      if (!blank) return emit(out, meta, begin, rec_line);
      carry.clear();
      rec_line = line;
    }
  }
};

ChunkReader::ChunkReader(SourceAwareStream& in)
  : ChunkReader(in, Config{}) {}

ChunkReader::ChunkReader(SourceAwareStream& in, Config cfg, Context ctx)
  : p_(new Impl(in, cfg, std::move(ctx))) {}

ChunkReader::~ChunkReader() { delete p_; }

bool ChunkReader::read_next(std::string_view& out, RecordMeta& meta) {
  return p_->read_next(out, meta);
}

const Status& ChunkReader::status() const noexcept { return p_->st; }
std::uint64_t ChunkReader::bytes_read() const noexcept { return p_->bytes; }

}
