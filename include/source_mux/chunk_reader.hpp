#pragma once
#include "source_mux/context.hpp"
#include "source_mux/src_meta.hpp"
#include "source_mux/status.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace smux {

class SourceAwareStream;

struct RecordMeta {
  SrcMeta src;                    // source of the record; offset just past it
  std::int64_t begin_offset = 0;  // source offset where scanning for it began
  std::uint64_t line = 0;         // 1-based line within the source
};

// Splits a source-aware stream into logical records. A record ends at a
// newline outside quotes or at the end of its source; it never spans two
// sources.
class ChunkReader {
public:
  struct Config {
    std::size_t chunk_bytes      = 64 * 1024;        // 64 KiB
    std::size_t max_record_bytes = 8 * 1024 * 1024;  // 8 MiB guard per record
    bool        strip_cr         = true;             // trim trailing '\r' (CRLF)
    char        quote            = '"';              // '\0' disables quote tracking
  };

  explicit ChunkReader(SourceAwareStream& in);       // uses default Config{}
  ChunkReader(SourceAwareStream& in, Config cfg, Context ctx = Context::background());
  ~ChunkReader();

  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;

  // Blank lines are skipped. `out` stays valid until the next call.
  // Returns false at end of stream or on failure; see status().
  bool read_next(std::string_view& out, RecordMeta& meta);

  // Ok while records flow, then EndOfStream or the failure (sticky).
  const Status& status() const noexcept;
  std::uint64_t bytes_read() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
