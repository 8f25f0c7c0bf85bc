#pragma once
#include "source_mux/chunk_reader.hpp"
#include "source_mux/record_iterator.hpp"

#include <string>
#include <utility>
#include <vector>

namespace smux {

struct CsvDecoderOptions {
  char delimiter = ',';
  // Canonical header. Empty: adopt the first row of the first source.
  std::vector<std::string> header;
  ChunkReader::Config reader;
};

// Delimited-record decoder for a stream that concatenates several sources,
// each of which may repeat the header on its first line.
//
// Every row is checked against the canonical header's length. At each source
// start, rows identical to the canonical header are dropped; the first row
// that differs is data, even if it looks like a header of some other schema.
class CsvDecoder final : public Decoder {
public:
  CsvDecoder() = default;
  explicit CsvDecoder(CsvDecoderOptions opt) : opt_(std::move(opt)) {}

  DecodeResult decode(const Context& ctx, std::unique_ptr<SourceAwareStream> in) const override;

  const CsvDecoderOptions& options() const noexcept { return opt_; }

private:
  CsvDecoderOptions opt_;
};

}
