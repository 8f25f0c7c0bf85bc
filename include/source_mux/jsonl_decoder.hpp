#pragma once
#include "source_mux/chunk_reader.hpp"
#include "source_mux/record_iterator.hpp"
#include "source_mux/token_jsonl_simdjson.hpp"

#include <string>
#include <utility>
#include <vector>

namespace smux {

struct JsonlDecoderOptions {
  // Field order. Empty: the keys of the first object, in document order.
  std::vector<std::string> header;
  JsonlConfig json;
  ChunkReader::Config reader;  // quote tracking is always off for JSONL
};

// One JSON object per line. Values are aligned to the header by key: missing
// keys give empty fields and unknown keys are ignored. In lenient mode a
// non-object line becomes a record whose first field holds its raw JSON.
class JsonlDecoder final : public Decoder {
public:
  JsonlDecoder() = default;
  explicit JsonlDecoder(JsonlDecoderOptions opt) : opt_(std::move(opt)) {}

  DecodeResult decode(const Context& ctx, std::unique_ptr<SourceAwareStream> in) const override;

private:
  JsonlDecoderOptions opt_;
};

}
