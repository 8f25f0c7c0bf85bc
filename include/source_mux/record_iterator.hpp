#pragma once
#include "source_mux/context.hpp"
#include "source_mux/record_view.hpp"
#include "source_mux/status.hpp"

#include <memory>

namespace smux {

class SourceAwareStream;

// Forward-only iterator over decoded records.
//
//   auto res = decoder.decode(ctx, std::move(stream));
//   if (!res.status.ok()) { ... }
//   while (res.iter->next()) use(res.iter->record());
//   if (res.iter->err().failed()) { ... }
class RecordIterator {
public:
  virtual ~RecordIterator() = default;

  // False at clean exhaustion (err() is Ok) or on a terminal failure.
  virtual bool next() = 0;

  // Current record; valid after next() returned true, until the next call.
  virtual RecordView record() const = 0;

  virtual const Status& err() const = 0;

  // Closes the underlying stream. Idempotent.
  virtual Status close() = 0;
};

struct DecodeResult {
  std::unique_ptr<RecordIterator> iter;  // null unless status is Ok
  Status status;
};

// Turns a source-aware byte stream into records of one on-wire format.
// Format options are fixed at construction.
class Decoder {
public:
  virtual ~Decoder() = default;

  // The iterator takes ownership of `in`; on failure `in` is closed.
  virtual DecodeResult decode(const Context& ctx, std::unique_ptr<SourceAwareStream> in) const = 0;
};

}
