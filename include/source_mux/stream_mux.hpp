#pragma once
#include "source_mux/context.hpp"
#include "source_mux/source.hpp"
#include "source_mux/src_meta.hpp"
#include "source_mux/status.hpp"

#include <cstddef>
#include <memory>
#include <thread>

namespace smux {

struct ReadResult {
  std::size_t n = 0;
  Status status;  // Ok while bytes flow, EndOfStream when exhausted, else the failure
  SrcMeta meta;   // source of the returned bytes and its offset just past them
};

struct BoundaryResult {
  SrcMeta meta;   // byte_offset is always 0
  Status status;  // Ok, EndOfStream, Cancelled or Closed
};

// A byte stream assembled from several sources that reports provenance.
class SourceAwareStream {
public:
  virtual ~SourceAwareStream() = default;

  // Bytes returned by one call never span two sources.
  virtual ReadResult read(char* dst, std::size_t cap) = 0;
  virtual ReadResult read(const Context& ctx, char* dst, std::size_t cap) = 0;

  // Idempotent; wakes any blocked read or await_boundary.
  virtual Status close() = 0;

  // Non-blocking snapshot; safe to call concurrently with read().
  virtual SrcMeta current() const = 0;

  // Blocks until the next source boundary. Boundaries coalesce: a late
  // caller sees only the latest one. EndOfStream once all are consumed.
  virtual BoundaryResult await_boundary(const Context& ctx) = 0;
};

// Streams an ordered list of sources, one open at a time, through a single
// background producer thread and a one-chunk handoff slot.
//
//   StreamMux mux(std::move(sources));
//   char buf[4096];
//   for (;;) {
//     auto r = mux.read(buf, sizeof buf);
//     consume(buf, r.n, r.meta);
//     if (r.n == 0) break;   // r.status: EndOfStream or the failure
//   }
class StreamMux final : public SourceAwareStream {
public:
  struct Config {
    std::size_t chunk_bytes = 32 * 1024;  // producer read size and slot capacity
  };

  explicit StreamMux(SourceList sources);
  StreamMux(SourceList sources, Config cfg, Context ctx = Context::background());

  // Closes, then joins the producer. The join waits for at most one pending
  // source open/read to return.
  ~StreamMux() override;

  StreamMux(const StreamMux&) = delete;
  StreamMux& operator=(const StreamMux&) = delete;

  ReadResult read(char* dst, std::size_t cap) override;
  ReadResult read(const Context& ctx, char* dst, std::size_t cap) override;
  Status close() override;
  SrcMeta current() const override;
  BoundaryResult await_boundary(const Context& ctx) override;

private:
  struct Shared;
  static void produce(std::shared_ptr<Shared> sh);

  std::shared_ptr<Shared> sh_;
  std::thread producer_;
};

}
