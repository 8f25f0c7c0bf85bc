#include "source_mux/stream_mux.hpp"

#include <algorithm>
#include <condition_variable>
#include <cstring>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace smux {

namespace {

template <class Pred>
void wait_ctx(std::unique_lock<std::mutex>& lk, std::condition_variable& cv,
              const Context& ctx, Pred pred) {
  auto ready = [&] { return pred() || ctx.done(); };
  if (auto dl = ctx.deadline()) cv.wait_until(lk, *dl, ready);
  else cv.wait(lk, ready);
}

// Wakes waiters on `cv` for as long as `owner` is alive.
std::function<void()> waker_for(const std::shared_ptr<void>& owner,
                                std::mutex& mu, std::condition_variable& cv) {
  std::weak_ptr<void> w = owner;
  return [w, &mu, &cv] {
    if (auto alive = w.lock()) {
      std::lock_guard<std::mutex> lk(mu);
      cv.notify_all();
    }
  };
}

std::string describe(const Status& st) {
  return st.message().empty() ? std::string(to_string(st.code())) : st.message();
}

}

struct StreamMux::Shared {
  Config cfg;
  Context ctx;  // producer lifetime; cancelling it aborts the stream
  SourceList sources;
  std::uint64_t ctx_hook{0};

  mutable std::mutex mu;
  std::condition_variable cv;

  // One-chunk handoff slot. The producer refills it only once it is drained.
  std::vector<char> slot;
  std::size_t slot_pos{0};
  std::size_t slot_len{0};

  SrcMeta current;                 // advanced by the consumer as it takes bytes
  std::optional<SrcMeta> mailbox;  // coalescing boundary slot
  bool mailbox_closed{false};

  bool producer_done{false};
  Status terminal;                 // EndOfStream or the failure, once producer_done
  bool closed{false};

  bool slot_empty() const { return slot_pos == slot_len; }
  bool stopping() const { return closed || ctx.done(); }

  // Caller holds mu.
  void finish_locked(Status st) {
    if (producer_done) return;
    producer_done = true;
    terminal = std::move(st);
    mailbox.reset();
    mailbox_closed = true;
    cv.notify_all();
  }

  // Caller holds mu.
  Status stop_status() const {
    if (closed) return Status(StatusCode::Closed, "stream closed");
    return ctx.err();
  }

  // Blocks until the slot is drained. False when the stream is stopping.
  bool wait_drained(std::unique_lock<std::mutex>& lk) {
    wait_ctx(lk, cv, ctx, [&] { return slot_empty() || closed; });
    if (stopping()) { finish_locked(stop_status()); return false; }
    return true;
  }
};

void StreamMux::produce(std::shared_ptr<Shared> shp) {
  Shared& sh = *shp;
  std::vector<char> buf(sh.cfg.chunk_bytes);

  for (const auto& src : sh.sources) {
    // The next boundary is published only after the previous source drained.
    {
      std::unique_lock<std::mutex> lk(sh.mu);
      if (!sh.wait_drained(lk)) return;
    }

    Status st;
    std::unique_ptr<ByteStream> in = src->open(sh.ctx, st);
    if (!in) {
      const StatusCode code =
          st.code() == StatusCode::Cancelled ? StatusCode::Cancelled : StatusCode::Open;
      std::lock_guard<std::mutex> lk(sh.mu);
      sh.finish_locked(Status(code, "open " + src->name() + ": " + describe(st)));
      return;
    }

    SrcMeta meta{src->name(), 0};
    {
      std::lock_guard<std::mutex> lk(sh.mu);
      if (sh.stopping()) { sh.finish_locked(sh.stop_status()); return; }
      sh.current = meta;
      sh.mailbox = meta;  // overwrites any unread boundary
      sh.cv.notify_all();
    }

    for (;;) {
      Status rst;
      const std::size_t n = in->read(buf.data(), buf.size(), rst);

      // Forward bytes before looking at the read status.
      if (n > 0) {
        std::unique_lock<std::mutex> lk(sh.mu);
        if (!sh.wait_drained(lk)) return;
        std::memcpy(sh.slot.data(), buf.data(), n);
        sh.slot_pos = 0;
        sh.slot_len = n;
        meta.byte_offset += static_cast<std::int64_t>(n);
        sh.cv.notify_all();
      }

      if (rst.failed()) {
        std::unique_lock<std::mutex> lk(sh.mu);
        if (!sh.wait_drained(lk)) return;
        sh.finish_locked(Status(StatusCode::Read, "read " + src->name() + ": " + describe(rst)));
        return;
      }
      if (rst.eof_reached() || n == 0) break;
    }
    in.reset();  // at most one source handle open
  }

  // Finish only once the consumer has taken the last chunk.
  std::unique_lock<std::mutex> lk(sh.mu);
  if (!sh.wait_drained(lk)) return;
  sh.finish_locked(Status::eof());
}

StreamMux::StreamMux(SourceList sources)
    : StreamMux(std::move(sources), Config{}) {}

StreamMux::StreamMux(SourceList sources, Config cfg, Context ctx)
    : sh_(std::make_shared<Shared>()) {
  if (cfg.chunk_bytes == 0) cfg.chunk_bytes = Config{}.chunk_bytes;
  sh_->cfg = cfg;
  sh_->ctx = std::move(ctx);
  sh_->sources = std::move(sources);
  sh_->slot.resize(cfg.chunk_bytes);
  sh_->ctx_hook = sh_->ctx.on_cancel(waker_for(sh_, sh_->mu, sh_->cv));
  producer_ = std::thread(&StreamMux::produce, sh_);
}

StreamMux::~StreamMux() {
  (void)close();
  sh_->ctx.remove(sh_->ctx_hook);
  if (producer_.joinable()) producer_.join();
}

ReadResult StreamMux::read(char* dst, std::size_t cap) {
  return read(Context::background(), dst, cap);
}

ReadResult StreamMux::read(const Context& ctx, char* dst, std::size_t cap) {
  CancelHook hook(ctx, waker_for(sh_, sh_->mu, sh_->cv));
  std::unique_lock<std::mutex> lk(sh_->mu);

  ReadResult r;
  if (cap > 0 && !sh_->closed) {
    wait_ctx(lk, sh_->cv, ctx, [&] {
      return !sh_->slot_empty() || sh_->producer_done || sh_->closed;
    });
  }

  if (sh_->closed) {
    r.status = Status(StatusCode::Closed, "read on closed stream");
  } else if (ctx.done()) {
    r.status = ctx.err();
  } else if (cap == 0) {
    // nothing requested
  } else if (!sh_->slot_empty()) {
    const std::size_t n = std::min(cap, sh_->slot_len - sh_->slot_pos);
    std::memcpy(dst, sh_->slot.data() + sh_->slot_pos, n);
    sh_->slot_pos += n;
    sh_->current.byte_offset += static_cast<std::int64_t>(n);
    r.n = n;
    if (sh_->slot_empty()) sh_->cv.notify_all();
  } else {
    r.status = sh_->terminal;
  }
  r.meta = sh_->current;
  return r;
}

Status StreamMux::close() {
  std::lock_guard<std::mutex> lk(sh_->mu);
  if (sh_->closed) return {};
  sh_->closed = true;
  sh_->cv.notify_all();
  return {};
}

SrcMeta StreamMux::current() const {
  std::lock_guard<std::mutex> lk(sh_->mu);
  return sh_->current;
}

BoundaryResult StreamMux::await_boundary(const Context& ctx) {
  BoundaryResult r;
  if (ctx.done()) { r.status = ctx.err(); return r; }

  CancelHook hook(ctx, waker_for(sh_, sh_->mu, sh_->cv));
  std::unique_lock<std::mutex> lk(sh_->mu);
  wait_ctx(lk, sh_->cv, ctx, [&] {
    return sh_->mailbox.has_value() || sh_->mailbox_closed || sh_->closed;
  });

  if (sh_->closed) {
    r.status = Status(StatusCode::Closed, "stream closed");
  } else if (sh_->mailbox) {
    r.meta = std::move(*sh_->mailbox);
    sh_->mailbox.reset();
  } else if (sh_->mailbox_closed) {
    r.status = Status::eof();
  } else {
    r.status = ctx.err();
  }
  return r;
}

}
