#pragma once
#include "source_mux/status.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace smux {

// Copyable cancellation handle. Copies share state: cancelling one cancels all.
// A default-constructed Context is "background" and never becomes done.
class Context {
public:
  using Clock = std::chrono::steady_clock;

  Context() = default;

  static Context background() { return Context{}; }
  static Context with_cancel();
  static Context with_deadline(Clock::time_point deadline);
  static Context with_timeout(Clock::duration timeout);

  // Marks the context cancelled and runs registered wakers once.
  // No-op on a background context or one already cancelled.
  void cancel() const;

  // Cancelled, or the deadline has passed.
  bool done() const;

  // Ok while not done; Cancelled with "context cancelled" or
  // "context deadline exceeded" afterwards.
  Status err() const;

  std::optional<Clock::time_point> deadline() const;

  // Registers fn to run when cancel() fires. Returns 0 (nothing registered)
  // for a background context or one already cancelled; callers must still
  // check done() after registering.
  std::uint64_t on_cancel(std::function<void()> fn) const;

  // After remove() returns, the callback is not running and never will.
  void remove(std::uint64_t id) const;

private:
  struct State;
  explicit Context(std::shared_ptr<State> s) : s_(std::move(s)) {}
  std::shared_ptr<State> s_;
};

// RAII registration of a cancel waker.
class CancelHook {
public:
  CancelHook(const Context& ctx, std::function<void()> fn)
      : ctx_(ctx), id_(ctx.on_cancel(std::move(fn))) {}
  ~CancelHook() { if (id_) ctx_.remove(id_); }

  CancelHook(const CancelHook&) = delete;
  CancelHook& operator=(const CancelHook&) = delete;

private:
  Context ctx_;
  std::uint64_t id_;
};

}
