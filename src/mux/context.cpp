#include "source_mux/context.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <utility>

namespace smux {

struct Context::State {
  std::atomic<bool> cancelled{false};
  std::optional<Clock::time_point> deadline;

  // dispatch_mu serializes running wakers against remove(); mu guards the map.
  std::mutex dispatch_mu;
  std::mutex mu;
  std::uint64_t next_id{1};
  std::map<std::uint64_t, std::function<void()>> wakers;
};

Context Context::with_cancel() {
  return Context(std::make_shared<State>());
}

Context Context::with_deadline(Clock::time_point deadline) {
  auto s = std::make_shared<State>();
  s->deadline = deadline;
  return Context(std::move(s));
}

Context Context::with_timeout(Clock::duration timeout) {
  return with_deadline(Clock::now() + timeout);
}

void Context::cancel() const {
  if (!s_ || s_->cancelled.load()) return;
  std::lock_guard<std::mutex> dispatch(s_->dispatch_mu);
  std::map<std::uint64_t, std::function<void()>> run;
  {
    std::lock_guard<std::mutex> lk(s_->mu);
    if (s_->cancelled.exchange(true)) return;
    run.swap(s_->wakers);
  }
  for (auto& kv : run) kv.second();
}

bool Context::done() const {
  if (!s_) return false;
  if (s_->cancelled.load()) return true;
  return s_->deadline && Clock::now() >= *s_->deadline;
}

Status Context::err() const {
  if (!s_) return {};
  if (s_->cancelled.load()) return Status(StatusCode::Cancelled, "context cancelled");
  if (s_->deadline && Clock::now() >= *s_->deadline)
    return Status(StatusCode::Cancelled, "context deadline exceeded");
  return {};
}

std::optional<Context::Clock::time_point> Context::deadline() const {
  if (!s_) return std::nullopt;
  return s_->deadline;
}

std::uint64_t Context::on_cancel(std::function<void()> fn) const {
  if (!s_) return 0;
  std::lock_guard<std::mutex> lk(s_->mu);
  if (s_->cancelled.load()) return 0;
  const std::uint64_t id = s_->next_id++;
  s_->wakers.emplace(id, std::move(fn));
  return id;
}

void Context::remove(std::uint64_t id) const {
  if (!s_ || id == 0) return;
  std::lock_guard<std::mutex> dispatch(s_->dispatch_mu);
  std::lock_guard<std::mutex> lk(s_->mu);
  s_->wakers.erase(id);
}

}
