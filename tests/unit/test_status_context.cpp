#include "source_mux/context.hpp"
#include "source_mux/status.hpp"
#include "support/test_sources.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace smux_test;
using namespace std::chrono_literals;

int main() {
  // Status
  smux::Status ok;
  check(ok.ok() && !ok.failed() && ok.to_string() == "ok", "default status is ok");
  check(smux::Status::eof().eof_reached() && !smux::Status::eof().failed(), "eof is not a failure");
  smux::Status bad(smux::StatusCode::Parse, "wrong number of fields");
  check(bad.failed() && bad.to_string() == "parse error: wrong number of fields", "status renders code and message");

  // Background
  auto bg = smux::Context::background();
  bg.cancel();
  check(!bg.done() && bg.err().ok(), "background context never becomes done");
  check(bg.on_cancel([] {}) == 0, "background context registers nothing");
  check(!bg.deadline(), "background context has no deadline");

  // Cancel
  auto ctx = smux::Context::with_cancel();
  std::atomic<int> fired{0};
  auto id = ctx.on_cancel([&] { ++fired; });
  auto removed = ctx.on_cancel([&] { fired += 100; });
  ctx.remove(removed);
  check(id != 0 && !ctx.done(), "registration on a live context");
  auto copy = ctx;
  copy.cancel();
  check(ctx.done(), "copies share cancellation");
  check(fired == 1, "registered waker runs once, removed waker never");
  ctx.cancel();
  check(fired == 1, "second cancel is a no-op");
  check(ctx.err().code() == smux::StatusCode::Cancelled && ctx.err().message() == "context cancelled",
        "cancelled context reports Cancelled");
  check(ctx.on_cancel([] {}) == 0, "no registration after cancel");

  // Deadline
  auto dl = smux::Context::with_timeout(20ms);
  check(dl.deadline().has_value() && !dl.done(), "deadline context starts live");
  std::this_thread::sleep_for(40ms);
  check(dl.done() && dl.err().message() == "context deadline exceeded", "deadline context expires");

  // RAII hook
  auto c2 = smux::Context::with_cancel();
  int hits = 0;
  {
    smux::CancelHook hook(c2, [&] { ++hits; });
  }
  c2.cancel();
  check(hits == 0, "hook removed on scope exit does not fire");

  auto c3 = smux::Context::with_cancel();
  int hits3 = 0;
  smux::CancelHook live(c3, [&] { ++hits3; });
  std::thread t([&] { c3.cancel(); });
  t.join();
  check(hits3 == 1, "live hook fires from another thread");

  return finish();
}
