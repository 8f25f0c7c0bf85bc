#include "source_mux/http_source.hpp"

#include <httplib.h>
#include <chrono>
#include <string>

namespace smux {

// "http://host:port/path?q" -> {"http://host:port", "/path?q"}
static bool split_url(const std::string& url, std::string& base, std::string& path) {
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos) return false;
  const auto slash = url.find('/', scheme_end + 3);
  base = url.substr(0, slash);
  path = slash == std::string::npos ? "/" : url.substr(slash);
  return base.size() > scheme_end + 3;
}

std::unique_ptr<ByteStream> HttpSource::open(const Context& ctx, Status& st) const {
  if (ctx.done()) { st = ctx.err(); return nullptr; }

  std::string base, path;
  if (!split_url(url_, base, path)) {
    st = Status(StatusCode::Open, "malformed URL");
    return nullptr;
  }

  httplib::Client cli(base);
  if (!cli.is_valid()) {
    st = Status(StatusCode::Open, "unsupported URL scheme or TLS not available");
    return nullptr;
  }
  cli.set_connection_timeout(std::chrono::seconds(cfg_.connect_timeout_sec));
  cli.set_read_timeout(std::chrono::seconds(cfg_.read_timeout_sec));
  cli.set_follow_location(cfg_.follow_redirects);

  std::string body;
  bool too_large = false;
  auto res = cli.Get(path, [&](const char* data, size_t len) {
    if (body.size() + len > cfg_.max_body_bytes) { too_large = true; return false; }
    body.append(data, len);
    return !ctx.done();
  });

  if (ctx.done()) { st = ctx.err(); return nullptr; }
  if (too_large) {
    st = Status(StatusCode::Open, "body exceeds " + std::to_string(cfg_.max_body_bytes) + " bytes");
    return nullptr;
  }
  if (!res) {
    st = Status(StatusCode::Open, httplib::to_string(res.error()));
    return nullptr;
  }
  if (res->status < 200 || res->status >= 300) {
    st = Status(StatusCode::Open, "HTTP status " + std::to_string(res->status));
    return nullptr;
  }

  // The stream shares the buffered body; the temporary source can go.
  return MemorySource(url_, std::move(body)).open(ctx, st);
}

}
