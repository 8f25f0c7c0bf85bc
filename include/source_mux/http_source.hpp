#pragma once
#include "source_mux/source.hpp"

#include <cstddef>
#include <string>

namespace smux {

// A resource fetched with one GET. The body is buffered on open() and then
// served like a memory source. https needs cpp-httplib built with OpenSSL.
class HttpSource final : public Source {
public:
  struct Config {
    int connect_timeout_sec = 10;
    int read_timeout_sec    = 30;
    std::size_t max_body_bytes = 256u * 1024 * 1024;
    bool follow_redirects = true;
  };

  explicit HttpSource(std::string url) : HttpSource(std::move(url), Config{}) {}
  HttpSource(std::string url, Config cfg) : url_(std::move(url)), cfg_(cfg) {}

  const std::string& name() const override { return url_; }
  std::unique_ptr<ByteStream> open(const Context& ctx, Status& st) const override;

private:
  std::string url_;
  Config cfg_;
};

}
