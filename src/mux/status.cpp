#include "source_mux/status.hpp"

namespace smux {

const char* to_string(StatusCode c) noexcept {
  switch (c) {
    case StatusCode::Ok:            return "ok";
    case StatusCode::EndOfStream:   return "end of stream";
    case StatusCode::Configuration: return "configuration error";
    case StatusCode::Open:          return "open error";
    case StatusCode::Read:          return "read error";
    case StatusCode::Parse:         return "parse error";
    case StatusCode::Cancelled:     return "cancelled";
    case StatusCode::Closed:        return "closed";
  }
  return "unknown";
}

std::string Status::to_string() const {
  if (ok()) return "ok";
  std::string s = smux::to_string(code_);
  if (!message_.empty()) { s += ": "; s += message_; }
  return s;
}

}
