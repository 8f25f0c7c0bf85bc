#pragma once
#include <string>
#include <utility>

namespace smux {

enum class StatusCode {
  Ok,
  EndOfStream,    // clean exhaustion, not a failure
  Configuration,  // bad header, delimiter, mapper or source spec
  Open,           // a source failed to open
  Read,           // I/O failure mid-source
  Parse,          // malformed row or field count mismatch
  Cancelled,      // context cancelled or deadline exceeded
  Closed          // use after close()
};

const char* to_string(StatusCode c) noexcept;

class Status {
public:
  Status() = default;
  Status(StatusCode code, std::string message)
      : code_(code), message_(std::move(message)) {}

  static Status eof() { return Status(StatusCode::EndOfStream, "end of stream"); }

  bool ok() const noexcept { return code_ == StatusCode::Ok; }
  bool eof_reached() const noexcept { return code_ == StatusCode::EndOfStream; }
  // True for every code other than Ok and EndOfStream.
  bool failed() const noexcept { return !ok() && !eof_reached(); }

  StatusCode code() const noexcept { return code_; }
  const std::string& message() const noexcept { return message_; }

  // "<code>: <message>", or "ok".
  std::string to_string() const;

private:
  StatusCode code_{StatusCode::Ok};
  std::string message_;
};

}
