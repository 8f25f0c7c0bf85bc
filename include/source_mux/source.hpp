#pragma once
#include "source_mux/context.hpp"
#include "source_mux/status.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace smux {

// A finite, non-rewindable byte stream. Closed on destruction.
class ByteStream {
public:
  virtual ~ByteStream() = default;

  // Reads up to cap bytes into dst and returns the count. `st` is set to
  // EndOfStream at the end of data or to a Read error; either may accompany
  // a non-zero count, in which case those bytes are still valid.
  virtual std::size_t read(char* dst, std::size_t cap, Status& st) = 0;
};

// A named entity that can produce one byte stream on request.
class Source {
public:
  virtual ~Source() = default;

  virtual const std::string& name() const = 0;

  // Returns nullptr and sets `st` to an Open (or Cancelled) status on failure.
  virtual std::unique_ptr<ByteStream> open(const Context& ctx, Status& st) const = 0;
};

using SourceList = std::vector<std::unique_ptr<Source>>;

// In-memory bytes; mainly for tests and synthetic pipelines.
class MemorySource final : public Source {
public:
  MemorySource(std::string name, std::string data)
      : name_(std::move(name)), data_(std::make_shared<const std::string>(std::move(data))) {}

  const std::string& name() const override { return name_; }
  std::unique_ptr<ByteStream> open(const Context& ctx, Status& st) const override;

private:
  std::string name_;
  std::shared_ptr<const std::string> data_;
};

// A regular file, opened lazily. The name is the path as given.
class FileSource final : public Source {
public:
  explicit FileSource(std::string path) : path_(std::move(path)) {}

  const std::string& name() const override { return path_; }
  std::unique_ptr<ByteStream> open(const Context& ctx, Status& st) const override;

private:
  std::string path_;
};

}
