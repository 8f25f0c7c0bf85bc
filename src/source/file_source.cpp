#include "source_mux/source.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

namespace smux {

namespace {

class FileStream final : public ByteStream {
public:
  explicit FileStream(std::FILE* f) : f_(f) {}
  ~FileStream() override { if (f_) std::fclose(f_); }

  FileStream(const FileStream&) = delete;
  FileStream& operator=(const FileStream&) = delete;

  std::size_t read(char* dst, std::size_t cap, Status& st) override {
    std::size_t n = std::fread(dst, 1, cap, f_);
    if (n < cap) {
      if (std::ferror(f_)) st = Status(StatusCode::Read, std::strerror(errno));
      else if (std::feof(f_)) st = Status::eof();
    }
    return n;
  }

private:
  std::FILE* f_;
};

}

std::unique_ptr<ByteStream> FileSource::open(const Context& ctx, Status& st) const {
  // fopen itself is not interruptible; only short-circuit before it.
  if (ctx.done()) { st = ctx.err(); return nullptr; }
  std::FILE* f = std::fopen(path_.c_str(), "rb");
  if (!f) { st = Status(StatusCode::Open, std::strerror(errno)); return nullptr; }
  return std::make_unique<FileStream>(f);
}

}
