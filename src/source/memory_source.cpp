#include "source_mux/source.hpp"

#include <algorithm>
#include <cstring>

namespace smux {

namespace {

class MemoryStream final : public ByteStream {
public:
  explicit MemoryStream(std::shared_ptr<const std::string> data) : data_(std::move(data)) {}

  std::size_t read(char* dst, std::size_t cap, Status& st) override {
    if (pos_ >= data_->size()) { st = Status::eof(); return 0; }
    const std::size_t n = std::min(cap, data_->size() - pos_);
    std::memcpy(dst, data_->data() + pos_, n);
    pos_ += n;
    return n;
  }

private:
  std::shared_ptr<const std::string> data_;
  std::size_t pos_{0};
};

}

std::unique_ptr<ByteStream> MemorySource::open(const Context& ctx, Status& st) const {
  if (ctx.done()) { st = ctx.err(); return nullptr; }
  return std::make_unique<MemoryStream>(data_);
}

}
