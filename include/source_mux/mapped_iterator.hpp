#pragma once
#include "source_mux/record_iterator.hpp"
#include "source_mux/stream_mux.hpp"

#include <functional>
#include <memory>
#include <utility>

namespace smux {

// Converts one decoded record into a T. A failed status stops iteration.
template <class T>
using Mapper = std::function<Status(const RecordView&, T&)>;

// Typed iteration over a RecordIterator.
template <class T>
class MappedIterator {
public:
  MappedIterator(std::unique_ptr<RecordIterator> inner, Mapper<T> mapper)
      : inner_(std::move(inner)), mapper_(std::move(mapper)) {}

  bool next() {
    if (!map_err_.ok()) return false;
    if (!inner_->next()) return false;
    T v{};
    Status st = mapper_(inner_->record(), v);
    if (!st.ok()) {
      map_err_ = std::move(st);
      return false;
    }
    value_ = std::move(v);
    return true;
  }

  // Valid after next() returned true.
  const T& value() const { return value_; }

  // The mapper's failure takes precedence over the decoder's.
  const Status& err() const { return map_err_.ok() ? inner_->err() : map_err_; }

  Status close() { return inner_->close(); }

private:
  std::unique_ptr<RecordIterator> inner_;
  Mapper<T> mapper_;
  T value_{};
  Status map_err_;
};

template <class T>
struct MappedResult {
  std::unique_ptr<MappedIterator<T>> iter;  // null unless status is Ok
  Status status;
};

// Decode-then-map over a fixed decoder.
template <class T>
class Transformer {
public:
  explicit Transformer(std::shared_ptr<const Decoder> decoder) : decoder_(std::move(decoder)) {}

  MappedResult<T> transform(const Context& ctx, std::unique_ptr<SourceAwareStream> in,
                            Mapper<T> mapper) const {
    MappedResult<T> res;
    if (!mapper) {
      if (in) (void)in->close();
      res.status = Status(StatusCode::Configuration, "transform: mapper is null");
      return res;
    }
    if (!decoder_) {
      if (in) (void)in->close();
      res.status = Status(StatusCode::Configuration, "transform: decoder is null");
      return res;
    }
    DecodeResult d = decoder_->decode(ctx, std::move(in));
    if (!d.status.ok()) {
      res.status = std::move(d.status);
      return res;
    }
    res.iter = std::make_unique<MappedIterator<T>>(std::move(d.iter), std::move(mapper));
    return res;
  }

private:
  std::shared_ptr<const Decoder> decoder_;
};

}
