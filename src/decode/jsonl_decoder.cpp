#include "source_mux/jsonl_decoder.hpp"
#include "source_mux/stream_mux.hpp"

#include <string>
#include <utility>

namespace smux {

namespace {

ChunkReader::Config unquoted(ChunkReader::Config c) {
  c.quote = '\0';
  return c;
}

class JsonlRecordIterator final : public RecordIterator {
public:
  JsonlRecordIterator(std::unique_ptr<SourceAwareStream> in,
                      const JsonlDecoderOptions& opt,
                      const Context& ctx)
    : in_(std::move(in)),
      reader_(*in_, unquoted(opt.reader), ctx),
      tok_(opt.json),
      cancel_(ctx, [s = in_.get()] { (void)s->close(); }) {}

  Status init(const std::vector<std::string>& explicit_header) {
    std::vector<std::string> names = explicit_header;
    if (names.empty()) {
      // The first object both names the fields and is served as data.
      if (!parse_next()) {
        if (err_.eof_reached() || err_.ok())
          return Status(StatusCode::Configuration,
                        "unable to infer header from first record: end of stream");
        return Status(err_.code(), "unable to infer header from first record: " + err_.message());
      }
      if (keys_.empty())
        return Status(StatusCode::Configuration,
                      values_.empty() ? "unable to infer header from first record: object has no keys"
                                      : "unable to infer header from first record: not a JSON object");
      names = keys_;
      primed_ = true;
    }
    if (auto dup = Header::find_duplicate(names))
      return Status(StatusCode::Configuration, "malformed header: duplicate entry " + *dup);
    header_ = Header(std::move(names));
    return {};
  }

  bool next() override {
    if (done_) return false;
    if (primed_) {
      primed_ = false;
      align();
      return true;
    }
    if (!parse_next()) {
      if (err_.eof_reached()) err_ = Status{};
      done_ = true;
      return false;
    }
    align();
    return true;
  }

  RecordView record() const override { return RecordView(&header_, &current_, &current_meta_); }
  const Status& err() const override { return err_; }
  Status close() override { return in_->close(); }

private:
  bool parse_next() {
    std::string_view line;
    if (!reader_.read_next(line, at_)) { err_ = reader_.status(); return false; }
    if (!tok_.parse_line(line, keys_, values_)) {
      err_ = Status(StatusCode::Parse, "record on line " + std::to_string(at_.line) + " of " +
                    at_.src.name + ": " + tok_.error());
      return false;
    }
    return true;
  }

  void align() {
    current_.assign(header_.size(), std::string{});
    if (keys_.empty()) {
      if (!values_.empty() && !current_.empty()) current_[0] = std::move(values_[0]);
    } else {
      for (std::size_t k = keys_.size(); k-- > 0;) {  // first occurrence wins
        if (auto idx = header_.index_of(keys_[k])) current_[*idx] = std::move(values_[k]);
      }
    }
    current_meta_ = at_.src;
  }

  std::unique_ptr<SourceAwareStream> in_;
  ChunkReader reader_;
  JsonlTokenizer tok_;
  CancelHook cancel_;

  Header header_;
  Status err_;
  bool done_{false};
  bool primed_{false};

  RecordMeta at_;
  std::vector<std::string> keys_;
  std::vector<std::string> values_;
  std::vector<std::string> current_;
  SrcMeta current_meta_;
};

}

DecodeResult JsonlDecoder::decode(const Context& ctx, std::unique_ptr<SourceAwareStream> in) const {
  DecodeResult res;
  if (!in) {
    res.status = Status(StatusCode::Configuration, "decode: stream is null");
    return res;
  }
  auto it = std::make_unique<JsonlRecordIterator>(std::move(in), opt_, ctx);
  Status st = it->init(opt_.header);
  if (!st.ok()) {
    (void)it->close();
    res.status = std::move(st);
    return res;
  }
  res.iter = std::move(it);
  return res;
}

}
