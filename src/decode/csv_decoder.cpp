#include "source_mux/csv_decoder.hpp"
#include "source_mux/stream_mux.hpp"
#include "source_mux/token_csv_fsm.hpp"

#include <optional>
#include <string>
#include <utility>

namespace smux {

namespace {

struct Row {
  std::vector<std::string> fields;
  RecordMeta at;
};

std::string quoted_list(const std::vector<std::string>& names) {
  std::string s = "[";
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (i) s += ' ';
    s += '"' + names[i] + '"';
  }
  return s + "]";
}

std::string where(const RecordMeta& at) {
  return "record on line " + std::to_string(at.line) + " of " + at.src.name;
}

class CsvRecordIterator final : public RecordIterator {
public:
  enum class State { AtSourceStart, Normal, PendingServe, Exhausted, Failed };

  CsvRecordIterator(std::unique_ptr<SourceAwareStream> in,
                    const CsvDecoderOptions& opt,
                    const Context& ctx)
    : in_(std::move(in)),
      reader_(*in_, opt.reader, ctx),
      fsm_(CsvConfig{opt.delimiter, '"', true}),
      cancel_(ctx, [s = in_.get()] { (void)s->close(); }) {}

  // Adopts the canonical header, reading the first row when none is given.
  Status init(const std::vector<std::string>& explicit_header) {
    std::vector<std::string> names = explicit_header;
    if (names.empty()) {
      Row first;
      Status st;
      if (!read_raw(first, st)) {
        if (st.eof_reached())
          return Status(StatusCode::Configuration,
                        "unable to infer header from first record: end of stream");
        return Status(st.code(), "unable to infer header from first record: " + st.message());
      }
      names = std::move(first.fields);
      note(first.at);
    }
    if (auto dup = Header::find_duplicate(names))
      return Status(StatusCode::Configuration,
                    "malformed header: duplicate entry " + *dup + " in header " + quoted_list(names));
    header_ = Header(std::move(names));
    return {};
  }

  bool next() override {
    for (;;) {
      switch (state_) {
        case State::Failed:
        case State::Exhausted:
          return false;

        case State::PendingServe:
          current_ = std::move(pending_.fields);
          current_meta_ = pending_.at.src;
          state_ = State::Normal;
          return true;

        case State::AtSourceStart:
        case State::Normal: {
          Row row;
          Status st;
          if (!read_checked(row, st)) {
            if (st.eof_reached()) { state_ = State::Exhausted; return false; }
            err_ = std::move(st);
            state_ = State::Failed;
            return false;
          }
          if (is_source_start(row.at)) state_ = State::AtSourceStart;
          note(row.at);

          if (state_ == State::AtSourceStart) {
            // Redundant per-source header: drop it and classify the next row.
            if (header_.matches(row.fields)) continue;
            pending_ = std::move(row);
            state_ = State::PendingServe;
            continue;
          }
          current_ = std::move(row.fields);
          current_meta_ = row.at.src;
          return true;
        }
      }
    }
  }

  RecordView record() const override { return RecordView(&header_, &current_, &current_meta_); }
  const Status& err() const override { return err_; }
  Status close() override { return in_->close(); }

private:
  bool read_raw(Row& row, Status& st) {
    std::string_view rec;
    if (!reader_.read_next(rec, row.at)) { st = reader_.status(); return false; }
    if (!fsm_.split(rec, row.fields)) {
      st = Status(StatusCode::Parse, where(row.at) + ": " + fsm_.error());
      return false;
    }
    return true;
  }

  bool read_checked(Row& row, Status& st) {
    if (!read_raw(row, st)) return false;
    if (row.fields.size() != header_.size()) {
      st = Status(StatusCode::Parse, where(row.at) + ": wrong number of fields (got " +
                  std::to_string(row.fields.size()) + ", want " +
                  std::to_string(header_.size()) + ")");
      return false;
    }
    return true;
  }

  // A changed source name, or an offset back at zero after being non-zero.
  bool is_source_start(const RecordMeta& at) const {
    if (!observed_) return true;
    if (at.src.name != last_.name) return true;
    return at.begin_offset == 0 && last_.byte_offset != 0;
  }

  void note(const RecordMeta& at) {
    last_ = at.src;
    observed_ = true;
  }

  std::unique_ptr<SourceAwareStream> in_;
  ChunkReader reader_;
  CsvFsm fsm_;
  CancelHook cancel_;

  Header header_;
  State state_{State::Normal};
  Status err_;

  std::vector<std::string> current_;
  SrcMeta current_meta_;
  Row pending_;  // one-slot pushback

  SrcMeta last_;
  bool observed_{false};
};

}

DecodeResult CsvDecoder::decode(const Context& ctx, std::unique_ptr<SourceAwareStream> in) const {
  DecodeResult res;
  if (!in) {
    res.status = Status(StatusCode::Configuration, "decode: stream is null");
    return res;
  }
  if (!valid_delimiter(opt_.delimiter)) {
    (void)in->close();
    res.status = Status(StatusCode::Configuration, "decode: invalid delimiter");
    return res;
  }

  auto it = std::make_unique<CsvRecordIterator>(std::move(in), opt_, ctx);
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
