#include "source_mux/token_csv_fsm.hpp"

namespace smux {

static bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\v' || c == '\f' || c == '\r';
}

bool valid_delimiter(char delimiter, char quote) noexcept {
  return delimiter != '\0' && delimiter != quote && delimiter != '\n' && delimiter != '\r';
}

struct CsvFsm::Impl {
  CsvConfig cfg;
  std::string cur;

  bool split(std::string_view rec, std::vector<std::string>& fields, std::string& err) {
    fields.clear();
    cur.clear();

    enum class Mode { FieldStart, Unquoted, Quoted, QuoteEscape } mode = Mode::FieldStart;
    const std::size_t n = rec.size();
    for (std::size_t i = 0; i < n; ++i) {
      const char c = rec[i];
      switch (mode) {
        case Mode::FieldStart:
          if (cfg.trim_leading_space && c != cfg.delimiter && is_space(c)) break;
          if (c == cfg.quote) {
            mode = Mode::Quoted;
          } else if (c == cfg.delimiter) {
            fields.emplace_back();
          } else {
            cur.push_back(c);
            mode = Mode::Unquoted;
          }
          break;
        case Mode::Unquoted:
          if (c == cfg.delimiter) {
            fields.push_back(cur);
            cur.clear();
            mode = Mode::FieldStart;
          } else if (c == cfg.quote) {
            err = "bare \" in non-quoted field (column " + std::to_string(i + 1) + ")";
            return false;
          } else {
            cur.push_back(c);
          }
          break;
        case Mode::Quoted:
          if (c == cfg.quote) mode = Mode::QuoteEscape;
          else if (c == '\r' && i + 1 < n && rec[i + 1] == '\n') break;  // CRLF -> LF
          else cur.push_back(c);
          break;
        case Mode::QuoteEscape:
          if (c == cfg.quote) {
            cur.push_back(c);            // escaped quote
            mode = Mode::Quoted;
          } else if (c == cfg.delimiter) {
            fields.push_back(cur);
            cur.clear();
            mode = Mode::FieldStart;
          } else {
            err = "extraneous or missing \" in quoted field (column " + std::to_string(i + 1) + ")";
            return false;
          }
          break;
      }
    }

    if (mode == Mode::Quoted) {
      err = "extraneous or missing \" in quoted field (unterminated)";
      return false;
    }
    fields.push_back(cur);
    return true;
  }
};

CsvFsm::CsvFsm(const CsvConfig& cfg) : p_(new Impl{cfg, {}}) {}
CsvFsm::~CsvFsm() { delete p_; }

bool CsvFsm::split(std::string_view record, std::vector<std::string>& fields) {
  err_.clear();
  if (!p_->split(record, fields, err_)) return false;
  ++records_;
  return true;
}

}
