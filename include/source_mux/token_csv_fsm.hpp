#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace smux {

struct CsvConfig {
  char delimiter = ',';
  char quote     = '"';
  bool trim_leading_space = true;
};

// A delimiter must not collide with quoting or record separators.
bool valid_delimiter(char delimiter, char quote = '"') noexcept;

// RFC4180 field splitter for one logical record (quoted fields may hold
// delimiters, doubled quotes and newlines).
class CsvFsm {
public:
  explicit CsvFsm(const CsvConfig& cfg);
  ~CsvFsm();

  CsvFsm(const CsvFsm&) = delete;
  CsvFsm& operator=(const CsvFsm&) = delete;

  // Replaces `fields` with the unescaped fields of `record`.
  bool split(std::string_view record, std::vector<std::string>& fields);

  const std::string& error() const { return err_; }
  std::uint64_t records() const { return records_; }

private:
  struct Impl; Impl* p_;
  std::uint64_t records_{0};
  std::string err_;
};

}
