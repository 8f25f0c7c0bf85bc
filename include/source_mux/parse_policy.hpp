#pragma once
#include "source_mux/record_view.hpp"
#include "source_mux/status.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace smux {

struct BoolPolicy {
  std::vector<std::string> true_tokens  = {"true", "1", "yes", "y", "t"};
  std::vector<std::string> false_tokens = {"false", "0", "no", "n", "f"};
  bool case_sensitive = false;
};

// Typed access to the text fields of a record.
//
// A field holding a null token yields std::nullopt with an Ok status. A field
// that fails to convert is a Parse status under Strict and std::nullopt under
// Lenient and Null. An unknown field name is always a Configuration status.
struct ParsePolicy {
  enum class OnError { Strict, Lenient, Null };

  OnError on_error = OnError::Null;
  BoolPolicy bools;
  std::vector<std::string> null_tokens = {"", "null", "NULL", "NA", "NaN"};

  // Scalar conversions (whole string must match).
  std::optional<double> parse_number(std::string_view s) const;   // fast_float
  std::optional<std::int64_t> parse_int(std::string_view s) const;
  std::optional<bool> parse_bool(std::string_view s) const;
  std::optional<std::int64_t> parse_date(std::string_view s) const;  // epoch ms
  bool is_null_token(std::string_view s) const;

  Status number(const RecordView& r, std::string_view field, std::optional<double>& out) const;
  Status integer(const RecordView& r, std::string_view field, std::optional<std::int64_t>& out) const;
  Status boolean(const RecordView& r, std::string_view field, std::optional<bool>& out) const;
  Status date_ms(const RecordView& r, std::string_view field, std::optional<std::int64_t>& out) const;
};

}
