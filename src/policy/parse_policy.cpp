#include "source_mux/parse_policy.hpp"
#include "source_mux/date_parse.hpp"

#include <cctype>
#include <charconv>
#include <string>
#include <string_view>
#include <fast_float/fast_float.h>

namespace smux {

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i)
    if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

std::optional<double> ParsePolicy::parse_number(std::string_view s) const {
  if (s.empty()) return std::nullopt;
  const char* first = s.data();
  if (*first == '+') {  // fast_float rejects a leading '+'
    ++first;
    if (first == s.data() + s.size() || *first == '-' || *first == '+') return std::nullopt;
  }
  double out;
  auto [ptr, ec] = fast_float::from_chars(first, s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

std::optional<std::int64_t> ParsePolicy::parse_int(std::string_view s) const {
  if (s.empty()) return std::nullopt;
  const char* first = s.data();
  if (*first == '+') {
    ++first;
    if (first == s.data() + s.size() || *first == '-' || *first == '+') return std::nullopt;
  }
  std::int64_t out;
  auto [ptr, ec] = std::from_chars(first, s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

std::optional<bool> ParsePolicy::parse_bool(std::string_view s) const {
  for (const auto& t : bools.true_tokens)
    if (bools.case_sensitive ? (s == t) : ieq(s, t)) return true;
  for (const auto& f : bools.false_tokens)
    if (bools.case_sensitive ? (s == f) : ieq(s, f)) return false;
  return std::nullopt;
}

std::optional<std::int64_t> ParsePolicy::parse_date(std::string_view s) const {
  return parse_iso8601_ms(s);
}

bool ParsePolicy::is_null_token(std::string_view s) const {
  for (const auto& n : null_tokens) if (s == n) return true;
  return false;
}

namespace {

template <class T, class Conv>
Status convert(const ParsePolicy& p, const RecordView& r, std::string_view field,
               const char* kind, std::optional<T>& out, Conv conv) {
  out.reset();
  auto raw = r.by_name(field);
  if (!raw) return Status(StatusCode::Configuration, "unknown field " + std::string(field));
  if (p.is_null_token(*raw)) return {};
  out = conv(*raw);
  if (!out && p.on_error == ParsePolicy::OnError::Strict) {
    return Status(StatusCode::Parse, "field " + std::string(field) + ": cannot parse \"" +
                  std::string(*raw) + "\" as " + kind);
  }
  return {};
}

}

Status ParsePolicy::number(const RecordView& r, std::string_view field, std::optional<double>& out) const {
  return convert(*this, r, field, "number", out, [this](std::string_view s) { return parse_number(s); });
}

Status ParsePolicy::integer(const RecordView& r, std::string_view field, std::optional<std::int64_t>& out) const {
  return convert(*this, r, field, "integer", out, [this](std::string_view s) { return parse_int(s); });
}

Status ParsePolicy::boolean(const RecordView& r, std::string_view field, std::optional<bool>& out) const {
  return convert(*this, r, field, "bool", out, [this](std::string_view s) { return parse_bool(s); });
}

Status ParsePolicy::date_ms(const RecordView& r, std::string_view field, std::optional<std::int64_t>& out) const {
  return convert(*this, r, field, "date", out, [this](std::string_view s) { return parse_date(s); });
}

}
