#include "source_mux/date_parse.hpp"

#include <chrono>
#include <ctime>
#include <string_view>

namespace smux {

static bool is_digit(char c) { return c >= '0' && c <= '9'; }

static bool parse_int(std::string_view s, int& out) {
  if (s.empty()) return false;
  int v = 0;
  for (char c : s) { if (!is_digit(c)) return false; v = v * 10 + (c - '0'); }
  out = v;
  return true;
}

static bool days_ok(int Y, int M, int D) {
  static constexpr int mdays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (M < 1 || M > 12 || D < 1) return false;
  const bool leap = (Y % 4 == 0 && Y % 100 != 0) || Y % 400 == 0;
  return D <= mdays[M - 1] + ((M == 2 && leap) ? 1 : 0);
}

std::optional<std::int64_t> parse_iso8601_ms(std::string_view s) {
  if (s.size() < 10) return std::nullopt;
  int Y, M, D, h = 0, m = 0, sec = 0, ms = 0;

  if (!(parse_int(s.substr(0, 4), Y) && s[4] == '-' && parse_int(s.substr(5, 2), M) &&
        s[7] == '-' && parse_int(s.substr(8, 2), D)))
    return std::nullopt;
  if (!days_ok(Y, M, D)) return std::nullopt;

  size_t i = 10;
  int offset_min = 0;
  if (i < s.size() && (s[i] == 'T' || s[i] == ' ')) {
    ++i;
    if (i + 8 > s.size()) return std::nullopt;
    if (!(parse_int(s.substr(i, 2), h) && s[i + 2] == ':' && parse_int(s.substr(i + 3, 2), m) &&
          s[i + 5] == ':' && parse_int(s.substr(i + 6, 2), sec)))
      return std::nullopt;
    if (h > 23 || m > 59 || sec > 60) return std::nullopt;
    i += 8;
    if (i < s.size() && s[i] == '.') {
      size_t j = i + 1, k = j;
      while (k < s.size() && is_digit(s[k])) ++k;
      if (k == j) return std::nullopt;
      // millisecond precision; extra digits are truncated
      int frac = 0;
      const size_t used = (k - j) < 3 ? (k - j) : 3;
      if (!parse_int(s.substr(j, used), frac)) return std::nullopt;
      ms = used == 1 ? frac * 100 : used == 2 ? frac * 10 : frac;
      i = k;
    }
    if (i < s.size() && s[i] == 'Z') {
      ++i;
    } else if (i < s.size() && (s[i] == '+' || s[i] == '-')) {
      int oh = 0, om = 0;
      if (i + 6 > s.size() || !parse_int(s.substr(i + 1, 2), oh) || s[i + 3] != ':' ||
          !parse_int(s.substr(i + 4, 2), om))
        return std::nullopt;
      offset_min = (s[i] == '-' ? -1 : 1) * (oh * 60 + om);
      i += 6;
    }
  }
  if (i != s.size()) return std::nullopt;

  std::tm tm{};
  tm.tm_year = Y - 1900; tm.tm_mon = M - 1; tm.tm_mday = D;
  tm.tm_hour = h; tm.tm_min = m; tm.tm_sec = sec;

#if defined(_WIN32)
  std::time_t t = _mkgmtime(&tm);
#else
  std::time_t t = timegm(&tm);
#endif
  if (t == (std::time_t)-1) return std::nullopt;

  using namespace std::chrono;
  auto ms_epoch = duration_cast<milliseconds>(system_clock::from_time_t(t).time_since_epoch()).count();
  return static_cast<std::int64_t>(ms_epoch + ms - static_cast<std::int64_t>(offset_min) * 60000);
}

}
