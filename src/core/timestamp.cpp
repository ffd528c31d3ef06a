#include "veritas/core/timestamp.hpp"

#include <cstdio>

namespace veritas::core {

namespace {

// Reads exactly n digits at pos; advances pos.
bool read_fixed(std::string_view s, std::size_t& pos, std::size_t n, int& out) {
  if (pos + n > s.size()) return false;
  int v = 0;
  for (std::size_t i = 0; i < n; ++i) {
    const char c = s[pos + i];
    if (c < '0' || c > '9') return false;
    v = v * 10 + (c - '0');
  }
  out = v;
  pos += n;
  return true;
}

bool expect(std::string_view s, std::size_t& pos, char c) {
  if (pos >= s.size() || s[pos] != c) return false;
  ++pos;
  return true;
}

} // namespace

auto min_timestamp() -> timestamp {
  using namespace std::chrono;
  return timestamp{sys_days{year{0} / January / 1}};
}

auto max_timestamp() -> timestamp {
  using namespace std::chrono;
  return timestamp{sys_days{year{9999} / December / 31}} + hours{23} + minutes{59} + seconds{59} +
         milliseconds{999};
}

auto now() -> timestamp {
  return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

auto parse_timestamp(std::string_view s) -> std::optional<timestamp> {
  using namespace std::chrono;
  std::size_t pos = 0;
  int y = 0, mo = 0, d = 0;
  if (!read_fixed(s, pos, 4, y) || !expect(s, pos, '-') ||
      !read_fixed(s, pos, 2, mo) || !expect(s, pos, '-') ||
      !read_fixed(s, pos, 2, d)) {
    return std::nullopt;
  }
  const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
  if (!ymd.ok()) return std::nullopt;
  sys_days days{ymd};
  if (pos == s.size()) return timestamp{days};

  if (s[pos] != 'T' && s[pos] != 't' && s[pos] != ' ') return std::nullopt;
  ++pos;
  int hh = 0, mm = 0, ss = 0;
  if (!read_fixed(s, pos, 2, hh) || !expect(s, pos, ':') ||
      !read_fixed(s, pos, 2, mm) || !expect(s, pos, ':') ||
      !read_fixed(s, pos, 2, ss)) {
    return std::nullopt;
  }
  if (hh > 23 || mm > 59 || ss > 59) return std::nullopt;

  int millis = 0;
  if (pos < s.size() && s[pos] == '.') {
    ++pos;
    std::size_t digits = 0;
    while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
      if (digits < 3) millis = millis * 10 + (s[pos] - '0');
      ++digits;
      ++pos;
    }
    if (digits == 0 || digits > 9) return std::nullopt;
    for (std::size_t i = digits; i < 3; ++i) millis *= 10;
  }

  minutes offset{0};
  if (pos >= s.size()) return std::nullopt; // zone designator is mandatory with a time part
  if (s[pos] == 'Z' || s[pos] == 'z') {
    ++pos;
  } else if (s[pos] == '+' || s[pos] == '-') {
    const int sign = s[pos] == '-' ? -1 : 1;
    ++pos;
    int oh = 0, om = 0;
    if (!read_fixed(s, pos, 2, oh) || !expect(s, pos, ':') || !read_fixed(s, pos, 2, om)) {
      return std::nullopt;
    }
    if (oh > 23 || om > 59) return std::nullopt;
    offset = minutes{sign * (oh * 60 + om)};
  } else {
    return std::nullopt;
  }
  if (pos != s.size()) return std::nullopt;

  const timestamp t = timestamp{days} + hours{hh} + minutes{mm} + seconds{ss} + milliseconds{millis} - offset;
  if (t < min_timestamp() || t > max_timestamp()) return std::nullopt;
  return t;
}

auto format_timestamp(timestamp t) -> std::string {
  using namespace std::chrono;
  const auto days = floor<std::chrono::days>(t);
  const year_month_day ymd{days};
  const hh_mm_ss<milliseconds> tod{t - days};
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ",
                static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()), static_cast<int>(tod.hours().count()),
                static_cast<int>(tod.minutes().count()), static_cast<int>(tod.seconds().count()),
                static_cast<int>(tod.subseconds().count()));
  return std::string(buf);
}

} // namespace veritas::core
