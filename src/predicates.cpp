#include "veritas/predicates.hpp"

#include <charconv>
#include <cmath>
#include <limits>
#include <string>

#include "veritas/core/timestamp.hpp"

namespace veritas {

namespace {

constexpr bool is_space(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

constexpr bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

// 2^63 as a double; integral doubles in [-2^63, 2^63) fit in int64.
constexpr double kInt64Bound = 9223372036854775808.0;

auto string_view_of(const value& v) noexcept -> std::string_view {
  return v.get_ref<const std::string&>();
}

} // namespace

auto trim(std::string_view s) noexcept -> std::string_view {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && is_space(s[b])) ++b;
  while (e > b && is_space(s[e - 1])) --e;
  return s.substr(b, e - b);
}

auto is_string(const value& v) noexcept -> bool { return v.is_string(); }

auto is_number(const value& v) noexcept -> bool {
  if (v.is_number_integer()) return true; // signed and unsigned
  if (v.is_number_float()) return std::isfinite(v.get<double>());
  return false;
}

auto is_boolean(const value& v) noexcept -> bool { return v.is_boolean(); }
auto is_null(const value& v) noexcept -> bool { return v.is_null(); }
auto is_array(const value& v) noexcept -> bool { return v.is_array(); }
auto is_object(const value& v) noexcept -> bool { return v.is_object(); }

auto is_non_empty_string(const value& v) noexcept -> bool {
  return is_string(v) && !trim(string_view_of(v)).empty();
}

auto is_numeric_string(const value& v) noexcept -> bool {
  if (!is_string(v)) return false;
  auto s = trim(string_view_of(v));
  if (s.empty()) return false;
  const bool explicit_plus = s.front() == '+';
  if (explicit_plus) s.remove_prefix(1);
  if (s.empty()) return false;
  // at most one sign: "+-5" is not numeric
  const bool sign_ok = s.front() == '-' && !explicit_plus;
  if (!(is_digit(s.front()) || s.front() == '.' || sign_ok)) return false;
  double out = 0.0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out, std::chars_format::general);
  return ec == std::errc{} && ptr == s.data() + s.size() && std::isfinite(out);
}

auto is_positive_number(const value& v) noexcept -> bool {
  if (!is_number(v)) return false;
  if (v.is_number_unsigned()) return v.get<std::uint64_t>() > 0;
  if (v.is_number_integer()) return v.get<std::int64_t>() > 0;
  return v.get<double>() > 0.0;
}

auto is_integer(const value& v) noexcept -> bool {
  if (v.is_number_unsigned()) {
    return v.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
  }
  if (v.is_number_integer()) return true;
  if (v.is_number_float()) {
    const double d = v.get<double>();
    return std::isfinite(d) && std::trunc(d) == d && d >= -kInt64Bound && d < kInt64Bound;
  }
  return false;
}

auto is_positive_integer(const value& v) noexcept -> bool {
  return is_integer(v) && is_positive_number(v);
}

auto integer_value(const value& v) noexcept -> std::int64_t {
  if (v.is_number_unsigned()) return static_cast<std::int64_t>(v.get<std::uint64_t>());
  if (v.is_number_integer()) return v.get<std::int64_t>();
  if (v.is_number_float()) return static_cast<std::int64_t>(v.get<double>());
  return 0;
}

auto is_non_empty_array(const value& v) noexcept -> bool { return v.is_array() && !v.empty(); }

auto is_array_of_length(const value& v, std::size_t length) noexcept -> bool {
  return v.is_array() && v.size() == length;
}

auto is_plain_object(const value& v) noexcept -> bool { return v.is_object(); }

auto is_empty_object(const value& v) noexcept -> bool { return v.is_object() && v.empty(); }

auto is_array_of(const value& v, predicate_fn pred) noexcept -> bool {
  if (!v.is_array() || pred == nullptr) return false;
  bool all = true;
  for (const auto& item : v) all = pred(item) && all;
  return all;
}

auto is_date(const value& v) noexcept -> bool {
  if (!is_string(v)) return false;
  return core::parse_timestamp(string_view_of(v)).has_value();
}

auto is_valid_date_string(const value& v) noexcept -> bool { return is_date(v); }

// ^[^\s@]+@[^\s@]+\.[^\s@]+$
auto is_valid_email(std::string_view s) noexcept -> bool {
  for (char c : s) if (is_space(c)) return false;
  const auto at = s.find('@');
  if (at == std::string_view::npos || at == 0) return false;
  const auto domain = s.substr(at + 1);
  if (domain.find('@') != std::string_view::npos) return false;
  // some dot with at least one character on each side
  for (std::size_t i = 1; i + 1 < domain.size(); ++i) {
    if (domain[i] == '.') return true;
  }
  return false;
}

// ^\+?[\d\s\-\(\)]+$ and at least 10 digits
auto is_valid_phone_number(std::string_view s) noexcept -> bool {
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return false;
  std::size_t digits = 0;
  for (char c : s) {
    if (is_digit(c)) {
      ++digits;
    } else if (!(is_space(c) || c == '-' || c == '(' || c == ')')) {
      return false;
    }
  }
  return digits >= 10;
}

} // namespace veritas
