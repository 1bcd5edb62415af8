// File: src/core/util/time_format.cpp
#include "pc/core/util/time_format.hpp"

#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <limits>

namespace pc {
namespace {

// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

bool is_leap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

int days_in_month(int y, int m) {
  static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return (m == 2 && is_leap(y)) ? 29 : kDays[m - 1];
}

// Reads exactly `n` digits at `pos`.
bool read_digits(const std::string& s, std::size_t& pos, std::size_t n, int& out) {
  if (pos + n > s.size()) return false;
  int v = 0;
  for (std::size_t i = 0; i < n; ++i) {
    const char c = s[pos + i];
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    v = v * 10 + (c - '0');
  }
  pos += n;
  out = v;
  return true;
}

bool expect(const std::string& s, std::size_t& pos, char c) {
  if (pos >= s.size() || s[pos] != c) return false;
  ++pos;
  return true;
}

Result<ParsedInstant> fail(const std::string& text) {
  return Result<ParsedInstant>::err(Status::parse_error("not an ISO 8601 date-time: '" + text + "'"));
}

}  // namespace

Result<ParsedInstant> parse_iso8601(const std::string& raw) {
  // Feeds often pad element text with whitespace.
  std::size_t b = 0;
  std::size_t e = raw.size();
  while (b < e && std::isspace(static_cast<unsigned char>(raw[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(raw[e - 1]))) --e;
  const std::string s = raw.substr(b, e - b);

  std::size_t pos = 0;
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

  if (!read_digits(s, pos, 4, year) || !expect(s, pos, '-') ||
      !read_digits(s, pos, 2, month) || !expect(s, pos, '-') ||
      !read_digits(s, pos, 2, day)) {
    return fail(raw);
  }
  if (pos >= s.size() || (s[pos] != 'T' && s[pos] != 't' && s[pos] != ' ')) return fail(raw);
  ++pos;
  if (!read_digits(s, pos, 2, hour) || !expect(s, pos, ':') ||
      !read_digits(s, pos, 2, minute)) {
    return fail(raw);
  }
  // Seconds are optional in the wild.
  if (pos < s.size() && s[pos] == ':') {
    ++pos;
    if (!read_digits(s, pos, 2, second)) return fail(raw);
  }

  std::int64_t frac_ns = 0;
  if (pos < s.size() && (s[pos] == '.' || s[pos] == ',')) {
    ++pos;
    std::int64_t scale = 100'000'000;
    std::size_t ndigits = 0;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
      frac_ns += (s[pos] - '0') * scale;  // digits past nanoseconds add 0
      scale /= 10;
      ++pos;
      ++ndigits;
    }
    if (ndigits == 0) return fail(raw);
  }

  int offset_min = 0;
  if (pos < s.size()) {
    const char c = s[pos];
    if (c == 'Z' || c == 'z') {
      ++pos;
    } else if (c == '+' || c == '-') {
      ++pos;
      int oh = 0, om = 0;
      if (!read_digits(s, pos, 2, oh)) return fail(raw);
      if (pos < s.size() && s[pos] == ':') ++pos;
      if (pos < s.size() && !read_digits(s, pos, 2, om)) return fail(raw);
      if (oh > 23 || om > 59) return fail(raw);
      offset_min = (c == '-' ? -1 : 1) * (oh * 60 + om);
    } else {
      return fail(raw);
    }
  }
  if (pos != s.size()) return fail(raw);

  if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) ||
      hour > 23 || minute > 59 || second > 60) {
    return fail(raw);
  }

  const std::int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
  const std::int64_t local_s = days * 86400 + hour * 3600 + minute * 60 + second;
  const std::int64_t utc_s = local_s - static_cast<std::int64_t>(offset_min) * 60;

  // Epoch nanoseconds in int64_t span roughly 1677-09-21 to 2262-04-11.
  constexpr std::int64_t kMaxSeconds = std::numeric_limits<std::int64_t>::max() / kNsPerSecond;
  constexpr std::int64_t kMinSeconds = std::numeric_limits<std::int64_t>::min() / kNsPerSecond;
  if (utc_s >= kMaxSeconds || utc_s <= kMinSeconds) {
    return Result<ParsedInstant>::err(
        Status::out_of_range("date-time outside the representable range: '" + raw + "'"));
  }

  ParsedInstant out;
  out.timestamp = TimestampNs{utc_s * kNsPerSecond + frac_ns};
  out.utc_offset_min = offset_min;
  return Result<ParsedInstant>::ok(out);
}

std::string format_hhmm(TimestampNs t, int utc_offset_min) {
  std::int64_t s = t.ns / kNsPerSecond;
  if (t.ns % kNsPerSecond < 0) --s;  // floor for pre-epoch instants
  s += static_cast<std::int64_t>(utc_offset_min) * 60;

  std::int64_t sod = s % 86400;
  if (sod < 0) sod += 86400;

  char buf[8];
  std::snprintf(buf, sizeof(buf), "%02d:%02d", static_cast<int>(sod / 3600),
                static_cast<int>((sod % 3600) / 60));
  return std::string(buf);
}

TimestampNs wall_now_epoch_ns() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now().time_since_epoch();
  const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
  return TimestampNs{static_cast<std::int64_t>(ns)};
}

}  // namespace pc
