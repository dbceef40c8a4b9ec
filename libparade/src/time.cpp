//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "parade/time.hpp"

#include "parade/error.hpp"

#include <caf/error.hpp>
#include <fmt/format.h>

#include <charconv>

namespace parade {

namespace {

using std::chrono::days;
using std::chrono::floor;
using std::chrono::hours;
using std::chrono::milliseconds;
using std::chrono::minutes;
using std::chrono::seconds;

/// A minimal cursor over the input of `parse_time`.
struct cursor {
  std::string_view str;
  size_t pos = 0;

  bool done() const {
    return pos == str.size();
  }

  bool accept(char c) {
    if (done() || str[pos] != c)
      return false;
    ++pos;
    return true;
  }

  /// Reads exactly `n` decimal digits.
  bool digits(size_t n, int& result) {
    if (str.size() - pos < n)
      return false;
    auto first = str.data() + pos;
    for (size_t i = 0; i < n; ++i)
      if (first[i] < '0' || first[i] > '9')
        return false;
    auto [ptr, err] = std::from_chars(first, first + n, result);
    if (err != std::errc{} || ptr != first + n)
      return false;
    pos += n;
    return true;
  }
};

caf::error invalid(std::string_view str, std::string_view what) {
  return caf::make_error(ec::parse_error,
                         fmt::format("invalid timestamp '{}': {}", str, what));
}

} // namespace

auto floor_ms(time x) -> time {
  return floor<milliseconds>(x);
}

auto now() -> time {
  return std::chrono::time_point_cast<duration>(
    std::chrono::system_clock::now());
}

auto to_string(time x) -> std::string {
  auto ms = floor<milliseconds>(x);
  auto day = floor<days>(ms);
  auto ymd = std::chrono::year_month_day{day};
  auto since_midnight = ms - day;
  auto h = floor<hours>(since_midnight);
  auto m = floor<minutes>(since_midnight - h);
  auto s = floor<seconds>(since_midnight - h - m);
  auto frac = since_midnight - h - m - s;
  return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                     static_cast<int>(ymd.year()),
                     static_cast<unsigned>(ymd.month()),
                     static_cast<unsigned>(ymd.day()), h.count(), m.count(),
                     s.count(), frac.count());
}

auto parse_time(std::string_view str) -> caf::expected<time> {
  auto in = cursor{str};
  int year = 0;
  int month = 0;
  int day = 0;
  if (!in.digits(4, year) || !in.accept('-') || !in.digits(2, month)
      || !in.accept('-') || !in.digits(2, day))
    return invalid(str, "expected YYYY-MM-DD");
  auto ymd = std::chrono::year{year} / month / day;
  if (!ymd.ok())
    return invalid(str, "no such date");
  auto result = time{std::chrono::sys_days{ymd}.time_since_epoch()};
  if (in.done())
    return result;
  if (!in.accept('T') && !in.accept('t') && !in.accept(' '))
    return invalid(str, "expected time separator");
  int hour = 0;
  int minute = 0;
  int second = 0;
  if (!in.digits(2, hour) || !in.accept(':') || !in.digits(2, minute))
    return invalid(str, "expected HH:MM");
  if (in.accept(':') && !in.digits(2, second))
    return invalid(str, "expected seconds");
  if (hour > 23 || minute > 59 || second > 60)
    return invalid(str, "time of day out of range");
  result += hours{hour} + minutes{minute} + seconds{second};
  if (in.accept('.')) {
    // Fractional seconds of arbitrary length; we keep nanoseconds.
    auto scale = int64_t{100'000'000};
    auto fraction = int64_t{0};
    auto count = size_t{0};
    while (!in.done() && in.str[in.pos] >= '0' && in.str[in.pos] <= '9') {
      fraction += (in.str[in.pos] - '0') * scale;
      scale /= 10;
      ++in.pos;
      ++count;
    }
    if (count == 0)
      return invalid(str, "expected fractional seconds");
    result += duration{fraction};
  }
  if (in.done() || in.accept('Z') || in.accept('z')) {
    if (!in.done())
      return invalid(str, "trailing characters");
    return result;
  }
  auto sign = 0;
  if (in.accept('+'))
    sign = 1;
  else if (in.accept('-'))
    sign = -1;
  else
    return invalid(str, "expected UTC offset");
  int offset_hours = 0;
  int offset_minutes = 0;
  if (!in.digits(2, offset_hours))
    return invalid(str, "expected offset hours");
  in.accept(':');
  if (!in.done() && !in.digits(2, offset_minutes))
    return invalid(str, "expected offset minutes");
  if (!in.done())
    return invalid(str, "trailing characters");
  // A local time with a positive offset lies before the same UTC reading.
  result -= sign * (hours{offset_hours} + minutes{offset_minutes});
  return result;
}

} // namespace parade
