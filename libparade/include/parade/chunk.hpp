//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "parade/fwd.hpp"

#include "parade/event.hpp"
#include "parade/time.hpp"

#include <string>
#include <vector>

namespace parade {

/// A window of at most 65.535 seconds of events that share one reference
/// time. The absolute time of an event is `reference_time + event.ms`.
struct chunk {
  time reference_time = {};
  std::vector<event> events = {};

  /// Returns the absolute time of `x`.
  auto time_of(const event& x) const -> time {
    return reference_time + std::chrono::milliseconds{x.ms};
  }

  friend bool operator==(const chunk&, const chunk&) = default;

  /// Human-readable formats carry the reference time as RFC 3339 string,
  /// binary formats as nanoseconds since the epoch. Loading truncates to
  /// milliseconds, the precision of the string form.
  friend auto inspect(auto& f, chunk& x) -> bool {
    auto get_string = [&]() {
      return to_string(x.reference_time);
    };
    auto set_string = [&](std::string str) {
      auto parsed = parse_time(str);
      if (!parsed)
        return false;
      x.reference_time = floor_ms(*parsed);
      return true;
    };
    auto get_count = [&]() {
      return x.reference_time.time_since_epoch().count();
    };
    auto set_count = [&](duration::rep count) {
      x.reference_time = floor_ms(time{duration{count}});
      return true;
    };
    if (f.has_human_readable_format())
      return f.object(x)
        .pretty_name("parade.chunk")
        .fields(f.field("reference_time", get_string, set_string),
                f.field("events", x.events));
    return f.object(x)
      .pretty_name("parade.chunk")
      .fields(f.field("reference_time", get_count, set_count),
              f.field("events", x.events));
  }
};

} // namespace parade
