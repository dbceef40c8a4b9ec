//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "parade/fwd.hpp"

#include <caf/expected.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace parade {

/// Truncates a point in time to millisecond precision, rounding towards the
/// past.
auto floor_ms(time x) -> time;

/// Returns the current wall clock time.
auto now() -> time;

/// Renders a point in time as RFC 3339 timestamp in UTC with millisecond
/// precision, e.g., `2024-03-01T12:00:00.250Z`.
auto to_string(time x) -> std::string;

/// Parses an RFC 3339 timestamp. The time of day and the UTC offset are
/// optional; a bare date denotes midnight UTC. A space may replace the `T`.
auto parse_time(std::string_view str) -> caf::expected<time>;

} // namespace parade
