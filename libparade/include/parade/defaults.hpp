//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace parade::defaults {

// -- constants for the storage engine -----------------------------------------

/// The largest millisecond offset an event may carry relative to the reference
/// time of its chunk. Appends beyond this window open a new chunk.
inline constexpr auto max_chunk_offset
  = std::chrono::milliseconds{std::numeric_limits<uint16_t>::max()};

/// The label id handed out once the id space is exhausted.
inline constexpr uint16_t overflow_label = std::numeric_limits<uint16_t>::max();

/// The number of distinct keys the interning table can assign ids to.
inline constexpr size_t max_labels
  = size_t{std::numeric_limits<uint16_t>::max()} + 1;

// -- constants for the logger -------------------------------------------------
namespace logger {

/// Log format for file output.
inline constexpr const char* file_format
  = "[%Y-%m-%dT%T.%e%z] [%n] [%l] [%s:%#] %v";

/// Log format for console output.
inline constexpr const char* console_format = "%^[%T.%e] %v%$";

/// Verbosity for writing to console.
inline constexpr const char* console_verbosity = "warning";

/// Verbosity for writing to file.
inline constexpr const char* file_verbosity = "quiet";

/// Log filename, used when file logging is enabled without a path.
inline constexpr const char* log_file = "parade.log";

/// Maximum number of log messages in the logger queue.
inline constexpr const size_t queue_size = 8'192;

/// Number of logger threads.
inline constexpr const size_t logger_threads = 1;

} // namespace logger

// -- constants for the tools --------------------------------------------------
namespace generate {

/// Number of random writes performed by `parade-generate`.
inline constexpr uint64_t count = 4096;

/// Output format of `parade-generate`.
inline constexpr const char* format = "original";

} // namespace generate

namespace query {

/// Quantiles reported for histograms by `parade-query`.
inline constexpr double quantiles[] = {0.5, 0.75, 0.9, 0.99};

} // namespace query

} // namespace parade::defaults
