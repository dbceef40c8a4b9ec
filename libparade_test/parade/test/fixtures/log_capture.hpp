//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "parade/logger.hpp"

#include <spdlog/sinks/ringbuffer_sink.h>

#include <algorithm>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace fixtures {

/// Replaces the process-wide logger with a synchronous in-memory logger for
/// the lifetime of the fixture.
struct log_capture {
  log_capture()
    : sink{std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(capacity)},
      previous{parade::detail::logger()} {
    sink->set_pattern("%l %v");
    auto logger = std::make_shared<spdlog::logger>("capture", sink);
    logger->set_level(spdlog::level::trace);
    parade::detail::logger() = std::move(logger);
  }

  ~log_capture() {
    parade::detail::logger() = std::move(previous);
  }

  log_capture(const log_capture&) = delete;
  log_capture& operator=(const log_capture&) = delete;

  /// All captured lines, each starting with the level name.
  auto lines() const -> std::vector<std::string> {
    return sink->last_formatted();
  }

  /// Counts the captured lines at `level`, e.g., `warning`.
  auto count(std::string_view level) const -> size_t {
    auto xs = lines();
    return std::count_if(xs.begin(), xs.end(), [&](const std::string& x) {
      return x.starts_with(level) && x.size() > level.size()
             && x[level.size()] == ' ';
    });
  }

  static constexpr size_t capacity = 1024;

  std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink;
  std::shared_ptr<spdlog::logger> previous;
};

} // namespace fixtures
