//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

// Must be included after SPDLOG_ACTIVE_LEVEL is defined.
#include <caf/fwd.hpp>
#include <spdlog/spdlog.h>

#include <memory>

namespace parade::detail {

/// Installs the console and file sinks described by `cfg` into the
/// process-wide logger.
/// @returns `false` if the configuration is invalid or the sinks could not be
///          created.
bool setup_spdlog(const caf::settings& cfg);

/// Flushes and drops all sinks.
void shutdown_spdlog();

/// The process-wide logger. Starts out as a null sink.
std::shared_ptr<spdlog::logger>& logger();

} // namespace parade::detail

#define PARADE_DISCARD_ARGS(...)                                               \
  do {                                                                         \
  } while (false)
