//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "parade/config.hpp"

#include <caf/detail/scope_guard.hpp>
#include <caf/expected.hpp>
#include <caf/fwd.hpp>

#include <string>

// PARADE_INFO -> spdlog::info
// PARADE_VERBOSE -> spdlog::debug
// PARADE_DEBUG -> spdlog::trace
// PARADE_TRACE -> spdlog::trace

#if PARADE_LOG_LEVEL == PARADE_LOG_LEVEL_TRACE
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#elif PARADE_LOG_LEVEL == PARADE_LOG_LEVEL_DEBUG
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#elif PARADE_LOG_LEVEL == PARADE_LOG_LEVEL_VERBOSE
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#elif PARADE_LOG_LEVEL == PARADE_LOG_LEVEL_INFO
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#elif PARADE_LOG_LEVEL == PARADE_LOG_LEVEL_WARNING
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_WARN
#elif PARADE_LOG_LEVEL == PARADE_LOG_LEVEL_ERROR
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_ERROR
#elif PARADE_LOG_LEVEL == PARADE_LOG_LEVEL_CRITICAL
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_CRITICAL
#elif PARADE_LOG_LEVEL == PARADE_LOG_LEVEL_QUIET
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_OFF
#endif

// Important: keep that below the log level mapping
#include "parade/detail/logger.hpp"

#if PARADE_LOG_LEVEL >= PARADE_LOG_LEVEL_TRACE

#  define PARADE_TRACE(...)                                                    \
    SPDLOG_LOGGER_TRACE(::parade::detail::logger(), __VA_ARGS__)

#else // PARADE_LOG_LEVEL < PARADE_LOG_LEVEL_TRACE

#  define PARADE_TRACE(...) PARADE_DISCARD_ARGS(__VA_ARGS__)

#endif // PARADE_LOG_LEVEL < PARADE_LOG_LEVEL_TRACE

#if PARADE_LOG_LEVEL >= PARADE_LOG_LEVEL_DEBUG

#  define PARADE_DEBUG(...)                                                    \
    SPDLOG_LOGGER_TRACE(::parade::detail::logger(), __VA_ARGS__)

#else // PARADE_LOG_LEVEL < PARADE_LOG_LEVEL_DEBUG

#  define PARADE_DEBUG(...) PARADE_DISCARD_ARGS(__VA_ARGS__)

#endif // PARADE_LOG_LEVEL < PARADE_LOG_LEVEL_DEBUG

#if PARADE_LOG_LEVEL >= PARADE_LOG_LEVEL_VERBOSE

#  define PARADE_VERBOSE(...)                                                  \
    SPDLOG_LOGGER_DEBUG(::parade::detail::logger(), __VA_ARGS__)

#else // PARADE_LOG_LEVEL < PARADE_LOG_LEVEL_VERBOSE

#  define PARADE_VERBOSE(...) PARADE_DISCARD_ARGS(__VA_ARGS__)

#endif // PARADE_LOG_LEVEL < PARADE_LOG_LEVEL_VERBOSE

#if PARADE_LOG_LEVEL >= PARADE_LOG_LEVEL_INFO

#  define PARADE_INFO(...)                                                     \
    SPDLOG_LOGGER_INFO(::parade::detail::logger(), __VA_ARGS__)

#else // PARADE_LOG_LEVEL < PARADE_LOG_LEVEL_INFO

#  define PARADE_INFO(...) PARADE_DISCARD_ARGS(__VA_ARGS__)

#endif // PARADE_LOG_LEVEL < PARADE_LOG_LEVEL_INFO

#if PARADE_LOG_LEVEL >= PARADE_LOG_LEVEL_WARNING

#  define PARADE_WARN(...)                                                     \
    SPDLOG_LOGGER_WARN(::parade::detail::logger(), __VA_ARGS__)

#else // PARADE_LOG_LEVEL < PARADE_LOG_LEVEL_WARNING

#  define PARADE_WARN(...) PARADE_DISCARD_ARGS(__VA_ARGS__)

#endif // PARADE_LOG_LEVEL < PARADE_LOG_LEVEL_WARNING

#if PARADE_LOG_LEVEL >= PARADE_LOG_LEVEL_ERROR

#  define PARADE_ERROR(...)                                                    \
    SPDLOG_LOGGER_ERROR(::parade::detail::logger(), __VA_ARGS__)

#else // PARADE_LOG_LEVEL < PARADE_LOG_LEVEL_ERROR

#  define PARADE_ERROR(...) PARADE_DISCARD_ARGS(__VA_ARGS__)

#endif // PARADE_LOG_LEVEL < PARADE_LOG_LEVEL_ERROR

#if PARADE_LOG_LEVEL >= PARADE_LOG_LEVEL_CRITICAL

#  define PARADE_CRITICAL(...)                                                 \
    SPDLOG_LOGGER_CRITICAL(::parade::detail::logger(), __VA_ARGS__)

#else // PARADE_LOG_LEVEL < PARADE_LOG_LEVEL_CRITICAL

#  define PARADE_CRITICAL(...) PARADE_DISCARD_ARGS(__VA_ARGS__)

#endif // PARADE_LOG_LEVEL < PARADE_LOG_LEVEL_CRITICAL

namespace parade {

/// Converts a verbosity to its integer counterpart. For unknown values,
/// the `default_value` parameter will be returned.
/// Used to map log level strings from config, like 'debug', to a log level.
int loglevel_to_int(std::string c, int default_value = PARADE_LOG_LEVEL_QUIET);

/// Sets up the process-wide logger from `cfg` and returns a guard that shuts
/// it down again.
[[nodiscard]] caf::expected<caf::detail::scope_guard<void (*)()>>
create_log_context(const caf::settings& cfg);

} // namespace parade
