//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "parade/logger.hpp"

#include "parade/defaults.hpp"
#include "parade/detail/assert.hpp"
#include "parade/error.hpp"

#include <caf/settings.hpp>
#include <fmt/format.h>
#include <spdlog/async.h>
#include <spdlog/common.h>
#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <iostream>
#include <memory>
#include <string_view>
#include <vector>

namespace parade {

namespace {

struct verbosity_level {
  std::string_view name;
  int value;
  spdlog::level::level_enum level;
};

// spdlog has no level between debug and trace, so our debug and trace levels
// both map onto spdlog's trace.
constexpr auto verbosity_levels = std::array{
  verbosity_level{"quiet", PARADE_LOG_LEVEL_QUIET, spdlog::level::off},
  verbosity_level{"critical", PARADE_LOG_LEVEL_CRITICAL,
                  spdlog::level::critical},
  verbosity_level{"error", PARADE_LOG_LEVEL_ERROR, spdlog::level::err},
  verbosity_level{"warning", PARADE_LOG_LEVEL_WARNING, spdlog::level::warn},
  verbosity_level{"info", PARADE_LOG_LEVEL_INFO, spdlog::level::info},
  verbosity_level{"verbose", PARADE_LOG_LEVEL_VERBOSE, spdlog::level::debug},
  verbosity_level{"debug", PARADE_LOG_LEVEL_DEBUG, spdlog::level::trace},
  verbosity_level{"trace", PARADE_LOG_LEVEL_TRACE, spdlog::level::trace},
};

auto to_spdlog_level(int value) -> spdlog::level::level_enum {
  auto it = std::find_if(verbosity_levels.begin(), verbosity_levels.end(),
                         [&](const verbosity_level& x) {
                           return x.value == value;
                         });
  PARADE_ASSERT(it != verbosity_levels.end(), "unhandled log level");
  return it->level;
}

} // namespace

caf::expected<caf::detail::scope_guard<void (*)()>>
create_log_context(const caf::settings& cfg) {
  if (!parade::detail::setup_spdlog(cfg))
    return caf::make_error(ec::invalid_configuration,
                           "failed to set up logging");
  return {caf::detail::make_scope_guard(
    std::addressof(parade::detail::shutdown_spdlog))};
}

int loglevel_to_int(std::string x, int default_value) {
  for (auto& ch : x)
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  for (const auto& level : verbosity_levels)
    if (level.name == x)
      return level.value;
  return default_value;
}

namespace {

/// Reads a verbosity option, falling back to `fallback` if it is absent.
/// @returns a negative value if the option holds an unknown verbosity.
int get_verbosity(const caf::settings& cfg, std::string_view key,
                  const char* fallback) {
  auto verbosity = std::string{fallback};
  if (auto value = caf::get_if<std::string>(&cfg, key)) {
    verbosity = *value;
  }
  auto result = loglevel_to_int(verbosity, -1);
  if (result < 0)
    fmt::print(stderr, "failed to start logger; {} '{}' is invalid\n", key,
               verbosity);
  return result;
}

} // namespace

namespace detail {

bool setup_spdlog(const caf::settings& cfg) try {
  if (parade::detail::logger()->name() != "/dev/null") {
    PARADE_ERROR("Log already up");
    return false;
  }
  auto console_verbosity = get_verbosity(cfg, "parade.console-verbosity",
                                         defaults::logger::console_verbosity);
  auto file_verbosity = get_verbosity(cfg, "parade.file-verbosity",
                                      defaults::logger::file_verbosity);
  if (console_verbosity < 0 || file_verbosity < 0)
    return false;
  auto log_file = caf::get_or(cfg, "parade.log-file",
                              std::string{defaults::logger::log_file});
  // Enabling a log file without naming a verbosity logs at the default file
  // verbosity of the console.
  if (caf::get_if<std::string>(&cfg, "parade.log-file")
      && !caf::get_if<std::string>(&cfg, "parade.file-verbosity")
      && file_verbosity == PARADE_LOG_LEVEL_QUIET)
    file_verbosity = console_verbosity;
  auto verbosity = std::max(console_verbosity, file_verbosity);
  spdlog::init_thread_pool(defaults::logger::queue_size,
                           defaults::logger::logger_threads);
  std::vector<spdlog::sink_ptr> sinks;
  // Add console sink.
  auto log_color = [&]() -> spdlog::color_mode {
    auto config_value = caf::get_or(cfg, "parade.console", "automatic");
    if (config_value == "automatic")
      return spdlog::color_mode::automatic;
    if (config_value == "always")
      return spdlog::color_mode::always;
    return spdlog::color_mode::never;
  }();
  auto console_sink
    = std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>(log_color);
  auto console_format
    = caf::get_or(cfg, "parade.console-format",
                  std::string{defaults::logger::console_format});
  console_sink->set_pattern(console_format);
  console_sink->set_level(to_spdlog_level(console_verbosity));
  sinks.push_back(console_sink);
  // Add file sink.
  if (file_verbosity != PARADE_LOG_LEVEL_QUIET) {
    auto file_sink
      = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file);
    file_sink->set_level(to_spdlog_level(file_verbosity));
    auto file_format = caf::get_or(cfg, "parade.file-format",
                                   std::string{defaults::logger::file_format});
    file_sink->set_pattern(file_format);
    sinks.push_back(file_sink);
  }
  // Replace the /dev/null logger that was created during init.
  logger() = std::make_shared<spdlog::async_logger>(
    "parade", sinks.begin(), sinks.end(), spdlog::thread_pool(),
    spdlog::async_overflow_policy::block);
  logger()->set_level(to_spdlog_level(verbosity));
  return true;
} catch (const spdlog::spdlog_ex& err) {
  std::cerr << err.what() << "\n";
  return false;
}

void shutdown_spdlog() {
  PARADE_DEBUG("shut down logging");
  logger()->flush();
  logger() = std::make_shared<spdlog::logger>(
    "/dev/null", std::make_shared<spdlog::sinks::null_sink_mt>());
  spdlog::shutdown();
}

std::shared_ptr<spdlog::logger>& logger() {
  static std::shared_ptr<spdlog::logger> parade_logger
    = std::make_shared<spdlog::logger>(
      "/dev/null", std::make_shared<spdlog::sinks::null_sink_mt>());
  return parade_logger;
}

} // namespace detail
} // namespace parade
