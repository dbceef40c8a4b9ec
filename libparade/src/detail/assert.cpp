//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "parade/detail/assert.hpp"

#include "parade/config.hpp"
#include "parade/logger.hpp"

#include <stdexcept>

namespace parade::detail {

void panic_impl(std::string message, std::source_location source) {
  PARADE_ERROR("panic: {}", message);
  PARADE_ERROR("version: {}", version::version);
  PARADE_ERROR("source: {}:{}", source.file_name(), source.line());
  message += fmt::format(" @ {}:{}", source.file_name(), source.line());
  throw std::runtime_error(message);
}

[[noreturn]] void
fail_assertion_impl(const char* expr, std::string_view explanation,
                    std::source_location source) {
  auto message = fmt::format("assertion `{}` failed", expr);
  if (not explanation.empty()) {
    message += ": ";
    message += explanation;
  }
  panic_impl(std::move(message), source);
}

} // namespace parade::detail
