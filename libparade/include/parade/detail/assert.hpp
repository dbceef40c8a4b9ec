//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <source_location>
#include <string>
#include <string_view>

namespace parade::detail {

/// Logs the message and throws a `std::runtime_error` carrying it.
[[noreturn]] void panic_impl(std::string message, std::source_location source);

[[noreturn]] void
fail_assertion_impl(const char* expr, std::string_view explanation,
                    std::source_location source);

} // namespace parade::detail

/// Checks an internal invariant. Unlike `assert`, the check stays enabled in
/// release builds and reports a violation by throwing.
#define PARADE_ASSERT(expr, ...)                                               \
  do {                                                                         \
    if (! static_cast<bool>(expr)) [[unlikely]] {                              \
      ::parade::detail::fail_assertion_impl(                                   \
        #expr, std::string_view{__VA_ARGS__},                                  \
        std::source_location::current());                                      \
    }                                                                          \
  } while (false)
