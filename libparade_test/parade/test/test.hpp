//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <caf/detail/stringification_inspector.hpp>
#include <caf/inspector_access.hpp>
#include <caf/test/test.hpp>
#include <fmt/format.h>

#include <optional>
#include <string>

namespace parade::test::detail {

template <class T>
auto stringify(const T& value) {
  if constexpr (std::is_same_v<T, std::nullptr_t>) {
    return std::string{"null"};
  } else if constexpr (std::is_convertible_v<T, std::string>) {
    return std::string{value};
  } else {
    return caf::deep_to_string(value);
  }
}

template <class T0, class T1>
bool check_eq(const T0& lhs, const T1& rhs,
              caf::detail::source_location location
              = caf::detail::source_location::current()) {
  // Adapted from CAF, but without safety checks.
  if (lhs == rhs) {
    caf::test::reporter::instance().pass(location);
    return true;
  }
  caf::test::reporter::instance().fail(
    caf::test::binary_predicate::eq, stringify(lhs), stringify(rhs), location);
  return false;
}

} // end namespace parade::test::detail

// -- logging macros -----------------------------------------------------------

// The new testing framework does not have `CAF_MESSAGE` anymore.
#define MESSAGE(...) fmt::print("{}\n", fmt::format(__VA_ARGS__))

// -- macros for checking results ----------------------------------------------
// Checks that abort the current test on failure
#define REQUIRE(x)                                                             \
  ::caf::test::runnable::current().require(static_cast<bool>(x))
#define REQUIRE_EQUAL(x, y)                                                    \
  ::caf::test::runnable::current().require_eq((x), (y))
#define REQUIRE_NOT_EQUAL(x, y)                                                \
  ::caf::test::runnable::current().require_ne((x), (y))
#define REQUIRE_LESS(x, y) ::caf::test::runnable::current().require_lt((x), (y))
#define REQUIRE_LESS_EQUAL(x, y)                                               \
  ::caf::test::runnable::current().require_le((x), (y))
#define REQUIRE_GREATER(x, y)                                                  \
  ::caf::test::runnable::current().require_gt((x), (y))
#define REQUIRE_GREATER_EQUAL(x, y)                                            \
  ::caf::test::runnable::current().require_ge((x), (y))
#define REQUIRE_NOERROR(x)                                                     \
  do {                                                                         \
    if (! (x)) {                                                               \
      ::caf::test::runnable::current().fail("Unexpected error {} in: {}",      \
                                            (x).error(), __FILE__);            \
    } else {                                                                   \
      MESSAGE("Successful check {}", #x);                                      \
    }                                                                          \
  } while (false)
#define REQUIRE_ERROR(x) REQUIRE_EQUAL(! (x), true)
#define FAIL ::caf::test::runnable::current().fail
// Checks that continue with the current test on failure
#define CHECK(x) ::caf::test::runnable::current().check(static_cast<bool>(x))
#define CHECK_EQUAL(x, y) ::parade::test::detail::check_eq((x), (y))
#define CHECK_NOT_EQUAL(x, y)                                                  \
  ::caf::test::runnable::current().check_ne((x), (y))
#define CHECK_LESS(x, y) ::caf::test::runnable::current().check_lt((x), (y))
#define CHECK_LESS_EQUAL(x, y)                                                 \
  ::caf::test::runnable::current().check_le((x), (y))
#define CHECK_GREATER(x, y) ::caf::test::runnable::current().check_gt((x), (y))
#define CHECK_GREATER_EQUAL(x, y)                                              \
  ::caf::test::runnable::current().check_ge((x), (y))
#define CHECK_ERROR(x) CHECK_EQUAL(! (x), true)

// -- global state -------------------------------------------------------------

namespace parade::test {

template <class T>
T unbox(std::optional<T> x) {
  if (! x) {
    FAIL("x == none");
  }
  return std::move(*x);
}

template <class T>
T unbox(caf::expected<T> x) {
  if (! x) {
    FAIL("expected<T> contains an error: {}", x.error());
  }
  return std::move(*x);
}

template <class T>
T unbox(T* x) {
  if (! x) {
    FAIL("T* contains nullptr");
  }
  return std::move(*x);
}

} // namespace parade::test

namespace parade {

using test::unbox;

} // namespace parade
