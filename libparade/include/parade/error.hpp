//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "parade/fwd.hpp"

#include <caf/default_enum_inspect.hpp>
#include <caf/error.hpp>
#include <fmt/format.h>

#include <string>
#include <string_view>
#include <type_traits>

namespace parade {

/// Parade's error codes.
enum class ec : uint8_t {
  /// No error.
  no_error = 0,
  /// The unspecified default error code.
  unspecified,
  /// Requested file does not exist.
  no_such_file,
  /// An error while accessing the filesystem.
  filesystem_error,
  /// Failure during parsing.
  parse_error,
  /// An error with an input/output format.
  format_error,
  /// An error during serialization or deserialization.
  serialization_error,
  /// A function received an invalid argument.
  invalid_argument,
  /// The configuration was invalid.
  invalid_configuration,
  /// An error caused by wrong internal application logic.
  logic_error,
  /// No error; number of error codes.
  ec_count,
};

/// @relates ec
auto to_string(ec x) -> std::string;

/// @relates ec
auto from_string(std::string_view str, ec& x) -> bool;

/// @relates ec
auto from_integer(std::underlying_type_t<ec> value, ec& x) -> bool;

template <class Inspector>
auto inspect(Inspector& f, ec& x) -> bool {
  return caf::default_enum_inspect(f, x);
}

/// A formatting function that converts an error into a human-readable string.
/// @relates ec
auto render(const caf::error& err) -> std::string;

auto add_context_impl(const caf::error& error, std::string str) -> caf::error;

/// Appends a formatted note to the context of an error. Returns the error
/// unchanged if it does not hold an error.
template <class... Ts>
auto add_context(const caf::error& error, fmt::format_string<Ts...> fmt,
                 Ts&&... args) -> caf::error {
  return add_context_impl(error, fmt::format(std::move(fmt),
                                             std::forward<Ts>(args)...));
}

} // namespace parade

CAF_ERROR_CODE_ENUM(parade::ec)
