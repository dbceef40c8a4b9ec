//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "parade/error.hpp"

#include "parade/detail/assert.hpp"

#include <caf/deep_to_string.hpp>
#include <caf/message.hpp>
#include <caf/pec.hpp>
#include <caf/sec.hpp>
#include <fmt/format.h>

#include <array>
#include <string>

namespace parade {

namespace {

constexpr auto code_names = std::array<std::string_view, 10>{
  "no_error",
  "unspecified",
  "no_such_file",
  "filesystem_error",
  "parse_error",
  "format_error",
  "serialization_error",
  "invalid_argument",
  "invalid_configuration",
  "logic_error",
};

static_assert(code_names.size() == static_cast<size_t>(ec::ec_count));

auto code_name(const caf::error& err) -> std::string {
  switch (err.category()) {
    case caf::type_id_v<ec>:
      return to_string(static_cast<ec>(err.code()));
    case caf::type_id_v<caf::pec>:
      return to_string(static_cast<caf::pec>(err.code()));
    case caf::type_id_v<caf::sec>:
      return to_string(static_cast<caf::sec>(err.code()));
  }
  return fmt::format("unknown error {}", err.code());
}

/// Joins a context that consists of strings only; falls back to CAF's
/// rendering of the whole message otherwise.
auto render_context(const caf::message& ctx) -> std::string {
  auto result = std::string{};
  for (size_t i = 0; i < ctx.size(); ++i) {
    if (!ctx.match_element<std::string>(i))
      return fmt::format(": {}", caf::deep_to_string(ctx));
    result += i == 0 ? ": " : " ";
    result += ctx.get_as<std::string>(i);
  }
  return result;
}

} // namespace

auto to_string(ec x) -> std::string {
  auto index = static_cast<size_t>(x);
  PARADE_ASSERT(index < code_names.size());
  return std::string{code_names[index]};
}

auto from_string(std::string_view str, ec& x) -> bool {
  for (size_t i = 0; i < code_names.size(); ++i) {
    if (code_names[i] == str) {
      x = static_cast<ec>(i);
      return true;
    }
  }
  return false;
}

auto from_integer(std::underlying_type_t<ec> value, ec& x) -> bool {
  if (value >= code_names.size())
    return false;
  x = static_cast<ec>(value);
  return true;
}

auto render(const caf::error& err) -> std::string {
  if (!err)
    return {};
  return fmt::format("!! {}{}", code_name(err), render_context(err.context()));
}

auto add_context_impl(const caf::error& error, std::string str) -> caf::error {
  if (!error)
    return error;
  auto context = caf::make_message(std::move(str));
  if (error.context())
    context = caf::message::concat(error.context(), std::move(context));
  return caf::error{error.code(), error.category(), std::move(context)};
}

} // namespace parade
