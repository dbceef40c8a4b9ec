//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "parade/event.hpp"

#include <array>

namespace parade {

namespace {

constexpr auto op_names = std::array<std::string_view, 3>{
  "add",
  "sub",
  "set",
};

} // namespace

auto to_string(op x) -> std::string {
  return std::string{op_names[static_cast<size_t>(x)]};
}

auto from_string(std::string_view str, op& x) -> bool {
  for (size_t i = 0; i < op_names.size(); ++i) {
    if (op_names[i] == str) {
      x = static_cast<op>(i);
      return true;
    }
  }
  return false;
}

auto from_integer(std::underlying_type_t<op> value, op& x) -> bool {
  if (value >= op_names.size())
    return false;
  x = static_cast<op>(value);
  return true;
}

auto entry::kind() const -> std::string_view {
  return match(
    [](const counter_entry&) {
      return std::string_view{"counter"};
    },
    [](const gauge_entry&) {
      return std::string_view{"gauge"};
    },
    [](const histogram_entry&) {
      return std::string_view{"histogram"};
    });
}

} // namespace parade
