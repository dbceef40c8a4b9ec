//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "parade/fwd.hpp"

#include <caf/expected.hpp>
#include <caf/settings.hpp>

#include <filesystem>
#include <string_view>

namespace parade {

/// Converts a YAML document into settings. The document must be a mapping or
/// empty. Scalars become booleans, integers or reals where they parse as such
/// and strings otherwise.
auto from_yaml(std::string_view str) -> caf::expected<caf::settings>;

/// Reads a YAML configuration file.
auto load_config_file(const std::filesystem::path& path)
  -> caf::expected<caf::settings>;

/// Overlays `src` onto `dst`. Nested dictionaries merge recursively; all other
/// values in `src` replace their counterparts in `dst`.
void merge_settings(const caf::settings& src, caf::settings& dst);

} // namespace parade
