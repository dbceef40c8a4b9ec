//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "parade/configuration.hpp"

#include "parade/error.hpp"
#include "parade/logger.hpp"

#include <caf/config_value.hpp>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

namespace parade {

namespace {

caf::config_value parse(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      return caf::config_value{};
    case YAML::NodeType::Scalar: {
      // Attempt some type inference.
      auto boolean = false;
      if (YAML::convert<bool>::decode(node, boolean))
        return caf::config_value{boolean};
      auto integer = caf::config_value::integer{};
      if (YAML::convert<caf::config_value::integer>::decode(node, integer))
        return caf::config_value{integer};
      auto real = caf::config_value::real{};
      if (YAML::convert<caf::config_value::real>::decode(node, real))
        return caf::config_value{real};
      // Take the input as-is if nothing worked.
      return caf::config_value{node.as<std::string>()};
    }
    case YAML::NodeType::Sequence: {
      auto xs = caf::config_value::list{};
      xs.reserve(node.size());
      for (const auto& element : node)
        xs.push_back(parse(element));
      return caf::config_value{std::move(xs)};
    }
    case YAML::NodeType::Map: {
      auto xs = caf::settings{};
      for (const auto& pair : node)
        xs.insert_or_assign(pair.first.as<std::string>(), parse(pair.second));
      return caf::config_value{std::move(xs)};
    }
  }
  throw std::logic_error{"unhandled YAML node type"};
}

void merge_settings_impl(const caf::settings& src, caf::settings& dst,
                         size_t depth) {
  if (depth > 100) {
    PARADE_ERROR("exceeded maximum nesting depth in settings");
    return;
  }
  for (const auto& [key, value] : src) {
    if (auto nested = caf::get_if<caf::settings>(&value))
      merge_settings_impl(*nested, dst[key].as_dictionary(), depth + 1);
    else
      dst.insert_or_assign(key, value);
  }
}

} // namespace

auto from_yaml(std::string_view str) -> caf::expected<caf::settings> {
  try {
    auto node = YAML::Load(std::string{str});
    if (node.IsNull())
      return caf::settings{};
    if (!node.IsMap())
      return caf::make_error(ec::invalid_configuration,
                             "configuration must be a YAML mapping");
    auto result = parse(node);
    return std::move(result.as_dictionary());
  } catch (const YAML::Exception& e) {
    return caf::make_error(ec::parse_error,
                           fmt::format("failed to parse YAML at line {} column "
                                       "{}: {}",
                                       e.mark.line + 1, e.mark.column + 1,
                                       e.msg));
  } catch (const std::logic_error& e) {
    return caf::make_error(ec::logic_error, e.what());
  }
}

auto load_config_file(const std::filesystem::path& path)
  -> caf::expected<caf::settings> {
  auto in = std::ifstream{path};
  if (!in)
    return caf::make_error(ec::no_such_file,
                           fmt::format("failed to open configuration file {}",
                                       path.string()));
  auto contents = std::string{std::istreambuf_iterator<char>{in},
                              std::istreambuf_iterator<char>{}};
  auto result = from_yaml(contents);
  if (!result)
    return add_context(result.error(), "while loading {}", path.string());
  PARADE_VERBOSE("loaded configuration file {}", path.string());
  return result;
}

void merge_settings(const caf::settings& src, caf::settings& dst) {
  merge_settings_impl(src, dst, 0);
}

} // namespace parade
