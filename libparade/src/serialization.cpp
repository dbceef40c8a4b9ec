//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "parade/serialization.hpp"

#include "parade/error.hpp"
#include "parade/logger.hpp"

#include <caf/binary_deserializer.hpp>
#include <caf/binary_serializer.hpp>
#include <caf/json_reader.hpp>
#include <caf/json_writer.hpp>
#include <fmt/format.h>

#include <array>
#include <cstddef>
#include <fstream>
#include <iterator>
#include <system_error>

namespace parade {

namespace {

constexpr auto format_names = std::array<std::string_view, 5>{
  "original",
  "array",
  "json-lines",
  "binary",
  "binary-array",
};

template <class T>
auto write_json(const T& x, bool pretty) -> caf::expected<std::string> {
  auto writer = caf::json_writer{};
  writer.skip_object_type_annotation(true);
  writer.indentation(pretty ? 2 : 0);
  if (!writer.apply(x))
    return caf::make_error(ec::serialization_error,
                           fmt::format("failed to write JSON: {}",
                                       render(writer.get_error())));
  return std::string{writer.str()};
}

template <class T>
auto read_json(std::string_view str) -> caf::expected<T> {
  auto reader = caf::json_reader{};
  if (!reader.load(str))
    return caf::make_error(ec::parse_error,
                           fmt::format("failed to parse JSON: {}",
                                       render(reader.get_error())));
  auto result = T{};
  if (!reader.apply(result))
    return caf::make_error(ec::serialization_error,
                           fmt::format("failed to read JSON: {}",
                                       render(reader.get_error())));
  return result;
}

template <class T>
auto write_binary(const T& x) -> caf::expected<caf::byte_buffer> {
  auto buffer = caf::byte_buffer{};
  auto serializer = caf::binary_serializer{buffer};
  if (!serializer.apply(x))
    return caf::make_error(ec::serialization_error,
                           fmt::format("failed to write binary: {}",
                                       render(serializer.get_error())));
  return buffer;
}

template <class T>
auto read_binary(caf::const_byte_span bytes) -> caf::expected<T> {
  auto deserializer = caf::binary_deserializer{bytes};
  auto result = T{};
  if (!deserializer.apply(result))
    return caf::make_error(ec::serialization_error,
                           fmt::format("failed to read binary: {}",
                                       render(deserializer.get_error())));
  if (deserializer.remaining() != 0)
    return caf::make_error(ec::serialization_error,
                           fmt::format("{} trailing bytes after binary input",
                                       deserializer.remaining()));
  return result;
}

auto read_file(const std::filesystem::path& path)
  -> caf::expected<std::string> {
  auto err = std::error_code{};
  if (!std::filesystem::exists(path, err))
    return caf::make_error(ec::no_such_file,
                           fmt::format("no such file: {}", path.string()));
  auto in = std::ifstream{path, std::ios::binary};
  if (!in)
    return caf::make_error(ec::filesystem_error,
                           fmt::format("failed to open {}", path.string()));
  auto result = std::string{std::istreambuf_iterator<char>{in},
                            std::istreambuf_iterator<char>{}};
  if (in.bad())
    return caf::make_error(ec::filesystem_error,
                           fmt::format("failed to read {}", path.string()));
  return result;
}

auto write_file(const std::filesystem::path& path, std::string_view bytes)
  -> caf::error {
  auto out = std::ofstream{path, std::ios::binary | std::ios::trunc};
  if (!out)
    return caf::make_error(ec::filesystem_error,
                           fmt::format("failed to open {} for writing",
                                       path.string()));
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  out.close();
  if (!out)
    return caf::make_error(ec::filesystem_error,
                           fmt::format("failed to write {}", path.string()));
  return {};
}

auto as_chars(const caf::byte_buffer& buffer) -> std::string_view {
  return {reinterpret_cast<const char*>(buffer.data()), buffer.size()};
}

auto as_bytes(std::string_view str) -> caf::const_byte_span {
  return {reinterpret_cast<const std::byte*>(str.data()), str.size()};
}

} // namespace

auto to_string(serialization_format x) -> std::string {
  return std::string{format_names[static_cast<size_t>(x)]};
}

auto from_string(std::string_view str, serialization_format& x) -> bool {
  for (size_t i = 0; i < format_names.size(); ++i) {
    if (format_names[i] == str) {
      x = static_cast<serialization_format>(i);
      return true;
    }
  }
  return false;
}

auto from_integer(std::underlying_type_t<serialization_format> value,
                  serialization_format& x) -> bool {
  if (value >= format_names.size())
    return false;
  x = static_cast<serialization_format>(value);
  return true;
}

auto to_json(const procession& x, bool pretty) -> caf::expected<std::string> {
  return write_json(x, pretty);
}

auto from_json(std::string_view str) -> caf::expected<procession> {
  return read_json<procession>(str);
}

auto to_binary(const procession& x) -> caf::expected<caf::byte_buffer> {
  return write_binary(x);
}

auto from_binary(caf::const_byte_span bytes) -> caf::expected<procession> {
  return read_binary<procession>(bytes);
}

auto to_json(const std::vector<metric>& xs, bool pretty)
  -> caf::expected<std::string> {
  return write_json(xs, pretty);
}

auto metrics_from_json(std::string_view str)
  -> caf::expected<std::vector<metric>> {
  return read_json<std::vector<metric>>(str);
}

auto to_json_lines(const std::vector<metric>& xs)
  -> caf::expected<std::string> {
  auto result = std::string{};
  for (const auto& x : xs) {
    auto line = write_json(x, false);
    if (!line)
      return std::move(line.error());
    result += *line;
    result += '\n';
  }
  return result;
}

auto metrics_from_json_lines(std::string_view str)
  -> caf::expected<std::vector<metric>> {
  auto result = std::vector<metric>{};
  auto line_number = size_t{0};
  while (!str.empty()) {
    ++line_number;
    auto end = str.find('\n');
    auto line = str.substr(0, end);
    str.remove_prefix(end == std::string_view::npos ? str.size() : end + 1);
    if (line.find_first_not_of(" \t\r") == std::string_view::npos)
      continue;
    auto x = read_json<metric>(line);
    if (!x)
      return add_context(x.error(), "in line {}", line_number);
    result.push_back(std::move(*x));
  }
  return result;
}

auto to_binary(const std::vector<metric>& xs)
  -> caf::expected<caf::byte_buffer> {
  return write_binary(xs);
}

auto metrics_from_binary(caf::const_byte_span bytes)
  -> caf::expected<std::vector<metric>> {
  return read_binary<std::vector<metric>>(bytes);
}

auto flatten(const procession& x) -> std::vector<metric> {
  auto result = std::vector<metric>{};
  result.reserve(x.event_count());
  for (auto&& m : x.iter_owned())
    result.push_back(std::move(m));
  return result;
}

auto save(const std::filesystem::path& path, const procession& x,
          serialization_format format) -> caf::error {
  auto bytes = caf::expected<std::string>{std::string{}};
  switch (format) {
    case serialization_format::original:
      bytes = to_json(x);
      break;
    case serialization_format::array:
      bytes = to_json(flatten(x));
      break;
    case serialization_format::json_lines:
      bytes = to_json_lines(flatten(x));
      break;
    case serialization_format::binary: {
      auto buffer = to_binary(x);
      if (!buffer)
        return add_context(buffer.error(), "while saving {}", path.string());
      bytes = std::string{as_chars(*buffer)};
      break;
    }
    case serialization_format::binary_array: {
      auto buffer = to_binary(flatten(x));
      if (!buffer)
        return add_context(buffer.error(), "while saving {}", path.string());
      bytes = std::string{as_chars(*buffer)};
      break;
    }
  }
  if (!bytes)
    return add_context(bytes.error(), "while saving {}", path.string());
  PARADE_VERBOSE("writing {} bytes of {} to {}", bytes->size(),
                 to_string(format), path.string());
  return write_file(path, *bytes);
}

auto load(const std::filesystem::path& path) -> caf::expected<procession> {
  auto contents = read_file(path);
  if (!contents)
    return std::move(contents.error());
  auto extension = path.extension();
  if (extension == ".bin") {
    auto result = from_binary(as_bytes(*contents));
    if (!result)
      return add_context(result.error(), "while loading {}", path.string());
    return result;
  }
  if (extension == ".events") {
    auto metrics = metrics_from_binary(as_bytes(*contents));
    if (!metrics)
      return add_context(metrics.error(), "while loading {}", path.string());
    return procession::from_metrics(*metrics);
  }
  if (extension == ".jsonl") {
    auto metrics = metrics_from_json_lines(*contents);
    if (!metrics)
      return add_context(metrics.error(), "while loading {}", path.string());
    return procession::from_metrics(*metrics);
  }
  auto result = from_json(*contents);
  if (result)
    return result;
  // A document that is no canonical procession may still be a flat array.
  if (auto metrics = metrics_from_json(*contents)) {
    PARADE_VERBOSE("loaded {} as array of {} metrics", path.string(),
                   metrics->size());
    return procession::from_metrics(*metrics);
  }
  return add_context(result.error(), "while loading {}", path.string());
}

} // namespace parade
