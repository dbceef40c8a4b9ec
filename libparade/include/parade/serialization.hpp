//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "parade/fwd.hpp"

#include "parade/metric.hpp"
#include "parade/procession.hpp"

#include <caf/byte_buffer.hpp>
#include <caf/byte_span.hpp>
#include <caf/default_enum_inspect.hpp>
#include <caf/error.hpp>
#include <caf/expected.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace parade {

/// The on-disk representations of a procession.
enum class serialization_format : uint8_t {
  /// The canonical form as JSON object of chunks and labels.
  original,
  /// A JSON array of logical events.
  array,
  /// One JSON object per logical event and line.
  json_lines,
  /// The canonical form in CAF's binary format.
  binary,
  /// An array of logical events in CAF's binary format.
  binary_array,
};

/// @relates serialization_format
auto to_string(serialization_format x) -> std::string;

/// @relates serialization_format
auto from_string(std::string_view str, serialization_format& x) -> bool;

/// @relates serialization_format
auto from_integer(std::underlying_type_t<serialization_format> value,
                  serialization_format& x) -> bool;

/// @relates serialization_format
template <class Inspector>
auto inspect(Inspector& f, serialization_format& x) -> bool {
  return caf::default_enum_inspect(f, x);
}

// -- canonical form -----------------------------------------------------------

/// Renders the canonical form as JSON.
/// @param pretty Whether to indent the output.
auto to_json(const procession& x, bool pretty = true)
  -> caf::expected<std::string>;

/// Parses the canonical form from JSON.
auto from_json(std::string_view str) -> caf::expected<procession>;

/// Renders the canonical form in CAF's binary format.
auto to_binary(const procession& x) -> caf::expected<caf::byte_buffer>;

/// Parses the canonical form from CAF's binary format.
auto from_binary(caf::const_byte_span bytes) -> caf::expected<procession>;

// -- flattened form -----------------------------------------------------------

/// Renders logical events as JSON array.
auto to_json(const std::vector<metric>& xs, bool pretty = true)
  -> caf::expected<std::string>;

/// Parses a JSON array of logical events.
auto metrics_from_json(std::string_view str)
  -> caf::expected<std::vector<metric>>;

/// Renders logical events with one compact JSON object per line.
auto to_json_lines(const std::vector<metric>& xs)
  -> caf::expected<std::string>;

/// Parses logical events from JSON lines. Skips blank lines.
auto metrics_from_json_lines(std::string_view str)
  -> caf::expected<std::vector<metric>>;

/// Renders logical events in CAF's binary format.
auto to_binary(const std::vector<metric>& xs)
  -> caf::expected<caf::byte_buffer>;

/// Parses logical events from CAF's binary format.
auto metrics_from_binary(caf::const_byte_span bytes)
  -> caf::expected<std::vector<metric>>;

/// Collects the owned logical events of a procession.
auto flatten(const procession& x) -> std::vector<metric>;

// -- files --------------------------------------------------------------------

/// Writes a procession to `path` in the given format.
auto save(const std::filesystem::path& path, const procession& x,
          serialization_format format) -> caf::error;

/// Reads a procession from `path`. Files ending in `.bin` hold the binary
/// canonical form, files ending in `.events` hold a binary array of logical
/// events, files ending in `.jsonl` hold JSON lines, and all other
/// files hold either the canonical JSON form or a JSON array of logical
/// events.
auto load(const std::filesystem::path& path) -> caf::expected<procession>;

} // namespace parade
