//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "parade/config.hpp" // IWYU pragma: export

#include <caf/config.hpp>
#include <caf/fwd.hpp>
#include <caf/type_id.hpp>

#include <chrono>
#include <cstdint>

#define PARADE_ADD_TYPE_ID(type) CAF_ADD_TYPE_ID(parade_types, type)

namespace parade {

// -- classes ------------------------------------------------------------------

class counter;
class entry;
class gauge;
class histogram;
class label_set;
class metric_iterator;
class metric_key;
class owned_metric_iterator;
class procession;
class procession_recorder;
class recorder;

// -- structs ------------------------------------------------------------------

struct chunk;
struct counter_entry;
struct event;
struct gauge_entry;
struct histogram_entry;
struct label;
struct label_set_entry;
struct metric;
struct metric_view;

// -- enum classes -------------------------------------------------------------

enum class ec : uint8_t;
enum class op : uint8_t;
enum class serialization_format : uint8_t;

// -- aliases ------------------------------------------------------------------

/// The label id type.
using label_id = uint16_t;

/// A duration with nanosecond resolution.
using duration = std::chrono::duration<int64_t, std::nano>;

/// An absolute point in time, UTC.
using time = std::chrono::time_point<std::chrono::system_clock, duration>;

} // namespace parade

// -- type announcements -------------------------------------------------------

constexpr inline caf::type_id_t first_parade_type_id = 900;

CAF_BEGIN_TYPE_ID_BLOCK(parade_types, first_parade_type_id)

  PARADE_ADD_TYPE_ID((parade::ec))
  PARADE_ADD_TYPE_ID((parade::op))
  PARADE_ADD_TYPE_ID((parade::chunk))
  PARADE_ADD_TYPE_ID((parade::event))
  PARADE_ADD_TYPE_ID((parade::label_set))
  PARADE_ADD_TYPE_ID((parade::metric))
  PARADE_ADD_TYPE_ID((parade::metric_key))
  PARADE_ADD_TYPE_ID((parade::procession))

CAF_END_TYPE_ID_BLOCK(parade_types)
