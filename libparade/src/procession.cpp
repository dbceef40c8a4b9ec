//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "parade/procession.hpp"

#include "parade/defaults.hpp"
#include "parade/logger.hpp"

#include <boost/unordered_set.hpp>

#include <algorithm>
#include <string_view>

namespace parade {

void procession::insert(entry x, label_id label) {
  insert(x, label, now());
}

void procession::insert(entry x, label_id label, time when) {
  if (!chunks_.empty()) {
    auto& last = chunks_.back();
    auto elapsed = std::chrono::floor<std::chrono::milliseconds>(
      when - last.reference_time);
    if (elapsed <= defaults::max_chunk_offset) {
      // Clock skew may move `when` before the reference time.
      auto ms = std::max(elapsed.count(), int64_t{0});
      last.events.push_back({x, static_cast<uint16_t>(ms), label});
      return;
    }
  }
  auto reference_time = floor_ms(when);
  PARADE_TRACE("opening chunk {} at {}", chunks_.size(),
               to_string(reference_time));
  chunks_.push_back({reference_time, {{x, 0, label}}});
}

auto procession::memory_size() const -> size_t {
  auto result = sizeof(procession);
  result += chunks_.capacity() * sizeof(chunk);
  for (const auto& x : chunks_)
    result += x.events.capacity() * sizeof(event);
  const auto& entries = labels_.entries();
  result += entries.capacity() * sizeof(label_set_entry);
  // Every entry has one slot in the hash index.
  result += entries.size() * (2 * sizeof(size_t) + sizeof(void*));
  // Count the heap storage of each distinct string once.
  auto seen = boost::unordered_set<std::string_view>{};
  auto add_string = [&](const std::string& str) {
    if (seen.insert(str).second)
      result += str.capacity();
  };
  for (const auto& entry : entries) {
    add_string(entry.key.name());
    result += entry.key.labels().capacity() * sizeof(label);
    for (const auto& l : entry.key.labels()) {
      add_string(l.key);
      add_string(l.value);
    }
  }
  return result;
}

auto procession::event_count() const -> size_t {
  auto result = size_t{0};
  for (const auto& x : chunks_)
    result += x.events.size();
  return result;
}

} // namespace parade
