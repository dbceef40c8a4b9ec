//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "parade/label_set.hpp"

#include "parade/logger.hpp"

#include <algorithm>

namespace parade {

namespace {

/// The id that the entry at `position` must carry.
auto id_for(size_t position) -> label_id {
  return static_cast<label_id>(
    std::min(position, size_t{defaults::overflow_label}));
}

} // namespace

auto label_set::lookup(const metric_key& key) const
  -> std::optional<label_id> {
  if (auto position = find(key))
    return entries_[*position].value;
  return std::nullopt;
}

auto label_set::intern(const metric_key& key) -> label_id {
  if (auto position = find(key))
    return entries_[*position].value;
  auto position = entries_.size();
  auto id = id_for(position);
  if (position >= defaults::max_labels)
    PARADE_WARN("label id space exhausted; assigning overflow id {} to {}", id,
                key);
  entries_.push_back({key, id});
  index(position);
  return id;
}

auto label_set::resolve(label_id id) const -> const metric_key* {
  // The entry at position `id` is the first one that received `id`.
  if (size_t{id} >= entries_.size())
    return nullptr;
  return &entries_[id].key;
}

auto label_set::make(std::vector<label_set_entry> entries)
  -> caf::expected<label_set> {
  auto result = label_set{};
  result.entries_.reserve(entries.size());
  for (auto& entry : entries) {
    auto position = result.entries_.size();
    if (entry.value != id_for(position))
      return caf::make_error(ec::format_error,
                             fmt::format("label entry {} for {} has id {}, "
                                         "expected {}",
                                         position, entry.key, entry.value,
                                         id_for(position)));
    if (result.find(entry.key))
      return caf::make_error(ec::format_error,
                             fmt::format("duplicate label entry for {}",
                                         entry.key));
    result.entries_.push_back(std::move(entry));
    result.index(position);
  }
  return result;
}

auto label_set::find(const metric_key& key) const -> std::optional<size_t> {
  auto [first, last] = index_.equal_range(hash_value(key));
  for (auto it = first; it != last; ++it)
    if (entries_[it->second].key == key)
      return it->second;
  return std::nullopt;
}

void label_set::index(size_t position) {
  index_.emplace(hash_value(entries_[position].key), position);
}

} // namespace parade
