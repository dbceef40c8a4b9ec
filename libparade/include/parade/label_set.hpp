//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "parade/fwd.hpp"

#include "parade/defaults.hpp"
#include "parade/error.hpp"
#include "parade/metric_key.hpp"

#include <boost/unordered_map.hpp>
#include <caf/error.hpp>
#include <fmt/format.h>

#include <optional>
#include <string>
#include <vector>

namespace parade {

/// One row of the persisted interning table.
struct label_set_entry {
  metric_key key;
  label_id value = 0;

  friend bool operator==(const label_set_entry&, const label_set_entry&)
    = default;

  friend auto inspect(auto& f, label_set_entry& x) -> bool {
    auto get_name = [&]() -> const std::string& {
      return x.key.name();
    };
    auto set_name = [&](std::string name) {
      x.key = metric_key{std::move(name), x.key.labels()};
      return true;
    };
    auto get_labels = [&]() -> const std::vector<label>& {
      return x.key.labels();
    };
    auto set_labels = [&](std::vector<label> labels) {
      x.key = metric_key{x.key.name(), std::move(labels)};
      return true;
    };
    return f.object(x)
      .pretty_name("parade.label_set_entry")
      .fields(f.field("key_name", get_name, set_name),
              f.field("labels", get_labels, set_labels),
              f.field("value", x.value));
  }
};

/// The interning table that maps metric keys to dense 16-bit surrogate ids.
/// Ids are handed out in first-seen order. Once the id space is exhausted,
/// every further key receives the shared overflow id.
class label_set {
public:
  /// Returns the id of `key` if it was interned before.
  auto lookup(const metric_key& key) const -> std::optional<label_id>;

  /// Returns the id of `key`, assigning the next free id if the key is new.
  auto intern(const metric_key& key) -> label_id;

  /// Maps an id back to the key that received it.
  /// @returns `nullptr` if no key carries `id`.
  auto resolve(label_id id) const -> const metric_key*;

  /// The number of interned keys, including keys that share the overflow id.
  auto size() const -> size_t {
    return entries_.size();
  }

  auto empty() const -> bool {
    return entries_.empty();
  }

  /// The entries in the order they were interned.
  auto entries() const -> const std::vector<label_set_entry>& {
    return entries_;
  }

  auto begin() const {
    return entries_.begin();
  }

  auto end() const {
    return entries_.end();
  }

  /// Rebuilds a table from its persisted entries.
  /// @returns an error if the entries contain duplicate keys or if their ids
  ///          deviate from the first-seen numbering.
  static auto make(std::vector<label_set_entry> entries)
    -> caf::expected<label_set>;

  friend bool operator==(const label_set& x, const label_set& y) {
    return x.entries_ == y.entries_;
  }

  friend auto inspect(auto& f, label_set& x) -> bool {
    if constexpr (std::decay_t<decltype(f)>::is_loading) {
      auto entries = std::vector<label_set_entry>{};
      if (!f.apply(entries))
        return false;
      auto result = make(std::move(entries));
      if (!result) {
        f.set_error(std::move(result.error()));
        return false;
      }
      x = std::move(*result);
      return true;
    } else {
      return f.apply(x.entries_);
    }
  }

private:
  /// All entries in persisted order.
  std::vector<label_set_entry> entries_;

  /// Finds the position of `key` in `entries_`.
  auto find(const metric_key& key) const -> std::optional<size_t>;

  /// Adds the entry at `position` to the index.
  void index(size_t position);

  /// Key hash -> positions in `entries_`. Keys are stored once, in `entries_`.
  boost::unordered_multimap<size_t, size_t> index_;
};

} // namespace parade
