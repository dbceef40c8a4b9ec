//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "parade/fwd.hpp"

#include "parade/chunk.hpp"
#include "parade/event.hpp"
#include "parade/label_set.hpp"
#include "parade/metric.hpp"
#include "parade/metric_key.hpp"
#include "parade/time.hpp"

#include <optional>
#include <vector>

namespace parade {

/// An append-only, in-memory time series of compact events. Events live in
/// chunks that each cover at most 65.535 seconds; the metric keys live in an
/// interning table and events refer to them by id.
class procession {
public:
  using iterator = metric_iterator;

  /// Appends an entry for `label` at the current wall clock time.
  void insert(entry x, label_id label);

  /// Appends an entry for `label` at time `when`. Opens a new chunk if `when`
  /// lies more than 65535 ms after the reference time of the last chunk. An
  /// entry earlier than that reference time lands at offset 0 of the last
  /// chunk.
  void insert(entry x, label_id label, time when);

  /// Returns the id of `key`, interning the key if needed.
  auto intern(const metric_key& key) -> label_id {
    return labels_.intern(key);
  }

  /// Returns the id of `key` if it was interned before.
  auto lookup(const metric_key& key) const -> std::optional<label_id> {
    return labels_.lookup(key);
  }

  /// Estimates the number of bytes that the procession occupies. Strings that
  /// are shared between label entries are counted once.
  auto memory_size() const -> size_t;

  auto chunks() const -> const std::vector<chunk>& {
    return chunks_;
  }

  auto labels() const -> const label_set& {
    return labels_;
  }

  /// The number of events across all chunks.
  auto event_count() const -> size_t;

  auto empty() const -> bool {
    return chunks_.empty();
  }

  /// Iterates all events in append order, borrowing keys from the label table.
  auto iter() const -> metric_range<metric_iterator> {
    return {begin(), end()};
  }

  /// Iterates all events in append order, yielding owned copies.
  auto iter_owned() const -> metric_range<owned_metric_iterator> {
    return {owned_metric_iterator{begin()}, owned_metric_iterator{end()}};
  }

  auto begin() const -> metric_iterator {
    return {chunks_, labels_};
  }

  auto end() const -> metric_iterator {
    return {chunks_, labels_, chunks_.size()};
  }

  /// Builds a procession from a sequence of logical events, e.g., the result
  /// of `iter()` or `iter_owned()`. Every event is placed according to the
  /// time it carries.
  template <class Range>
  static auto from_metrics(Range&& xs) -> procession {
    auto result = procession{};
    for (auto&& x : xs)
      result.insert(x.entry, result.intern(make_key(x)), x.when);
    return result;
  }

  friend bool operator==(const procession&, const procession&) = default;

  friend auto inspect(auto& f, procession& x) -> bool {
    return f.object(x)
      .pretty_name("parade.procession")
      .fields(f.field("chunks", x.chunks_), f.field("labels", x.labels_));
  }

private:
  std::vector<chunk> chunks_;
  label_set labels_;
};

} // namespace parade
