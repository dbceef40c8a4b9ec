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
#include "parade/metric_key.hpp"
#include "parade/time.hpp"

#include <cstddef>
#include <iterator>
#include <string>
#include <vector>

namespace parade {

/// A self-describing logical event that borrows its key from the label table
/// of a procession. Valid only as long as the procession is.
struct metric_view {
  time when;
  parade::entry entry;
  const metric_key& key;

  friend bool operator==(const metric_view& x, const metric_view& y) {
    return x.when == y.when && x.entry == y.entry && x.key == y.key;
  }
};

/// A self-describing logical event that owns all of its data.
struct metric {
  time when = {};
  parade::entry entry = {};
  std::string key = {};
  std::vector<label> labels = {};

  metric() = default;

  metric(time when, parade::entry entry, std::string key,
         std::vector<label> labels)
    : when{when},
      entry{entry},
      key{std::move(key)},
      labels{std::move(labels)} {
  }

  explicit metric(const metric_view& view)
    : when{view.when},
      entry{view.entry},
      key{view.key.name()},
      labels{view.key.labels()} {
  }

  /// Assembles the structured key of the metric.
  auto make_key() const -> metric_key {
    return metric_key{key, labels};
  }

  friend bool operator==(const metric&, const metric&) = default;

  friend bool operator==(const metric& x, const metric_view& y) {
    return x.when == y.when && x.entry == y.entry && x.key == y.key.name()
           && canonicalize(x.labels) == y.key.labels();
  }

  friend auto inspect(auto& f, metric& x) -> bool {
    auto get_string = [&]() {
      return to_string(x.when);
    };
    auto set_string = [&](std::string str) {
      auto parsed = parse_time(str);
      if (!parsed)
        return false;
      x.when = floor_ms(*parsed);
      return true;
    };
    auto get_count = [&]() {
      return x.when.time_since_epoch().count();
    };
    auto set_count = [&](duration::rep count) {
      x.when = floor_ms(time{duration{count}});
      return true;
    };
    if (f.has_human_readable_format())
      return f.object(x)
        .pretty_name("parade.metric")
        .fields(f.field("when", get_string, set_string),
                f.field("entry", x.entry), f.field("key", x.key),
                f.field("labels", x.labels));
    return f.object(x)
      .pretty_name("parade.metric")
      .fields(f.field("when", get_count, set_count), f.field("entry", x.entry),
              f.field("key", x.key), f.field("labels", x.labels));
  }
};

/// Returns the structured key of a logical event.
inline auto make_key(const metric_view& x) -> const metric_key& {
  return x.key;
}

/// Returns the structured key of a logical event.
inline auto make_key(const metric& x) -> metric_key {
  return x.make_key();
}

/// Walks the events of a sequence of chunks in order, resolving every label id
/// through a label table. Yields borrowed views.
class metric_iterator {
public:
  using iterator_category = std::input_iterator_tag;
  using value_type = metric_view;
  using difference_type = std::ptrdiff_t;
  using reference = metric_view;
  using pointer = void;

  metric_iterator() = default;

  /// Constructs an iterator that points to the first event at or after
  /// position `(chunk, event)`.
  metric_iterator(const std::vector<chunk>& chunks, const label_set& labels,
                  size_t chunk = 0, size_t event = 0);

  auto operator*() const -> metric_view;

  auto operator++() -> metric_iterator&;

  auto operator++(int) -> metric_iterator {
    auto result = *this;
    ++*this;
    return result;
  }

  friend bool operator==(const metric_iterator& x, const metric_iterator& y) {
    return x.chunk_ == y.chunk_ && x.event_ == y.event_;
  }

private:
  /// Moves forward past empty chunks.
  void skip_empty();

  const std::vector<chunk>* chunks_ = nullptr;
  const label_set* labels_ = nullptr;
  size_t chunk_ = 0;
  size_t event_ = 0;
};

/// Like `metric_iterator`, but yields owned copies.
class owned_metric_iterator {
public:
  using iterator_category = std::input_iterator_tag;
  using value_type = metric;
  using difference_type = std::ptrdiff_t;
  using reference = metric;
  using pointer = void;

  owned_metric_iterator() = default;

  explicit owned_metric_iterator(metric_iterator inner) : inner_{inner} {
  }

  auto operator*() const -> metric {
    return metric{*inner_};
  }

  auto operator++() -> owned_metric_iterator& {
    ++inner_;
    return *this;
  }

  auto operator++(int) -> owned_metric_iterator {
    auto result = *this;
    ++*this;
    return result;
  }

  friend bool
  operator==(const owned_metric_iterator&, const owned_metric_iterator&)
    = default;

private:
  metric_iterator inner_;
};

/// A restartable pair of iterators.
template <class Iterator>
class metric_range {
public:
  metric_range(Iterator first, Iterator last)
    : first_{std::move(first)}, last_{std::move(last)} {
  }

  auto begin() const -> Iterator {
    return first_;
  }

  auto end() const -> Iterator {
    return last_;
  }

private:
  Iterator first_;
  Iterator last_;
};

} // namespace parade
