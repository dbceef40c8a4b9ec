//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "parade/metric.hpp"

#include "parade/logger.hpp"

namespace parade {

namespace {

/// The key substituted for label ids that the table cannot resolve.
const metric_key& unresolved_key() {
  static const auto result = metric_key{};
  return result;
}

} // namespace

metric_iterator::metric_iterator(const std::vector<chunk>& chunks,
                                 const label_set& labels, size_t chunk,
                                 size_t event)
  : chunks_{&chunks}, labels_{&labels}, chunk_{chunk}, event_{event} {
  skip_empty();
}

auto metric_iterator::operator*() const -> metric_view {
  const auto& current = (*chunks_)[chunk_];
  const auto& x = current.events[event_];
  const auto* key = labels_->resolve(x.label);
  if (!key) {
    PARADE_DEBUG("substituting empty key for unknown label id {}", x.label);
    key = &unresolved_key();
  }
  return {current.time_of(x), x.entry, *key};
}

auto metric_iterator::operator++() -> metric_iterator& {
  ++event_;
  skip_empty();
  return *this;
}

void metric_iterator::skip_empty() {
  if (!chunks_)
    return;
  while (chunk_ < chunks_->size()
         && event_ >= (*chunks_)[chunk_].events.size()) {
    ++chunk_;
    event_ = 0;
  }
}

} // namespace parade
