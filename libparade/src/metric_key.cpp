//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "parade/metric_key.hpp"

#include <algorithm>

namespace parade {

auto canonicalize(std::vector<label> labels) -> std::vector<label> {
  std::sort(labels.begin(), labels.end());
  labels.erase(std::unique(labels.begin(), labels.end()), labels.end());
  return labels;
}

metric_key::metric_key(std::string name, std::vector<label> labels)
  : name_{std::move(name)}, labels_{canonicalize(std::move(labels))} {
}

metric_key::metric_key(std::string name, std::initializer_list<label> labels)
  : metric_key(std::move(name), std::vector<label>(labels)) {
}

auto hash_value(const metric_key& x) -> size_t {
  auto seed = size_t{0};
  boost::hash_combine(seed, x.name_);
  boost::hash_range(seed, x.labels_.begin(), x.labels_.end());
  return seed;
}

} // namespace parade
