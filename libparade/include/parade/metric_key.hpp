//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "parade/fwd.hpp"

#include <boost/functional/hash.hpp>
#include <fmt/format.h>

#include <compare>
#include <initializer_list>
#include <string>
#include <vector>

namespace parade {

/// A single key-value pair attached to a metric.
struct label {
  std::string key;
  std::string value;

  friend auto operator<=>(const label&, const label&) = default;

  friend auto hash_value(const label& x) -> size_t {
    auto seed = size_t{0};
    boost::hash_combine(seed, x.key);
    boost::hash_combine(seed, x.value);
    return seed;
  }

  /// Labels persist as a two-element list `[key, value]`.
  friend auto inspect(auto& f, label& x) -> bool {
    return f.begin_tuple(2) && f.apply(x.key) && f.apply(x.value)
           && f.end_tuple();
  }
};

/// Brings a list of labels into canonical form: sorted by key and value, with
/// duplicates removed.
auto canonicalize(std::vector<label> labels) -> std::vector<label>;

/// The structured identity of a metric: its name plus an unordered set of
/// labels. The labels are kept in canonical order, so two keys with the same
/// name and the same labels compare equal regardless of the order in which the
/// labels were given.
class metric_key {
public:
  metric_key() = default;

  explicit metric_key(std::string name, std::vector<label> labels = {});

  metric_key(std::string name, std::initializer_list<label> labels);

  auto name() const -> const std::string& {
    return name_;
  }

  /// The labels in canonical order.
  auto labels() const -> const std::vector<label>& {
    return labels_;
  }

  friend bool operator==(const metric_key&, const metric_key&) = default;

  friend auto hash_value(const metric_key& x) -> size_t;

  friend auto inspect(auto& f, metric_key& x) -> bool {
    auto get_labels = [&]() -> const std::vector<label>& {
      return x.labels_;
    };
    auto set_labels = [&](std::vector<label> labels) {
      x.labels_ = canonicalize(std::move(labels));
      return true;
    };
    return f.object(x)
      .pretty_name("parade.metric_key")
      .fields(f.field("name", x.name_),
              f.field("labels", get_labels, set_labels));
  }

private:
  std::string name_;
  std::vector<label> labels_;
};

} // namespace parade

template <>
struct fmt::formatter<parade::metric_key> {
  constexpr auto parse(fmt::format_parse_context& ctx) {
    return ctx.begin();
  }

  template <class FormatContext>
  auto format(const parade::metric_key& x, FormatContext& ctx) const {
    auto out = fmt::format_to(ctx.out(), "{}", x.name());
    if (x.labels().empty())
      return out;
    out = fmt::format_to(out, "{{");
    auto first = true;
    for (const auto& l : x.labels()) {
      out = fmt::format_to(out, "{}{}={}", first ? "" : ",", l.key, l.value);
      first = false;
    }
    return fmt::format_to(out, "}}");
  }
};
