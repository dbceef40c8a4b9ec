//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "parade/fwd.hpp"

#include "parade/detail/overload.hpp"
#include "parade/error.hpp"

#include <caf/default_enum_inspect.hpp>
#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace parade {

/// The write semantics of an entry.
enum class op : uint8_t {
  /// Adds the value to the current state.
  add,
  /// Subtracts the value from the current state. Only gauges subtract.
  sub,
  /// Overwrites the current state.
  set,
};

/// @relates op
auto to_string(op x) -> std::string;

/// @relates op
auto from_string(std::string_view str, op& x) -> bool;

/// @relates op
auto from_integer(std::underlying_type_t<op> value, op& x) -> bool;

/// @relates op
template <class Inspector>
auto inspect(Inspector& f, op& x) -> bool {
  return caf::default_enum_inspect(f, x);
}

struct counter_entry {
  uint32_t value = 0;
  parade::op op = parade::op::add;

  friend bool operator==(const counter_entry&, const counter_entry&) = default;

  friend auto inspect(auto& f, counter_entry& x) -> bool {
    return f.object(x)
      .pretty_name("parade.counter_entry")
      .fields(f.field("value", x.value), f.field("op", x.op));
  }
};

struct gauge_entry {
  float value = 0;
  parade::op op = parade::op::set;

  friend bool operator==(const gauge_entry&, const gauge_entry&) = default;

  friend auto inspect(auto& f, gauge_entry& x) -> bool {
    return f.object(x)
      .pretty_name("parade.gauge_entry")
      .fields(f.field("value", x.value), f.field("op", x.op));
  }
};

struct histogram_entry {
  float value = 0;

  friend bool operator==(const histogram_entry&, const histogram_entry&)
    = default;

  friend auto inspect(auto& f, histogram_entry& x) -> bool {
    return f.object(x)
      .pretty_name("parade.histogram_entry")
      .fields(f.field("value", x.value));
  }
};

/// The typed value of a single recorded write.
class entry {
public:
  using variant_type
    = std::variant<counter_entry, gauge_entry, histogram_entry>;

  entry() = default;

  entry(counter_entry x) : value_{x} {
  }

  entry(gauge_entry x) : value_{x} {
  }

  entry(histogram_entry x) : value_{x} {
  }

  /// Returns the kind of the entry, i.e., `counter`, `gauge` or `histogram`.
  auto kind() const -> std::string_view;

  template <class T>
  auto as() const -> const T* {
    return std::get_if<T>(&value_);
  }

  template <class T>
  auto is() const -> bool {
    return std::holds_alternative<T>(value_);
  }

  template <class... Fs>
  auto match(Fs&&... fs) const -> decltype(auto) {
    return std::visit(detail::overload{std::forward<Fs>(fs)...}, value_);
  }

  auto get() const -> const variant_type& {
    return value_;
  }

  friend bool operator==(const entry&, const entry&) = default;

  /// Binary formats write the alternative index followed by the value; human
  /// readable formats write a single-key object that names the kind, e.g.,
  /// `{"counter": {"value": 1, "op": "add"}}`.
  friend auto inspect(auto& f, entry& x) -> bool {
    using inspector_type = std::decay_t<decltype(f)>;
    if constexpr (inspector_type::is_loading) {
      if (!f.has_human_readable_format()) {
        auto index = uint8_t{};
        if (!f.apply(index))
          return false;
        switch (index) {
          case 0:
            return f.apply(x.value_.template emplace<0>());
          case 1:
            return f.apply(x.value_.template emplace<1>());
          case 2:
            return f.apply(x.value_.template emplace<2>());
        }
        f.set_error(caf::make_error(ec::serialization_error,
                                    fmt::format("invalid entry index {}",
                                                index)));
        return false;
      }
      auto count = size_t{};
      if (!f.begin_associative_array(count))
        return false;
      if (count != 1) {
        f.set_error(caf::make_error(ec::serialization_error,
                                    fmt::format("entry must have exactly one "
                                                "kind, got {}",
                                                count)));
        return false;
      }
      auto kind = std::string{};
      if (!(f.begin_key_value_pair() && f.value(kind)))
        return false;
      auto success = false;
      if (kind == "counter") {
        success = f.apply(x.value_.template emplace<counter_entry>());
      } else if (kind == "gauge") {
        success = f.apply(x.value_.template emplace<gauge_entry>());
      } else if (kind == "histogram") {
        success = f.apply(x.value_.template emplace<histogram_entry>());
      } else {
        f.set_error(caf::make_error(ec::serialization_error,
                                    fmt::format("unknown entry kind `{}`",
                                                kind)));
        return false;
      }
      return success && f.end_key_value_pair() && f.end_associative_array();
    } else {
      return std::visit(
        [&](auto& y) {
          if (!f.has_human_readable_format()) {
            auto index = static_cast<uint8_t>(x.value_.index());
            return f.apply(index) && f.apply(y);
          }
          return f.begin_associative_array(1) && f.begin_key_value_pair()
                 && f.value(x.kind()) && f.apply(y) && f.end_key_value_pair()
                 && f.end_associative_array();
        },
        x.value_);
    }
  }

private:
  variant_type value_;
};

/// A single compact recorded write: the value, the millisecond offset to the
/// reference time of the owning chunk, and the id of the metric key.
struct event {
  parade::entry entry;
  uint16_t ms = 0;
  label_id label = 0;

  friend bool operator==(const event&, const event&) = default;

  friend auto inspect(auto& f, event& x) -> bool {
    return f.object(x)
      .pretty_name("parade.event")
      .fields(f.field("entry", x.entry), f.field("ms", x.ms),
              f.field("label", x.label));
  }
};

static_assert(sizeof(event) <= 16, "events must stay compact");

} // namespace parade

template <>
struct fmt::formatter<parade::op> : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(parade::op x, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(to_string(x), ctx);
  }
};

template <>
struct fmt::formatter<parade::entry> {
  constexpr auto parse(fmt::format_parse_context& ctx) {
    return ctx.begin();
  }

  template <class FormatContext>
  auto format(const parade::entry& x, FormatContext& ctx) const {
    return x.match(
      [&](const parade::counter_entry& y) {
        return fmt::format_to(ctx.out(), "counter {}({})", y.op, y.value);
      },
      [&](const parade::gauge_entry& y) {
        return fmt::format_to(ctx.out(), "gauge {}({})", y.op, y.value);
      },
      [&](const parade::histogram_entry& y) {
        return fmt::format_to(ctx.out(), "histogram ({})", y.value);
      });
  }
};
