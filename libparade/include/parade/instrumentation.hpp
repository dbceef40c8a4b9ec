//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "parade/fwd.hpp"

#include "parade/metric_key.hpp"

#include <cstdint>
#include <memory>
#include <string_view>

namespace parade {

/// The write capability of a monotonic counter.
class counter_fn {
public:
  virtual ~counter_fn() noexcept = default;

  /// Adds `value` to the counter.
  virtual void increment(uint64_t value) = 0;

  /// Sets the counter to `value`.
  virtual void absolute(uint64_t value) = 0;
};

/// The write capability of a gauge.
class gauge_fn {
public:
  virtual ~gauge_fn() noexcept = default;

  virtual void increment(double value) = 0;

  virtual void decrement(double value) = 0;

  virtual void set(double value) = 0;
};

/// The write capability of a histogram.
class histogram_fn {
public:
  virtual ~histogram_fn() noexcept = default;

  /// Records one sample.
  virtual void record(double value) = 0;
};

/// A handle to a registered counter. A default-constructed handle discards
/// all writes.
class counter {
public:
  counter() = default;

  explicit counter(std::shared_ptr<counter_fn> fn) : fn_{std::move(fn)} {
  }

  void increment(uint64_t value) const {
    if (fn_)
      fn_->increment(value);
  }

  void absolute(uint64_t value) const {
    if (fn_)
      fn_->absolute(value);
  }

  explicit operator bool() const {
    return fn_ != nullptr;
  }

private:
  std::shared_ptr<counter_fn> fn_;
};

/// A handle to a registered gauge. A default-constructed handle discards all
/// writes.
class gauge {
public:
  gauge() = default;

  explicit gauge(std::shared_ptr<gauge_fn> fn) : fn_{std::move(fn)} {
  }

  void increment(double value) const {
    if (fn_)
      fn_->increment(value);
  }

  void decrement(double value) const {
    if (fn_)
      fn_->decrement(value);
  }

  void set(double value) const {
    if (fn_)
      fn_->set(value);
  }

  explicit operator bool() const {
    return fn_ != nullptr;
  }

private:
  std::shared_ptr<gauge_fn> fn_;
};

/// A handle to a registered histogram. A default-constructed handle discards
/// all writes.
class histogram {
public:
  histogram() = default;

  explicit histogram(std::shared_ptr<histogram_fn> fn) : fn_{std::move(fn)} {
  }

  void record(double value) const {
    if (fn_)
      fn_->record(value);
  }

  explicit operator bool() const {
    return fn_ != nullptr;
  }

private:
  std::shared_ptr<histogram_fn> fn_;
};

/// The interface through which host code registers metrics.
class recorder {
public:
  virtual ~recorder() noexcept = default;

  virtual auto register_counter(const metric_key& key) -> counter = 0;

  virtual auto register_gauge(const metric_key& key) -> gauge = 0;

  virtual auto register_histogram(const metric_key& key) -> histogram = 0;

  /// Attaches a description to a metric name. Ignored unless overridden.
  virtual void
  describe_counter(std::string_view name, std::string_view description) {
    (void)name;
    (void)description;
  }

  /// Attaches a description to a metric name. Ignored unless overridden.
  virtual void
  describe_gauge(std::string_view name, std::string_view description) {
    (void)name;
    (void)description;
  }

  /// Attaches a description to a metric name. Ignored unless overridden.
  virtual void
  describe_histogram(std::string_view name, std::string_view description) {
    (void)name;
    (void)description;
  }
};

} // namespace parade
