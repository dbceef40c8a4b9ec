//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "parade/recorder.hpp"

#include "parade/logger.hpp"

#include <exception>
#include <limits>

namespace parade {

namespace {

using state_ptr = std::shared_ptr<procession_recorder::state>;

/// Appends one entry under the lock. Failures never reach the caller.
void append(const state_ptr& state, entry x, label_id label) noexcept {
  try {
    auto guard = std::lock_guard{state->mutex};
    state->data.insert(x, label);
  } catch (const std::exception& err) {
    PARADE_ERROR("failed to record {} for label {}: {}", x, label, err.what());
  }
}

class counter_handle final : public counter_fn {
public:
  counter_handle(label_id label, state_ptr state)
    : label_{label}, state_{std::move(state)} {
  }

  void increment(uint64_t value) override {
    write(value, op::add);
  }

  void absolute(uint64_t value) override {
    write(value, op::set);
  }

private:
  void write(uint64_t value, op x) {
    if (value > std::numeric_limits<uint32_t>::max()) {
      PARADE_WARN("dropping counter {} value {} for label {}: exceeds 32 bits",
                  x, value, label_);
      return;
    }
    append(state_, counter_entry{static_cast<uint32_t>(value), x}, label_);
  }

  label_id label_;
  state_ptr state_;
};

class gauge_handle final : public gauge_fn {
public:
  gauge_handle(label_id label, state_ptr state)
    : label_{label}, state_{std::move(state)} {
  }

  void increment(double value) override {
    append(state_, gauge_entry{static_cast<float>(value), op::add}, label_);
  }

  void decrement(double value) override {
    append(state_, gauge_entry{static_cast<float>(value), op::sub}, label_);
  }

  void set(double value) override {
    append(state_, gauge_entry{static_cast<float>(value), op::set}, label_);
  }

private:
  label_id label_;
  state_ptr state_;
};

class histogram_handle final : public histogram_fn {
public:
  histogram_handle(label_id label, state_ptr state)
    : label_{label}, state_{std::move(state)} {
  }

  void record(double value) override {
    append(state_, histogram_entry{static_cast<float>(value)}, label_);
  }

private:
  label_id label_;
  state_ptr state_;
};

} // namespace

procession_recorder::procession_recorder()
  : state_{std::make_shared<state>()} {
}

procession_recorder::procession_recorder(procession initial)
  : procession_recorder() {
  state_->data = std::move(initial);
}

auto procession_recorder::register_counter(const metric_key& key) -> counter {
  if (auto id = intern(key))
    return counter{std::make_shared<counter_handle>(*id, state_)};
  return {};
}

auto procession_recorder::register_gauge(const metric_key& key) -> gauge {
  if (auto id = intern(key))
    return gauge{std::make_shared<gauge_handle>(*id, state_)};
  return {};
}

auto procession_recorder::register_histogram(const metric_key& key)
  -> histogram {
  if (auto id = intern(key))
    return histogram{std::make_shared<histogram_handle>(*id, state_)};
  return {};
}

auto procession_recorder::lock() const -> locked {
  return {std::unique_lock{state_->mutex}, state_->data};
}

auto procession_recorder::snapshot() const -> procession {
  auto guard = std::lock_guard{state_->mutex};
  return state_->data;
}

auto procession_recorder::memory_size() const -> size_t {
  auto guard = std::lock_guard{state_->mutex};
  return state_->data.memory_size();
}

auto procession_recorder::intern(const metric_key& key) noexcept
  -> std::optional<label_id> {
  try {
    auto guard = std::lock_guard{state_->mutex};
    auto id = state_->data.intern(key);
    PARADE_DEBUG("registered {} as label {}", key, id);
    return id;
  } catch (const std::exception& err) {
    PARADE_ERROR("failed to register {}; discarding its writes: {}", key,
                 err.what());
    return std::nullopt;
  }
}

} // namespace parade
