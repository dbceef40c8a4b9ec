//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "parade/fwd.hpp"

#include "parade/instrumentation.hpp"
#include "parade/procession.hpp"

#include <memory>
#include <mutex>
#include <optional>

namespace parade {

/// A recorder that stores every write in a shared procession. Copies of a
/// recorder share the procession; all access goes through one mutex.
class procession_recorder final : public recorder {
public:
  /// Exclusive read access to the procession. Holds the lock until
  /// destruction.
  class locked {
  public:
    locked(std::unique_lock<std::mutex> lock, const procession& x)
      : lock_{std::move(lock)}, procession_{&x} {
    }

    auto operator*() const -> const procession& {
      return *procession_;
    }

    auto operator->() const -> const procession* {
      return procession_;
    }

  private:
    std::unique_lock<std::mutex> lock_;
    const procession* procession_;
  };

  /// The state shared between a recorder, its copies, and its handles.
  struct state {
    std::mutex mutex;
    procession data;
  };

  procession_recorder();

  explicit procession_recorder(procession initial);

  auto register_counter(const metric_key& key) -> counter override;

  auto register_gauge(const metric_key& key) -> gauge override;

  auto register_histogram(const metric_key& key) -> histogram override;

  /// Locks the procession for reading.
  auto lock() const -> locked;

  /// Returns a copy of the procession.
  auto snapshot() const -> procession;

  /// Estimates the memory footprint of the procession.
  auto memory_size() const -> size_t;

private:
  /// Interns `key` under the lock.
  /// @returns `std::nullopt` if the key could not be stored.
  auto intern(const metric_key& key) noexcept -> std::optional<label_id>;

  std::shared_ptr<state> state_;
};

} // namespace parade
