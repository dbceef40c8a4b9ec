//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "parade/procession.hpp"

#include "parade/test/serialization.hpp"
#include "parade/test/test.hpp"

#include <string>

using namespace parade;
using namespace std::chrono_literals;

namespace {

struct fixture {
  const parade::time t0 = parade::time{1'700'000'000'000ms};
  procession xs;
  label_id requests = xs.intern(metric_key{"requests", {{"method", "GET"}}});
  label_id load = xs.intern(metric_key{"load"});
};

auto add(uint32_t value) -> entry {
  return counter_entry{value, op::add};
}

} // namespace

WITH_FIXTURE(fixture) {

TEST("a fresh procession has no chunks") {
  CHECK(xs.empty());
  CHECK_EQUAL(xs.event_count(), 0u);
  CHECK_EQUAL(xs.labels().size(), 2u);
  CHECK(xs.begin() == xs.end());
}

TEST("the first insert opens a chunk") {
  xs.insert(add(1), requests, t0);
  REQUIRE_EQUAL(xs.chunks().size(), 1u);
  CHECK_EQUAL(xs.chunks()[0].reference_time, t0);
  REQUIRE_EQUAL(xs.chunks()[0].events.size(), 1u);
  CHECK_EQUAL(xs.chunks()[0].events[0], (event{add(1), 0, requests}));
}

TEST("reference times have millisecond precision") {
  xs.insert(add(1), requests, t0 + 1500us);
  xs.insert(add(1), requests, t0 + 2999us);
  REQUIRE_EQUAL(xs.chunks().size(), 1u);
  CHECK_EQUAL(xs.chunks()[0].reference_time, t0 + 1ms);
  CHECK_EQUAL(xs.chunks()[0].events[1].ms, 1u);
}

TEST("offsets up to 65535 ms stay in the chunk") {
  xs.insert(add(1), requests, t0);
  xs.insert(add(2), requests, t0 + 1ms);
  xs.insert(add(3), load, t0 + 65535ms);
  REQUIRE_EQUAL(xs.chunks().size(), 1u);
  const auto& events = xs.chunks()[0].events;
  REQUIRE_EQUAL(events.size(), 3u);
  CHECK_EQUAL(events[1].ms, 1u);
  CHECK_EQUAL(events[2].ms, 65535u);
  CHECK_EQUAL(events[2].label, load);
}

TEST("an offset of 65536 ms opens a new chunk") {
  xs.insert(add(1), requests, t0);
  xs.insert(add(2), requests, t0 + 65536ms);
  REQUIRE_EQUAL(xs.chunks().size(), 2u);
  CHECK_EQUAL(xs.chunks()[1].reference_time, t0 + 65536ms);
  REQUIRE_EQUAL(xs.chunks()[1].events.size(), 1u);
  CHECK_EQUAL(xs.chunks()[1].events[0].ms, 0u);
  MESSAGE("offsets restart at the new reference time");
  xs.insert(add(3), requests, t0 + 65536ms + 65535ms);
  CHECK_EQUAL(xs.chunks().size(), 2u);
  CHECK_EQUAL(xs.chunks()[1].events.back().ms, 65535u);
  CHECK_EQUAL(xs.event_count(), 3u);
}

TEST("a fraction of a millisecond beyond the window stays in the chunk") {
  xs.insert(add(1), requests, t0);
  xs.insert(add(2), requests, t0 + 65535ms + 999us);
  CHECK_EQUAL(xs.chunks().size(), 1u);
  CHECK_EQUAL(xs.chunks()[0].events.back().ms, 65535u);
}

TEST("long gaps open exactly one chunk") {
  xs.insert(add(1), requests, t0);
  xs.insert(add(2), requests, t0 + 24h);
  REQUIRE_EQUAL(xs.chunks().size(), 2u);
  CHECK_EQUAL(xs.chunks()[1].reference_time, t0 + 24h);
}

TEST("time going backwards lands at offset zero") {
  xs.insert(add(1), requests, t0);
  xs.insert(add(2), requests, t0 + 10ms);
  xs.insert(add(3), requests, t0 - 5s);
  REQUIRE_EQUAL(xs.chunks().size(), 1u);
  const auto& events = xs.chunks()[0].events;
  REQUIRE_EQUAL(events.size(), 3u);
  CHECK_EQUAL(events[2].ms, 0u);
  CHECK_EQUAL(events[2].entry, add(3));
}

TEST("inserting at the current time") {
  auto before = floor_ms(now());
  xs.insert(add(1), requests);
  xs.insert(gauge_entry{1.5f, op::set}, load);
  auto after = now();
  REQUIRE_EQUAL(xs.chunks().size(), 1u);
  CHECK_GREATER_EQUAL(xs.chunks()[0].reference_time, before);
  CHECK_LESS_EQUAL(xs.chunks()[0].reference_time, after);
  CHECK_EQUAL(xs.event_count(), 2u);
}

TEST("intern and lookup forward to the label table") {
  CHECK_EQUAL(unbox(xs.lookup(metric_key{"load"})), load);
  CHECK(!xs.lookup(metric_key{"unknown"}));
  CHECK_EQUAL(xs.intern(metric_key{"requests", {{"method", "GET"}}}),
              requests);
  CHECK_EQUAL(xs.intern(metric_key{"unknown"}), 2u);
}

TEST("memory size grows monotonically") {
  auto previous = xs.memory_size();
  for (size_t i = 0; i < 1000; ++i) {
    auto label
      = xs.intern(metric_key{"requests", {{"id", std::to_string(i % 50)}}});
    xs.insert(add(1), label, t0 + std::chrono::seconds{i});
    auto current = xs.memory_size();
    REQUIRE_GREATER_EQUAL(current, previous);
    previous = current;
  }
  CHECK_GREATER(previous, 1000 * sizeof(event));
}

TEST("memory size counts shared strings once") {
  auto ys = procession{};
  ys.intern(metric_key{"a_rather_long_metric_name_that_defeats_sso",
                       {{"a_rather_long_label_key_that_defeats_sso", "1"}}});
  auto one = ys.memory_size();
  ys.intern(metric_key{"a_rather_long_metric_name_that_defeats_sso",
                       {{"a_rather_long_label_key_that_defeats_sso", "2"}}});
  auto two = ys.memory_size();
  auto zs = procession{};
  zs.intern(metric_key{"a_rather_long_metric_name_that_defeats_sso",
                       {{"a_rather_long_label_key_that_defeats_sso", "1"}}});
  zs.intern(metric_key{"another_long_metric_name_that_defeats_sso",
                       {{"another_long_label_key_that_defeats_sso", "2"}}});
  CHECK_GREATER(two, one);
  CHECK_LESS(two, zs.memory_size());
}

TEST("equality") {
  auto ys = xs;
  CHECK(xs == ys);
  xs.insert(add(1), requests, t0);
  CHECK(xs != ys);
  ys.insert(add(1), requests, t0);
  CHECK(xs == ys);
}

TEST("serialization") {
  xs.insert(add(1), requests, t0);
  xs.insert(gauge_entry{-3.5f, op::sub}, load, t0 + 20ms);
  xs.insert(histogram_entry{0.25f}, load, t0 + 2min);
  check_serialization(xs);
}

} // WITH_FIXTURE(fixture)
