//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "parade/metric.hpp"

#include "parade/procession.hpp"
#include "parade/serialization.hpp"
#include "parade/test/serialization.hpp"
#include "parade/test/test.hpp"

#include <iterator>
#include <string>
#include <vector>

using namespace parade;
using namespace std::chrono_literals;

namespace {

struct fixture {
  fixture() {
    xs.insert(counter_entry{1, op::add}, requests, t0);
    xs.insert(gauge_entry{0.5f, op::set}, load, t0 + 250ms);
    xs.insert(counter_entry{2, op::add}, requests, t0 + 70s);
    xs.insert(histogram_entry{12.5f}, latency, t0 + 70s + 3ms);
    xs.insert(gauge_entry{0.25f, op::sub}, load, t0 + 1h);
  }

  const parade::time t0 = parade::time{1'700'000'000'000ms};
  procession xs;
  label_id requests = xs.intern(metric_key{"requests", {{"method", "GET"}}});
  label_id load = xs.intern(metric_key{"load", {{"cpu", "0"}}});
  label_id latency = xs.intern(metric_key{"latency"});
};

} // namespace

WITH_FIXTURE(fixture) {

TEST("iteration follows append order across chunks") {
  REQUIRE_EQUAL(xs.chunks().size(), 3u);
  auto views = std::vector<metric>{};
  for (auto view : xs.iter())
    views.emplace_back(view);
  REQUIRE_EQUAL(views.size(), 5u);
  CHECK_EQUAL(views[0],
              (metric{t0, counter_entry{1, op::add}, "requests",
                      {{"method", "GET"}}}));
  CHECK_EQUAL(views[1], (metric{t0 + 250ms, gauge_entry{0.5f, op::set},
                                "load", {{"cpu", "0"}}}));
  CHECK_EQUAL(views[2].when, t0 + 70s);
  CHECK_EQUAL(views[3],
              (metric{t0 + 70s + 3ms, histogram_entry{12.5f}, "latency", {}}));
  CHECK_EQUAL(views[4].when, t0 + 1h);
  CHECK_EQUAL(views[4].entry, entry{gauge_entry{0.25f, op::sub}});
}

TEST("views borrow keys from the label table") {
  auto first = *xs.begin();
  CHECK(&first.key == xs.labels().resolve(requests));
  CHECK(metric{first} == first);
  CHECK_EQUAL(make_key(first), (metric_key{"requests", {{"method", "GET"}}}));
}

TEST("owned and borrowed iteration agree") {
  auto borrowed = xs.iter();
  auto owned = xs.iter_owned();
  auto i = borrowed.begin();
  auto j = owned.begin();
  for (; i != borrowed.end() && j != owned.end(); ++i, ++j)
    CHECK(*j == *i);
  CHECK(i == borrowed.end());
  CHECK(j == owned.end());
  CHECK_EQUAL(std::distance(owned.begin(), owned.end()), 5);
}

TEST("ranges can be traversed more than once") {
  auto range = xs.iter();
  auto n = std::distance(range.begin(), range.end());
  CHECK_EQUAL(n, std::distance(range.begin(), range.end()));
  CHECK_EQUAL(static_cast<size_t>(n), xs.event_count());
}

TEST("owned metrics outlive their procession") {
  auto metrics = std::vector<metric>{};
  {
    auto ys = xs;
    metrics = flatten(ys);
  }
  REQUIRE_EQUAL(metrics.size(), 5u);
  CHECK_EQUAL(metrics[3].key, "latency");
  CHECK_EQUAL(metrics[1].make_key(), (metric_key{"load", {{"cpu", "0"}}}));
}

TEST("rebuilding from borrowed views reproduces the procession") {
  auto ys = procession::from_metrics(xs.iter());
  CHECK_EQUAL(ys, xs);
}

TEST("rebuilding from owned metrics reproduces the procession") {
  auto ys = procession::from_metrics(flatten(xs));
  CHECK_EQUAL(ys, xs);
  CHECK_EQUAL(ys.chunks().size(), 3u);
  CHECK_EQUAL(ys.chunks()[1].reference_time, t0 + 70s);
}

TEST("rebuilding interns keys in order of first use") {
  auto metrics = std::vector<metric>{
    {t0, histogram_entry{1.0f}, "b", {}},
    {t0 + 1ms, histogram_entry{2.0f}, "a", {{"y", "2"}, {"x", "1"}}},
    {t0 + 2ms, histogram_entry{3.0f}, "b", {}},
  };
  auto ys = procession::from_metrics(metrics);
  CHECK_EQUAL(unbox(ys.lookup(metric_key{"b"})), 0u);
  CHECK_EQUAL(unbox(ys.lookup(metric_key{"a", {{"x", "1"}, {"y", "2"}}})),
              1u);
  CHECK_EQUAL(ys.labels().size(), 2u);
  CHECK_EQUAL(ys.event_count(), 3u);
}

TEST("serialization of owned metrics") {
  auto metrics = flatten(xs);
  check_serialization(metrics[0]);
  check_serialization(metrics);
}

} // WITH_FIXTURE(fixture)

TEST("unknown label ids resolve to the empty key") {
  auto xs = procession{};
  xs.insert(counter_entry{7, op::set}, 42, parade::time{1'700'000'000'000ms});
  auto view = *xs.begin();
  CHECK(view.key.name().empty());
  CHECK(view.key.labels().empty());
  CHECK_EQUAL(metric{view}.entry, entry{counter_entry{7, op::set}});
}

TEST("iteration skips empty chunks") {
  auto json = std::string_view{R"({
    "chunks": [
      {"reference_time": "2023-11-14T22:13:20.000Z", "events": []},
      {"reference_time": "2023-11-14T22:13:30.000Z", "events": [
        {"entry": {"counter": {"value": 1, "op": "add"}}, "ms": 5, "label": 0}
      ]},
      {"reference_time": "2023-11-14T22:15:00.000Z", "events": []}
    ],
    "labels": [{"key_name": "requests", "labels": [], "value": 0}]
  })"};
  auto xs = unbox(from_json(json));
  REQUIRE_EQUAL(xs.chunks().size(), 3u);
  auto range = xs.iter();
  REQUIRE(range.begin() != range.end());
  auto view = *range.begin();
  CHECK_EQUAL(view.when,
              parade::time{1'700'000'010'000ms} + std::chrono::milliseconds{5});
  CHECK_EQUAL(view.key.name(), "requests");
  CHECK_EQUAL(std::distance(range.begin(), range.end()), 1);
}

TEST("a procession of empty chunks has no metrics") {
  auto json = std::string_view{R"({
    "chunks": [{"reference_time": "2023-11-14T22:13:20.000Z", "events": []}],
    "labels": []
  })"};
  auto xs = unbox(from_json(json));
  CHECK(xs.begin() == xs.end());
  CHECK(flatten(xs).empty());
}
