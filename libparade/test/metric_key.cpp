//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "parade/metric_key.hpp"

#include "parade/test/serialization.hpp"
#include "parade/test/test.hpp"

#include <fmt/format.h>

#include <string>

using namespace parade;
using namespace std::string_literals;

TEST("label order does not matter") {
  auto x = metric_key{"requests", {{"method", "GET"}, {"status", "200"}}};
  auto y = metric_key{"requests", {{"status", "200"}, {"method", "GET"}}};
  CHECK(x == y);
  CHECK_EQUAL(hash_value(x), hash_value(y));
  CHECK_EQUAL(x.labels().front().key, "method"s);
  CHECK_EQUAL(x.labels().back().key, "status"s);
}

TEST("keys differ by name and labels") {
  auto x = metric_key{"requests", {{"method", "GET"}}};
  CHECK(x != metric_key{"responses", {{"method", "GET"}}});
  CHECK(x != metric_key{"requests", {{"method", "POST"}}});
  CHECK(x != metric_key{"requests"});
  CHECK(x != metric_key("requests", {{"method", "GET"}, {"path", "/"}}));
}

TEST("duplicate labels collapse") {
  auto x = metric_key{"requests", {{"a", "1"}, {"a", "1"}, {"b", "2"}}};
  CHECK_EQUAL(x.labels().size(), 2u);
  CHECK(x == metric_key("requests", {{"b", "2"}, {"a", "1"}}));
}

TEST("formatting") {
  CHECK_EQUAL(fmt::format("{}", metric_key{"uptime"}), "uptime"s);
  auto x = metric_key{"requests", {{"status", "200"}, {"method", "GET"}}};
  CHECK_EQUAL(fmt::format("{}", x), "requests{method=GET,status=200}"s);
}

TEST("serialization") {
  check_serialization(metric_key{"requests", {{"method", "GET"}}});
  check_serialization(metric_key{});
}

TEST("labels are canonical after deserialization") {
  auto reader = caf::json_reader{};
  REQUIRE(reader.load(R"({"name": "requests", "labels": [["z", "1"], )"
                      R"(["a", "2"]]})"));
  auto x = metric_key{};
  REQUIRE(reader.apply(x));
  CHECK(x == metric_key("requests", {{"a", "2"}, {"z", "1"}}));
  CHECK_EQUAL(x.labels().front().key, "a"s);
}
