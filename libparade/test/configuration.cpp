//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "parade/configuration.hpp"

#include "parade/error.hpp"
#include "parade/test/test.hpp"

#include <caf/settings.hpp>

#include <string>

using namespace parade;
using namespace std::string_literals;

TEST("YAML scalars are typed") {
  auto yaml = R"__(
parade:
  console-verbosity: debug
  enabled: true
query:
  quantiles: [0.5, 0.99]
generate:
  count: 128
  seed: -3
)__";
  auto xs = unbox(from_yaml(yaml));
  auto verbosity = caf::get_if<std::string>(&xs, "parade.console-verbosity");
  REQUIRE(verbosity != nullptr);
  CHECK_EQUAL(*verbosity, "debug"s);
  auto enabled = caf::get_if<bool>(&xs, "parade.enabled");
  REQUIRE(enabled != nullptr);
  CHECK(*enabled);
  auto count = caf::get_if<caf::config_value::integer>(&xs, "generate.count");
  REQUIRE(count != nullptr);
  CHECK_EQUAL(*count, 128);
  auto seed = caf::get_if<caf::config_value::integer>(&xs, "generate.seed");
  REQUIRE(seed != nullptr);
  CHECK_EQUAL(*seed, -3);
  auto quantiles = caf::get_if<caf::config_value::list>(&xs, "query.quantiles");
  REQUIRE(quantiles != nullptr);
  REQUIRE_EQUAL(quantiles->size(), 2u);
  auto first = caf::get_if<caf::config_value::real>(&(*quantiles)[0]);
  REQUIRE(first != nullptr);
  CHECK_EQUAL(*first, 0.5);
}

TEST("empty YAML yields empty settings") {
  CHECK(unbox(from_yaml("")).empty());
  CHECK(unbox(from_yaml("# nothing but a comment\n")).empty());
}

TEST("YAML documents must be mappings") {
  auto result = from_yaml("- a\n- b\n");
  REQUIRE_ERROR(result);
  CHECK_EQUAL(result.error(), ec::invalid_configuration);
  CHECK_ERROR(from_yaml("just a scalar"));
}

TEST("malformed YAML") {
  auto result = from_yaml("parade: [unterminated\n");
  REQUIRE_ERROR(result);
  CHECK_EQUAL(result.error(), ec::parse_error);
}

TEST("merging settings") {
  auto dst = unbox(from_yaml(R"__(
parade:
  console-verbosity: info
  log-file: parade.log
query:
  key: requests
)__"));
  auto src = unbox(from_yaml(R"__(
parade:
  console-verbosity: trace
generate:
  count: 10
)__"));
  merge_settings(src, dst);
  CHECK_EQUAL(caf::get_or(dst, "parade.console-verbosity", ""s), "trace"s);
  CHECK_EQUAL(caf::get_or(dst, "parade.log-file", ""s), "parade.log"s);
  CHECK_EQUAL(caf::get_or(dst, "query.key", ""s), "requests"s);
  CHECK_EQUAL(caf::get_or(dst, "generate.count", int64_t{0}), 10);
}

TEST("loading a missing configuration file") {
  auto result = load_config_file("/nonexistent/parade.yaml");
  REQUIRE_ERROR(result);
  CHECK_EQUAL(result.error(), ec::no_such_file);
}
