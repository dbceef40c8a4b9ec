//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "parade/logger.hpp"

#include "parade/test/fixtures/log_capture.hpp"
#include "parade/test/test.hpp"

using namespace parade;

TEST("verbosity names") {
  CHECK_EQUAL(loglevel_to_int("quiet"), PARADE_LOG_LEVEL_QUIET);
  CHECK_EQUAL(loglevel_to_int("warning"), PARADE_LOG_LEVEL_WARNING);
  CHECK_EQUAL(loglevel_to_int("verbose"), PARADE_LOG_LEVEL_VERBOSE);
  CHECK_EQUAL(loglevel_to_int("TRACE"), PARADE_LOG_LEVEL_TRACE);
  CHECK_EQUAL(loglevel_to_int("loud"), PARADE_LOG_LEVEL_QUIET);
  CHECK_EQUAL(loglevel_to_int("loud", -1), -1);
}

WITH_FIXTURE(fixtures::log_capture) {

TEST("log macros reach the process-wide logger") {
  PARADE_WARN("disk {} is full", "/dev/sda");
  PARADE_INFO("hello");
  PARADE_VERBOSE("details");
  CHECK_EQUAL(count("warning"), 1u);
  CHECK_EQUAL(count("info"), 1u);
  auto xs = lines();
  REQUIRE_EQUAL(xs.size(), 3u);
  CHECK(xs[0].starts_with("warning disk /dev/sda is full"));
}

} // WITH_FIXTURE(fixtures::log_capture)
