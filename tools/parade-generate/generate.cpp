//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include <parade/configuration.hpp>
#include <parade/defaults.hpp>
#include <parade/detail/add_message_types.hpp>
#include <parade/error.hpp>
#include <parade/instrumentation.hpp>
#include <parade/logger.hpp>
#include <parade/recorder.hpp>
#include <parade/serialization.hpp>

#include <caf/config_option_set.hpp>
#include <caf/settings.hpp>
#include <fmt/format.h>

#include <array>
#include <cstdint>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace parade;

namespace {

/// Writes `x` to stdout in the given format.
auto print(const procession& x, serialization_format format) -> caf::error {
  auto text = caf::expected<std::string>{std::string{}};
  switch (format) {
    case serialization_format::original:
      text = to_json(x);
      break;
    case serialization_format::array:
      text = to_json(flatten(x));
      break;
    case serialization_format::json_lines:
      text = to_json_lines(flatten(x));
      break;
    case serialization_format::binary:
    case serialization_format::binary_array:
      return caf::make_error(ec::invalid_argument,
                             "binary output requires --output");
  }
  if (!text)
    return std::move(text.error());
  std::cout << *text;
  if (format != serialization_format::json_lines)
    std::cout << '\n';
  std::cout.flush();
  return {};
}

/// Performs `count` random writes through the instrumentation interface.
void generate(recorder& r, uint64_t count, uint64_t seed) {
  auto counters = std::array{
    r.register_counter(metric_key{"counter1"}),
    r.register_counter(metric_key{"counter2", {{"label1", "value1"}}}),
    r.register_counter(metric_key{
      "counter3", {{"2label1", "2value1"}, {"2label2", "2value2"}}}),
  };
  auto gauges = std::array{
    r.register_gauge(metric_key{"gauge1"}),
    r.register_gauge(metric_key{"gauge2", {{"label1", "value1"}}}),
    r.register_gauge(metric_key{
      "gauge3", {{"2label1", "2value1"}, {"2label2", "2value2"}}}),
  };
  auto histograms = std::array{
    r.register_histogram(metric_key{"histo1"}),
    r.register_histogram(metric_key{"histo2", {{"label1", "value1"}}}),
    r.register_histogram(metric_key{
      "histo3", {{"2label1", "2value1"}, {"2label2", "2value2"}}}),
  };
  auto engine = std::mt19937_64{seed};
  auto kind = std::uniform_int_distribution<size_t>{0, 2};
  auto index = std::uniform_int_distribution<size_t>{0, 2};
  auto value = std::uniform_int_distribution<int>{0, 255};
  for (uint64_t i = 0; i < count; ++i) {
    switch (kind(engine)) {
      case 0:
        counters[index(engine)].increment(1);
        break;
      case 1:
        gauges[index(engine)].set(value(engine));
        break;
      default:
        histograms[index(engine)].record(value(engine));
        break;
    }
  }
}

auto make_options() -> caf::config_option_set {
  return caf::config_option_set{}
    .add<uint64_t>("count,n", "number of random writes")
    .add<std::string>("format,f",
                      "one of original, array, json-lines, binary, "
                      "binary-array")
    .add<std::string>("output,o", "path to the output file or '-' for "
                                  "stdout")
    .add<uint64_t>("seed", "seed of the random number generator")
    .add<std::string>("config", "path to a YAML configuration file")
    .add<std::string>("parade", "console-verbosity",
                      "one of quiet, error, warning, info, verbose, debug, "
                      "trace")
    .add<std::string>("parade", "log-file", "path to a log file")
    .add<bool>("help,h?", "print this help text");
}

} // namespace

int main(int argc, char** argv) {
  auto options = make_options();
  auto args = std::vector<std::string>{argv + 1, argv + argc};
  auto cli = caf::settings{};
  auto [code, it] = options.parse(cli, args);
  if (code != caf::pec::success) {
    std::cerr << "error while parsing argument \"" << *it
              << "\": " << to_string(code) << "\n\n"
              << options.help_text() << std::endl;
    return 1;
  }
  if (caf::get_or(cli, "help", false)) {
    std::cout << "usage: parade-generate [options]\n\n"
              << options.help_text() << std::endl;
    return 0;
  }
  auto cfg = caf::settings{};
  if (auto path = caf::get_if<std::string>(&cli, "config")) {
    auto file = load_config_file(*path);
    if (!file) {
      std::cerr << render(file.error()) << std::endl;
      return 1;
    }
    cfg = std::move(*file);
  }
  merge_settings(cli, cfg);
  detail::add_message_types();
  auto log_context = create_log_context(cfg);
  if (!log_context) {
    std::cerr << render(log_context.error()) << std::endl;
    return 1;
  }
  auto format = serialization_format::original;
  auto format_name = caf::get_or(cfg, "format",
                                 std::string{defaults::generate::format});
  if (!from_string(format_name, format)) {
    std::cerr << render(caf::make_error(ec::invalid_argument,
                                        fmt::format("unknown format '{}'",
                                                    format_name)))
              << std::endl;
    return 1;
  }
  auto count = caf::get_or(cfg, "count", defaults::generate::count);
  auto seed = caf::get_or(cfg, "seed", uint64_t{std::random_device{}()});
  PARADE_VERBOSE("generating {} writes with seed {}", count, seed);
  auto recorder = procession_recorder{};
  generate(recorder, count, seed);
  auto guard = recorder.lock();
  PARADE_INFO("recorded {} events in {} chunks using about {} bytes",
              guard->event_count(), guard->chunks().size(),
              guard->memory_size());
  auto output = caf::get_or(cfg, "output", std::string{"-"});
  auto err = output == "-" ? print(*guard, format)
                           : save(output, *guard, format);
  if (err) {
    PARADE_ERROR("{}", render(err));
    std::cerr << render(err) << std::endl;
    return 1;
  }
  return 0;
}
