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
#include <parade/logger.hpp>
#include <parade/metric.hpp>
#include <parade/procession.hpp>
#include <parade/serialization.hpp>
#include <parade/time.hpp>

#include <boost/unordered_map.hpp>
#include <caf/config_option_set.hpp>
#include <caf/settings.hpp>
#include <fmt/format.h>
#include <re2/re2.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace parade;

namespace {

using regex = std::shared_ptr<const re2::RE2>;

bool search(const std::string& str, const regex& re) {
  return re2::RE2::PartialMatch(str, *re);
}

/// Selects events that carry a label whose key matches `key` and, if
/// present, whose value matches `value`.
struct label_matcher {
  regex key;
  regex value;

  bool matches(const metric_key& x) const {
    return std::any_of(x.labels().begin(), x.labels().end(),
                       [&](const label& l) {
                         return search(l.key, key)
                                && (!value || search(l.value, value));
                       });
  }
};

/// The user-supplied selection of events.
struct query {
  std::vector<regex> keys;
  std::vector<label_matcher> labels;
  std::optional<parade::time> start;
  std::optional<parade::time> end;

  bool matches(const metric_view& x) const {
    auto match_key = [&](const regex& re) {
      return search(x.key.name(), re);
    };
    if (!std::all_of(keys.begin(), keys.end(), match_key))
      return false;
    auto match_label = [&](const label_matcher& m) {
      return m.matches(x.key);
    };
    if (!std::all_of(labels.begin(), labels.end(), match_label))
      return false;
    if (start && x.when < *start)
      return false;
    if (end && x.when >= *end)
      return false;
    return true;
  }
};

struct gauge_statistics {
  double min = std::numeric_limits<double>::infinity();
  double max = -std::numeric_limits<double>::infinity();
  double sum = 0.0;
  double latest = 0.0;
  uint64_t count = 0;

  void track(op x, double value) {
    switch (x) {
      case op::add:
        latest += value;
        break;
      case op::sub:
        latest -= value;
        break;
      case op::set:
        latest = value;
        break;
    }
    min = std::min(min, latest);
    max = std::max(max, latest);
    sum += latest;
    ++count;
  }

  auto average() const -> double {
    return count == 0 ? 0.0 : sum / static_cast<double>(count);
  }
};

/// Aggregates the selected events per metric key, keeping first-seen order.
template <class T>
class keyed {
public:
  auto operator[](const metric_key& key) -> T& {
    auto [it, inserted] = positions_.try_emplace(key, values_.size());
    if (inserted)
      values_.emplace_back(key, T{});
    return values_[it->second].second;
  }

  auto begin() {
    return values_.begin();
  }

  auto end() {
    return values_.end();
  }

  auto empty() const -> bool {
    return values_.empty();
  }

private:
  boost::unordered_map<metric_key, size_t> positions_;
  std::vector<std::pair<metric_key, T>> values_;
};

class collector {
public:
  void track(const metric_view& x) {
    x.entry.match(
      [&](const counter_entry& y) {
        auto& total = counters_[x.key];
        if (y.op == op::set)
          total = y.value;
        else if (y.op == op::add)
          total += y.value;
        else
          total -= std::min(total, uint64_t{y.value});
      },
      [&](const gauge_entry& y) {
        gauges_[x.key].track(y.op, y.value);
      },
      [&](const histogram_entry& y) {
        histograms_[x.key].push_back(y.value);
      });
  }

  void report(std::ostream& out) {
    if (!counters_.empty()) {
      out << fmt::format("{:->5}COUNTERS{:->5}\n", "", "");
      for (const auto& [key, total] : counters_)
        out << fmt::format("{}\n{}\n-\n", header(key), total);
    }
    if (!gauges_.empty()) {
      out << fmt::format("{:->5}GAUGES{:->5}\n", "", "");
      for (const auto& [key, stats] : gauges_) {
        out << header(key) << '\n';
        out << fmt::format("   min: {:.2f}\n", stats.min);
        out << fmt::format("   max: {:.2f}\n", stats.max);
        out << fmt::format("   avg: {:.2f}\n", stats.average());
        out << fmt::format("latest: {:.2f}\n", stats.latest);
        out << fmt::format(" count: {}\n-\n", stats.count);
      }
    }
    if (!histograms_.empty()) {
      out << fmt::format("{:->5}HISTOS{:->5}\n", "", "");
      for (auto& [key, samples] : histograms_) {
        out << header(key) << '\n';
        for (auto q : defaults::query::quantiles)
          out << fmt::format("p{:.2f}: {:.2f}\n", q, quantile(samples, q));
        out << fmt::format(" count: {}\n-\n", samples.size());
      }
    }
  }

private:
  static auto header(const metric_key& key) -> std::string {
    auto result = fmt::format("{} {{", key.name());
    for (const auto& l : key.labels())
      result += fmt::format("\n  {} => {}", l.key, l.value);
    result += '}';
    return result;
  }

  /// Returns the sample at rank `q * (n - 1)`. Reorders `xs`.
  static auto quantile(std::vector<float>& xs, double q) -> double {
    if (xs.empty())
      return std::numeric_limits<double>::quiet_NaN();
    auto rank = static_cast<size_t>(
      std::round(q * static_cast<double>(xs.size() - 1)));
    auto nth = xs.begin() + static_cast<std::ptrdiff_t>(rank);
    std::nth_element(xs.begin(), nth, xs.end());
    return *nth;
  }

  keyed<uint64_t> counters_;
  keyed<gauge_statistics> gauges_;
  keyed<std::vector<float>> histograms_;
};

auto make_regex(const std::string& str) -> caf::expected<regex> {
  auto result = std::make_shared<const re2::RE2>(
    str, re2::RE2::Options{re2::RE2::CannedOptions::Quiet});
  if (!result->ok())
    return caf::make_error(ec::invalid_argument,
                           fmt::format("invalid regex '{}': {}", str,
                                       result->error()));
  return result;
}

auto make_query(const caf::settings& cfg) -> caf::expected<query> {
  auto result = query{};
  for (const auto& str :
       caf::get_or(cfg, "key", std::vector<std::string>{})) {
    auto re = make_regex(str);
    if (!re)
      return std::move(re.error());
    result.keys.push_back(std::move(*re));
  }
  for (const auto& str :
       caf::get_or(cfg, "label", std::vector<std::string>{})) {
    auto separator = str.find('=');
    auto key = make_regex(str.substr(0, separator));
    if (!key)
      return std::move(key.error());
    auto matcher = label_matcher{std::move(*key), nullptr};
    if (separator != std::string::npos) {
      auto value = make_regex(str.substr(separator + 1));
      if (!value)
        return std::move(value.error());
      matcher.value = std::move(*value);
    }
    result.labels.push_back(std::move(matcher));
  }
  if (auto str = caf::get_if<std::string>(&cfg, "start")) {
    auto start = parse_time(*str);
    if (!start)
      return add_context(start.error(), "in option --start");
    result.start = *start;
  }
  if (auto str = caf::get_if<std::string>(&cfg, "end")) {
    auto end = parse_time(*str);
    if (!end)
      return add_context(end.error(), "in option --end");
    result.end = *end;
  }
  return result;
}

auto make_options() -> caf::config_option_set {
  return caf::config_option_set{}
    .add<std::vector<std::string>>("key", "regexes that the metric name must "
                                          "match")
    .add<std::vector<std::string>>("label", "matchers of the form KEY[=VALUE] "
                                            "that one label must satisfy")
    .add<std::string>("start", "skip events before this RFC 3339 time")
    .add<std::string>("end", "skip events at or after this RFC 3339 time")
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
  auto args = std::vector<std::string>{};
  auto positional = std::vector<std::string>{};
  for (auto i = 1; i < argc; ++i) {
    auto arg = std::string_view{argv[i]};
    if (arg.starts_with("-"))
      args.emplace_back(arg);
    else
      positional.emplace_back(arg);
  }
  auto cli = caf::settings{};
  auto [code, it] = options.parse(cli, args);
  if (code != caf::pec::success) {
    std::cerr << "error while parsing argument \"" << *it
              << "\": " << to_string(code) << "\n\n"
              << options.help_text() << std::endl;
    return 1;
  }
  if (caf::get_or(cli, "help", false)) {
    std::cout << "usage: parade-query <file> [options]\n\n"
              << options.help_text() << std::endl;
    return 0;
  }
  if (positional.size() != 1) {
    std::cerr << "expected exactly one input file\n\n"
              << options.help_text() << std::endl;
    return 1;
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
  auto selection = make_query(cfg);
  if (!selection) {
    std::cerr << render(selection.error()) << std::endl;
    return 1;
  }
  auto xs = load(positional.front());
  if (!xs) {
    PARADE_ERROR("{}", render(xs.error()));
    std::cerr << render(xs.error()) << std::endl;
    return 1;
  }
  PARADE_VERBOSE("loaded {} events with {} keys in {} chunks",
                 xs->event_count(), xs->labels().size(), xs->chunks().size());
  auto result = collector{};
  auto selected = size_t{0};
  for (auto x : xs->iter()) {
    if (!selection->matches(x))
      continue;
    result.track(x);
    ++selected;
  }
  PARADE_VERBOSE("selected {} of {} events", selected, xs->event_count());
  result.report(std::cout);
  return 0;
}
