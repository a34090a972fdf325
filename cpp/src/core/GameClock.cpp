#include "core/GameClock.hpp"

#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace core {

namespace {

double parse_seconds(const std::string& original, std::string str) {
  boost::algorithm::trim(str);
  boost::algorithm::replace_all(str, "∞", "inf");
  double value;
  try {
    value = boost::lexical_cast<double>(str);
  } catch (const boost::bad_lexical_cast&) {
    throw GameClockConfigurationError("invalid clock configuration \"{}\": \"{}\" is not a number",
                                      original, str);
  }
  if (std::isnan(value) || value < 0) {
    throw GameClockConfigurationError("invalid clock configuration \"{}\": \"{}\" is negative",
                                      original, str);
  }
  return value;
}

int64_t to_ns(double seconds) {
  if (std::isinf(seconds)) return GameClock::kInfiniteNs;
  return std::min<int64_t>(GameClock::kInfiniteNs, std::llround(seconds * 1e9));
}

std::string format_seconds(double seconds) {
  if (std::isinf(seconds)) return "inf";
  return fmt::format("{:g}", seconds);
}

}  // namespace

GameClock::Configuration GameClock::Configuration::from_str(const std::string& str) {
  std::string rest = boost::algorithm::trim_copy(str);
  if (rest.empty()) {
    throw GameClockConfigurationError("invalid clock configuration \"{}\": empty", str);
  }

  Configuration config;
  if (rest[0] != 'd') {
    size_t cut = rest.find_first_of("|d");
    config.total_time = parse_seconds(str, rest.substr(0, cut));
    rest = cut == std::string::npos ? "" : rest.substr(cut);
  }
  if (!rest.empty() && rest[0] == '|') {
    size_t cut = rest.find('d');
    config.increment = parse_seconds(str, rest.substr(1, cut == std::string::npos ? cut : cut - 1));
    rest = cut == std::string::npos ? "" : rest.substr(cut);
  }
  if (!rest.empty() && rest[0] == 'd') {
    config.delay = parse_seconds(str, rest.substr(1));
    rest.clear();
  }
  if (!rest.empty()) {
    throw GameClockConfigurationError("invalid clock configuration \"{}\"", str);
  }
  return config;
}

std::string GameClock::Configuration::to_string() const {
  return fmt::format("{} | {} d {}", format_seconds(total_time), format_seconds(increment),
                     format_seconds(delay));
}

int64_t GameClock::Configuration::total_time_ns() const { return to_ns(total_time); }
int64_t GameClock::Configuration::increment_ns() const { return to_ns(increment); }
int64_t GameClock::Configuration::delay_ns() const { return to_ns(delay); }

bool GameClock::Configuration::can_timeout() const {
  return !std::isinf(total_time) && !std::isinf(delay);
}

GameClock::Configuration GameClock::no_timeout() {
  return {0.0, 0.0, std::numeric_limits<double>::infinity()};
}

GameClock::GameClock(const Configuration& configuration)
    : configuration_(configuration), total_time_ns_(configuration.total_time_ns()) {}

void GameClock::start() { start_ns_ = util::ns_since_epoch(); }

int64_t GameClock::stop() {
  int64_t now = util::ns_since_epoch();
  int64_t delta = start_ns_ ? now - *start_ns_ : 0;
  if (start_ns_ && can_timeout()) {
    total_time_ns_ -= std::max<int64_t>(0, delta - configuration_.delay_ns());
    if (!is_expired()) {
      total_time_ns_ += configuration_.increment_ns();
    }
  }
  last_delta_ns_ = delta;
  start_ns_.reset();
  return delta;
}

int64_t GameClock::get_timeout_ns() const {
  if (!can_timeout()) return kInfiniteNs;
  return std::max<int64_t>(0, total_time_ns_ + configuration_.delay_ns());
}

}  // namespace core
