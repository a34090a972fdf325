#pragma once

#include "util/CppUtil.hpp"
#include "util/Exception.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace core {

// Malformed clock configuration string.
class GameClockConfigurationError : public util::CleanException {
 public:
  using util::CleanException::CleanException;
};

/*
 * A chess clock. The clock of a role holds a total time, which decreases while the role thinks,
 * minus a per-move delay that is free, plus a per-move increment credited after each move.
 *
 * Any component may be infinite. An infinite total time or delay means the clock never expires.
 */
class GameClock {
 public:
  // Stand-in for an infinite duration in nanosecond arithmetic.
  static constexpr int64_t kInfiniteNs = util::s_to_ns(24 * 60 * 60);

  struct Configuration {
    double total_time = 0;  // seconds
    double increment = 0;   // seconds
    double delay = 0;       // seconds

    /*
     * Accepted forms (seconds, "inf" or "∞" for infinity):
     *
     * "T | I d D", "T | I", "T d D", "T", "d D"
     *
     * Throws GameClockConfigurationError on anything else.
     */
    static Configuration from_str(const std::string& str);
    std::string to_string() const;

    int64_t total_time_ns() const;
    int64_t increment_ns() const;
    int64_t delay_ns() const;
    bool can_timeout() const;

    bool operator==(const Configuration&) const = default;
  };

  static Configuration default_start_clock() { return {60.0, 0.0, 0.0}; }
  static Configuration default_play_clock() { return {0.0, 0.0, 60.0}; }
  static Configuration no_timeout();

  explicit GameClock(const Configuration& configuration);

  void start();

  // Charges the time since start() and credits the increment. Returns the elapsed ns.
  int64_t stop();

  int64_t total_time_ns() const { return total_time_ns_; }
  int64_t delay_ns() const { return configuration_.delay_ns(); }
  bool can_timeout() const { return configuration_.can_timeout(); }
  bool is_expired() const { return can_timeout() && total_time_ns_ < 0; }
  std::optional<int64_t> last_delta_ns() const { return last_delta_ns_; }
  const Configuration& configuration() const { return configuration_; }

  // Time until the clock expires during the current move, never negative.
  int64_t get_timeout_ns() const;

 private:
  Configuration configuration_;
  int64_t total_time_ns_;
  std::optional<int64_t> start_ns_;
  std::optional<int64_t> last_delta_ns_;
};

}  // namespace core
