#pragma once

#include "core/GameClock.hpp"
#include "core/Interpreter.hpp"
#include "core/State.hpp"
#include "core/Subrelation.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace core {

// Opaque handle on the rules of a game, turned into an Interpreter by an InterpreterFactory.
struct Ruleset {
  std::string name;

  bool operator==(const Ruleset&) const = default;
};

using InterpreterFactory = std::function<InterpreterPtr(const Ruleset&)>;

/*
 * Base class for all agents.
 *
 * The match driver calls, per match:
 *
 * - prepare_match() once, within the start clock;
 * - calculate_move() at every ply where the agent's role is in control, within the play clock;
 * - conclude_match() with the final view, or abort_match() if the match ends abnormally.
 *
 * set_up() and tear_down() bracket the lifetime of the agent across matches (see AgentScope).
 */
class Agent {
 public:
  virtual ~Agent() = default;

  virtual void set_up() {}
  virtual void tear_down() {}

  virtual void prepare_match(const Role& role, const Ruleset& ruleset,
                             const GameClock::Configuration& start_clock_config,
                             const GameClock::Configuration& play_clock_config) = 0;

  /*
   * total_time_ns is the time left on the play clock, delay excluded. view is what the agent's
   * role observes at ply.
   */
  virtual Move calculate_move(int ply, int64_t total_time_ns, const View& view) = 0;

  virtual void conclude_match(const View& view) = 0;
  virtual void abort_match() = 0;

  virtual std::string name() const = 0;
};

// Calls set_up() on construction and tear_down() on destruction.
class AgentScope {
 public:
  explicit AgentScope(Agent& agent) : agent_(agent) { agent_.set_up(); }
  ~AgentScope() { agent_.tear_down(); }

  AgentScope(const AgentScope&) = delete;
  AgentScope& operator=(const AgentScope&) = delete;

 private:
  Agent& agent_;
};

}  // namespace core
