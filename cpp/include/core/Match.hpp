#pragma once

#include "core/Agent.hpp"
#include "core/GameClock.hpp"
#include "core/Interpreter.hpp"
#include "core/State.hpp"
#include "core/Subrelation.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace core {

/*
 * Drives one match between agents, one agent per role.
 *
 * Every agent is prepared within the start clock. At every ply, each role in control is asked for
 * its move with its view and the time left on its own play clock. An agent that raises a
 * recoverable error (anything but a failed assertion), exceeds its clock or plays an illegal move
 * did not respond: the match is aborted and every agent receives abort_match(). Otherwise, once
 * the state is terminal, every agent receives conclude_match() with its final view.
 */
class Match {
 public:
  using agents_t = std::map<Role, Agent*>;

  struct Result {
    std::vector<State> states;  // one per ply, the final state included
    Interpreter::goals_t goals;
    std::optional<Role> unresponsive_role;
    std::string error;

    bool aborted() const { return unresponsive_role.has_value(); }
    int plies() const { return int(states.size()) - 1; }
  };

  // Throws util::CleanException unless agents has exactly one agent per role.
  Match(InterpreterPtr interpreter, const Ruleset& ruleset, const agents_t& agents,
        const GameClock::Configuration& start_clock_config,
        const GameClock::Configuration& play_clock_config);

  Result run();

 private:
  // Returns false (and fills result_) if the agent of role did not respond.
  bool prepare(const Role& role, Agent& agent);
  std::optional<Move> request_move(const Role& role, Agent& agent, int ply, const State& state);

  void abort(const Role& role, const std::string& error);
  void conclude(const State& state);

  InterpreterPtr interpreter_;
  Ruleset ruleset_;
  agents_t agents_;
  GameClock::Configuration start_clock_config_;
  GameClock::Configuration play_clock_config_;
  std::map<Role, GameClock> play_clocks_;
  Result result_;
};

}  // namespace core
