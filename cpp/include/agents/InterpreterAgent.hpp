#pragma once

#include "core/Agent.hpp"
#include "core/GameClock.hpp"
#include "core/Interpreter.hpp"
#include "core/Subrelation.hpp"

#include <optional>
#include <string>

namespace agents {

/*
 * Base class for agents that consult an Interpreter.
 *
 * prepare_match() stores the role, the ruleset and the clock configurations, and builds the
 * interpreter through the factory. conclude_match() and abort_match() drop all of them, so that a
 * late calculate_move() fails with core::InterpreterIsNoneAgentError.
 */
class InterpreterAgent : public core::Agent {
 public:
  explicit InterpreterAgent(core::InterpreterFactory interpreter_factory);

  void prepare_match(const core::Role& role, const core::Ruleset& ruleset,
                     const core::GameClock::Configuration& start_clock_config,
                     const core::GameClock::Configuration& play_clock_config) override;
  void conclude_match(const core::View& view) override;
  void abort_match() override;

  bool is_prepared() const { return interpreter_ != nullptr; }

 protected:
  // Throw InterpreterIsNoneAgentError / RoleIsNoneAgentError outside of a match.
  const core::Interpreter& interpreter() const;
  const core::InterpreterPtr& interpreter_ptr() const;
  const core::Role& role() const;

  const core::GameClock::Configuration& start_clock_config() const { return start_clock_config_; }
  const core::GameClock::Configuration& play_clock_config() const { return play_clock_config_; }

  // Drops the match data.
  virtual void reset();

 private:
  core::InterpreterFactory interpreter_factory_;
  core::InterpreterPtr interpreter_;
  std::optional<core::Role> role_;
  std::optional<core::Ruleset> ruleset_;
  core::GameClock::Configuration start_clock_config_;
  core::GameClock::Configuration play_clock_config_;
};

}  // namespace agents
