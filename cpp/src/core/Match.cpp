#include "core/Match.hpp"

#include "core/Turn.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

#include <boost/algorithm/string/join.hpp>

#include <fmt/format.h>

namespace core {

Match::Match(InterpreterPtr interpreter, const Ruleset& ruleset, const agents_t& agents,
             const GameClock::Configuration& start_clock_config,
             const GameClock::Configuration& play_clock_config)
    : interpreter_(std::move(interpreter)),
      ruleset_(ruleset),
      agents_(agents),
      start_clock_config_(start_clock_config),
      play_clock_config_(play_clock_config) {
  Interpreter::roles_t roles = interpreter_->get_roles();
  for (const auto& role : roles) {
    auto it = agents_.find(role);
    if (it == agents_.end() || it->second == nullptr) {
      throw util::CleanException("no agent for role {}", role.to_string());
    }
    play_clocks_.emplace(role, GameClock(play_clock_config_));
  }
  if (agents_.size() != roles.size()) {
    throw util::CleanException("{} agents for {} roles", agents_.size(), roles.size());
  }
}

Match::Result Match::run() {
  result_ = Result();
  for (auto& [role, agent] : agents_) {
    if (!prepare(role, *agent)) return result_;
  }

  State state = interpreter_->get_init_state();
  result_.states.push_back(state);
  for (int ply = 0; !interpreter_->is_terminal(state); ++ply) {
    Turn::plays_t plays;
    for (const auto& role : Interpreter::get_roles_in_control(state)) {
      std::optional<Move> move = request_move(role, *agents_.at(role), ply, state);
      if (!move) return result_;
      plays.emplace_back(role, *move);
    }
    Turn turn(std::move(plays));
    LOG_INFO("ply {}: {}", ply, turn.to_string());

    state = interpreter_->get_next_state(state, turn);
    result_.states.push_back(state);
  }

  conclude(state);
  return result_;
}

bool Match::prepare(const Role& role, Agent& agent) {
  GameClock start_clock(start_clock_config_);
  start_clock.start();
  try {
    agent.prepare_match(role, ruleset_, start_clock_config_, play_clock_config_);
  } catch (const util::ReleaseAssertionError&) {
    throw;
  } catch (const util::DebugAssertionError&) {
    throw;
  } catch (const util::Exception& e) {
    start_clock.stop();
    abort(role, e.what());
    return false;
  }
  start_clock.stop();
  if (start_clock.is_expired()) {
    abort(role, "start clock expired");
    return false;
  }
  return true;
}

std::optional<Move> Match::request_move(const Role& role, Agent& agent, int ply,
                                        const State& state) {
  GameClock& clock = play_clocks_.at(role);
  View view = interpreter_->get_sees_by_role(state, role);

  std::optional<Move> move;
  clock.start();
  try {
    move = agent.calculate_move(ply, clock.total_time_ns(), view);
  } catch (const util::ReleaseAssertionError&) {
    throw;
  } catch (const util::DebugAssertionError&) {
    throw;
  } catch (const util::Exception& e) {
    clock.stop();
    abort(role, e.what());
    return std::nullopt;
  }
  clock.stop();

  if (clock.is_expired()) {
    abort(role, fmt::format("play clock expired at ply {}", ply));
    return std::nullopt;
  }
  if (!interpreter_->is_legal(state, role, *move)) {
    abort(role, fmt::format("illegal move {} at ply {}", move->to_string(), ply));
    return std::nullopt;
  }
  LOG_DEBUG("{} played {} in {:.3f}s ({:.3f}s left)", role.to_string(), move->to_string(),
            *clock.last_delta_ns() * 1e-9, clock.total_time_ns() * 1e-9);
  return move;
}

void Match::abort(const Role& role, const std::string& error) {
  LOG_WARN("{} ({}) did not respond: {}", role.to_string(), agents_.at(role)->name(), error);
  result_.unresponsive_role = role;
  result_.error = error;

  for (auto& [other_role, agent] : agents_) {
    try {
      agent->abort_match();
    } catch (const util::Exception& e) {
      LOG_WARN("{} failed to abort: {}", other_role.to_string(), e.what());
    }
  }
}

void Match::conclude(const State& state) {
  Interpreter::sees_t sees = interpreter_->get_sees(state);
  for (auto& [role, agent] : agents_) {
    agent->conclude_match(sees[role]);
  }

  result_.goals = interpreter_->get_goals(state);
  std::vector<std::string> parts;
  for (const auto& [role, goal] : result_.goals) {
    if (goal) parts.push_back(fmt::format("{}={}", role.to_string(), *goal));
  }
  LOG_INFO("match over after {} plies: {}", result_.plies(), boost::algorithm::join(parts, " "));
}

}  // namespace core
