#include "games/minipoker/Interpreter.hpp"

#include "core/Exceptions.hpp"

#include <algorithm>
#include <optional>

namespace minipoker {

namespace {

const int kBlufferResignGoal = -10;
const int kCallerResignGoal = 4;
const int kCallOnRedGoal = -20;
const int kCallOnBlackGoal = 16;

core::State::facts_t without_control(const core::State& state) {
  core::State::facts_t facts;
  for (const auto& fact : state) {
    if (fact.name() != "control") facts.push_back(fact);
  }
  return facts;
}

}  // namespace

const core::Role& Interpreter::bluffer() {
  static const core::Role role("bluffer");
  return role;
}

const core::Role& Interpreter::caller() {
  static const core::Role role("caller");
  return role;
}

core::Subrelation Interpreter::red() { return core::Subrelation("red"); }
core::Subrelation Interpreter::black() { return core::Subrelation("black"); }

core::Move Interpreter::deal(const core::Subrelation& colour) {
  return core::Move("deal", {colour});
}

core::Move Interpreter::hold() { return core::Move("hold"); }
core::Move Interpreter::call() { return core::Move("call"); }
core::Move Interpreter::resign() { return core::Move("resign"); }

core::Subrelation Interpreter::control(const core::Role& role) {
  return core::Subrelation("control", {role});
}

core::Subrelation Interpreter::dealt() { return core::Subrelation("dealt"); }

core::Subrelation Interpreter::dealt(const core::Subrelation& colour) {
  return core::Subrelation("dealt", {colour});
}

core::Subrelation Interpreter::held() { return core::Subrelation("held", {bluffer()}); }
core::Subrelation Interpreter::called() { return core::Subrelation("called", {caller()}); }

core::Subrelation Interpreter::resigned(const core::Role& role) {
  return core::Subrelation("resigned", {role});
}

Interpreter::roles_t Interpreter::get_roles() const {
  return {bluffer(), caller(), core::random_role()};
}

core::State Interpreter::get_init_state() const {
  return core::State{control(core::random_role())};
}

Interpreter::sees_t Interpreter::get_sees(const core::State& state) const {
  core::View caller_view = state;
  if (!state.contains(called())) {
    core::State::facts_t facts;
    for (const auto& fact : state) {
      if (fact != dealt(red()) && fact != dealt(black())) facts.push_back(fact);
    }
    caller_view = core::View(std::move(facts));
  }
  return {{bluffer(), state}, {caller(), caller_view}, {core::random_role(), state}};
}

Interpreter::legal_moves_t Interpreter::get_legal_moves(const core::State& state) const {
  legal_moves_t out;
  if (state.contains(control(core::random_role()))) {
    out[core::random_role()] = {deal(black()), deal(red())};
  } else if (state.contains(control(bluffer()))) {
    if (state.contains(dealt(red()))) {
      out[bluffer()] = {hold(), resign()};
    } else {
      out[bluffer()] = {hold()};
    }
  } else if (state.contains(control(caller()))) {
    out[caller()] = {call(), resign()};
  }
  for (auto& [role, moves] : out) std::sort(moves.begin(), moves.end());
  return out;
}

Interpreter::goals_t Interpreter::get_goals(const core::State& state) const {
  std::optional<int> bluffer_goal;
  if (state.contains(resigned(bluffer()))) {
    bluffer_goal = kBlufferResignGoal;
  } else if (state.contains(resigned(caller()))) {
    bluffer_goal = kCallerResignGoal;
  } else if (state.contains(called())) {
    bluffer_goal = state.contains(dealt(red())) ? kCallOnRedGoal : kCallOnBlackGoal;
  }

  std::optional<int> caller_goal;
  if (bluffer_goal) caller_goal = -*bluffer_goal;
  return {{bluffer(), bluffer_goal}, {caller(), caller_goal}, {core::random_role(), std::nullopt}};
}

bool Interpreter::is_terminal(const core::State& state) const {
  return state.contains(resigned(bluffer())) || state.contains(resigned(caller())) ||
         state.contains(called());
}

core::State Interpreter::get_next_state_impl(const core::State& state,
                                             const core::Turn& turn) const {
  const auto& [role, move] = *turn.begin();
  core::State::facts_t facts = without_control(state);

  if (role == core::random_role()) {
    facts.push_back(dealt());
    facts.push_back(dealt(move.arguments().at(0)));
    facts.push_back(control(bluffer()));
  } else if (role == bluffer()) {
    if (move == hold()) {
      facts.push_back(held());
      facts.push_back(control(caller()));
    } else {
      facts.push_back(resigned(bluffer()));
    }
  } else if (role == caller()) {
    facts.push_back(move == call() ? called() : resigned(caller()));
  } else {
    throw core::IllegalTurnInterpreterError("unexpected role {}", role.to_string());
  }
  return core::State(std::move(facts));
}

}  // namespace minipoker
