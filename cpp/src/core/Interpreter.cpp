#include "core/Interpreter.hpp"

#include "core/Exceptions.hpp"
#include "util/Asserts.hpp"

#include <algorithm>

namespace core {

State Interpreter::get_next_state(const State& state, const Turn& turn) const {
  std::set<Role> in_control = get_roles_in_control(state);
  if (turn.size() != in_control.size()) {
    throw IllegalTurnInterpreterError("turn {} does not match the roles in control of {}",
                                      turn.to_string(), state.to_string());
  }
  legal_moves_t legal_moves = get_legal_moves(state);
  for (const auto& [role, move] : turn) {
    auto it = legal_moves.find(role);
    if (!in_control.contains(role) || it == legal_moves.end() ||
        !std::binary_search(it->second.begin(), it->second.end(), move)) {
      throw IllegalTurnInterpreterError("illegal play {}: {} in {}", role.to_string(),
                                        move.to_string(), state.to_string());
    }
  }
  return get_next_state_impl(state, turn);
}

View Interpreter::get_sees_by_role(const State& state, const Role& role) const {
  sees_t sees = get_sees(state);
  auto it = sees.find(role);
  if (it == sees.end()) return View();
  return it->second;
}

Interpreter::moves_t Interpreter::get_legal_moves_by_role(const State& state,
                                                          const Role& role) const {
  legal_moves_t legal_moves = get_legal_moves(state);
  auto it = legal_moves.find(role);
  if (it == legal_moves.end()) return {};
  return it->second;
}

bool Interpreter::is_legal(const State& state, const Role& role, const Move& move) const {
  moves_t moves = get_legal_moves_by_role(state, role);
  return std::binary_search(moves.begin(), moves.end(), move);
}

std::optional<int> Interpreter::get_goal_by_role(const State& state, const Role& role) const {
  goals_t goals = get_goals(state);
  auto it = goals.find(role);
  if (it == goals.end()) return std::nullopt;
  return it->second;
}

Interpreter::next_states_t Interpreter::get_all_next_states(const State& state) const {
  next_states_t out;
  if (is_terminal(state)) return out;

  std::set<Role> in_control = get_roles_in_control(state);
  legal_moves_t legal_moves = get_legal_moves(state);

  std::vector<std::pair<Role, const moves_t*>> axes;
  for (const auto& role : in_control) {
    auto it = legal_moves.find(role);
    if (it == legal_moves.end() || it->second.empty()) {
      throw UnsatInterpreterError("role {} is in control of {} but has no legal move",
                                  role.to_string(), state.to_string());
    }
    axes.emplace_back(role, &it->second);
  }

  // Odometer over the moves of every role in control; the last axis varies fastest.
  std::vector<size_t> index(axes.size(), 0);
  while (true) {
    Turn::plays_t plays;
    plays.reserve(axes.size());
    for (size_t a = 0; a < axes.size(); ++a) {
      plays.emplace_back(axes[a].first, (*axes[a].second)[index[a]]);
    }
    Turn turn(std::move(plays));
    State next = get_next_state_impl(state, turn);
    out.emplace_back(std::move(turn), std::move(next));

    int a = static_cast<int>(axes.size()) - 1;
    for (; a >= 0; --a) {
      if (++index[a] < axes[a].second->size()) break;
      index[a] = 0;
    }
    if (a < 0) break;
  }
  return out;
}

Interpreter::ranks_t Interpreter::get_ranks(const State& state) const {
  goals_t goals = get_goals(state);
  ranks_t ranks;
  for (const auto& [role, goal] : goals) {
    if (!goal) continue;
    int rank = 0;
    for (const auto& [other_role, other_goal] : goals) {
      if (other_goal && *other_goal > *goal) ++rank;
    }
    ranks[role] = rank;
  }
  return ranks;
}

void Interpreter::for_each_development(const Record& record,
                                       const development_visitor_t& visitor) const {
  int offset = record.offset();

  StateSet starts;
  auto it = record.possible_states.find(offset);
  if (it != record.possible_states.end()) {
    starts = it->second;
  } else {
    RELEASE_ASSERT(offset == 0, "cannot enumerate developments from unknown states at ply {}",
                   offset);
    starts.insert(get_init_state());
  }

  Development development;
  for (const auto& state : starts) {
    if (!develop_from(record, offset, state, development, visitor)) return;
  }
}

Interpreter::developments_t Interpreter::get_developments(const Record& record) const {
  developments_t out;
  for_each_development(record, [&](const Development& development) {
    out.push_back(development);
    return true;
  });
  return out;
}

std::set<Role> Interpreter::get_roles_in_control(const State& state) {
  std::set<Role> out;
  for (const auto& fact : state.facts_named("control")) {
    std::vector<Subrelation> args = fact.arguments();
    if (args.size() == 1) out.insert(args[0]);
  }
  return out;
}

bool Interpreter::is_in_control(const State& state, const Role& role) {
  return state.contains(Subrelation("control", {role}));
}

bool Interpreter::develop_from(const Record& record, int ply, const State& state,
                               Development& development,
                               const development_visitor_t& visitor) const {
  if (!is_consistent(record, ply, state)) return true;

  if (ply == record.horizon()) {
    development.push_back({state, std::nullopt});
    bool proceed = visitor(development);
    development.pop_back();
    return proceed;
  }

  auto pinned = record.turns.find(ply);
  for (auto& [turn, next] : get_all_next_states(state)) {
    if (pinned != record.turns.end() && !turn.includes(pinned->second)) continue;

    development.push_back({state, turn});
    bool proceed = develop_from(record, ply + 1, next, development, visitor);
    development.pop_back();
    if (!proceed) return false;
  }
  return true;
}

bool Interpreter::is_consistent(const Record& record, int ply, const State& state) const {
  auto states_it = record.possible_states.find(ply);
  if (states_it != record.possible_states.end() && !states_it->second.contains(state)) {
    return false;
  }

  auto views_it = record.views.find(ply);
  if (views_it != record.views.end()) {
    sees_t sees = get_sees(state);
    for (const auto& [role, view] : views_it->second) {
      auto it = sees.find(role);
      const View empty;
      if ((it == sees.end() ? empty : it->second) != view) return false;
    }
  }
  return true;
}

}  // namespace core
