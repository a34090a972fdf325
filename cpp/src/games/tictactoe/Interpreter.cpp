#include "games/tictactoe/Interpreter.hpp"

#include "core/Exceptions.hpp"

#include <boost/lexical_cast.hpp>

#include <algorithm>
#include <bit>

namespace tictactoe {

const core::Role& Interpreter::x() {
  static const core::Role role("x");
  return role;
}

const core::Role& Interpreter::o() {
  static const core::Role role("o");
  return role;
}

core::Move Interpreter::mark(int row, int col) {
  return core::Move("cell", {core::Subrelation::number(row), core::Subrelation::number(col)});
}

core::Subrelation Interpreter::cell(int row, int col, const core::Role& role) {
  return core::Subrelation(
    "cell", {core::Subrelation::number(row), core::Subrelation::number(col), role});
}

core::Subrelation Interpreter::control(const core::Role& role) {
  return core::Subrelation("control", {role});
}

Interpreter::roles_t Interpreter::get_roles() const { return {o(), x()}; }

core::State Interpreter::get_init_state() const { return core::State{control(x())}; }

Interpreter::sees_t Interpreter::get_sees(const core::State& state) const {
  return {{x(), state}, {o(), state}};
}

Interpreter::legal_moves_t Interpreter::get_legal_moves(const core::State& state) const {
  legal_moves_t out;
  if (is_terminal(state)) return out;

  Board board = parse(state);
  for (const auto& role : get_roles_in_control(state)) {
    moves_t& moves = out[role];
    for (int row = 1; row <= kBoardDimension; ++row) {
      for (int col = 1; col <= kBoardDimension; ++col) {
        if (!(board.full_mask() & (mask_t(1) << index(row, col)))) {
          moves.push_back(mark(row, col));
        }
      }
    }
    std::sort(moves.begin(), moves.end());
  }
  return out;
}

Interpreter::goals_t Interpreter::get_goals(const core::State& state) const {
  if (!is_terminal(state)) return {{x(), std::nullopt}, {o(), std::nullopt}};

  Board board = parse(state);
  if (has_line(board.x_mask)) return {{x(), kWinGoal}, {o(), kLossGoal}};
  if (has_line(board.o_mask)) return {{x(), kLossGoal}, {o(), kWinGoal}};
  return {{x(), kDrawGoal}, {o(), kDrawGoal}};
}

bool Interpreter::is_terminal(const core::State& state) const {
  Board board = parse(state);
  return has_line(board.x_mask) || has_line(board.o_mask) ||
         std::popcount(board.full_mask()) == kNumCells;
}

core::State Interpreter::get_next_state_impl(const core::State& state,
                                             const core::Turn& turn) const {
  const auto& [role, move] = *turn.begin();
  std::vector<core::Subrelation> args = move.arguments();
  int row = boost::lexical_cast<int>(args[0].to_string());
  int col = boost::lexical_cast<int>(args[1].to_string());

  core::State::facts_t facts;
  for (const auto& fact : state) {
    if (fact.name() != "control") facts.push_back(fact);
  }
  facts.push_back(cell(row, col, role));
  facts.push_back(control(role == x() ? o() : x()));
  return core::State(std::move(facts));
}

Interpreter::Board Interpreter::parse(const core::State& state) {
  Board board;
  for (const auto& fact : state.facts_named("cell")) {
    std::vector<core::Subrelation> args = fact.arguments();
    if (args.size() != 3) {
      throw core::UnsatInterpreterError("malformed fact {}", fact.to_string());
    }
    int row = boost::lexical_cast<int>(args[0].to_string());
    int col = boost::lexical_cast<int>(args[1].to_string());
    mask_t bit = mask_t(1) << index(row, col);
    if (args[2] == x()) {
      board.x_mask |= bit;
    } else {
      board.o_mask |= bit;
    }
  }
  return board;
}

bool Interpreter::has_line(mask_t mask) {
  for (mask_t line : kThreeInARowMasks) {
    if ((line & mask) == line) return true;
  }
  return false;
}

}  // namespace tictactoe
