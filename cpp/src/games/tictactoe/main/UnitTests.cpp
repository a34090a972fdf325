#include "core/Exceptions.hpp"
#include "core/State.hpp"
#include "core/Turn.hpp"
#include "games/tictactoe/Interpreter.hpp"
#include "util/GTestUtil.hpp"

#include <gtest/gtest.h>

#include <utility>
#include <vector>

using Interpreter = tictactoe::Interpreter;
using core::State;

namespace {

State play(const Interpreter& interpreter, const std::vector<std::pair<int, int>>& cells) {
  State state = interpreter.get_init_state();
  for (const auto& [row, col] : cells) {
    const core::Role& role = Interpreter::is_in_control(state, Interpreter::x())
                               ? Interpreter::x()
                               : Interpreter::o();
    state = interpreter.get_next_state(state, core::Turn{{role, Interpreter::mark(row, col)}});
  }
  return state;
}

}  // namespace

TEST(tictactoe, init_state) {
  Interpreter interpreter;
  State init = interpreter.get_init_state();
  EXPECT_EQ(init, State{Interpreter::control(Interpreter::x())});
  EXPECT_FALSE(interpreter.is_terminal(init));

  auto legal_moves = interpreter.get_legal_moves(init);
  ASSERT_EQ(legal_moves.size(), 1u);
  EXPECT_EQ(legal_moves.at(Interpreter::x()).size(), 9u);
  EXPECT_TRUE(interpreter.get_legal_moves_by_role(init, Interpreter::o()).empty());

  auto goals = interpreter.get_goals(init);
  EXPECT_FALSE(goals.at(Interpreter::x()).has_value());
  EXPECT_FALSE(goals.at(Interpreter::o()).has_value());
}

TEST(tictactoe, marks_alternate) {
  Interpreter interpreter;
  State state = play(interpreter, {{2, 2}, {1, 1}});
  EXPECT_TRUE(state.contains(Interpreter::cell(2, 2, Interpreter::x())));
  EXPECT_TRUE(state.contains(Interpreter::cell(1, 1, Interpreter::o())));
  EXPECT_TRUE(state.contains(Interpreter::control(Interpreter::x())));
  EXPECT_FALSE(state.contains(Interpreter::control(Interpreter::o())));

  EXPECT_FALSE(interpreter.is_legal(state, Interpreter::x(), Interpreter::mark(2, 2)));
  EXPECT_TRUE(interpreter.is_legal(state, Interpreter::x(), Interpreter::mark(3, 3)));
  EXPECT_EQ(interpreter.get_legal_moves_by_role(state, Interpreter::x()).size(), 7u);

  EXPECT_THROW(
    interpreter.get_next_state(state, core::Turn{{Interpreter::x(), Interpreter::mark(1, 1)}}),
    core::IllegalTurnInterpreterError);
  EXPECT_THROW(
    interpreter.get_next_state(state, core::Turn{{Interpreter::o(), Interpreter::mark(3, 3)}}),
    core::IllegalTurnInterpreterError);
}

TEST(tictactoe, everyone_sees_everything) {
  Interpreter interpreter;
  State state = play(interpreter, {{1, 3}});
  auto sees = interpreter.get_sees(state);
  EXPECT_EQ(sees.at(Interpreter::x()), state);
  EXPECT_EQ(sees.at(Interpreter::o()), state);
}

TEST(tictactoe, three_in_a_row) {
  Interpreter interpreter;

  // x x x
  // o o .
  // . . .
  State state = play(interpreter, {{1, 1}, {2, 1}, {1, 2}, {2, 2}, {1, 3}});
  EXPECT_TRUE(interpreter.is_terminal(state));
  EXPECT_TRUE(interpreter.get_legal_moves(state).empty());
  EXPECT_TRUE(interpreter.get_all_next_states(state).empty());
  EXPECT_EQ(interpreter.get_goal_by_role(state, Interpreter::x()), 100);
  EXPECT_EQ(interpreter.get_goal_by_role(state, Interpreter::o()), 0);

  // x x .
  // o o o
  // x . .
  state = play(interpreter, {{1, 1}, {2, 1}, {1, 2}, {2, 2}, {3, 1}, {2, 3}});
  EXPECT_TRUE(interpreter.is_terminal(state));
  EXPECT_EQ(interpreter.get_goal_by_role(state, Interpreter::x()), 0);
  EXPECT_EQ(interpreter.get_goal_by_role(state, Interpreter::o()), 100);
}

TEST(tictactoe, draw) {
  Interpreter interpreter;

  // x o x
  // x o o
  // o x x
  State state = play(interpreter,
                     {{1, 1}, {1, 2}, {1, 3}, {2, 2}, {2, 1}, {3, 1}, {3, 2}, {2, 3}, {3, 3}});
  EXPECT_TRUE(interpreter.is_terminal(state));
  EXPECT_EQ(interpreter.get_goal_by_role(state, Interpreter::x()), 50);
  EXPECT_EQ(interpreter.get_goal_by_role(state, Interpreter::o()), 50);

  auto ranks = interpreter.get_ranks(state);
  EXPECT_EQ(ranks.at(Interpreter::x()), 0);
  EXPECT_EQ(ranks.at(Interpreter::o()), 0);
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
