#pragma once

#include "core/Interpreter.hpp"
#include "core/State.hpp"
#include "core/Subrelation.hpp"
#include "core/Turn.hpp"
#include "games/tictactoe/Constants.hpp"

#include <optional>

namespace tictactoe {

constexpr mask_t make_mask(int a, int b, int c) {
  return (mask_t(1) << a) + (mask_t(1) << b) + (mask_t(1) << c);
}

/*
 * Roles x and o, x moving first. A state holds control(x) or control(o), plus a cell(r,c,p) fact
 * for every occupied cell (r and c in 1..3, p the occupant). Blank cells have no fact. The role in
 * control plays cell(r,c) on a blank cell.
 *
 * Three in a row scores 100 against 0, a full board without one 50 each. Both roles see the whole
 * state.
 *
 * Bit order encoding for the board:
 *
 * 0 1 2
 * 3 4 5
 * 6 7 8
 */
class Interpreter : public core::Interpreter {
 public:
  static const core::Role& x();
  static const core::Role& o();

  // The move marking cell (row, col).
  static core::Move mark(int row, int col);

  // The fact for cell (row, col) occupied by role.
  static core::Subrelation cell(int row, int col, const core::Role& role);

  static core::Subrelation control(const core::Role& role);

  roles_t get_roles() const override;
  core::State get_init_state() const override;
  sees_t get_sees(const core::State& state) const override;
  legal_moves_t get_legal_moves(const core::State& state) const override;
  goals_t get_goals(const core::State& state) const override;
  bool is_terminal(const core::State& state) const override;

 protected:
  core::State get_next_state_impl(const core::State& state,
                                  const core::Turn& turn) const override;

 private:
  struct Board {
    mask_t x_mask = 0;
    mask_t o_mask = 0;

    mask_t full_mask() const { return x_mask | o_mask; }
  };

  static Board parse(const core::State& state);
  static bool has_line(mask_t mask);
  static int index(int row, int col) { return (row - 1) * kBoardDimension + (col - 1); }

  static constexpr mask_t kThreeInARowMasks[] = {
    make_mask(0, 1, 2), make_mask(3, 4, 5), make_mask(6, 7, 8), make_mask(0, 3, 6),
    make_mask(1, 4, 7), make_mask(2, 5, 8), make_mask(0, 4, 8), make_mask(2, 4, 6)};
};

}  // namespace tictactoe
