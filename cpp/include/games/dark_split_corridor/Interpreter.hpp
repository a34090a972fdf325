#pragma once

#include "core/Interpreter.hpp"
#include "core/State.hpp"
#include "core/Subrelation.hpp"
#include "core/Turn.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace dark_split_corridor {

const int kNumCols = 3;
const int kNumRows = 4;

const int kWinGoal = 100;
const int kDrawGoal = 50;
const int kLossGoal = 0;

/*
 * Roles left and right race their pawns from b1 to row 4, each on its own 3x4 board (cells a1 to
 * c4). The roles alternate, left first. The role in control either moves its pawn one cell
 * (move(north), move(east), move(south), move(west)) or places a border on a crossing of the
 * opponent's board (block(a2-a3)). A crossing is named after the two cells it separates, in
 * lexicographic order.
 *
 * Borders are invisible to the role they hinder. Running into one leaves the pawn in place and
 * reveals it (revealed(role, crossing)), after which that move is no longer legal. A border may not
 * be placed on a crossing of row 4, on a crossing already blocked, or where it would cut the
 * opponent off from row 4.
 *
 * Every role sees control, both pawns, the borders it placed and the borders it revealed. The game
 * ends when a pawn reaches row 4: 100 against 0, or 50 each if both are there.
 */
class Interpreter : public core::Interpreter {
 public:
  static const core::Role& left();
  static const core::Role& right();
  static const core::Role& other(const core::Role& role);

  // "a1" for (0, 0).
  static std::string cell(int col, int row);
  static std::string crossing(const std::string& cell1, const std::string& cell2);

  static core::Move move(const std::string& direction);
  static core::Move block(const std::string& crossing);

  static core::Subrelation control(const core::Role& role);
  static core::Subrelation at(const core::Role& role, const std::string& cell);
  static core::Subrelation border(const core::Role& role, const std::string& crossing);
  static core::Subrelation revealed(const core::Role& role, const std::string& crossing);

  // The crossings a border may be placed on.
  static const std::vector<std::string>& blockable_crossings();

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
  struct Position {
    int col;
    int row;

    std::string cell() const { return Interpreter::cell(col, row); }
    std::optional<Position> neighbor(const std::string& direction) const;
    bool is_finished() const { return row == kNumRows - 1; }
  };

  // What a state (or a view holding control and both pawns) says about role.
  struct Board {
    Position position;
    std::set<std::string> borders;   // crossings blocked for role
    std::set<std::string> revealed;  // crossings role ran into
  };

  static Board parse(const core::State& state, const core::Role& role);
  static Position parse_cell(const std::string& cell);

  // Whether a pawn at position can reach row 4 without crossing borders or extra_border.
  static bool can_finish(const Position& position, const std::set<std::string>& borders,
                         const std::string& extra_border);

  static const std::vector<std::string>& directions();
};

}  // namespace dark_split_corridor
