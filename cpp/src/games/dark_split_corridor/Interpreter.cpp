#include "games/dark_split_corridor/Interpreter.hpp"

#include "core/Exceptions.hpp"

#include <algorithm>
#include <deque>

namespace dark_split_corridor {

const core::Role& Interpreter::left() {
  static const core::Role role("left");
  return role;
}

const core::Role& Interpreter::right() {
  static const core::Role role("right");
  return role;
}

const core::Role& Interpreter::other(const core::Role& role) {
  return role == left() ? right() : left();
}

std::string Interpreter::cell(int col, int row) {
  return std::string{char('a' + col), char('1' + row)};
}

std::string Interpreter::crossing(const std::string& cell1, const std::string& cell2) {
  return cell1 < cell2 ? cell1 + "-" + cell2 : cell2 + "-" + cell1;
}

core::Move Interpreter::move(const std::string& direction) {
  return core::Move("move", {core::Subrelation(direction)});
}

core::Move Interpreter::block(const std::string& crossing) {
  return core::Move("block", {core::Subrelation(crossing)});
}

core::Subrelation Interpreter::control(const core::Role& role) {
  return core::Subrelation("control", {role});
}

core::Subrelation Interpreter::at(const core::Role& role, const std::string& cell) {
  return core::Subrelation("at", {role, core::Subrelation(cell)});
}

core::Subrelation Interpreter::border(const core::Role& role, const std::string& crossing) {
  return core::Subrelation("border", {role, core::Subrelation(crossing)});
}

core::Subrelation Interpreter::revealed(const core::Role& role, const std::string& crossing) {
  return core::Subrelation("revealed", {role, core::Subrelation(crossing)});
}

const std::vector<std::string>& Interpreter::blockable_crossings() {
  static const std::vector<std::string> crossings = [] {
    std::vector<std::string> out;
    for (int col = 0; col < kNumCols; ++col) {
      for (int row = 0; row + 1 < kNumRows; ++row) {
        out.push_back(crossing(cell(col, row), cell(col, row + 1)));
      }
    }
    for (int row = 0; row + 1 < kNumRows; ++row) {
      for (int col = 0; col + 1 < kNumCols; ++col) {
        out.push_back(crossing(cell(col, row), cell(col + 1, row)));
      }
    }
    std::sort(out.begin(), out.end());
    return out;
  }();
  return crossings;
}

const std::vector<std::string>& Interpreter::directions() {
  static const std::vector<std::string> out = {"east", "north", "south", "west"};
  return out;
}

std::optional<Interpreter::Position> Interpreter::Position::neighbor(
  const std::string& direction) const {
  Position next = *this;
  if (direction == "north") {
    ++next.row;
  } else if (direction == "south") {
    --next.row;
  } else if (direction == "east") {
    ++next.col;
  } else if (direction == "west") {
    --next.col;
  }
  if (next.col < 0 || next.col >= kNumCols || next.row < 0 || next.row >= kNumRows) {
    return std::nullopt;
  }
  return next;
}

Interpreter::roles_t Interpreter::get_roles() const { return {left(), right()}; }

core::State Interpreter::get_init_state() const {
  return core::State{at(left(), "b1"), at(right(), "b1"), control(left())};
}

Interpreter::sees_t Interpreter::get_sees(const core::State& state) const {
  sees_t out;
  for (const auto& role : get_roles()) {
    core::State::facts_t facts;
    for (const auto& fact : state) {
      std::string_view name = fact.name();
      if (name == "control" || name == "at") {
        facts.push_back(fact);
        continue;
      }
      std::vector<core::Subrelation> args = fact.arguments();
      if (name == "revealed" && args[0] == role) {
        facts.push_back(fact);
      } else if (name == "border" &&
                 (args[0] != role || state.contains(revealed(role, args[1].to_string())))) {
        facts.push_back(fact);
      }
    }
    out.emplace(role, core::View(std::move(facts)));
  }
  return out;
}

Interpreter::legal_moves_t Interpreter::get_legal_moves(const core::State& state) const {
  legal_moves_t out;
  for (const auto& role : get_roles_in_control(state)) {
    Board own = parse(state, role);
    Board opponent = parse(state, other(role));
    moves_t& moves = out[role];

    for (const auto& direction : directions()) {
      std::optional<Position> next = own.position.neighbor(direction);
      if (!next) continue;
      if (own.revealed.contains(crossing(own.position.cell(), next->cell()))) continue;
      moves.push_back(move(direction));
    }

    for (const auto& candidate : blockable_crossings()) {
      if (opponent.borders.contains(candidate)) continue;
      if (!can_finish(opponent.position, opponent.borders, candidate)) continue;
      moves.push_back(block(candidate));
    }
    std::sort(moves.begin(), moves.end());
  }
  return out;
}

Interpreter::goals_t Interpreter::get_goals(const core::State& state) const {
  if (!is_terminal(state)) return {{left(), std::nullopt}, {right(), std::nullopt}};

  bool left_finished = parse(state, left()).position.is_finished();
  bool right_finished = parse(state, right()).position.is_finished();
  if (left_finished && right_finished) return {{left(), kDrawGoal}, {right(), kDrawGoal}};
  if (left_finished) return {{left(), kWinGoal}, {right(), kLossGoal}};
  return {{left(), kLossGoal}, {right(), kWinGoal}};
}

bool Interpreter::is_terminal(const core::State& state) const {
  return parse(state, left()).position.is_finished() ||
         parse(state, right()).position.is_finished();
}

core::State Interpreter::get_next_state_impl(const core::State& state,
                                             const core::Turn& turn) const {
  const auto& [role, played] = *turn.begin();
  Board own = parse(state, role);

  core::State::facts_t facts;
  for (const auto& fact : state) {
    if (fact.name() != "control") facts.push_back(fact);
  }
  facts.push_back(control(other(role)));

  std::string argument = played.arguments().at(0).to_string();
  if (played.name() == "block") {
    facts.push_back(border(other(role), argument));
    return core::State(std::move(facts));
  }

  std::optional<Position> next = own.position.neighbor(argument);
  if (!next) {
    throw core::IllegalTurnInterpreterError("{} cannot move {} from {}", role.to_string(),
                                            argument, own.position.cell());
  }
  std::string crossed = crossing(own.position.cell(), next->cell());
  if (own.borders.contains(crossed)) {
    facts.push_back(revealed(role, crossed));
  } else {
    std::replace(facts.begin(), facts.end(), at(role, own.position.cell()),
                 at(role, next->cell()));
  }
  return core::State(std::move(facts));
}

Interpreter::Board Interpreter::parse(const core::State& state, const core::Role& role) {
  std::optional<Position> position;
  Board board{};
  for (const auto& fact : state) {
    std::string_view name = fact.name();
    if (name != "at" && name != "border" && name != "revealed") continue;
    std::vector<core::Subrelation> args = fact.arguments();
    if (args.size() != 2 || args[0] != role) continue;

    if (name == "at") {
      position = parse_cell(args[1].to_string());
    } else if (name == "border") {
      board.borders.insert(args[1].to_string());
    } else {
      board.revealed.insert(args[1].to_string());
    }
  }
  if (!position) {
    throw core::UnsatInterpreterError("no position for {} in {}", role.to_string(),
                                      state.to_string());
  }
  board.position = *position;
  return board;
}

Interpreter::Position Interpreter::parse_cell(const std::string& cell) {
  if (cell.size() != 2 || cell[0] < 'a' || cell[0] >= 'a' + kNumCols || cell[1] < '1' ||
      cell[1] >= '1' + kNumRows) {
    throw core::UnsatInterpreterError("malformed cell {}", cell);
  }
  return Position{cell[0] - 'a', cell[1] - '1'};
}

bool Interpreter::can_finish(const Position& position, const std::set<std::string>& borders,
                             const std::string& extra_border) {
  std::set<std::string> visited = {position.cell()};
  std::deque<Position> queue = {position};
  while (!queue.empty()) {
    Position current = queue.front();
    queue.pop_front();
    if (current.is_finished()) return true;
    for (const auto& direction : directions()) {
      std::optional<Position> next = current.neighbor(direction);
      if (!next || visited.contains(next->cell())) continue;
      std::string crossed = crossing(current.cell(), next->cell());
      if (crossed == extra_border || borders.contains(crossed)) continue;
      visited.insert(next->cell());
      queue.push_back(*next);
    }
  }
  return false;
}

}  // namespace dark_split_corridor
