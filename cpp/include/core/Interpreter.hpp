#pragma once

#include "core/Record.hpp"
#include "core/State.hpp"
#include "core/Subrelation.hpp"
#include "core/Turn.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <utility>
#include <vector>

namespace core {

/*
 * The boundary between the search core and the rules of a game.
 *
 * A concrete Interpreter answers seven primitive queries (the pure virtual methods below). All the
 * other queries are derived from those, and may be overridden where a concrete interpreter has a
 * cheaper way to answer them.
 *
 * Every method is const: an Interpreter may be shared by several agents. Any caching layer is the
 * concrete interpreter's responsibility, including its locking.
 *
 * Queries that cannot be answered throw a core::InterpreterError.
 */
class Interpreter {
 public:
  using roles_t = std::vector<Role>;
  using sees_t = std::map<Role, View>;
  using moves_t = std::vector<Move>;
  using legal_moves_t = std::map<Role, moves_t>;
  using goals_t = std::map<Role, std::optional<int>>;
  using ranks_t = std::map<Role, int>;
  using next_states_t = std::vector<std::pair<Turn, State>>;
  using developments_t = std::vector<Development>;

  // Return false to stop the enumeration.
  using development_visitor_t = std::function<bool(const Development&)>;

  virtual ~Interpreter() = default;

  // Sorted.
  virtual roles_t get_roles() const = 0;
  virtual State get_init_state() const = 0;

  // Throws IllegalTurnInterpreterError unless turn has exactly one legal move for each role in
  // control of state.
  State get_next_state(const State& state, const Turn& turn) const;

  virtual sees_t get_sees(const State& state) const = 0;

  // Legal moves, sorted, for every role that has any. A view can stand in for the state when it
  // contains everything legality depends on.
  virtual legal_moves_t get_legal_moves(const State& state) const = 0;

  // nullopt for roles without a goal in state (all roles while non-terminal, the chance role
  // always).
  virtual goals_t get_goals(const State& state) const = 0;

  virtual bool is_terminal(const State& state) const = 0;

  virtual View get_sees_by_role(const State& state, const Role& role) const;
  virtual moves_t get_legal_moves_by_role(const State& state, const Role& role) const;
  bool is_legal(const State& state, const Role& role, const Move& move) const;
  std::optional<int> get_goal_by_role(const State& state, const Role& role) const;

  /*
   * Every (turn, next state) pair reachable from state by one joint move of the roles in control,
   * in a deterministic order: roles sorted, and for each role its moves sorted, with the first role
   * varying slowest. Empty iff state is terminal.
   */
  virtual next_states_t get_all_next_states(const State& state) const;

  /*
   * Competition ranking of the roles with a goal: rank 0 is best, and tied roles share the rank of
   * the best of them.
   */
  ranks_t get_ranks(const State& state) const;

  /*
   * Enumerates every development consistent with record, from record.offset() to
   * record.horizon(), in a deterministic order.
   *
   * The start of the enumeration is record.possible_states at the offset, or the initial state if
   * the record pins nothing at an offset of 0. A development never passes through a terminal state
   * before the horizon. A turn pinned in the record may be partial, in which case it constrains
   * only the roles it mentions.
   */
  virtual void for_each_development(const Record& record,
                                    const development_visitor_t& visitor) const;

  developments_t get_developments(const Record& record) const;

  // Roles named by the control/1 facts of state.
  static std::set<Role> get_roles_in_control(const State& state);
  static bool is_in_control(const State& state, const Role& role);

 protected:
  // Called by get_next_state() once the turn has been validated.
  virtual State get_next_state_impl(const State& state, const Turn& turn) const = 0;

 private:
  bool develop_from(const Record& record, int ply, const State& state, Development& development,
                    const development_visitor_t& visitor) const;
  bool is_consistent(const Record& record, int ply, const State& state) const;
};

using InterpreterPtr = std::shared_ptr<const Interpreter>;

}  // namespace core
