#pragma once

#include "core/State.hpp"
#include "core/Subrelation.hpp"
#include "core/Turn.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace core {

// One step of a development: the state at a ply, and the turn taken from it (absent at the last
// step).
struct DevelopmentStep {
  State state;
  std::optional<Turn> turn;

  bool operator==(const DevelopmentStep&) const = default;
};

/*
 * A concrete playthrough from Record::offset() to Record::horizon(), consistent with a Record. The
 * step at index i describes ply offset + i.
 */
using Development = std::vector<DevelopmentStep>;

/*
 * Partial evidence about a match: for some plies the set of states the world may be in, for some
 * plies the views some roles received, for some plies (possibly partial) turns.
 *
 * A ply missing from possible_states is unconstrained. A ply present in possible_states with a
 * single state pins the world at that ply.
 */
struct Record {
  std::map<int, StateSet> possible_states;
  std::map<int, std::map<Role, View>> views;
  std::map<int, Turn> turns;

  // Smallest ply mentioned anywhere. 0 if nothing is mentioned.
  int offset() const;

  // Largest ply mentioned anywhere. 0 if nothing is mentioned.
  int horizon() const;

  std::string to_string() const;
};

}  // namespace core
