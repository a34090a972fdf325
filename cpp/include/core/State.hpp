#pragma once

#include "core/Subrelation.hpp"

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <set>
#include <string>
#include <vector>

namespace core {

/*
 * An immutable set of ground facts. Facts are kept sorted and duplicate-free, so that two
 * constructions of the same world compare and hash equal regardless of insertion order.
 *
 * A View has the same shape: it is the subset of a State's facts that one role observes. A view is
 * consistent with a state s iff s.includes(view).
 */
class State {
 public:
  using facts_t = std::vector<Subrelation>;
  using const_iterator = facts_t::const_iterator;

  State() { init_hash(); }
  explicit State(facts_t facts);
  State(std::initializer_list<Subrelation> facts) : State(facts_t(facts)) {}

  bool contains(const Subrelation& fact) const;
  bool includes(const State& subset) const;

  // Returns a new state, with fact added.
  State with(const Subrelation& fact) const;

  // All facts named name, in order.
  facts_t facts_named(std::string_view name) const;

  const_iterator begin() const { return facts_.begin(); }
  const_iterator end() const { return facts_.end(); }
  size_t size() const { return facts_.size(); }
  bool empty() const { return facts_.empty(); }
  const facts_t& facts() const { return facts_; }

  size_t hash() const { return hash_; }
  std::string to_string() const;

  bool operator==(const State& other) const {
    return hash_ == other.hash_ && facts_ == other.facts_;
  }
  bool operator!=(const State& other) const { return !(*this == other); }
  bool operator<(const State& other) const { return facts_ < other.facts_; }

 private:
  void init_hash();

  facts_t facts_;
  size_t hash_ = 0;
};

using View = State;

// Ordered, so that iteration over a belief state is deterministic.
using StateSet = std::set<State>;

std::string to_string(const StateSet&);

}  // namespace core

namespace std {

template <>
struct hash<core::State> {
  size_t operator()(const core::State& s) const { return s.hash(); }
};

}  // namespace std
