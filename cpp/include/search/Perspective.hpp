#pragma once

#include "core/Interpreter.hpp"
#include "core/State.hpp"

#include <memory>
#include <random>
#include <utility>
#include <vector>

namespace search {

/*
 * What an observer knows about the current world: either the world itself, or a set of worlds it
 * cannot distinguish.
 *
 * Perspectives do not own the states they refer to; they are views into the node that created
 * them, and must not outlive it.
 */
class Perspective {
 public:
  virtual ~Perspective() = default;

  virtual bool is_deterministic() const = 0;
  virtual size_t world_count() const = 0;
  virtual bool contains(const core::State& state) const = 0;

  // A uniformly chosen world.
  virtual const core::State& sample_state(std::mt19937& prng) const = 0;

  // Every (turn, next state) pair reachable in one ply from any of the worlds, world by world in
  // order.
  virtual core::Interpreter::next_states_t get_next_states(
    const core::Interpreter& interpreter) const = 0;
};

class DeterministicPerspective : public Perspective {
 public:
  explicit DeterministicPerspective(const core::State& state) : state_(state) {}

  bool is_deterministic() const override { return true; }
  size_t world_count() const override { return 1; }
  bool contains(const core::State& state) const override { return state == state_; }
  const core::State& sample_state(std::mt19937&) const override { return state_; }
  core::Interpreter::next_states_t get_next_states(
    const core::Interpreter& interpreter) const override {
    return interpreter.get_all_next_states(state_);
  }

 private:
  const core::State& state_;
};

class PossibleStatesPerspective : public Perspective {
 public:
  explicit PossibleStatesPerspective(const core::StateSet& possible_states);

  bool is_deterministic() const override { return possible_states_.size() == 1; }
  size_t world_count() const override { return possible_states_.size(); }
  bool contains(const core::State& state) const override {
    return possible_states_.contains(state);
  }
  const core::State& sample_state(std::mt19937& prng) const override;
  core::Interpreter::next_states_t get_next_states(
    const core::Interpreter& interpreter) const override;

 private:
  const core::StateSet& possible_states_;
};

}  // namespace search
