#pragma once

#include "agents/InterpreterAgent.hpp"
#include "agents/TreeAgentParams.hpp"
#include "search/Evaluators.hpp"
#include "search/Node.hpp"
#include "search/NodeArena.hpp"
#include "search/Repeater.hpp"
#include "search/Selectors.hpp"
#include "search/Valuation.hpp"

#include <cstdint>
#include <memory>

namespace agents {

/*
 * Base class of the Monte Carlo tree search agents.
 *
 * calculate_move() runs, in order:
 *
 * 1. develop() the tree to the ply and view received;
 * 2. step() repeatedly for get_timeout_ns() through a search::Repeater;
 * 3. the chooser picks the agent's move at decision_node(), aggregating the options by own move;
 * 4. commit() the move, pruning the tree.
 *
 * Derived classes own the shape of their tree(s) in arena_. Every node is valued from its owner's
 * point of view.
 */
class TreeAgent : public InterpreterAgent {
 public:
  TreeAgent(core::InterpreterFactory interpreter_factory, const TreeAgentParams& params = {},
            std::shared_ptr<const search::Selector> selector = nullptr,
            std::shared_ptr<const search::Selector> chooser = nullptr,
            std::shared_ptr<const search::Evaluator> evaluator = nullptr,
            std::shared_ptr<const search::ValuationFactory> valuation_factory = nullptr);

  void prepare_match(const core::Role& role, const core::Ruleset& ruleset,
                     const core::GameClock::Configuration& start_clock_config,
                     const core::GameClock::Configuration& play_clock_config) override;
  core::Move calculate_move(int ply, int64_t total_time_ns, const core::View& view) override;

  // One simulation: selection, expansion, evaluation and backpropagation.
  virtual void step() = 0;

  // The node the agent's move is chosen at.
  virtual search::node_id_t decision_node() const = 0;

  /*
   * Search budget for a move, given the time left on the play clock and the time already used
   * this move. Spends the per-move allowance (increment plus delay) plus a share of the total
   * time, scaled by time_scale, without getting within min_buffer_ms of the clock expiring. Never
   * negative.
   */
  int64_t get_timeout_ns(int64_t total_time_ns, int64_t used_ns) const;

  const search::NodeArena& arena() const { return arena_; }
  const TreeAgentParams& params() const { return params_; }
  const search::Repeater::Result& last_search() const { return last_search_; }

 protected:
  // Builds the tree(s) at the initial state.
  virtual void init_tree() = 0;
  virtual void develop(int ply, const core::View& view) = 0;
  virtual void commit(const core::Move& move) = 0;

  void reset() override;

  // Merges utility into every ancestor of node_id.
  void backpropagate(search::node_id_t node_id, double utility);

  // The only distinct child of node_id, or node_id itself if it has several or none.
  search::node_id_t descend_if_determinate(search::node_id_t node_id) const;

  void log_options(const search::Node& node) const;

  search::NodeArena arena_;
  TreeAgentParams params_;
  std::shared_ptr<const search::Selector> selector_;
  std::shared_ptr<const search::Selector> chooser_;
  std::shared_ptr<const search::Evaluator> evaluator_;
  std::shared_ptr<const search::ValuationFactory> valuation_factory_;

 private:
  search::Repeater repeater_;
  search::Repeater::Result last_search_;
};

}  // namespace agents
