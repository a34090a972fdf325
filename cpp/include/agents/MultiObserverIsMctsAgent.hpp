#pragma once

#include "agents/TreeAgent.hpp"
#include "core/State.hpp"
#include "core/Subrelation.hpp"
#include "search/Node.hpp"

#include <map>
#include <string>
#include <utility>

namespace agents {

/*
 * Multi-observer information-set MCTS: one tree of ImperfectInformationNodes per role (the chance
 * role excepted), each from its role's point of view.
 *
 * A simulation samples one world of the agent's own root, and finds in every other tree the node
 * describing that same world, so that all trees agree on the world for the whole simulation. The
 * trees then descend in lockstep: each role in control picks its move with the selector at its own
 * node, the chance role moves uniformly, and every tree follows the resulting joint turn.
 *
 * The other roles' trees are rooted at the last ply at which the agent could tell which of their
 * nodes it is in. Below that, the node for a world is located through the interpreter's
 * developments, and cached until the next develop().
 */
class MultiObserverIsMctsAgent : public TreeAgent {
 public:
  using trees_t = std::map<core::Role, search::node_id_t>;

  // The nodes one simulation reached, and the world they agree on.
  struct Selection {
    trees_t nodes;
    core::State state;
  };

  using TreeAgent::TreeAgent;

  void step() override;
  search::node_id_t decision_node() const override { return trees_.at(role()); }
  std::string name() const override { return "mo-ismcts"; }

  // Selection phase of step().
  Selection select();

  const trees_t& trees() const { return trees_; }

 protected:
  void init_tree() override;
  void develop(int ply, const core::View& view) override;
  void commit(const core::Move& move) override;
  void reset() override;

 private:
  using location_key_t = std::pair<core::Role, core::State>;

  // The node of other_role's tree describing world at the depth of the agent's own root.
  search::node_id_t locate(const core::Role& other_role, const core::State& world);

  // Reroots other_role's tree at ply if a single node there can hold the agent's own worlds.
  void advance(const core::Role& other_role, int ply);

  void sweep();

  trees_t trees_;
  std::map<int, core::View> views_;
  std::map<int, core::Move> moves_;
  std::map<location_key_t, search::node_id_t> locations_;
};

}  // namespace agents
