#pragma once

#include "agents/TreeAgent.hpp"
#include "search/Node.hpp"

#include <string>

namespace agents {

/*
 * Single-observer information-set MCTS: one tree of ImperfectInformationNodes, from the agent's own
 * point of view.
 *
 * Every simulation samples one world of the root's information set and follows it down the tree:
 * only the entries originating from the current world are eligible, and the world advances to the
 * next state of the entry taken. The other roles are modelled by the same selector, acting on the
 * agent's own statistics. The node where the world leaves the tree expands that world only, so the
 * cost of a simulation does not grow with the size of the information sets.
 */
class SoIsMctsAgent : public TreeAgent {
 public:
  using TreeAgent::TreeAgent;

  void step() override;
  search::node_id_t decision_node() const override { return root_; }
  std::string name() const override { return "sois-mcts"; }

  search::node_id_t root() const { return root_; }

 protected:
  void init_tree() override;
  void develop(int ply, const core::View& view) override;
  void commit(const core::Move& move) override;
  void reset() override;

 private:
  search::node_id_t root_ = search::kNullNodeId;
};

}  // namespace agents
