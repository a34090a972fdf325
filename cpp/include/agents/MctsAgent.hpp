#pragma once

#include "agents/TreeAgent.hpp"
#include "search/Node.hpp"

#include <string>

namespace agents {

/*
 * Monte Carlo tree search over PerfectInformationNodes. Suited to games where every role sees the
 * whole state.
 *
 * With params.build_book set, prepare_match() spends the start clock on a search::BookBuilder and
 * the playouts stop at the states it solved.
 */
class MctsAgent : public TreeAgent {
 public:
  using TreeAgent::TreeAgent;

  void step() override;
  search::node_id_t decision_node() const override { return root_; }
  std::string name() const override { return "mcts"; }

  search::node_id_t root() const { return root_; }

 protected:
  void init_tree() override;
  void develop(int ply, const core::View& view) override;
  void commit(const core::Move& move) override;
  void reset() override;

 private:
  void build_book();

  search::node_id_t root_ = search::kNullNodeId;
};

}  // namespace agents
