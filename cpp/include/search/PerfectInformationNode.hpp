#pragma once

#include "search/Node.hpp"

#include <optional>

namespace search {

/*
 * A node whose world is known: one state, and the joint turn that led to it (absent at a root).
 */
class PerfectInformationNode : public Node {
 public:
  PerfectInformationNode(NodeArena* arena, node_id_t id, node_id_t parent, int depth,
                         const core::Role& role, core::State state,
                         std::optional<core::Turn> turn = std::nullopt);

  const core::State& state() const { return state_; }
  const std::optional<core::Turn>& turn() const { return turn_; }

  void expand(const core::Interpreter& interpreter) override;
  void trim() override;

  /*
   * The walk follows already expanded children along the first development consistent with view,
   * and creates parentless nodes where the tree has not been grown.
   */
  node_id_t develop(const core::Interpreter& interpreter, int ply,
                    const core::View& view) override;

  std::unique_ptr<Perspective> perspective() const override;
  std::set<core::Role> roles_in_control(const core::State* world = nullptr) const override;

 private:
  core::State state_;
  std::optional<core::Turn> turn_;
};

}  // namespace search
