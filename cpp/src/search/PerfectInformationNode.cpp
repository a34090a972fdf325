#include "search/PerfectInformationNode.hpp"

#include "search/Exceptions.hpp"
#include "search/NodeArena.hpp"
#include "util/Asserts.hpp"

namespace search {

PerfectInformationNode::PerfectInformationNode(NodeArena* arena, node_id_t id, node_id_t parent,
                                               int depth, const core::Role& role,
                                               core::State state, std::optional<core::Turn> turn)
    : Node(arena, id, NodeKind::kPerfect, parent, depth, role),
      state_(std::move(state)),
      turn_(std::move(turn)) {}

void PerfectInformationNode::expand(const core::Interpreter& interpreter) {
  if (is_expanded()) return;

  core::Interpreter::next_states_t next_states = perspective()->get_next_states(interpreter);
  children_t entries;
  entries.reserve(next_states.size());
  for (auto& [turn, next_state] : next_states) {
    auto& child = arena().emplace<PerfectInformationNode>(id(), depth() + 1, role(), next_state,
                                                          turn);
    entries.push_back(ChildEntry{ChildKey{std::nullopt, turn}, turn, next_state, child.id()});
  }
  set_children(std::move(entries));
  trim();
}

void PerfectInformationNode::trim() {
  if (!is_expanded() || !move()) return;
  const core::Move& move = *this->move();
  remove_children_if(
    [&](const ChildEntry& entry) { return !entry.turn.contains(role(), move); });
}

node_id_t PerfectInformationNode::develop(const core::Interpreter& interpreter, int ply,
                                          const core::View& view) {
  RELEASE_ASSERT(ply >= depth(), "cannot develop node at depth {} back to ply {}", depth(), ply);
  if (ply == depth()) {
    if (interpreter.get_sees_by_role(state_, role()) != view) {
      throw DevelopmentMismatchError("view {} is inconsistent with state {} at ply {}",
                                     view.to_string(), state_.to_string(), ply);
    }
    trim();
    return id();
  }

  core::Record record;
  record.possible_states[depth()] = {state_};
  record.views[ply][role()] = view;
  if (move()) {
    record.turns[depth()] = core::Turn{{role(), *move()}};
  }

  std::optional<core::Development> development;
  interpreter.for_each_development(record, [&](const core::Development& d) {
    development = d;
    return false;
  });
  if (!development) {
    throw DevelopmentMismatchError(
      "no development from ply {} is consistent with view {} at ply {}", depth(), view.to_string(),
      ply);
  }

  node_id_t current = id();
  bool in_tree = true;
  for (size_t k = 0; k + 1 < development->size(); ++k) {
    const core::Turn& turn = *(*development)[k].turn;
    const core::State& next_state = (*development)[k + 1].state;
    if (in_tree) {
      auto& node = arena().as<PerfectInformationNode>(current);
      if (node.is_expanded()) {
        int index = node.find(nullptr, turn);
        if (index >= 0) {
          current = node.children()[index].child;
          continue;
        }
      }
      in_tree = false;
    }
    current = arena()
                .emplace<PerfectInformationNode>(kNullNodeId, depth() + k + 1, role(), next_state,
                                                 turn)
                .id();
  }
  return current;
}

std::unique_ptr<Perspective> PerfectInformationNode::perspective() const {
  return std::make_unique<DeterministicPerspective>(state_);
}

std::set<core::Role> PerfectInformationNode::roles_in_control(const core::State* world) const {
  return core::Interpreter::get_roles_in_control(world ? *world : state_);
}

}  // namespace search
