#include "agents/SoIsMctsAgent.hpp"

#include "search/ImperfectInformationNode.hpp"
#include "util/Random.hpp"

#include <algorithm>
#include <vector>

namespace agents {

void SoIsMctsAgent::step() {
  const core::Interpreter& interp = interpreter();
  std::mt19937& prng = util::Random::default_prng();

  search::node_id_t node_id = root_;
  core::State world = arena_[root_].perspective()->sample_state(prng);

  while (true) {
    const auto& node = arena_.as<search::ImperfectInformationNode>(node_id);
    if (!node.has_expanded(world)) break;

    const search::Node::children_t& entries = node.children();
    bool has_world = std::any_of(entries.begin(), entries.end(),
                                 [&](const search::ChildEntry& entry) {
                                   return *entry.key.state == world;
                                 });
    if (!has_world) break;

    search::ChildKey key = selector_->select(node, &world);
    std::vector<size_t> matching;
    for (size_t i = 0; i < entries.size(); ++i) {
      if (entries[i].key == key) matching.push_back(i);
    }
    const search::ChildEntry& entry = entries[*util::Random::uniform_choice(prng, matching.begin(),
                                                                           matching.end())];
    world = entry.next_state;
    node_id = entry.child;
  }

  // Only the sampled world is expanded: the leaf may hold many more.
  auto& leaf = arena_.as<search::ImperfectInformationNode>(node_id);
  leaf.expand_world(interp, world);
  double utility = leaf.evaluate(interp, *evaluator_, *valuation_factory_, &world);
  backpropagate(node_id, utility);
}

void SoIsMctsAgent::init_tree() {
  const core::Interpreter& interp = interpreter();
  core::State init_state = interp.get_init_state();
  core::View view = interp.get_sees_by_role(init_state, role());
  bool in_control = core::Interpreter::is_in_control(init_state, role());
  root_ = search::ImperfectInformationNode::create(arena_, search::kNullNodeId, 0, role(),
                                                   {init_state}, true, view, in_control)
            .id();
}

void SoIsMctsAgent::develop(int ply, const core::View& view) {
  root_ = arena_[root_].develop(interpreter(), ply, view);
  arena_.reroot(root_);
}

void SoIsMctsAgent::commit(const core::Move& move) {
  search::Node& root = arena_[root_];
  root.set_move(move);
  root.trim();
  root_ = arena_.reroot(descend_if_determinate(root_));
}

void SoIsMctsAgent::reset() {
  TreeAgent::reset();
  root_ = search::kNullNodeId;
}

}  // namespace agents
