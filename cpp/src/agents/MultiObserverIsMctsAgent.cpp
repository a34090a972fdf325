#include "agents/MultiObserverIsMctsAgent.hpp"

#include "search/Exceptions.hpp"
#include "search/ImperfectInformationNode.hpp"
#include "util/Asserts.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <algorithm>
#include <optional>
#include <unordered_set>
#include <vector>

namespace agents {

void MultiObserverIsMctsAgent::step() {
  const core::Interpreter& interp = interpreter();
  Selection selection = select();

  std::vector<core::Role> roles;
  for (const auto& [tree_role, node_id] : selection.nodes) {
    arena_[node_id].expand(interp);
    roles.push_back(tree_role);
  }

  search::Evaluator::utilities_t utilities =
    evaluator_->evaluate_all(selection.state, roles, interp);
  for (const auto& [tree_role, node_id] : selection.nodes) {
    double utility = utilities.at(tree_role);
    arena_[node_id].propagate(utility, *valuation_factory_);
    backpropagate(node_id, utility);
  }
}

MultiObserverIsMctsAgent::Selection MultiObserverIsMctsAgent::select() {
  const core::Interpreter& interp = interpreter();
  const core::Role& own_role = role();
  std::mt19937& prng = util::Random::default_prng();

  Selection selection;
  selection.state = arena_[trees_.at(own_role)].perspective()->sample_state(prng);
  for (const auto& [tree_role, root_id] : trees_) {
    selection.nodes[tree_role] =
      tree_role == own_role ? root_id : locate(tree_role, selection.state);
  }

  while (!interp.is_terminal(selection.state)) {
    bool all_expanded =
      std::all_of(selection.nodes.begin(), selection.nodes.end(),
                  [&](const auto& item) { return arena_[item.second].is_expanded(); });
    if (!all_expanded) break;

    core::Turn::plays_t plays;
    for (const auto& in_control : core::Interpreter::get_roles_in_control(selection.state)) {
      auto it = selection.nodes.find(in_control);
      if (it == selection.nodes.end()) {
        core::Interpreter::moves_t moves =
          interp.get_legal_moves_by_role(selection.state, in_control);
        plays.emplace_back(in_control,
                           *util::Random::uniform_choice(prng, moves.begin(), moves.end()));
      } else {
        search::ChildKey key = selector_->select(arena_[it->second], &selection.state);
        plays.emplace_back(in_control, key.turn.at(in_control));
      }
    }
    core::Turn turn(std::move(plays));

    std::optional<core::State> next_state;
    for (auto& [tree_role, node_id] : selection.nodes) {
      const search::Node& node = arena_[node_id];
      int index = node.find(&selection.state, turn);
      RELEASE_ASSERT(index >= 0, "node {} of {} has no entry for {} in {}", node_id,
                     tree_role.to_string(), turn.to_string(), selection.state.to_string());
      const search::ChildEntry& entry = node.children()[index];
      node_id = entry.child;
      next_state = entry.next_state;
    }
    selection.state = std::move(*next_state);
  }
  return selection;
}

void MultiObserverIsMctsAgent::init_tree() {
  const core::Interpreter& interp = interpreter();
  core::State init_state = interp.get_init_state();
  for (const auto& tree_role : interp.get_roles()) {
    if (tree_role == core::random_role()) continue;
    core::View view = interp.get_sees_by_role(init_state, tree_role);
    bool in_control = core::Interpreter::is_in_control(init_state, tree_role);
    trees_[tree_role] =
      search::ImperfectInformationNode::create(arena_, search::kNullNodeId, 0, tree_role,
                                               core::StateSet{init_state}, true, view, in_control)
        .id();
  }
  RELEASE_ASSERT(trees_.contains(role()), "{} is not a role of the game", role().to_string());
}

void MultiObserverIsMctsAgent::develop(int ply, const core::View& view) {
  views_[ply] = view;

  search::node_id_t& own_root = trees_.at(role());
  own_root = arena_[own_root].develop(interpreter(), ply, view);
  arena_.detach(own_root);

  for (const auto& [tree_role, root_id] : trees_) {
    if (tree_role != role()) advance(tree_role, ply);
  }
  locations_.clear();
  sweep();
}

void MultiObserverIsMctsAgent::commit(const core::Move& move) {
  search::node_id_t& own_root = trees_.at(role());
  search::Node& root = arena_[own_root];
  moves_[root.depth()] = move;
  root.set_move(move);
  root.trim();

  own_root = descend_if_determinate(own_root);
  arena_.detach(own_root);
  locations_.clear();
  sweep();
}

void MultiObserverIsMctsAgent::reset() {
  TreeAgent::reset();
  trees_.clear();
  views_.clear();
  moves_.clear();
  locations_.clear();
}

search::node_id_t MultiObserverIsMctsAgent::locate(const core::Role& other_role,
                                                   const core::State& world) {
  const core::Interpreter& interp = interpreter();
  search::node_id_t root_id = trees_.at(other_role);
  const auto& root = arena_.as<search::ImperfectInformationNode>(root_id);
  int from = root.depth();
  int to = arena_[trees_.at(role())].depth();

  if (from == to) {
    if (root.possible_states().contains(world)) return root_id;
    throw search::DevelopmentMismatchError("{}'s tree at ply {} does not hold {}",
                                           other_role.to_string(), to, world.to_string());
  }

  location_key_t key(other_role, world);
  auto it = locations_.find(key);
  if (it != locations_.end()) return it->second;

  core::Record record;
  record.possible_states[from] = root.possible_states();
  record.possible_states[to] = core::StateSet{world};
  for (auto v = views_.lower_bound(from); v != views_.end() && v->first <= to; ++v) {
    record.views[v->first][role()] = v->second;
  }
  for (auto m = moves_.lower_bound(from); m != moves_.end() && m->first < to; ++m) {
    record.turns[m->first] = core::Turn{{role(), m->second}};
  }

  core::Interpreter::developments_t developments = interp.get_developments(record);
  if (developments.empty()) {
    throw search::DevelopmentMismatchError("{} is unreachable from {}'s tree at ply {}",
                                           world.to_string(), other_role.to_string(), from);
  }
  const core::Development& development =
    *util::Random::uniform_choice(developments.begin(), developments.end());

  search::node_id_t node_id = root_id;
  for (size_t k = 0; k + 1 < development.size(); ++k) {
    search::Node& node = arena_[node_id];
    node.expand(interp);
    int index = node.find(&development[k].state, *development[k].turn);
    RELEASE_ASSERT(index >= 0, "node {} of {} has no entry for {} at ply {}", node_id,
                   other_role.to_string(), development[k].turn->to_string(), from + k);
    node_id = node.children()[index].child;
  }

  locations_.emplace(std::move(key), node_id);
  return node_id;
}

void MultiObserverIsMctsAgent::advance(const core::Role& other_role, int ply) {
  search::node_id_t root_id = trees_.at(other_role);
  if (arena_[root_id].depth() >= ply) return;

  std::vector<search::node_id_t> frontier = {root_id};
  for (int depth = arena_[root_id].depth(); depth < ply; ++depth) {
    std::vector<search::node_id_t> next;
    std::unordered_set<search::node_id_t> seen;
    for (search::node_id_t node_id : frontier) {
      const search::Node& node = arena_[node_id];
      if (!node.is_expanded()) return;
      for (const auto& entry : node.children()) {
        if (seen.insert(entry.child).second) next.push_back(entry.child);
      }
    }
    if (next.size() > search::ImperfectInformationNode::kMaxDevelopFrontier) return;
    frontier = std::move(next);
  }

  const core::StateSet& own_states =
    arena_.as<search::ImperfectInformationNode>(trees_.at(role())).possible_states();
  std::optional<search::node_id_t> found;
  for (search::node_id_t node_id : frontier) {
    const core::StateSet& states =
      arena_.as<search::ImperfectInformationNode>(node_id).possible_states();
    bool intersects = std::any_of(own_states.begin(), own_states.end(),
                                  [&](const auto& state) { return states.contains(state); });
    if (!intersects) continue;
    if (found) return;
    found = node_id;
  }
  if (!found) return;

  const core::StateSet& states =
    arena_.as<search::ImperfectInformationNode>(*found).possible_states();
  if (!std::includes(states.begin(), states.end(), own_states.begin(), own_states.end())) return;

  LOG_DEBUG("{} rerooted the tree of {} at ply {} (node {})", name(), other_role.to_string(), ply,
            *found);
  trees_[other_role] = *found;
  arena_.detach(*found);
}

void MultiObserverIsMctsAgent::sweep() {
  std::vector<search::node_id_t> roots;
  for (const auto& [tree_role, root_id] : trees_) roots.push_back(root_id);
  arena_.sweep(roots);
}

}  // namespace agents
