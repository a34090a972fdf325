#include "search/ImperfectInformationNode.hpp"

#include "search/Exceptions.hpp"
#include "search/NodeArena.hpp"
#include "util/Asserts.hpp"
#include "util/Random.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <unordered_set>

namespace search {

namespace {

core::StateSet sample_states(const core::StateSet& states, size_t count) {
  core::StateSet out;
  std::sample(states.begin(), states.end(), std::inserter(out, out.end()), count,
              util::Random::default_prng());
  return out;
}

}  // namespace

ImperfectInformationNode::ImperfectInformationNode(NodeArena* arena, node_id_t id, NodeKind kind,
                                                   node_id_t parent, int depth,
                                                   const core::Role& role,
                                                   core::StateSet possible_states,
                                                   bool fully_enumerated)
    : Node(arena, id, kind, parent, depth, role),
      possible_states_(std::move(possible_states)),
      fully_enumerated_(fully_enumerated) {
  RELEASE_ASSERT(!possible_states_.empty(), "information set without possible states");
}

size_t ImperfectInformationNode::arity() const {
  if (!has_children()) return 0;
  std::unordered_set<node_id_t> distinct;
  for (const auto& entry : children()) distinct.insert(entry.child);
  return distinct.size();
}

int64_t ImperfectInformationNode::descendant_count() const {
  if (!has_children()) return 0;
  std::unordered_set<node_id_t> visited;
  std::vector<const ImperfectInformationNode*> stack = {this};
  while (!stack.empty()) {
    const ImperfectInformationNode* node = stack.back();
    stack.pop_back();
    if (!node->has_children()) continue;
    for (const auto& entry : node->children()) {
      if (visited.insert(entry.child).second) {
        stack.push_back(&arena().as<ImperfectInformationNode>(entry.child));
      }
    }
  }
  return visited.size();
}

ImperfectInformationNode& ImperfectInformationNode::create(NodeArena& arena, node_id_t parent,
                                                           int depth, const core::Role& role,
                                                           core::StateSet states,
                                                           bool fully_enumerated,
                                                           const core::View& view,
                                                           bool in_control) {
  if (in_control) {
    return arena.emplace<VisibleInformationSetNode>(parent, depth, role, std::move(states),
                                                    fully_enumerated, view);
  }
  return arena.emplace<HiddenInformationSetNode>(parent, depth, role, std::move(states),
                                                 fully_enumerated);
}

bool ImperfectInformationNode::is_expanded() const {
  return has_children() && expanded_worlds_.size() == possible_states_.size();
}

void ImperfectInformationNode::expand(const core::Interpreter& interpreter) {
  if (is_expanded()) return;
  for (const auto& world : possible_states_) {
    if (!expanded_worlds_.contains(world)) add_transitions(interpreter, world);
  }
}

void ImperfectInformationNode::expand_world(const core::Interpreter& interpreter,
                                            const core::State& world) {
  if (expanded_worlds_.contains(world)) return;
  RELEASE_ASSERT(possible_states_.contains(world), "{} is not a world of node {}",
                 world.to_string(), id());
  add_transitions(interpreter, world);
}

void ImperfectInformationNode::add_transitions(const core::Interpreter& interpreter,
                                               const core::State& world) {
  if (!has_children()) set_children({});

  for (auto& [turn, next_state] : interpreter.get_all_next_states(world)) {
    core::Turn key_turn = kind() == NodeKind::kVisible ? turn.restrict(role()) : turn;
    ChildEntry entry{ChildKey{world, std::move(key_turn)}, turn, next_state, kNullNodeId};
    if (!is_committed(entry)) continue;

    const core::Move* move = turn.find(role());
    bucket_key_t key(move ? std::optional<core::Move>(*move) : std::nullopt,
                     core::Interpreter::is_in_control(next_state, role()),
                     interpreter.get_sees_by_role(next_state, role()));
    auto it = buckets_.find(key);
    if (it == buckets_.end()) {
      const auto& [own_move, in_control, view] = key;
      auto& child = create(arena(), id(), depth() + 1, role(), core::StateSet{next_state},
                           fully_enumerated_, view, in_control);
      child.history_ = history_;
      if (own_move) child.history_.turns[depth()] = core::Turn{{role(), *own_move}};
      if (in_control) child.history_.views[depth() + 1][role()] = view;
      it = buckets_.emplace(std::move(key), child.id()).first;
    } else {
      arena().as<ImperfectInformationNode>(it->second).possible_states_.insert(next_state);
    }
    entry.child = it->second;
    add_child(std::move(entry));
  }
  expanded_worlds_.insert(world);
}

void ImperfectInformationNode::trim() {
  if (!has_children()) return;

  remove_children_if([&](const ChildEntry& entry) {
    return !possible_states_.contains(*entry.key.state) || !is_committed(entry);
  });

  std::map<node_id_t, core::StateSet> reachable;
  for (const auto& entry : children()) {
    reachable[entry.child].insert(entry.next_state);
  }
  std::erase_if(buckets_, [&](const auto& item) { return !reachable.contains(item.second); });
  for (const auto& [child_id, states] : reachable) {
    arena().as<ImperfectInformationNode>(child_id).restrict_possible_states(states);
  }
}

void ImperfectInformationNode::restrict_possible_states(const core::StateSet& allowed) {
  core::StateSet narrowed;
  std::set_intersection(possible_states_.begin(), possible_states_.end(), allowed.begin(),
                        allowed.end(), std::inserter(narrowed, narrowed.end()));
  RELEASE_ASSERT(!narrowed.empty(), "restricting node {} would leave no possible state", id());
  if (narrowed.size() == possible_states_.size()) return;

  possible_states_ = std::move(narrowed);
  std::erase_if(expanded_worlds_,
                [&](const core::State& world) { return !possible_states_.contains(world); });
  trim();
}

void ImperfectInformationNode::set_sample(const core::StateSet& sample) {
  mark_sampled();
  restrict_possible_states(sample);
}

void ImperfectInformationNode::mark_sampled() {
  if (!fully_enumerated_) return;
  fully_enumerated_ = false;
  if (!has_children()) return;
  for (const auto& entry : children()) {
    arena().as<ImperfectInformationNode>(entry.child).mark_sampled();
  }
}

node_id_t ImperfectInformationNode::develop(const core::Interpreter& interpreter, int ply,
                                            const core::View& view) {
  RELEASE_ASSERT(ply >= depth(), "cannot develop node at depth {} back to ply {}", depth(), ply);

  core::Record observations = history_;
  if (move() && ply > depth()) observations.turns[depth()] = core::Turn{{role(), *move()}};
  observations.views[ply][role()] = view;

  node_id_t node_id;
  if (ply == depth()) {
    node_id = develop_here(interpreter, view);
    if (node_id == kNullNodeId) node_id = resample(interpreter, ply, view, observations);
  } else {
    trim();
    std::optional<node_id_t> found = develop_through_tree(interpreter, ply, view);
    node_id = found ? *found : develop_through_developments(interpreter, ply, view, observations);
  }

  auto& node = arena().as<ImperfectInformationNode>(node_id);
  node.history_ = std::move(observations);
  if (node.possible_states_.size() > kMaxPossibleStates) {
    node.set_sample(sample_states(node.possible_states_, kMaxPossibleStates));
  }
  return node_id;
}

std::unique_ptr<Perspective> ImperfectInformationNode::perspective() const {
  return std::make_unique<PossibleStatesPerspective>(possible_states_);
}

std::set<core::Role> ImperfectInformationNode::roles_in_control(const core::State* world) const {
  return core::Interpreter::get_roles_in_control(world ? *world : *possible_states_.begin());
}

core::StateSet ImperfectInformationNode::consistent_states(const core::Interpreter& interpreter,
                                                           const core::View& view,
                                                           const core::StateSet& states) const {
  core::StateSet out;
  for (const auto& state : states) {
    if (interpreter.get_sees_by_role(state, role()) == view) out.insert(state);
  }
  return out;
}

// kNullNodeId if the node is sampled and none of its worlds sees view.
node_id_t ImperfectInformationNode::develop_here(const core::Interpreter& interpreter,
                                                 const core::View& view) {
  if (has_observed(view)) return id();

  core::StateSet consistent = consistent_states(interpreter, view, possible_states_);
  if (consistent.empty()) {
    if (!fully_enumerated_) return kNullNodeId;
    throw DevelopmentMismatchError("view {} is inconsistent with every world of node {} at ply {}",
                                   view.to_string(), id(), depth());
  }
  observe(view);
  restrict_possible_states(consistent);
  trim();
  return id();
}

std::optional<node_id_t> ImperfectInformationNode::develop_through_tree(
  const core::Interpreter& interpreter, int ply, const core::View& view) {
  std::vector<node_id_t> frontier = {id()};
  for (int d = depth(); d < ply; ++d) {
    std::vector<node_id_t> next;
    std::unordered_set<node_id_t> seen;
    for (node_id_t node_id : frontier) {
      auto& node = arena().as<ImperfectInformationNode>(node_id);
      if (!node.fully_enumerated_) return std::nullopt;
      node.expand(interpreter);
      for (const auto& entry : node.children()) {
        if (seen.insert(entry.child).second) next.push_back(entry.child);
      }
    }
    if (next.size() > kMaxDevelopFrontier) return std::nullopt;
    frontier = std::move(next);
  }

  struct Candidate {
    node_id_t id;
    core::StateSet states;
  };
  std::vector<Candidate> candidates;
  for (node_id_t node_id : frontier) {
    auto& node = arena().as<ImperfectInformationNode>(node_id);
    core::StateSet states = consistent_states(interpreter, view, node.possible_states_);
    if (!states.empty()) candidates.push_back(Candidate{node_id, std::move(states)});
  }

  if (candidates.empty()) {
    throw DevelopmentMismatchError("view {} at ply {} is unreachable from node {}",
                                   view.to_string(), ply, id());
  }
  if (candidates.size() == 1) {
    auto& node = arena().as<ImperfectInformationNode>(candidates[0].id);
    node.observe(view);
    node.restrict_possible_states(candidates[0].states);
    node.trim();
    return node.id();
  }

  core::StateSet merged;
  for (auto& candidate : candidates) merged.merge(candidate.states);
  return merge(interpreter, ply, view, std::move(merged), true);
}

node_id_t ImperfectInformationNode::develop_through_developments(
  const core::Interpreter& interpreter, int ply, const core::View& view,
  const core::Record& observations) {
  core::Record record;
  record.possible_states[depth()] = possible_states_;
  record.views[ply][role()] = view;
  if (move()) {
    record.turns[depth()] = core::Turn{{role(), *move()}};
  }

  core::StateSet states;
  interpreter.for_each_development(record, [&](const core::Development& development) {
    states.insert(development.back().state);
    return true;
  });
  if (states.empty()) {
    if (!fully_enumerated_) return resample(interpreter, ply, view, observations);
    throw DevelopmentMismatchError(
      "no development from node {} is consistent with view {} at ply {}", id(), view.to_string(),
      ply);
  }

  // Keep the subtree's node at ply if it alone holds the developed worlds.
  std::optional<node_id_t> holder;
  bool unique = true;
  for (node_id_t node_id : nodes_at(ply)) {
    const auto& node = arena().as<ImperfectInformationNode>(node_id);
    bool intersects = std::any_of(states.begin(), states.end(), [&](const core::State& state) {
      return node.possible_states_.contains(state);
    });
    if (!intersects) continue;
    if (holder) {
      unique = false;
      break;
    }
    holder = node_id;
  }

  if (holder && unique) {
    auto& node = arena().as<ImperfectInformationNode>(*holder);
    if (std::includes(node.possible_states_.begin(), node.possible_states_.end(), states.begin(),
                      states.end())) {
      node.observe(view);
      if (!fully_enumerated_) node.mark_sampled();
      node.restrict_possible_states(states);
      node.trim();
      return node.id();
    }
  }
  return merge(interpreter, ply, view, std::move(states), fully_enumerated_);
}

node_id_t ImperfectInformationNode::resample(const core::Interpreter& interpreter, int ply,
                                             const core::View& view,
                                             const core::Record& observations) {
  core::Record record = observations;
  record.possible_states[0] = core::StateSet{interpreter.get_init_state()};

  core::StateSet states;
  bool complete = true;
  interpreter.for_each_development(record, [&](const core::Development& development) {
    states.insert(development.back().state);
    if (states.size() < kMaxPossibleStates) return true;
    complete = false;
    return false;
  });
  if (states.empty()) {
    throw DevelopmentMismatchError("no world at ply {} agrees with what {} has observed: {}", ply,
                                   role().to_string(), record.to_string());
  }
  return merge(interpreter, ply, view, std::move(states), complete);
}

node_id_t ImperfectInformationNode::merge(const core::Interpreter& interpreter, int ply,
                                          const core::View& view, core::StateSet states,
                                          bool fully_enumerated) {
  bool in_control = core::Interpreter::is_in_control(*states.begin(), role());
  for (const auto& state : states) {
    RELEASE_ASSERT(core::Interpreter::is_in_control(state, role()) == in_control,
                   "control of {} differs across worlds sharing view {}", role().to_string(),
                   view.to_string());
  }
  return create(arena(), kNullNodeId, ply, role(), std::move(states), fully_enumerated, view,
                in_control)
    .id();
}

std::vector<node_id_t> ImperfectInformationNode::nodes_at(int ply) const {
  std::vector<node_id_t> frontier = {id()};
  for (int d = depth(); d < ply && !frontier.empty(); ++d) {
    std::vector<node_id_t> next;
    std::unordered_set<node_id_t> seen;
    for (node_id_t node_id : frontier) {
      const Node& node = arena()[node_id];
      if (!node.has_children()) continue;
      for (const auto& entry : node.children()) {
        if (seen.insert(entry.child).second) next.push_back(entry.child);
      }
    }
    if (next.size() > kMaxDevelopFrontier) return {};
    frontier = std::move(next);
  }
  return frontier;
}

VisibleInformationSetNode::VisibleInformationSetNode(NodeArena* arena, node_id_t id,
                                                     node_id_t parent, int depth,
                                                     const core::Role& role,
                                                     core::StateSet possible_states,
                                                     bool fully_enumerated,
                                                     std::optional<core::View> view)
    : ImperfectInformationNode(arena, id, NodeKind::kVisible, parent, depth, role,
                               std::move(possible_states), fully_enumerated),
      view_(std::move(view)) {}

bool VisibleInformationSetNode::is_view_consistent(const core::Interpreter& interpreter) const {
  if (!view_) return true;
  return std::all_of(possible_states().begin(), possible_states().end(), [&](const auto& state) {
    return interpreter.get_sees_by_role(state, role()) == *view_;
  });
}

std::string VisibleInformationSetNode::to_string() const {
  return fmt::format("{} view={}", Node::to_string(), view_ ? view_->to_string() : "-");
}

bool VisibleInformationSetNode::is_committed(const ChildEntry& entry) const {
  return !move() || entry.key.turn.contains(role(), *move());
}

HiddenInformationSetNode::HiddenInformationSetNode(NodeArena* arena, node_id_t id,
                                                   node_id_t parent, int depth,
                                                   const core::Role& role,
                                                   core::StateSet possible_states,
                                                   bool fully_enumerated)
    : ImperfectInformationNode(arena, id, NodeKind::kHidden, parent, depth, role,
                               std::move(possible_states), fully_enumerated) {}

}  // namespace search
