#include "search/Node.hpp"

#include "search/Evaluators.hpp"
#include "search/NodeArena.hpp"
#include "util/Asserts.hpp"
#include "util/Random.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <unordered_set>

namespace search {

std::string ChildKey::to_string() const {
  if (!state) return turn.to_string();
  return fmt::format("({}, {})", state->to_string(), turn.to_string());
}

Node::Node(NodeArena* arena, node_id_t id, NodeKind kind, node_id_t parent, int depth,
           const core::Role& role)
    : arena_(arena), id_(id), kind_(kind), parent_(parent), depth_(depth), role_(role) {
  RELEASE_ASSERT(depth_ >= 0, "negative depth {}", depth_);
}

int Node::height() const {
  if (!has_children()) return 0;
  int height = 0;
  std::unordered_set<node_id_t> visited;
  for (const auto& entry : *children_) {
    if (!visited.insert(entry.child).second) continue;
    height = std::max(height, 1 + child(entry).height());
  }
  return height;
}

const Node::children_t& Node::children() const {
  RELEASE_ASSERT(children_.has_value(), "node {} is not expanded", id_);
  return *children_;
}

Node& Node::child(const ChildEntry& entry) const { return arena()[entry.child]; }

void Node::add_child(ChildEntry entry) {
  if (!children_) children_.emplace();
  children_->push_back(std::move(entry));
}

void Node::propagate(double utility, const ValuationFactory& factory) {
  if (valuation_) {
    valuation_->propagate(utility);
  } else {
    valuation_ = factory.make(utility);
  }
}

double Node::evaluate(const core::Interpreter& interpreter, const Evaluator& evaluator,
                      const ValuationFactory& valuation_factory, const core::State* world) {
  std::unique_ptr<Perspective> view = perspective();
  if (world) {
    RELEASE_ASSERT(view->contains(*world), "{} is not a world of node {}", world->to_string(),
                   id_);
  } else {
    world = &view->sample_state(util::Random::default_prng());
  }
  double utility = evaluator.evaluate(*world, role_, interpreter);
  propagate(utility, valuation_factory);
  return utility;
}

void Node::fill(const core::Interpreter& interpreter) {
  expand(interpreter);
  for (const auto& entry : *children_) {
    child(entry).expand(interpreter);
  }
}

bool Node::is_in_control(const core::State* world) const {
  return roles_in_control(world).contains(role_);
}

bool Node::is_chance(const core::State* world) const {
  std::set<core::Role> roles = roles_in_control(world);
  return roles.size() == 1 && *roles.begin() == core::random_role();
}

int Node::find(const ChildKey& key) const {
  const children_t& entries = children();
  for (size_t i = 0; i < entries.size(); ++i) {
    if (entries[i].key == key) return i;
  }
  return -1;
}

int Node::find(const core::State* world, const core::Turn& turn) const {
  const children_t& entries = children();
  for (size_t i = 0; i < entries.size(); ++i) {
    const ChildEntry& entry = entries[i];
    if (entry.turn != turn) continue;
    if (world && entry.key.state && *entry.key.state != *world) continue;
    return i;
  }
  return -1;
}

bool Node::remove_children_if(const std::function<bool(const ChildEntry&)>& pred) {
  children_t& entries = *children_;
  auto it = std::remove_if(entries.begin(), entries.end(), pred);
  bool removed = it != entries.end();
  entries.erase(it, entries.end());
  return removed;
}

std::string Node::to_string() const {
  std::string valuation = valuation_ ? valuation_->to_string() : "-";
  return fmt::format("node {} depth={} role={} valuation={}", id_, depth_, role_.to_string(),
                     valuation);
}

}  // namespace search
