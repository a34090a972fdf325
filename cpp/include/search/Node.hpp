#pragma once

#include "core/Interpreter.hpp"
#include "core/State.hpp"
#include "core/Subrelation.hpp"
#include "core/Turn.hpp"
#include "search/Perspective.hpp"
#include "search/Valuation.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace search {

using node_id_t = int64_t;
constexpr node_id_t kNullNodeId = -1;

class Evaluator;
class NodeArena;

/*
 * Key of a child in its parent's children list:
 *
 * - PerfectInformationNode: no state, the joint turn.
 * - VisibleInformationSetNode: the originating world, and a turn holding the owner's move only.
 * - HiddenInformationSetNode: the originating world, and the joint turn.
 */
struct ChildKey {
  std::optional<core::State> state;
  core::Turn turn;

  bool operator==(const ChildKey&) const = default;
  std::string to_string() const;
};

/*
 * One transition out of a node. Several entries may share a key (at a visible node, when other
 * roles move simultaneously) and several keys may share a child (worlds the owner cannot tell
 * apart afterwards).
 */
struct ChildEntry {
  ChildKey key;
  core::Turn turn;  // full joint turn
  core::State next_state;
  node_id_t child;
};

enum class NodeKind : int8_t { kPerfect, kVisible, kHidden };

/*
 * Base class of the search tree nodes. Nodes live in a NodeArena and refer to each other by
 * node_id_t: a node owns its subtree through its children list, and its parent id is a
 * back-reference only.
 *
 * children() is absent until the node is first expanded, and empty for a terminal node. depth()
 * is the ply the node describes.
 */
class Node {
 public:
  using children_t = std::vector<ChildEntry>;

  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;
  virtual ~Node() = default;

  NodeKind kind() const { return kind_; }
  node_id_t id() const { return id_; }
  node_id_t parent() const { return parent_; }
  bool is_root() const { return parent_ == kNullNodeId; }
  int depth() const { return depth_; }
  const core::Role& role() const { return role_; }

  // Longest path to an expanded-but-childless descendant. 0 for an unexpanded node.
  int height() const;

  // Whether every next step is in children(). A node may hold children before that, see
  // ImperfectInformationNode::expand_world().
  virtual bool is_expanded() const { return children_.has_value(); }
  bool is_terminal() const { return is_expanded() && children_->empty(); }
  bool has_children() const { return children_.has_value(); }
  const children_t& children() const;

  Node& child(const ChildEntry& entry) const;

  const std::optional<core::Move>& move() const { return move_; }
  void set_move(const core::Move& move) { move_ = move; }

  const Valuation* valuation() const { return valuation_.get(); }
  void set_valuation(std::unique_ptr<Valuation> valuation) { valuation_ = std::move(valuation); }

  // Creates the valuation through factory if absent, else merges utility into it.
  void propagate(double utility, const ValuationFactory& factory);

  /*
   * Populates children() with every distinguishable next step. No-op if already expanded.
   */
  virtual void expand(const core::Interpreter& interpreter) = 0;

  /*
   * Estimates the utility of this node for its owner, merges it into the node's valuation and
   * returns it. The world evaluated is world if given (it must be one of the node's worlds),
   * otherwise a uniformly sampled one.
   */
  double evaluate(const core::Interpreter& interpreter, const Evaluator& evaluator,
                  const ValuationFactory& valuation_factory, const core::State* world = nullptr);

  /*
   * Discards the children inconsistent with what is known at this node, in particular with the
   * committed move(). Idempotent.
   */
  virtual void trim() = 0;

  /*
   * Advances to ply, given that the owner now observes view. Returns the node describing the
   * current position, which is not necessarily this node nor attached to this node's tree. Throws
   * DevelopmentMismatchError if no world is consistent with view.
   */
  virtual node_id_t develop(const core::Interpreter& interpreter, int ply,
                            const core::View& view) = 0;

  // expand() this node and each of its children.
  void fill(const core::Interpreter& interpreter);

  virtual std::unique_ptr<Perspective> perspective() const = 0;

  // Roles in control of world, or of this node's worlds when world is null.
  virtual std::set<core::Role> roles_in_control(const core::State* world = nullptr) const = 0;
  bool is_in_control(const core::State* world = nullptr) const;

  // Only the chance role is in control.
  bool is_chance(const core::State* world = nullptr) const;

  // Index of the first entry with key, or -1.
  int find(const ChildKey& key) const;

  // Index of the entry for world (ignored at perfect-information nodes) and the joint turn, or -1.
  int find(const core::State* world, const core::Turn& turn) const;

  virtual std::string to_string() const;

 protected:
  Node(NodeArena* arena, node_id_t id, NodeKind kind, node_id_t parent, int depth,
       const core::Role& role);

  void set_children(children_t children) { children_ = std::move(children); }
  void add_child(ChildEntry entry);

  // Removes the entries matching pred. Returns true if any was removed.
  bool remove_children_if(const std::function<bool(const ChildEntry&)>& pred);

  NodeArena& arena() const { return *arena_; }

 private:
  friend class NodeArena;

  NodeArena* arena_;
  node_id_t id_;
  NodeKind kind_;
  node_id_t parent_;
  int depth_;
  core::Role role_;

  std::optional<children_t> children_;
  std::unique_ptr<Valuation> valuation_;
  std::optional<core::Move> move_;
};

}  // namespace search
