#pragma once

#include "core/Record.hpp"
#include "search/Node.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <tuple>
#include <vector>

namespace search {

/*
 * A node describing what its owner believes at one ply: the set of worlds consistent with
 * everything the owner has observed so far.
 *
 * Children are grouped by what the owner can observe of a transition (its own move, whether it is
 * in control next, and what it sees next), so that worlds the owner cannot tell apart share one
 * child. That child is referenced by every entry leading to it, one entry per originating world and
 * joint turn. Children where the owner is in control are VisibleInformationSetNodes, the others
 * HiddenInformationSetNodes.
 *
 * Worlds are expanded one at a time: expand_world() adds the transitions out of a single world,
 * expand() those of every world not expanded yet.
 *
 * develop() keeps at most kMaxPossibleStates worlds. Past that it keeps a uniform sample, and the
 * node is no longer fully_enumerated(). Developing a sampled node always goes through the
 * interpreter's developments, and if none of the sampled worlds explains the new view, the belief is
 * rebuilt from the initial state and every observation of the owner so far.
 */
class ImperfectInformationNode : public Node {
 public:
  // Bound on the number of nodes develop() will track at one ply before giving up on the tree and
  // enumerating developments instead.
  static constexpr size_t kMaxDevelopFrontier = 4096;

  // Bound on the number of worlds develop() leaves in the node it returns.
  static constexpr size_t kMaxPossibleStates = 256;

  const core::StateSet& possible_states() const { return possible_states_; }

  // Whether possible_states() is the complete set of consistent worlds, rather than a sample.
  bool fully_enumerated() const { return fully_enumerated_; }

  // The owner's views and own moves up to this node's ply, as far as the node knows them.
  const core::Record& history() const { return history_; }

  // Number of distinct children.
  size_t arity() const;

  // Number of distinct nodes in the subtree, this node excluded.
  int64_t descendant_count() const;

  bool is_expanded() const override;
  bool has_expanded(const core::State& world) const { return expanded_worlds_.contains(world); }

  void expand(const core::Interpreter& interpreter) override;

  // Adds the transitions out of world, one of possible_states(). No-op if already done.
  void expand_world(const core::Interpreter& interpreter, const core::State& world);

  void trim() override;
  node_id_t develop(const core::Interpreter& interpreter, int ply,
                    const core::View& view) override;

  std::unique_ptr<Perspective> perspective() const override;
  std::set<core::Role> roles_in_control(const core::State* world = nullptr) const override;

  /*
   * Narrows possible_states() to its intersection with allowed, which must not be empty, then
   * trims. Children left with fewer worlds are narrowed in turn.
   */
  void restrict_possible_states(const core::StateSet& allowed);

  // Narrows possible_states() to sample and marks the node, and its subtree, as sampled.
  void set_sample(const core::StateSet& sample);

  // Every world sees exactly the node's view (trivially true for nodes without a view).
  virtual bool is_view_consistent(const core::Interpreter& interpreter) const { return true; }

  /*
   * Creates the node describing states for role at depth: a VisibleInformationSetNode observing
   * view if role is in control, else a HiddenInformationSetNode.
   */
  static ImperfectInformationNode& create(NodeArena& arena, node_id_t parent, int depth,
                                          const core::Role& role, core::StateSet states,
                                          bool fully_enumerated, const core::View& view,
                                          bool in_control);

 protected:
  ImperfectInformationNode(NodeArena* arena, node_id_t id, NodeKind kind, node_id_t parent,
                           int depth, const core::Role& role, core::StateSet possible_states,
                           bool fully_enumerated);

  // Whether entry agrees with the owner's committed move.
  virtual bool is_committed(const ChildEntry& entry) const { return true; }

  virtual bool has_observed(const core::View& view) const { return false; }
  virtual void observe(const core::View& view) {}

 private:
  // What the owner can observe of a transition: its own move, whether it is in control next, and
  // what it sees next.
  using bucket_key_t = std::tuple<std::optional<core::Move>, bool, core::View>;

  void add_transitions(const core::Interpreter& interpreter, const core::State& world);

  // Clears fully_enumerated() here and below. A sampled node only has sampled descendants.
  void mark_sampled();
  core::StateSet consistent_states(const core::Interpreter& interpreter, const core::View& view,
                                   const core::StateSet& states) const;
  node_id_t develop_here(const core::Interpreter& interpreter, const core::View& view);
  std::optional<node_id_t> develop_through_tree(const core::Interpreter& interpreter, int ply,
                                                const core::View& view);
  node_id_t develop_through_developments(const core::Interpreter& interpreter, int ply,
                                         const core::View& view, const core::Record& observations);
  node_id_t resample(const core::Interpreter& interpreter, int ply, const core::View& view,
                     const core::Record& observations);
  node_id_t merge(const core::Interpreter& interpreter, int ply, const core::View& view,
                  core::StateSet states, bool fully_enumerated);

  // The distinct nodes of the subtree at ply, or nothing if there are more than
  // kMaxDevelopFrontier of them. Does not expand anything.
  std::vector<node_id_t> nodes_at(int ply) const;

  core::StateSet possible_states_;
  core::StateSet expanded_worlds_;
  std::map<bucket_key_t, node_id_t> buckets_;
  core::Record history_;
  bool fully_enumerated_;
};

/*
 * An information set at which the owner is in control. The owner's legal moves are the same in
 * every world, and children are keyed by (world, owner's move).
 */
class VisibleInformationSetNode : public ImperfectInformationNode {
 public:
  VisibleInformationSetNode(NodeArena* arena, node_id_t id, node_id_t parent, int depth,
                            const core::Role& role, core::StateSet possible_states,
                            bool fully_enumerated, std::optional<core::View> view = std::nullopt);

  const std::optional<core::View>& view() const { return view_; }

  bool is_view_consistent(const core::Interpreter& interpreter) const override;
  std::string to_string() const override;

 protected:
  bool is_committed(const ChildEntry& entry) const override;
  bool has_observed(const core::View& view) const override { return view_ == view; }
  void observe(const core::View& view) override { view_ = view; }

 private:
  std::optional<core::View> view_;
};

/*
 * An information set at which the owner is not in control. Children are keyed by (world, joint
 * turn).
 */
class HiddenInformationSetNode : public ImperfectInformationNode {
 public:
  HiddenInformationSetNode(NodeArena* arena, node_id_t id, node_id_t parent, int depth,
                           const core::Role& role, core::StateSet possible_states,
                           bool fully_enumerated);
};

}  // namespace search
