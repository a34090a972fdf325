#pragma once

#include "core/State.hpp"
#include "core/Subrelation.hpp"
#include "search/Node.hpp"

#include <cstdint>
#include <functional>
#include <numbers>
#include <optional>
#include <vector>

namespace search {

/*
 * Picks one of a node's children, by key.
 *
 * The options a selector picks among depend on what the caller knows:
 *
 * - At a perfect-information node, or when a determinization (one of the node's worlds) is given,
 *   each distinct key is an option, and only the entries originating from the determinization are
 *   eligible.
 * - Otherwise entries are grouped by key turn, which at a visible node is the owner's own move.
 *   The key of such an option carries no state.
 *
 * An option's statistics aggregate the valuations of the distinct children it leads to. Ties go to
 * the option listed first.
 */
class Selector {
 public:
  struct Option {
    ChildKey key;
    std::vector<node_id_t> children;
    int64_t playouts = 0;
    double mean = 0;  // meaningless if playouts == 0

    bool visited() const { return playouts > 0; }
  };
  using options_t = std::vector<Option>;

  virtual ~Selector() = default;

  // Throws util::Exception if node has no eligible child.
  ChildKey select(const Node& node, const core::State* determinization = nullptr) const;

  /*
   * Picks the move of role among the options of node grouped by role's own move. Used to choose
   * the real move, where several keys (worlds, or other roles' moves) can share the move.
   */
  core::Move choose_move(const Node& node, const core::Role& role) const;

  static options_t options(const Node& node, const core::State* determinization = nullptr);

  // Options keyed by role's move alone (key state absent, key turn restricted to role).
  static options_t options_by_move(const Node& node, const core::Role& role);

 protected:
  // options is non-empty. Returns an index into options.
  virtual size_t pick(const Node& node, const core::State* determinization,
                      const options_t& options) const = 0;

 private:
  static options_t group(const Node& node, const core::State* determinization,
                         const std::function<ChildKey(const ChildEntry&)>& key_of);
};

/*
 * Upper confidence bound for trees:
 *
 * score = exploit + c * sqrt(ln(N) / n)
 *
 * where n is the option's playout count and N the sum over all options. exploit is the option's
 * mean if the node's owner is in control, else 1 - mean. Unvisited options score +inf. At a chance
 * node, visited options are picked uniformly.
 */
class UctSelector : public Selector {
 public:
  static constexpr double kDefaultExplorationConstant = std::numbers::sqrt2;

  explicit UctSelector(double exploration_constant = kDefaultExplorationConstant);

  double exploration_constant() const { return exploration_constant_; }

 protected:
  size_t pick(const Node& node, const core::State* determinization,
              const options_t& options) const override;

 private:
  const double exploration_constant_;
};

// Highest mean. Unvisited options rank lowest.
class BestSelector : public Selector {
 protected:
  size_t pick(const Node& node, const core::State* determinization,
              const options_t& options) const override;
};

// Most playouts.
class MostVisitedSelector : public Selector {
 protected:
  size_t pick(const Node& node, const core::State* determinization,
              const options_t& options) const override;
};

class RandomSelector : public Selector {
 protected:
  size_t pick(const Node& node, const core::State* determinization,
              const options_t& options) const override;
};

}  // namespace search
