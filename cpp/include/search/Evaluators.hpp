#pragma once

#include "core/Interpreter.hpp"
#include "core/State.hpp"
#include "core/Subrelation.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace search {

// Exact values of states for one role, e.g. as produced by a BookBuilder.
using Book = std::unordered_map<core::State, double>;

/*
 * Estimates the utility in [0, 1] of a state for a role.
 */
class Evaluator {
 public:
  using utilities_t = std::map<core::Role, double>;

  virtual ~Evaluator() = default;

  virtual double evaluate(const core::State& state, const core::Role& role,
                          const core::Interpreter& interpreter) const = 0;

  // The utility for each of roles. Implementations based on a simulation share one simulation
  // across roles.
  virtual utilities_t evaluate_all(const core::State& state, const std::vector<core::Role>& roles,
                                   const core::Interpreter& interpreter) const;
};

/*
 * Utility of a terminal state, derived from the ranking of the goals:
 *
 * (places - rank - 1) / (rank_count * (places - 1)), clamped to [0, 1]
 *
 * where places is the number of roles with a goal, rank the number of roles with a strictly
 * greater goal and rank_count the number of roles sharing the role's goal. A role that is alone in
 * the game gets goal / 100. A role without a goal gets 0.5.
 */
class FinalGoalNormalizedUtilityEvaluator : public Evaluator {
 public:
  double evaluate(const core::State& state, const core::Role& role,
                  const core::Interpreter& interpreter) const override;

  static double utility(int rank, int rank_count, int places);
};

/*
 * Plays uniformly random joint moves until a terminal state, then applies the final evaluator.
 *
 * A playout stops after max_depth plies; a non-terminal state reached that way is worth 0.5. When
 * a book is attached, a playout evaluated for the book's role alone also stops at the first state
 * found in the book, and the book's value is used.
 */
class LightPlayoutEvaluator : public Evaluator {
 public:
  static constexpr int kDefaultMaxDepth = 1000;

  explicit LightPlayoutEvaluator(int max_depth = kDefaultMaxDepth,
                                 std::shared_ptr<const Evaluator> final_evaluator = nullptr);

  void set_book(std::shared_ptr<const Book> book, const core::Role& role);

  double evaluate(const core::State& state, const core::Role& role,
                  const core::Interpreter& interpreter) const override;

  utilities_t evaluate_all(const core::State& state, const std::vector<core::Role>& roles,
                           const core::Interpreter& interpreter) const override;

  struct Playout {
    core::State state;
    int depth = 0;
    bool in_book = false;
  };

  Playout playout(const core::State& state, const core::Interpreter& interpreter,
                  bool use_book = false) const;

  int max_depth() const { return max_depth_; }
  int64_t book_hits() const { return book_hits_; }

 private:
  double evaluate_end(const Playout& playout, const core::Role& role,
                      const core::Interpreter& interpreter) const;

  int max_depth_;
  std::shared_ptr<const Evaluator> final_evaluator_;
  std::shared_ptr<const Book> book_;
  std::optional<core::Role> book_role_;
  mutable int64_t book_hits_ = 0;
};

}  // namespace search
