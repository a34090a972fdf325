#pragma once

#include "core/Interpreter.hpp"
#include "core/State.hpp"
#include "core/Subrelation.hpp"
#include "search/Evaluators.hpp"

#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <set>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

namespace search {

/*
 * Computes exact minimax values of a perfect-information game for one role, one work item per
 * step().
 *
 * The work queue holds two kinds of items:
 *
 * - Seed(state): plays one random playout from state, and schedules the search of the state the
 *   playout ended before, together with seeds for every successor of state.
 * - Search(state, alpha, beta): alpha-beta evaluation of state. A state whose children are not yet
 *   known is pushed back in front of the queue behind searches of those children.
 *
 * States where only the chance role is in control are worth the average of their successors, whose
 * values are searched with the full window. States controlled by allies of the role (the role
 * included) maximize, the others minimize.
 *
 * Every entry carries a lower and an upper bound; a value is exact when both meet. Only exact
 * values are part of the book. done() becomes true once the value of the initial state is exact.
 *
 * Usage:
 *
 * BookBuilder builder(interpreter, role);
 * while (!builder.done()) builder.step();
 * Book book = builder.book();
 */
class BookBuilder {
 public:
  struct Seed {
    core::State state;
  };

  struct Search {
    core::State state;
    double alpha;
    double beta;
  };

  using item_t = std::variant<Seed, Search>;

  struct Bounds {
    double lower;
    double upper;

    bool is_exact() const { return lower == upper; }
  };

  BookBuilder(core::InterpreterPtr interpreter, const core::Role& role,
              std::shared_ptr<const Evaluator> evaluator = nullptr, double min_value = 0,
              double max_value = 1, const std::set<core::Role>& allies = {},
              std::optional<core::State> init_state = std::nullopt);

  void step();
  bool done() const { return done_; }

  // Exact values only.
  Book book() const;

  // Exact value of state, if known.
  std::optional<double> value(const core::State& state) const;

  const core::Role& role() const { return role_; }
  size_t entry_count() const { return entries_.size(); }
  size_t queue_size() const { return queue_.size(); }

 private:
  void initialize();
  void handle(const Seed& seed);
  void handle(const Search& search);
  void handle_chance(const Search& search, const std::vector<core::State>& next_states);
  void handle_max(const Search& search, const std::vector<core::State>& next_states);
  void handle_min(const Search& search, const std::vector<core::State>& next_states);

  // Schedules the searches of children, then of search itself.
  void push_front(const Search& search, const std::vector<Search>& children);

  const Bounds* find(const core::State& state) const;
  void tighten(const core::State& state, double lower, double upper);
  void set_exact(const core::State& state, double value) { tighten(state, value, value); }
  std::vector<core::State> next_states(const core::State& state) const;

  core::InterpreterPtr interpreter_;
  core::Role role_;
  std::shared_ptr<const Evaluator> evaluator_;
  double min_value_;
  double max_value_;
  std::set<core::Role> allies_;
  core::State init_state_;

  std::unordered_map<core::State, Bounds> entries_;
  std::unordered_set<core::State> seeded_;
  std::deque<item_t> queue_;
  bool done_ = false;
};

}  // namespace search
