#include "search/Evaluators.hpp"

#include "util/Asserts.hpp"
#include "util/Random.hpp"

#include <algorithm>

namespace search {

Evaluator::utilities_t Evaluator::evaluate_all(const core::State& state,
                                               const std::vector<core::Role>& roles,
                                               const core::Interpreter& interpreter) const {
  utilities_t out;
  for (const auto& role : roles) {
    out[role] = evaluate(state, role, interpreter);
  }
  return out;
}

double FinalGoalNormalizedUtilityEvaluator::evaluate(const core::State& state,
                                                     const core::Role& role,
                                                     const core::Interpreter& interpreter) const {
  core::Interpreter::goals_t goals = interpreter.get_goals(state);
  auto it = goals.find(role);
  if (it == goals.end() || !it->second) return 0.5;

  int goal = *it->second;
  int places = 0;
  int rank = 0;
  int rank_count = 0;
  for (const auto& [other_role, other_goal] : goals) {
    if (!other_goal) continue;
    ++places;
    if (*other_goal > goal) ++rank;
    if (*other_goal == goal) ++rank_count;
  }
  if (places <= 1) {
    return std::clamp(goal / 100.0, 0.0, 1.0);
  }
  return utility(rank, rank_count, places);
}

double FinalGoalNormalizedUtilityEvaluator::utility(int rank, int rank_count, int places) {
  RELEASE_ASSERT(places > 1 && rank_count >= 1 && rank >= 0 && rank + rank_count <= places,
                 "invalid ranking rank={} rank_count={} places={}", rank, rank_count, places);
  double u = double(places - rank - 1) / (rank_count * (places - 1));
  return std::clamp(u, 0.0, 1.0);
}

LightPlayoutEvaluator::LightPlayoutEvaluator(int max_depth,
                                             std::shared_ptr<const Evaluator> final_evaluator)
    : max_depth_(max_depth), final_evaluator_(std::move(final_evaluator)) {
  RELEASE_ASSERT(max_depth_ >= 0, "max_depth must be non-negative");
  if (!final_evaluator_) {
    final_evaluator_ = std::make_shared<FinalGoalNormalizedUtilityEvaluator>();
  }
}

void LightPlayoutEvaluator::set_book(std::shared_ptr<const Book> book, const core::Role& role) {
  book_ = std::move(book);
  book_role_ = role;
}

LightPlayoutEvaluator::Playout LightPlayoutEvaluator::playout(
  const core::State& state, const core::Interpreter& interpreter, bool use_book) const {
  Playout out{state, 0, false};
  while (true) {
    if (use_book && book_->contains(out.state)) {
      out.in_book = true;
      ++book_hits_;
      return out;
    }
    if (out.depth >= max_depth_ || interpreter.is_terminal(out.state)) return out;

    core::Interpreter::legal_moves_t legal_moves = interpreter.get_legal_moves(out.state);
    core::Turn::plays_t plays;
    for (const auto& role : core::Interpreter::get_roles_in_control(out.state)) {
      const auto& moves = legal_moves[role];
      RELEASE_ASSERT(!moves.empty(), "role {} has no legal move", role.to_string());
      plays.emplace_back(role, *util::Random::uniform_choice(moves.begin(), moves.end()));
    }
    out.state = interpreter.get_next_state(out.state, core::Turn(std::move(plays)));
    ++out.depth;
  }
}

double LightPlayoutEvaluator::evaluate(const core::State& state, const core::Role& role,
                                       const core::Interpreter& interpreter) const {
  bool use_book = book_ && role == *book_role_;
  return evaluate_end(playout(state, interpreter, use_book), role, interpreter);
}

Evaluator::utilities_t LightPlayoutEvaluator::evaluate_all(
  const core::State& state, const std::vector<core::Role>& roles,
  const core::Interpreter& interpreter) const {
  bool use_book = book_ && roles.size() == 1 && roles[0] == *book_role_;
  Playout end = playout(state, interpreter, use_book);
  utilities_t out;
  for (const auto& role : roles) {
    out[role] = evaluate_end(end, role, interpreter);
  }
  return out;
}

double LightPlayoutEvaluator::evaluate_end(const Playout& playout, const core::Role& role,
                                           const core::Interpreter& interpreter) const {
  if (playout.in_book) return book_->at(playout.state);
  if (!interpreter.is_terminal(playout.state)) return 0.5;
  return final_evaluator_->evaluate(playout.state, role, interpreter);
}

}  // namespace search
