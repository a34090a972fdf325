#include "search/BookBuilder.hpp"

#include "util/Asserts.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <algorithm>
#include <numeric>

namespace search {

BookBuilder::BookBuilder(core::InterpreterPtr interpreter, const core::Role& role,
                         std::shared_ptr<const Evaluator> evaluator, double min_value,
                         double max_value, const std::set<core::Role>& allies,
                         std::optional<core::State> init_state)
    : interpreter_(std::move(interpreter)),
      role_(role),
      evaluator_(std::move(evaluator)),
      min_value_(min_value),
      max_value_(max_value),
      allies_(allies) {
  RELEASE_ASSERT(interpreter_ != nullptr);
  RELEASE_ASSERT(min_value_ <= max_value_, "empty value range [{}, {}]", min_value_, max_value_);
  if (!evaluator_) {
    evaluator_ = std::make_shared<FinalGoalNormalizedUtilityEvaluator>();
  }
  allies_.insert(role_);
  init_state_ = init_state ? *init_state : interpreter_->get_init_state();
}

void BookBuilder::step() {
  if (done_) return;
  if (queue_.empty()) {
    initialize();
    if (done_) return;
  }

  item_t item = std::move(queue_.front());
  queue_.pop_front();
  std::visit([&](const auto& x) { handle(x); }, item);

  const Bounds* init = find(init_state_);
  if (init && init->is_exact()) {
    done_ = true;
    LOG_DEBUG("book for {} done: {} entries, initial value {}", role_.to_string(),
              entries_.size(), init->lower);
  }
}

Book BookBuilder::book() const {
  Book out;
  for (const auto& [state, bounds] : entries_) {
    if (bounds.is_exact()) out.emplace(state, bounds.lower);
  }
  return out;
}

std::optional<double> BookBuilder::value(const core::State& state) const {
  const Bounds* bounds = find(state);
  if (!bounds || !bounds->is_exact()) return std::nullopt;
  return bounds->lower;
}

void BookBuilder::initialize() {
  const Bounds* init = find(init_state_);
  if (init && init->is_exact()) {
    done_ = true;
    return;
  }
  if (!seeded_.contains(init_state_)) {
    queue_.push_back(Seed{init_state_});
  }
  queue_.push_back(Search{init_state_, min_value_, max_value_});
}

void BookBuilder::handle(const Seed& seed) {
  if (!seeded_.insert(seed.state).second) return;

  std::optional<core::State> penultimate;
  core::State state = seed.state;
  while (true) {
    const Bounds* bounds = find(state);
    if (bounds && bounds->is_exact()) break;
    if (interpreter_->is_terminal(state)) {
      set_exact(state, evaluator_->evaluate(state, role_, *interpreter_));
      break;
    }

    core::Interpreter::legal_moves_t legal_moves = interpreter_->get_legal_moves(state);
    core::Turn::plays_t plays;
    for (const auto& role : core::Interpreter::get_roles_in_control(state)) {
      const auto& moves = legal_moves[role];
      RELEASE_ASSERT(!moves.empty(), "role {} has no legal move", role.to_string());
      plays.emplace_back(role, *util::Random::uniform_choice(moves.begin(), moves.end()));
    }
    penultimate = state;
    state = interpreter_->get_next_state(state, core::Turn(std::move(plays)));
  }

  if (penultimate) {
    queue_.push_back(Seed{*penultimate});
    queue_.push_back(Search{*penultimate, min_value_, max_value_});
  }
  for (const auto& next_state : next_states(seed.state)) {
    if (!seeded_.contains(next_state)) queue_.push_back(Seed{next_state});
  }
}

void BookBuilder::handle(const Search& search) {
  const Bounds* bounds = find(search.state);
  if (bounds && (bounds->is_exact() || bounds->lower >= search.beta ||
                 bounds->upper <= search.alpha)) {
    return;
  }
  if (interpreter_->is_terminal(search.state)) {
    set_exact(search.state, evaluator_->evaluate(search.state, role_, *interpreter_));
    return;
  }

  std::vector<core::State> children = next_states(search.state);
  std::set<core::Role> roles_in_control = core::Interpreter::get_roles_in_control(search.state);
  if (roles_in_control.size() == 1 && *roles_in_control.begin() == core::random_role()) {
    handle_chance(search, children);
  } else if (std::includes(allies_.begin(), allies_.end(), roles_in_control.begin(),
                           roles_in_control.end())) {
    handle_max(search, children);
  } else {
    handle_min(search, children);
  }
}

void BookBuilder::handle_chance(const Search& search, const std::vector<core::State>& children) {
  std::vector<Search> pending;
  double total = 0;
  for (const auto& child : children) {
    const Bounds* bounds = find(child);
    if (bounds && bounds->is_exact()) {
      total += bounds->lower;
    } else {
      pending.push_back(Search{child, min_value_, max_value_});
    }
  }
  if (!pending.empty()) {
    push_front(search, pending);
    return;
  }
  set_exact(search.state, total / children.size());
}

void BookBuilder::handle_max(const Search& search, const std::vector<core::State>& children) {
  double value = min_value_;
  for (const auto& child : children) {
    const Bounds* bounds = find(child);
    if (bounds && bounds->is_exact()) value = std::max(value, bounds->lower);
  }
  if (value >= search.beta) {
    tighten(search.state, value, max_value_);
    return;
  }

  // A child bounded above by alpha cannot raise the value; one bounded below by beta cuts off.
  double alpha = std::max(search.alpha, value);
  double skipped_upper = min_value_;
  std::vector<Search> pending;
  for (const auto& child : children) {
    const Bounds* bounds = find(child);
    if (bounds && bounds->is_exact()) continue;
    if (bounds && bounds->upper <= alpha) {
      skipped_upper = std::max(skipped_upper, bounds->upper);
    } else if (bounds && bounds->lower >= search.beta) {
      tighten(search.state, bounds->lower, max_value_);
      return;
    } else {
      pending.push_back(Search{child, alpha, search.beta});
    }
  }

  if (!pending.empty()) {
    push_front(search, pending);
    return;
  }
  tighten(search.state, value, std::max(value, skipped_upper));
}

void BookBuilder::handle_min(const Search& search, const std::vector<core::State>& children) {
  double value = max_value_;
  for (const auto& child : children) {
    const Bounds* bounds = find(child);
    if (bounds && bounds->is_exact()) value = std::min(value, bounds->lower);
  }
  if (value <= search.alpha) {
    tighten(search.state, min_value_, value);
    return;
  }

  double beta = std::min(search.beta, value);
  double skipped_lower = max_value_;
  std::vector<Search> pending;
  for (const auto& child : children) {
    const Bounds* bounds = find(child);
    if (bounds && bounds->is_exact()) continue;
    if (bounds && bounds->lower >= beta) {
      skipped_lower = std::min(skipped_lower, bounds->lower);
    } else if (bounds && bounds->upper <= search.alpha) {
      tighten(search.state, min_value_, bounds->upper);
      return;
    } else {
      pending.push_back(Search{child, search.alpha, beta});
    }
  }

  if (!pending.empty()) {
    push_front(search, pending);
    return;
  }
  tighten(search.state, std::min(value, skipped_lower), value);
}

void BookBuilder::push_front(const Search& search, const std::vector<Search>& children) {
  queue_.push_front(search);
  for (auto it = children.rbegin(); it != children.rend(); ++it) {
    queue_.push_front(*it);
  }
}

const BookBuilder::Bounds* BookBuilder::find(const core::State& state) const {
  auto it = entries_.find(state);
  return it == entries_.end() ? nullptr : &it->second;
}

void BookBuilder::tighten(const core::State& state, double lower, double upper) {
  auto [it, inserted] = entries_.try_emplace(state, Bounds{min_value_, max_value_});
  Bounds& bounds = it->second;
  bounds.lower = std::max(bounds.lower, lower);
  bounds.upper = std::min(bounds.upper, upper);
  RELEASE_ASSERT(bounds.lower <= bounds.upper, "inconsistent bounds [{}, {}] for {}", bounds.lower,
                 bounds.upper, state.to_string());
}

std::vector<core::State> BookBuilder::next_states(const core::State& state) const {
  std::vector<core::State> out;
  for (auto& [turn, next_state] : interpreter_->get_all_next_states(state)) {
    if (std::find(out.begin(), out.end(), next_state) == out.end()) {
      out.push_back(std::move(next_state));
    }
  }
  return out;
}

}  // namespace search
