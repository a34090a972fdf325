#include "search/Perspective.hpp"

#include "util/Asserts.hpp"
#include "util/Random.hpp"

namespace search {

PossibleStatesPerspective::PossibleStatesPerspective(const core::StateSet& possible_states)
    : possible_states_(possible_states) {
  RELEASE_ASSERT(!possible_states_.empty(), "a perspective needs at least one world");
}

const core::State& PossibleStatesPerspective::sample_state(std::mt19937& prng) const {
  return *util::Random::uniform_choice(prng, possible_states_.begin(), possible_states_.end());
}

core::Interpreter::next_states_t PossibleStatesPerspective::get_next_states(
  const core::Interpreter& interpreter) const {
  core::Interpreter::next_states_t out;
  for (const auto& state : possible_states_) {
    for (auto& pair : interpreter.get_all_next_states(state)) {
      out.push_back(std::move(pair));
    }
  }
  return out;
}

}  // namespace search
