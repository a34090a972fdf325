#include "core/State.hpp"

#include <boost/algorithm/string/join.hpp>
#include <boost/functional/hash.hpp>

#include <algorithm>

namespace core {

State::State(facts_t facts) : facts_(std::move(facts)) {
  std::sort(facts_.begin(), facts_.end());
  facts_.erase(std::unique(facts_.begin(), facts_.end()), facts_.end());
  init_hash();
}

bool State::contains(const Subrelation& fact) const {
  return std::binary_search(facts_.begin(), facts_.end(), fact);
}

bool State::includes(const State& subset) const {
  return std::includes(facts_.begin(), facts_.end(), subset.facts_.begin(), subset.facts_.end());
}

State State::with(const Subrelation& fact) const {
  facts_t facts = facts_;
  facts.push_back(fact);
  return State(std::move(facts));
}

State::facts_t State::facts_named(std::string_view name) const {
  facts_t out;
  for (const auto& fact : facts_) {
    if (fact.name() == name) out.push_back(fact);
  }
  return out;
}

std::string State::to_string() const {
  std::vector<std::string> parts;
  parts.reserve(facts_.size());
  for (const auto& fact : facts_) {
    parts.push_back(fact.to_string());
  }
  return "{" + boost::algorithm::join(parts, ", ") + "}";
}

void State::init_hash() {
  size_t seed = facts_.size();
  for (const auto& fact : facts_) {
    boost::hash_combine(seed, fact.hash());
  }
  hash_ = seed;
}

std::string to_string(const StateSet& states) {
  std::vector<std::string> parts;
  parts.reserve(states.size());
  for (const auto& state : states) {
    parts.push_back(state.to_string());
  }
  return "{" + boost::algorithm::join(parts, ", ") + "}";
}

}  // namespace core
