#include "search/Selectors.hpp"

#include "util/Asserts.hpp"
#include "util/Exception.hpp"
#include "util/Random.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace search {

ChildKey Selector::select(const Node& node, const core::State* determinization) const {
  options_t opts = options(node, determinization);
  if (opts.empty()) {
    throw util::Exception("no child of node {} to select from", node.id());
  }
  size_t index = pick(node, determinization, opts);
  RELEASE_ASSERT(index < opts.size());
  return opts[index].key;
}

core::Move Selector::choose_move(const Node& node, const core::Role& role) const {
  options_t opts = options_by_move(node, role);
  if (opts.empty()) {
    throw util::Exception("node {} offers no move for {}", node.id(), role.to_string());
  }
  size_t index = pick(node, nullptr, opts);
  RELEASE_ASSERT(index < opts.size());
  return opts[index].key.turn.at(role);
}

Selector::options_t Selector::options(const Node& node, const core::State* determinization) {
  bool by_full_key = determinization || node.kind() == NodeKind::kPerfect;
  return group(node, determinization, [&](const ChildEntry& entry) {
    if (by_full_key) return entry.key;
    return ChildKey{std::nullopt, entry.key.turn};
  });
}

Selector::options_t Selector::options_by_move(const Node& node, const core::Role& role) {
  return group(node, nullptr, [&](const ChildEntry& entry) {
    return ChildKey{std::nullopt, entry.key.turn.restrict(role)};
  });
}

Selector::options_t Selector::group(const Node& node, const core::State* determinization,
                                    const std::function<ChildKey(const ChildEntry&)>& key_of) {
  options_t out;
  for (const auto& entry : node.children()) {
    if (determinization && entry.key.state && *entry.key.state != *determinization) continue;

    ChildKey key = key_of(entry);
    auto it = std::find_if(out.begin(), out.end(),
                           [&](const Option& option) { return option.key == key; });
    if (it == out.end()) {
      out.push_back(Option{std::move(key), {}, 0, 0});
      it = out.end() - 1;
    }
    if (std::find(it->children.begin(), it->children.end(), entry.child) != it->children.end()) {
      continue;
    }
    it->children.push_back(entry.child);

    const Valuation* valuation = node.child(entry).valuation();
    if (!valuation || valuation->total_playouts() == 0) continue;
    int64_t playouts = it->playouts + valuation->total_playouts();
    it->mean = (it->mean * it->playouts + valuation->mean() * valuation->total_playouts()) /
               playouts;
    it->playouts = playouts;
  }
  return out;
}

UctSelector::UctSelector(double exploration_constant)
    : exploration_constant_(exploration_constant) {
  RELEASE_ASSERT(exploration_constant_ >= 0, "negative exploration constant {}",
                 exploration_constant_);
}

size_t UctSelector::pick(const Node& node, const core::State* determinization,
                         const options_t& options) const {
  for (size_t i = 0; i < options.size(); ++i) {
    if (!options[i].visited()) return i;
  }
  if (node.is_chance(determinization)) {
    return util::Random::uniform_sample(size_t(0), options.size());
  }

  int64_t total_playouts = 0;
  for (const auto& option : options) total_playouts += option.playouts;
  double log_total = std::log(double(total_playouts));
  bool in_control = node.is_in_control(determinization);

  size_t best = 0;
  double best_score = -std::numeric_limits<double>::infinity();
  for (size_t i = 0; i < options.size(); ++i) {
    const Option& option = options[i];
    double exploit = in_control ? option.mean : 1 - option.mean;
    double score = exploit + exploration_constant_ * std::sqrt(log_total / option.playouts);
    if (score > best_score) {
      best = i;
      best_score = score;
    }
  }
  return best;
}

size_t BestSelector::pick(const Node&, const core::State*, const options_t& options) const {
  size_t best = 0;
  for (size_t i = 1; i < options.size(); ++i) {
    const Option& option = options[i];
    if (!option.visited()) continue;
    if (!options[best].visited() || option.mean > options[best].mean) best = i;
  }
  return best;
}

size_t MostVisitedSelector::pick(const Node&, const core::State*,
                                 const options_t& options) const {
  size_t best = 0;
  for (size_t i = 1; i < options.size(); ++i) {
    if (options[i].playouts > options[best].playouts) best = i;
  }
  return best;
}

size_t RandomSelector::pick(const Node&, const core::State*, const options_t& options) const {
  return util::Random::uniform_sample(size_t(0), options.size());
}

}  // namespace search
