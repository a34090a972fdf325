#include "agents/TreeAgent.hpp"

#include "util/Asserts.hpp"
#include "util/CppUtil.hpp"
#include "util/LoggingUtil.hpp"

#include <boost/algorithm/string/join.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <string>
#include <vector>

namespace agents {

TreeAgent::TreeAgent(core::InterpreterFactory interpreter_factory, const TreeAgentParams& params,
                     std::shared_ptr<const search::Selector> selector,
                     std::shared_ptr<const search::Selector> chooser,
                     std::shared_ptr<const search::Evaluator> evaluator,
                     std::shared_ptr<const search::ValuationFactory> valuation_factory)
    : InterpreterAgent(std::move(interpreter_factory)),
      params_(params),
      selector_(std::move(selector)),
      chooser_(std::move(chooser)),
      evaluator_(std::move(evaluator)),
      valuation_factory_(std::move(valuation_factory)),
      repeater_([this] { step(); }, 0) {
  if (!selector_) {
    selector_ = std::make_shared<search::UctSelector>(params_.exploration_constant);
  }
  if (!chooser_) {
    chooser_ = std::make_shared<search::MostVisitedSelector>();
  }
  if (!evaluator_) {
    evaluator_ = std::make_shared<search::LightPlayoutEvaluator>(params_.max_playout_depth);
  }
  if (!valuation_factory_) {
    valuation_factory_ = std::make_shared<search::NormalizedUtilityValuationFactory>();
  }
}

void TreeAgent::prepare_match(const core::Role& role, const core::Ruleset& ruleset,
                              const core::GameClock::Configuration& start_clock_config,
                              const core::GameClock::Configuration& play_clock_config) {
  InterpreterAgent::prepare_match(role, ruleset, start_clock_config, play_clock_config);
  arena_.clear();
  init_tree();
}

core::Move TreeAgent::calculate_move(int ply, int64_t total_time_ns, const core::View& view) {
  const core::Interpreter& interp = interpreter();
  const core::Role& own_role = role();

  int64_t start_ns = util::ns_since_epoch();
  develop(ply, view);
  int64_t used_ns = util::ns_since_epoch() - start_ns;
  LOG_DEBUG("{} developed to ply {} in {:.3f}s ({} nodes)", name(), ply, used_ns * 1e-9,
            arena_.size());

  int64_t timeout_ns = get_timeout_ns(total_time_ns, used_ns);
  repeater_.set_timeout_ns(timeout_ns);
  last_search_ = repeater_();
  LOG_DEBUG("{} searched for {:.3f}s (budget {:.3f}s): {} iterations", name(),
            last_search_.elapsed_ns * 1e-9, timeout_ns * 1e-9, last_search_.iterations);

  const search::Node& node = arena_[decision_node()];
  core::Move move = chooser_->choose_move(node, own_role);
  log_options(node);
  LOG_INFO("{} as {} chose {} at ply {}", name(), own_role.to_string(), move.to_string(), ply);

  commit(move);
  RELEASE_ASSERT(interp.is_legal(view, own_role, move), "{} chose illegal move {}", name(),
                 move.to_string());
  return move;
}

int64_t TreeAgent::get_timeout_ns(int64_t total_time_ns, int64_t used_ns) const {
  const core::GameClock::Configuration& play_clock = play_clock_config();
  const double scale = params_.time_scale;
  const int64_t min_buffer_ns = util::ms_to_ns(params_.min_buffer_ms);
  const int64_t max_buffer_ns = util::ms_to_ns(params_.max_buffer_ms);

  int64_t net_zero_ns = play_clock.increment_ns() + play_clock.delay_ns() - used_ns;
  int64_t zero_ns = total_time_ns + play_clock.delay_ns() - used_ns;

  int64_t remaining_moves = total_time_ns > 0 ? std::max(1, params_.guessed_remaining_moves) : 1;
  int64_t using_ns = std::max<int64_t>(0, total_time_ns / remaining_moves);

  int64_t max_ns = int64_t(zero_ns * scale) - min_buffer_ns;
  int64_t min_ns = int64_t(net_zero_ns * scale) - max_buffer_ns;

  int64_t timeout_ns = int64_t((net_zero_ns + using_ns) * scale);
  timeout_ns = std::max({int64_t(0), timeout_ns, min_ns});
  timeout_ns = std::min(timeout_ns, max_ns);
  return std::max(int64_t(0), timeout_ns);
}

void TreeAgent::reset() {
  InterpreterAgent::reset();
  arena_.clear();
}

void TreeAgent::backpropagate(search::node_id_t node_id, double utility) {
  for (search::node_id_t id = arena_[node_id].parent(); id != search::kNullNodeId;
       id = arena_[id].parent()) {
    arena_[id].propagate(utility, *valuation_factory_);
  }
}

search::node_id_t TreeAgent::descend_if_determinate(search::node_id_t node_id) const {
  const search::Node& node = arena_[node_id];
  if (!node.is_expanded() || node.is_terminal()) return node_id;

  search::node_id_t child = node.children().front().child;
  for (const auto& entry : node.children()) {
    if (entry.child != child) return node_id;
  }
  return child;
}

void TreeAgent::log_options(const search::Node& node) const {
  search::Selector::options_t options = search::Selector::options_by_move(node, role());
  std::stable_sort(options.begin(), options.end(), [](const auto& a, const auto& b) {
    return a.playouts > b.playouts;
  });

  std::vector<std::string> lines;
  if (options.size() > size_t(params_.max_logged_options)) {
    lines.push_back(fmt::format("options (top {} out of {}):", params_.max_logged_options,
                                options.size()));
    options.resize(params_.max_logged_options);
  } else {
    lines.push_back("options:");
  }
  for (const auto& option : options) {
    lines.push_back(fmt::format("  {}: {:.3f} ({} playouts)",
                                option.key.turn.at(role()).to_string(), option.mean,
                                option.playouts));
  }
  LOG_DEBUG("{}", boost::algorithm::join(lines, "\n"));
}

}  // namespace agents
