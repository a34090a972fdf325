#pragma once

#include "search/Evaluators.hpp"
#include "search/Selectors.hpp"

#include <cstdint>

namespace agents {

struct TreeAgentParams {
  auto make_options_description();

  double exploration_constant = search::UctSelector::kDefaultExplorationConstant;
  int max_playout_depth = search::LightPlayoutEvaluator::kDefaultMaxDepth;

  // Search budget, see TreeAgent::get_timeout_ns().
  double time_scale = 0.975;
  int64_t min_buffer_ms = 1000;
  int64_t max_buffer_ms = 5000;
  int guessed_remaining_moves = 128;

  int max_logged_options = 10;
  bool build_book = false;
};

}  // namespace agents

#include "inline/agents/TreeAgentParams.inl"
