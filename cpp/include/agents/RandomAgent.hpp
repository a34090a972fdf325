#pragma once

#include "agents/InterpreterAgent.hpp"

#include <string>

namespace agents {

// Plays a uniformly random legal move. Also used for the chance role.
class RandomAgent : public InterpreterAgent {
 public:
  using InterpreterAgent::InterpreterAgent;

  core::Move calculate_move(int ply, int64_t total_time_ns, const core::View& view) override;
  std::string name() const override { return "random"; }
};

}  // namespace agents
