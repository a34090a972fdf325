#include "agents/RandomAgent.hpp"

#include "util/Exception.hpp"
#include "util/Random.hpp"

namespace agents {

core::Move RandomAgent::calculate_move(int ply, int64_t, const core::View& view) {
  core::Interpreter::moves_t moves = interpreter().get_legal_moves_by_role(view, role());
  if (moves.empty()) {
    throw util::Exception("{} has no legal move at ply {}", role().to_string(), ply);
  }
  return *util::Random::uniform_choice(moves.begin(), moves.end());
}

}  // namespace agents
