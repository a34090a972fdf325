#include "games/Games.hpp"

#include "games/dark_split_corridor/Interpreter.hpp"
#include "games/minipoker/Interpreter.hpp"
#include "games/tictactoe/Interpreter.hpp"
#include "util/Exception.hpp"

#include <boost/algorithm/string/join.hpp>

#include <memory>

namespace games {

const std::vector<std::string>& names() {
  static const std::vector<std::string> out = {"dark_split_corridor", "minipoker", "tictactoe"};
  return out;
}

core::InterpreterPtr make_interpreter(const core::Ruleset& ruleset) {
  if (ruleset.name == "tictactoe") return std::make_shared<tictactoe::Interpreter>();
  if (ruleset.name == "minipoker") return std::make_shared<minipoker::Interpreter>();
  if (ruleset.name == "dark_split_corridor") {
    return std::make_shared<dark_split_corridor::Interpreter>();
  }
  throw util::CleanException("unknown game \"{}\" (expected one of: {})", ruleset.name,
                             boost::algorithm::join(names(), ", "));
}

}  // namespace games
