#pragma once

#include "core/Agent.hpp"
#include "core/Interpreter.hpp"

#include <string>
#include <vector>

namespace games {

// Names of the built-in games, accepted as core::Ruleset names.
const std::vector<std::string>& names();

// Throws util::CleanException for a ruleset that names no built-in game.
core::InterpreterPtr make_interpreter(const core::Ruleset& ruleset);

}  // namespace games
