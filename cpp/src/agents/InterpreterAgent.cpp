#include "agents/InterpreterAgent.hpp"

#include "core/Exceptions.hpp"
#include "util/Asserts.hpp"
#include "util/LoggingUtil.hpp"

namespace agents {

InterpreterAgent::InterpreterAgent(core::InterpreterFactory interpreter_factory)
    : interpreter_factory_(std::move(interpreter_factory)) {
  RELEASE_ASSERT(bool(interpreter_factory_), "missing interpreter factory");
}

void InterpreterAgent::prepare_match(const core::Role& role, const core::Ruleset& ruleset,
                                     const core::GameClock::Configuration& start_clock_config,
                                     const core::GameClock::Configuration& play_clock_config) {
  LOG_DEBUG("preparing {} as {} for {} (start clock {}, play clock {})", name(), role.to_string(),
            ruleset.name, start_clock_config.to_string(), play_clock_config.to_string());
  role_ = role;
  ruleset_ = ruleset;
  start_clock_config_ = start_clock_config;
  play_clock_config_ = play_clock_config;
  interpreter_ = interpreter_factory_(ruleset);
  RELEASE_ASSERT(interpreter_ != nullptr, "interpreter factory returned nothing for {}",
                 ruleset.name);
}

void InterpreterAgent::conclude_match(const core::View& view) {
  LOG_DEBUG("concluding match for {}, view={}", name(), view.to_string());
  reset();
}

void InterpreterAgent::abort_match() {
  LOG_DEBUG("aborting match for {}", name());
  reset();
}

const core::Interpreter& InterpreterAgent::interpreter() const { return *interpreter_ptr(); }

const core::InterpreterPtr& InterpreterAgent::interpreter_ptr() const {
  if (!interpreter_) {
    throw core::InterpreterIsNoneAgentError("{} has no interpreter (no match in progress)", name());
  }
  return interpreter_;
}

const core::Role& InterpreterAgent::role() const {
  if (!role_) {
    throw core::RoleIsNoneAgentError("{} has no role (no match in progress)", name());
  }
  return *role_;
}

void InterpreterAgent::reset() {
  interpreter_.reset();
  role_.reset();
  ruleset_.reset();
}

}  // namespace agents
