#pragma once

#include "util/Exception.hpp"

namespace core {

/*
 * Raised by an Interpreter when a query cannot be answered. These are recoverable at the agent
 * boundary: the match runner reports the agent as not having responded.
 */
class InterpreterError : public util::Exception {
 public:
  using util::Exception::Exception;
};

// A single query exceeded its time limit.
class InterpreterTimeoutError : public InterpreterError {
 public:
  using InterpreterError::InterpreterError;
};

// A query that the rules guarantee to have a model had none.
class UnsatInterpreterError : public InterpreterError {
 public:
  using InterpreterError::InterpreterError;
};

// A query that the rules guarantee to have a unique model had several.
class MoreThanOneModelInterpreterError : public InterpreterError {
 public:
  using InterpreterError::InterpreterError;
};

// get_next_state() was given a turn that is not exactly one legal move per role in control.
class IllegalTurnInterpreterError : public InterpreterError {
 public:
  using InterpreterError::InterpreterError;
};

/*
 * Usage errors of an Agent, e.g. calculate_move() before prepare_match() or after
 * conclude_match(). An agent drops its interpreter and role when a match ends, so both cases raise
 * the same kinds.
 */
class AgentError : public util::Exception {
 public:
  using util::Exception::Exception;
};

class InterpreterIsNoneAgentError : public AgentError {
 public:
  using AgentError::AgentError;
};

class RoleIsNoneAgentError : public AgentError {
 public:
  using AgentError::AgentError;
};

}  // namespace core
