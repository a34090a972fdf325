#pragma once

#include "util/Exception.hpp"

namespace search {

// No world of a belief state is consistent with a new observation.
class DevelopmentMismatchError : public util::Exception {
 public:
  using util::Exception::Exception;
};

}  // namespace search
