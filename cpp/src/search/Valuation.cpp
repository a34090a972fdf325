#include "search/Valuation.hpp"

#include "util/Asserts.hpp"

#include <fmt/format.h>

namespace search {

std::string Valuation::to_string() const {
  return fmt::format("{:.3f} ({} playouts)", mean(), total_playouts());
}

bool Valuation::operator<(const Valuation& other) const {
  if (mean() != other.mean()) return mean() < other.mean();
  return total_playouts() < other.total_playouts();
}

NormalizedUtilityValuation::NormalizedUtilityValuation(double utility, int64_t total_playouts)
    : utility_(utility), total_playouts_(total_playouts) {
  RELEASE_ASSERT(utility >= 0.0 && utility <= 1.0, "utility {} out of range", utility);
  RELEASE_ASSERT(total_playouts >= 0);
}

void NormalizedUtilityValuation::propagate(double utility) {
  utility_ = (utility_ * total_playouts_ + utility) / (total_playouts_ + 1);
  total_playouts_ += 1;
}

void NormalizedUtilityValuation::propagate(const Valuation& other) {
  int64_t n = total_playouts_ + other.total_playouts();
  if (n == 0) return;
  utility_ = (utility_ * total_playouts_ + other.mean() * other.total_playouts()) / n;
  total_playouts_ = n;
}

std::unique_ptr<Valuation> NormalizedUtilityValuation::clone() const {
  return std::make_unique<NormalizedUtilityValuation>(*this);
}

}  // namespace search
