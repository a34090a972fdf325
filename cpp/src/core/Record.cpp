#include "core/Record.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <climits>

namespace core {

namespace {

template <typename Map>
void update_bounds(const Map& map, int& lo, int& hi) {
  if (map.empty()) return;
  lo = std::min(lo, map.begin()->first);
  hi = std::max(hi, map.rbegin()->first);
}

}  // namespace

int Record::offset() const {
  int lo = INT_MAX;
  int hi = INT_MIN;
  update_bounds(possible_states, lo, hi);
  update_bounds(views, lo, hi);
  update_bounds(turns, lo, hi);
  return lo == INT_MAX ? 0 : lo;
}

int Record::horizon() const {
  int lo = INT_MAX;
  int hi = INT_MIN;
  update_bounds(possible_states, lo, hi);
  update_bounds(views, lo, hi);
  update_bounds(turns, lo, hi);
  return hi == INT_MIN ? 0 : hi;
}

std::string Record::to_string() const {
  std::string out = fmt::format("Record[{}..{}]", offset(), horizon());
  for (const auto& [ply, states] : possible_states) {
    out += fmt::format(" states@{}={}", ply, states.size());
  }
  for (const auto& [ply, views_by_role] : views) {
    for (const auto& [role, view] : views_by_role) {
      out += fmt::format(" view@{}[{}]={}", ply, role.to_string(), view.to_string());
    }
  }
  for (const auto& [ply, turn] : turns) {
    out += fmt::format(" turn@{}={}", ply, turn.to_string());
  }
  return out;
}

}  // namespace core
