#include "core/Turn.hpp"

#include "util/Exception.hpp"

#include <boost/algorithm/string/join.hpp>
#include <boost/functional/hash.hpp>

#include <algorithm>

namespace core {

Turn::Turn(plays_t plays) : plays_(std::move(plays)) {
  std::sort(plays_.begin(), plays_.end());
  for (size_t i = 1; i < plays_.size(); ++i) {
    if (plays_[i - 1].first == plays_[i].first) {
      throw util::Exception("Turn: role {} appears twice", plays_[i].first.to_string());
    }
  }
  init_hash();
}

const Move* Turn::find(const Role& role) const {
  auto it = std::lower_bound(plays_.begin(), plays_.end(), role,
                             [](const play_t& play, const Role& r) { return play.first < r; });
  if (it == plays_.end() || it->first != role) return nullptr;
  return &it->second;
}

const Move& Turn::at(const Role& role) const {
  const Move* move = find(role);
  if (!move) {
    throw util::Exception("Turn {} has no move for role {}", to_string(), role.to_string());
  }
  return *move;
}

bool Turn::contains(const Role& role, const Move& move) const {
  const Move* found = find(role);
  return found && *found == move;
}

Turn Turn::restrict(const Role& role) const {
  const Move* move = find(role);
  if (!move) return Turn();
  return Turn{{role, *move}};
}

bool Turn::includes(const Turn& other) const {
  for (const auto& [role, move] : other) {
    if (!contains(role, move)) return false;
  }
  return true;
}

std::string Turn::to_string() const {
  std::vector<std::string> parts;
  parts.reserve(plays_.size());
  for (const auto& [role, move] : plays_) {
    parts.push_back(role.to_string() + ": " + move.to_string());
  }
  return "{" + boost::algorithm::join(parts, ", ") + "}";
}

void Turn::init_hash() {
  size_t seed = plays_.size();
  for (const auto& [role, move] : plays_) {
    boost::hash_combine(seed, role.hash());
    boost::hash_combine(seed, move.hash());
  }
  hash_ = seed;
}

}  // namespace core
